#include "utils/config.h"
#include "utils/utils.h"
#include <unordered_map>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace paycore {
namespace utils {

struct Config::Impl {
    std::unordered_map<std::string, std::string> data;
    std::string configPath;
    std::string dataDir;
    std::function<void(const std::string&)> changeCallback;
    mutable std::mutex mtx;

    void store(const std::string& key, const std::string& value) {
        std::function<void(const std::string&)> cb;
        {
            std::lock_guard<std::mutex> lock(mtx);
            data[key] = value;
            cb = changeCallback;
        }
        if (cb) cb(key);
    }
};

static std::string trimmed(const std::string& s) {
    return Formatter::trim(s);
}

Config::Config() : impl_(std::make_unique<Impl>()) {
    const char* home = std::getenv("HOME");
    if (home) {
        impl_->dataDir = std::string(home) + "/.paycore";
    } else {
        impl_->dataDir = ".paycore";
    }
    loadDefaults();
}

Config& Config::instance() {
    static Config inst;
    return inst;
}

bool Config::loadDefaults() {
    set("ledger.currency", "USD");
    set("ledger.minor_digits", 2);
    set("ledger.lock_timeout_ms", 5000);
    set("ledger.require_verification", true);
    set("ledger.verify_recipient", false);
    set("ledger.idempotency_cache_size", 4096);
    set("ledger.max_history_page", 500);

    set("storage.db_file", "ledger.db");

    set("log.level", "info");
    set("log.file", "paycore.log");
    set("log.console", true);
    set("log.max_file_size", static_cast<int64_t>(10 * 1024 * 1024));
    set("log.max_files", 5);
    return true;
}

void Config::reset() {
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.clear();
    }
    loadDefaults();
}

bool Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return false;

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->configPath = path;
    std::string line;

    while (std::getline(file, line)) {
        line = trimmed(line);
        if (line.empty() || line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trimmed(line.substr(0, pos));
        std::string value = trimmed(line.substr(pos + 1));
        if (!key.empty()) impl_->data[key] = value;
    }
    return true;
}

bool Config::save(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::string savePath = path.empty() ? impl_->configPath : path;
    if (savePath.empty()) return false;

    std::ofstream file(savePath);
    if (!file.is_open()) return false;

    file << "# paycore configuration\n\n";

    std::vector<std::string> sortedKeys;
    for (const auto& [key, value] : impl_->data) {
        sortedKeys.push_back(key);
    }
    std::sort(sortedKeys.begin(), sortedKeys.end());

    std::string lastPrefix;
    for (const auto& key : sortedKeys) {
        auto pos = key.find('.');
        std::string prefix = pos != std::string::npos ? key.substr(0, pos) : "";
        if (prefix != lastPrefix && !lastPrefix.empty()) {
            file << "\n";
        }
        lastPrefix = prefix;
        file << key << "=" << impl_->data[key] << "\n";
    }
    return static_cast<bool>(file);
}

std::string Config::getString(const std::string& key, const std::string& def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    return it != impl_->data.end() ? it->second : def;
}

int Config::getInt(const std::string& key, int def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoi(it->second); }
    catch (const std::exception&) { return def; }
}

int64_t Config::getInt64(const std::string& key, int64_t def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    try { return std::stoll(it->second); }
    catch (const std::exception&) { return def; }
}

bool Config::getBool(const std::string& key, bool def) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return def;
    const std::string val = Formatter::toLower(it->second);
    return val == "true" || val == "1" || val == "yes" || val == "on";
}

std::vector<std::string> Config::getList(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    auto it = impl_->data.find(key);
    if (it == impl_->data.end()) return result;

    std::istringstream iss(it->second);
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trimmed(item);
        if (!item.empty()) result.push_back(item);
    }
    return result;
}

void Config::set(const std::string& key, const std::string& value) {
    impl_->store(key, value);
}

void Config::set(const std::string& key, const char* value) {
    impl_->store(key, value ? std::string(value) : std::string());
}

void Config::set(const std::string& key, int value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, int64_t value) {
    impl_->store(key, std::to_string(value));
}

void Config::set(const std::string& key, bool value) {
    impl_->store(key, value ? "true" : "false");
}

bool Config::has(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->data.find(key) != impl_->data.end();
}

void Config::remove(const std::string& key) {
    std::function<void(const std::string&)> cb;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->data.erase(key);
        cb = impl_->changeCallback;
    }
    if (cb) cb(key);
}

std::vector<std::string> Config::keys(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<std::string> result;
    for (const auto& [key, value] : impl_->data) {
        if (prefix.empty() || key.compare(0, prefix.size(), prefix) == 0) {
            result.push_back(key);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

EngineConfig Config::getEngineConfig() const {
    EngineConfig cfg;
    cfg.currency = getString("ledger.currency", "USD");
    cfg.minorDigits = static_cast<uint32_t>(std::clamp(getInt("ledger.minor_digits", 2), 0, 6));
    cfg.lockTimeoutMs = static_cast<uint32_t>(std::max(1, getInt("ledger.lock_timeout_ms", 5000)));
    cfg.requireVerification = getBool("ledger.require_verification", true);
    cfg.verifyRecipient = getBool("ledger.verify_recipient", false);
    cfg.idempotencyCacheSize = static_cast<size_t>(std::max<int64_t>(0, getInt64("ledger.idempotency_cache_size", 4096)));
    cfg.maxHistoryPage = static_cast<size_t>(std::max<int64_t>(1, getInt64("ledger.max_history_page", 500)));
    return cfg;
}

StorageConfig Config::getStorageConfig() const {
    StorageConfig cfg;
    cfg.dataDir = getString("storage.data_dir", getDataDir());
    cfg.dbFile = getString("storage.db_file", "ledger.db");
    return cfg;
}

LogConfig Config::getLogConfig() const {
    LogConfig cfg;
    cfg.level = getString("log.level", "info");
    cfg.file = getString("log.file", "paycore.log");
    cfg.console = getBool("log.console", true);
    cfg.maxFileSize = static_cast<uint64_t>(std::max<int64_t>(1024, getInt64("log.max_file_size", 10 * 1024 * 1024)));
    cfg.maxFiles = static_cast<uint32_t>(std::max(1, getInt("log.max_files", 5)));
    return cfg;
}

void Config::setEngineConfig(const EngineConfig& cfg) {
    set("ledger.currency", cfg.currency);
    set("ledger.minor_digits", static_cast<int>(cfg.minorDigits));
    set("ledger.lock_timeout_ms", static_cast<int>(cfg.lockTimeoutMs));
    set("ledger.require_verification", cfg.requireVerification);
    set("ledger.verify_recipient", cfg.verifyRecipient);
    set("ledger.idempotency_cache_size", static_cast<int64_t>(cfg.idempotencyCacheSize));
    set("ledger.max_history_page", static_cast<int64_t>(cfg.maxHistoryPage));
}

void Config::onChange(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->changeCallback = callback;
}

std::string Config::getDataDir() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->dataDir;
}

std::string Config::getConfigPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->configPath;
}

void Config::setDataDir(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->dataDir = path;
}

}
}
