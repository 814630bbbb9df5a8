#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace paycore {
namespace utils {

// Everything the transfer engine needs, handed to it at construction.
struct EngineConfig {
    std::string currency = "USD";
    uint32_t minorDigits = 2;
    uint32_t lockTimeoutMs = 5000;
    bool requireVerification = true;
    bool verifyRecipient = false;
    size_t idempotencyCacheSize = 4096;
    size_t maxHistoryPage = 500;
};

struct StorageConfig {
    std::string dataDir;
    std::string dbFile = "ledger.db";
};

struct LogConfig {
    std::string level = "info";
    std::string file = "paycore.log";
    bool console = true;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& path);
    bool save(const std::string& path);
    bool loadDefaults();
    void reset();

    std::string getString(const std::string& key, const std::string& def = "") const;
    int getInt(const std::string& key, int def = 0) const;
    int64_t getInt64(const std::string& key, int64_t def = 0) const;
    bool getBool(const std::string& key, bool def = false) const;
    std::vector<std::string> getList(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, int value);
    void set(const std::string& key, int64_t value);
    void set(const std::string& key, bool value);

    bool has(const std::string& key) const;
    void remove(const std::string& key);
    std::vector<std::string> keys(const std::string& prefix = "") const;

    EngineConfig getEngineConfig() const;
    StorageConfig getStorageConfig() const;
    LogConfig getLogConfig() const;

    void setEngineConfig(const EngineConfig& config);

    void onChange(std::function<void(const std::string&)> callback);

    std::string getDataDir() const;
    std::string getConfigPath() const;
    void setDataDir(const std::string& path);

private:
    Config();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
