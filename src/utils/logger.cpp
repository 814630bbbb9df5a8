#include "utils/logger.h"
#include "utils/config.h"
#include "utils/utils.h"
#include <fstream>
#include <iostream>
#include <mutex>
#include <atomic>
#include <thread>
#include <sstream>
#include <filesystem>
#include <deque>
#include <cstdlib>

namespace paycore {
namespace utils {

namespace {

constexpr size_t RECENT_CAPACITY = 1000;
const char* const SENSITIVE_KEYS[] = {"password", "secret", "token", "signature", "card", "cvv"};

struct LogState {
    std::mutex mtx;
    std::ofstream file;
    std::string path;
    uint64_t maxFileSize = 10 * 1024 * 1024;
    uint32_t maxFiles = 5;
    std::deque<LogEntry> recent;
    std::function<void(const LogEntry&)> callback;

    std::atomic<LogLevel> level{LogLevel::INFO};
    std::atomic<bool> console{true};
    std::atomic<bool> allowSensitive{false};
    std::atomic<uint64_t> errors{0};
};

LogState& state() {
    static LogState s;
    return s;
}

bool isValueSeparator(char c) {
    return c == ' ' || c == '"' || c == '\'' || c == ':' || c == '=';
}

bool isValueEnd(char c) {
    return c == '"' || c == '\'' || c == ' ' || c == ',' || c == ')' || c == ';' || c == '\n';
}

// Caller holds the state mutex.
void rotateFiles(LogState& s) {
    if (s.path.empty()) return;
    if (s.file.is_open()) s.file.close();

    namespace fs = std::filesystem;
    std::error_code ec;
    fs::remove(s.path + "." + std::to_string(s.maxFiles), ec);
    for (uint32_t i = s.maxFiles; i > 1; --i) {
        std::string from = s.path + "." + std::to_string(i - 1);
        if (fs::exists(from, ec)) fs::rename(from, s.path + "." + std::to_string(i), ec);
    }
    if (fs::exists(s.path, ec)) fs::rename(s.path, s.path + ".1", ec);
    s.file.open(s.path, std::ios::app);
}

}

void Logger::init(const std::string& path) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);

    if (s.file.is_open()) s.file.close();
    s.path = path;
    s.file.open(path, std::ios::app);

    const char* env = std::getenv("PAYCORE_ALLOW_SENSITIVE_LOGS");
    if (env) {
        std::string v = Formatter::toLower(env);
        if (v == "1" || v == "true" || v == "yes") s.allowSensitive = true;
    }
}

void Logger::configure(const LogConfig& cfg, const std::string& dir) {
    setLevel(parseLogLevel(cfg.level));
    setMaxFileSize(cfg.maxFileSize);
    setMaxFiles(cfg.maxFiles);
    enableConsole(cfg.console);
    if (!cfg.file.empty()) init(dir.empty() ? cfg.file : dir + "/" + cfg.file);
}

void Logger::shutdown() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) {
        s.file.flush();
        s.file.close();
    }
    s.path.clear();
}

void Logger::setLevel(LogLevel level) {
    state().level = level;
}

LogLevel Logger::getLevel() {
    return state().level;
}

void Logger::enableConsole(bool enable) {
    state().console = enable;
}

void Logger::setMaxFileSize(uint64_t bytes) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.maxFileSize = bytes;
}

void Logger::setMaxFiles(uint32_t count) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.maxFiles = count == 0 ? 1 : count;
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    LogState& s = state();
    if (level < s.level.load() || level == LogLevel::OFF) return;

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = s.allowSensitive ? msg : redact(msg);
    entry.timestamp = nowMillis();
    entry.threadId = std::hash<std::thread::id>{}(std::this_thread::get_id());

    std::ostringstream line;
    line << Formatter::formatTimestamp(entry.timestamp) << " [" << logLevelName(level) << "]";
    if (!category.empty()) line << " [" << category << "]";
    line << " " << entry.message << "\n";

    std::function<void(const LogEntry&)> callback;
    {
        std::lock_guard<std::mutex> lock(s.mtx);
        if (s.console) (level >= LogLevel::ERROR ? std::cerr : std::cout) << line.str();
        if (s.file.is_open()) {
            s.file << line.str();
            s.file.flush();
            if (s.file.tellp() > static_cast<std::streampos>(s.maxFileSize)) rotateFiles(s);
        }
        if (level >= LogLevel::ERROR) s.errors++;
        s.recent.push_back(entry);
        if (s.recent.size() > RECENT_CAPACITY) s.recent.pop_front();
        callback = s.callback;
    }
    if (callback) callback(entry);
}

void Logger::onLog(std::function<void(const LogEntry&)> callback) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.callback = std::move(callback);
}

std::vector<LogEntry> Logger::recent(size_t count) {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t start = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(start), s.recent.end());
}

uint64_t Logger::errorCount() {
    return state().errors;
}

void Logger::clear() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
    s.errors = 0;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    state().allowSensitive = allow;
}

std::string Logger::redact(const std::string& msg) {
    static const std::string mask = "[REDACTED]";
    std::string out = msg;
    for (const char* key : SENSITIVE_KEYS) {
        const std::string k(key);
        size_t pos = 0;
        while ((pos = out.find(k, pos)) != std::string::npos) {
            size_t valueStart = pos + k.size();
            while (valueStart < out.size() && isValueSeparator(out[valueStart])) valueStart++;
            size_t valueEnd = valueStart;
            while (valueEnd < out.size() && !isValueEnd(out[valueEnd])) valueEnd++;
            if (valueStart > pos + k.size() && valueEnd > valueStart) {
                out.replace(valueStart, valueEnd - valueStart, mask);
                pos = valueStart + mask.size();
            } else {
                pos += k.size();
            }
        }
    }
    return out;
}

std::string Logger::redactIdentifier(const std::string& identifier) {
    if (state().allowSensitive) return identifier;
    if (identifier.size() <= 8) return "[REDACTED]";
    return identifier.substr(0, 4) + "..." + identifier.substr(identifier.size() - 4);
}

LogLevel parseLogLevel(const std::string& name, LogLevel def) {
    std::string v = Formatter::toLower(Formatter::trim(name));
    if (v == "trace") return LogLevel::TRACE;
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARN;
    if (v == "error") return LogLevel::ERROR;
    if (v == "fatal") return LogLevel::FATAL;
    if (v == "off") return LogLevel::OFF;
    return def;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "OFF  ";
    }
}

}
}
