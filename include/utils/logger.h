#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace paycore {
namespace utils {

struct LogConfig;

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    uint64_t timestamp;
    uint64_t threadId;
};

// Process-wide logger. File output is optional; entries are kept in a
// bounded ring and handed to the registered callback after the lock is
// released.
class Logger {
public:
    static void init(const std::string& path);
    // Applies level, rotation limits and console flag; the file is placed in dir.
    static void configure(const LogConfig& cfg, const std::string& dir);
    static void shutdown();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void log(LogLevel level, const std::string& category, const std::string& msg);
    static void onLog(std::function<void(const LogEntry&)> callback);

    static std::vector<LogEntry> recent(size_t count = 100);
    static uint64_t errorCount();
    static void clear();

    static void setAllowSensitiveLogging(bool allow);
    // Masks values following password, secret, token, signature, card and cvv.
    static std::string redact(const std::string& msg);
    // Keeps the first and last four characters of an account identifier.
    static std::string redactIdentifier(const std::string& identifier);
};

LogLevel parseLogLevel(const std::string& name, LogLevel def = LogLevel::INFO);
const char* logLevelName(LogLevel level);

#define LOG_DEBUG(cat, msg) do { if (paycore::utils::Logger::getLevel() <= paycore::utils::LogLevel::DEBUG) paycore::utils::Logger::log(paycore::utils::LogLevel::DEBUG, cat, msg); } while(0)
#define LOG_INFO(cat, msg) paycore::utils::Logger::log(paycore::utils::LogLevel::INFO, cat, msg)
#define LOG_WARN(cat, msg) paycore::utils::Logger::log(paycore::utils::LogLevel::WARN, cat, msg)
#define LOG_ERROR(cat, msg) paycore::utils::Logger::log(paycore::utils::LogLevel::ERROR, cat, msg)

}
}
