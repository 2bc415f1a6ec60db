#pragma once

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace coursedao {
namespace utils {

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
};

// Process-wide logger. Writes to the console (ERROR and above on stderr,
// the rest on clog) and, after init(), to a size rotated file. The most
// recent entries stay in memory.
class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    static void setMaxFileSize(uint64_t bytes);
    static void setMaxFiles(uint32_t count);

    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    // Runs outside the logger lock for every entry that passes the level.
    static void onLog(std::function<void(const LogEntry&)> callback);
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static uint64_t getLogCount();
    static uint64_t getErrorCount();
    static void clearLogs();

    static void setAllowSensitiveLogging(bool allow);
    // Shortens account identifiers unless sensitive logging is on.
    static std::string redactAddress(const std::string& address);
};

#define LOG_TRACE(msg) coursedao::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (coursedao::utils::Logger::getLevel() <= coursedao::utils::LogLevel::DEBUG) coursedao::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) coursedao::utils::Logger::info(msg)
#define LOG_WARN(msg) coursedao::utils::Logger::warn(msg)
#define LOG_ERROR(msg) coursedao::utils::Logger::error(msg)
#define LOG_CAT(level, category, msg) coursedao::utils::Logger::log(coursedao::utils::LogLevel::level, category, msg)

}
}
