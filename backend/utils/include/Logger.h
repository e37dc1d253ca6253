#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace Logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    CRITICAL = 4
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string details;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& det = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), details(det) {}
};

/**
 * @brief Parse "debug", "info", "warning"/"warn", "error", "critical"/"crit" (case-insensitive)
 */
std::optional<LogLevel> ParseLogLevel(const std::string& name);

/**
 * @brief Thread-safe asynchronous logger shared by the wallet core and its front ends
 *
 * Entries are queued by the caller and written by a single worker thread, so logging
 * never blocks on file I/O inside a balance query or settlement.
 */
class Logger {
public:
    static Logger& getInstance();

    /**
     * @brief Start the worker and open the sink
     * @param logFilePath Log file (appended); empty means console only
     * @param minLevel Minimum level recorded
     * @param enableConsole Echo entries to stdout/stderr
     * @return false if the log file could not be opened
     */
    bool initialize(const std::string& logFilePath, LogLevel minLevel = LogLevel::INFO, bool enableConsole = false);

    /**
     * @brief Drain the queue, stop the worker and close the file
     */
    void shutdown();

    void log(LogLevel level, const std::string& component, const std::string& message, const std::string& details = "");

    void debug(const std::string& component, const std::string& message, const std::string& details = "");
    void info(const std::string& component, const std::string& message, const std::string& details = "");
    void warning(const std::string& component, const std::string& message, const std::string& details = "");
    void error(const std::string& component, const std::string& message, const std::string& details = "");
    void critical(const std::string& component, const std::string& message, const std::string& details = "");

    void setMinLevel(LogLevel level);

    /**
     * @brief Most recent entries, oldest first (for a UI log view or tests)
     */
    std::vector<LogEntry> getRecentEntries(size_t maxEntries = 100) const;

    void clearRecentEntries();

    static std::string logLevelToString(LogLevel level);

private:
    Logger() : m_initialized(false), m_minLevel(LogLevel::INFO), m_enableConsole(false), m_shutdown(false) {}
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void logWorker();
    std::string formatLogEntry(const LogEntry& entry) const;

private:
    std::atomic<bool> m_initialized;
    std::atomic<LogLevel> m_minLevel;
    std::atomic<bool> m_enableConsole;
    std::atomic<bool> m_shutdown;

    std::string m_logFilePath;
    std::ofstream m_logFile;

    std::queue<LogEntry> m_logQueue;
    mutable std::mutex m_queueMutex;
    std::condition_variable m_queueCondition;
    std::thread m_logWorker;

    mutable std::mutex m_entriesMutex;
    std::vector<LogEntry> m_recentEntries;
    static constexpr size_t MAX_RECENT_ENTRIES = 1000;
};

/**
 * @brief RAII timing of one operation; logs failure or success exactly once
 */
class ScopedLogger {
public:
    ScopedLogger(const std::string& component, const std::string& operation);
    ~ScopedLogger();

    void success(const std::string& details = "");
    void failure(const std::string& error, const std::string& details = "");
    void addContext(const std::string& key, const std::string& value);

private:
    long long elapsedMs() const;

    std::string m_component;
    std::string m_operation;
    std::chrono::steady_clock::time_point m_startTime;
    bool m_completed;
    std::string m_context;
};

} // namespace Logging

#define SOLDESK_LOG_DEBUG(component, message, ...) \
    Logging::Logger::getInstance().debug(component, message, ##__VA_ARGS__)

#define SOLDESK_LOG_INFO(component, message, ...) \
    Logging::Logger::getInstance().info(component, message, ##__VA_ARGS__)

#define SOLDESK_LOG_WARNING(component, message, ...) \
    Logging::Logger::getInstance().warning(component, message, ##__VA_ARGS__)

#define SOLDESK_LOG_ERROR(component, message, ...) \
    Logging::Logger::getInstance().error(component, message, ##__VA_ARGS__)

#define SOLDESK_LOG_CRITICAL(component, message, ...) \
    Logging::Logger::getInstance().critical(component, message, ##__VA_ARGS__)

#define SOLDESK_SCOPED_LOG(component, operation) \
    Logging::ScopedLogger _scopedLogger(component, operation)
