#pragma once
#include <string>
#include <memory>
#include <atomic>
#include <thread>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <fstream>

namespace logging {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string component;
    std::string thread_id;
    // Wall clock, decoration only
    uint64_t timestamp_us;

    LogEntry(LogLevel lvl, const std::string& msg, const std::string& comp = "");
};

/**
 * Process-wide log sink.
 *
 * Before initialize() entries are written synchronously by the calling
 * thread, so the one-shot CLI and the tests get their output without a
 * background writer. After initialize() entries are queued and drained by a
 * worker thread until shutdown(). Everything goes to stderr (plus the
 * optional file); stdout belongs to the CLI's JSON result.
 */
class LogManager {
public:
    static LogManager& get_instance() {
        static LogManager instance;
        return instance;
    }

    void initialize(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO);
    void shutdown();

    void log(const LogEntry& entry);

    LogLevel get_level() const { return min_level_.load(); }

    static std::string level_to_string(LogLevel level);
    // Case-insensitive; unknown names map to INFO.
    static LogLevel level_from_string(const std::string& name);

private:
    LogManager() = default;
    ~LogManager() { shutdown(); }

    void log_worker();
    void write_log(const LogEntry& entry);
    std::string format_log_entry(const LogEntry& entry) const;

    std::atomic<LogLevel> min_level_{LogLevel::INFO};
    std::ofstream file_stream_;

    std::atomic<bool> running_{false};
    std::thread log_thread_;
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::mutex write_mutex_;
    std::condition_variable cv_;
};

class Logger {
public:
    Logger(const std::string& component) : component_(component) {}

    void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    void info(const std::string& message) { log(LogLevel::INFO, message); }
    void warn(const std::string& message) { log(LogLevel::WARN, message); }
    void error(const std::string& message) { log(LogLevel::ERROR, message); }

    void log(LogLevel level, const std::string& message) {
        LogManager::get_instance().log(LogEntry(level, message, component_));
    }

private:
    std::string component_;
};

// Process logger for messages without a component tag
extern std::unique_ptr<Logger> g_logger;

#define LOG_INFO(msg) if (logging::g_logger) logging::g_logger->info(msg)

// Starts the background writer; until then entries are written inline.
void initialize_logging(const std::string& log_file = "", LogLevel min_level = LogLevel::INFO);

void cleanup_logging();

} // namespace logging
