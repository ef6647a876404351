#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {

std::unique_ptr<Logger> g_logger = std::make_unique<Logger>("MATCHER");

LogEntry::LogEntry(LogLevel lvl, const std::string& msg, const std::string& comp)
    : level(lvl), message(msg), component(comp), timestamp_us(0) {
    timestamp_us = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::stringstream ss;
    ss << std::this_thread::get_id();
    thread_id = ss.str();
}

void LogManager::initialize(const std::string& log_file, LogLevel min_level) {
    if (running_.load()) {
        return;
    }
    min_level_.store(min_level);

    if (!log_file.empty()) {
        file_stream_.open(log_file, std::ios::app);
        if (!file_stream_.is_open()) {
            std::cerr << "[LOG_MANAGER] Failed to open log file: " << log_file << std::endl;
        }
    }

    running_.store(true);
    log_thread_ = std::thread(&LogManager::log_worker, this);
}

void LogManager::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }
    cv_.notify_all();

    if (log_thread_.joinable()) {
        log_thread_.join();
    }

    // Anything queued after the worker's last pass is flushed here.
    std::lock_guard<std::mutex> lock(queue_mutex_);
    while (!log_queue_.empty()) {
        write_log(log_queue_.front());
        log_queue_.pop();
    }

    if (file_stream_.is_open()) {
        file_stream_.close();
    }
}

void LogManager::log(const LogEntry& entry) {
    if (entry.level < min_level_.load()) {
        return;
    }

    if (!running_.load()) {
        std::lock_guard<std::mutex> lock(write_mutex_);
        write_log(entry);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        log_queue_.push(entry);
    }
    cv_.notify_one();
}

std::string LogManager::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel LogManager::level_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

void LogManager::log_worker() {
    while (running_.load()) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        cv_.wait(lock, [this] { return !log_queue_.empty() || !running_.load(); });

        while (!log_queue_.empty()) {
            LogEntry entry = log_queue_.front();
            log_queue_.pop();
            lock.unlock();

            write_log(entry);

            lock.lock();
        }
    }
}

void LogManager::write_log(const LogEntry& entry) {
    const std::string formatted = format_log_entry(entry);

    std::cerr << formatted << std::endl;

    if (file_stream_.is_open()) {
        file_stream_ << formatted << std::endl;
        file_stream_.flush();
    }
}

std::string LogManager::format_log_entry(const LogEntry& entry) const {
    std::stringstream ss;

    auto time_t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point(std::chrono::microseconds(entry.timestamp_us)));
    std::tm tm{};
    localtime_r(&time_t, &tm);

    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(6) << (entry.timestamp_us % 1000000);
    ss << " [" << level_to_string(entry.level) << "]";
    if (!entry.component.empty()) {
        ss << " [" << entry.component << "]";
    }
    ss << " [T" << entry.thread_id << "] " << entry.message;

    return ss.str();
}

void initialize_logging(const std::string& log_file, LogLevel min_level) {
    LogManager::get_instance().initialize(log_file, min_level);
    LOG_INFO("Logging initialized at level " + LogManager::level_to_string(min_level) +
             (log_file.empty() ? std::string() : " (file: " + log_file + ")"));
}

void cleanup_logging() {
    LOG_INFO("Logging shutting down");
    LogManager::get_instance().shutdown();
}

} // namespace logging
