#pragma once
#include <memory>
#include <string>
#include <atomic>
#include <thread>
#include <chrono>
#include <signal.h>
#include "../config/process_config_manager.hpp"

namespace app_service {

/**
 * Base for the long-running matcher processes.
 *
 * initialize() parses --config / --stats-interval / --help, loads the INI
 * file (optional unless --config was given), layers the environment on top
 * and starts logging from [logging]. start() runs the service until SIGINT,
 * SIGTERM or request_stop(); SIGUSR1 asks for a statistics dump.
 */
class AppService {
public:
    AppService(const std::string& service_name);
    virtual ~AppService();

    bool initialize(int argc, char** argv);
    // Blocks until a stop is requested.
    void start();
    void stop();
    void request_stop() { stop_requested_.store(true); }

    struct Statistics {
        std::atomic<uint64_t> messages_processed{0};
        std::atomic<uint64_t> errors_count{0};
        std::atomic<uint64_t> uptime_seconds{0};

        std::chrono::system_clock::time_point start_time;

        void reset() {
            messages_processed.store(0);
            errors_count.store(0);
            uptime_seconds.store(0);
            start_time = std::chrono::system_clock::now();
        }
    };

    const Statistics& get_statistics() const { return statistics_; }

protected:
    virtual bool configure_service() = 0;
    virtual bool start_service() = 0;
    virtual void stop_service() = 0;
    virtual void print_service_stats() = 0;

    void increment_message_count() { statistics_.messages_processed.fetch_add(1); }
    void increment_error_count() { statistics_.errors_count.fetch_add(1); }

    config::ProcessConfigManager* get_config_manager() { return config_manager_.get(); }

private:
    std::string service_name_;
    std::string config_file_;
    bool config_file_required_{false};
    int stats_interval_seconds_{30};

    std::atomic<bool> running_;
    std::atomic<bool> initialized_;
    std::atomic<bool> stop_requested_{false};

    std::unique_ptr<config::ProcessConfigManager> config_manager_;
    std::thread stats_thread_;
    std::atomic<bool> stats_running_{false};

    Statistics statistics_;

    void setup_signal_handlers();
    void stats_reporting_loop();
    void log_service_totals();
    void print_startup_banner();
    void print_shutdown_banner();

    // Signal handlers only set flags; the main loop acts on them.
    static std::atomic<AppService*> g_instance;
    static std::atomic<bool> g_stats_requested;
    static void signal_handler(int signal);
};

} // namespace app_service
