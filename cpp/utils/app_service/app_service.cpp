#include "app_service.hpp"
#include "../logging/log_helper.hpp"
#include "../logging/log_levels.hpp"
#include <fstream>
#include <stdexcept>

namespace app_service {

std::atomic<AppService*> AppService::g_instance{nullptr};
std::atomic<bool> AppService::g_stats_requested{false};

AppService::AppService(const std::string& service_name)
    : service_name_(service_name), running_(false), initialized_(false) {
    statistics_.reset();
}

AppService::~AppService() {
    stop();
    AppService* self = this;
    g_instance.compare_exchange_strong(self, nullptr);
}

bool AppService::initialize(int argc, char** argv) {
    if (initialized_.load()) {
        return true;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--config" || arg == "--stats-interval") && i + 1 >= argc) {
            LOG_ERROR_COMP(logging::components::APP_SERVICE, "Missing value for " + arg);
            return false;
        }

        if (arg == "--config") {
            config_file_ = argv[++i];
            config_file_required_ = true;
        } else if (arg == "--stats-interval") {
            try {
                stats_interval_seconds_ = std::stoi(argv[++i]);
            } catch (const std::exception& e) {
                LOG_ERROR_COMP(logging::components::APP_SERVICE, "Invalid --stats-interval: " + std::string(e.what()));
                return false;
            }
        } else if (arg == "--help") {
            LOG_INFO_COMP(logging::components::APP_SERVICE, "Usage: " + service_name_ + " [options]");
            LOG_INFO_COMP(logging::components::APP_SERVICE, "Options:");
            LOG_INFO_COMP(logging::components::APP_SERVICE, "  --config <file>               Configuration file path");
            LOG_INFO_COMP(logging::components::APP_SERVICE, "  --stats-interval <seconds>    Statistics reporting interval");
            LOG_INFO_COMP(logging::components::APP_SERVICE, "  --help                        Show this help message");
            return false;
        } else {
            LOG_WARN_COMP(logging::components::APP_SERVICE, "Ignoring unknown argument " + arg);
        }
    }

    if (config_file_.empty()) {
        config_file_ = "config/matcher.ini";
    }

    config_manager_ = std::make_unique<config::ProcessConfigManager>();
    if (std::ifstream(config_file_).good() || config_file_required_) {
        if (!config_manager_->load_config(config_file_)) {
            LOG_ERROR_COMP(logging::components::APP_SERVICE, "Failed to load configuration from " + config_file_);
            return false;
        }
    } else {
        LOG_WARN_COMP(logging::components::APP_SERVICE, "No config file at " + config_file_ + ", using defaults");
    }
    config_manager_->apply_env_overrides(config::default_env_bindings());

    logging::initialize_logging(config_manager_->get_log_file(),
                                logging::LogManager::level_from_string(config_manager_->get_log_level()));

    print_startup_banner();
    LOG_INFO_COMP(logging::components::APP_SERVICE, "Config file: " + config_file_);

    setup_signal_handlers();

    if (!configure_service()) {
        LOG_ERROR_COMP(logging::components::APP_SERVICE, "Service configuration failed");
        return false;
    }

    initialized_.store(true);
    LOG_INFO_COMP(logging::components::APP_SERVICE, "Service initialized successfully");
    return true;
}

void AppService::start() {
    if (!initialized_.load()) {
        LOG_ERROR_COMP(logging::components::APP_SERVICE, "Service not initialized");
        return;
    }

    if (running_.load()) {
        LOG_INFO_COMP(logging::components::APP_SERVICE, "Service already running");
        return;
    }

    stop_requested_.store(false);
    statistics_.start_time = std::chrono::system_clock::now();

    if (!start_service()) {
        LOG_ERROR_COMP(logging::components::APP_SERVICE, "Failed to start service");
        stop_service();
        return;
    }

    running_.store(true);
    stats_running_.store(true);
    stats_thread_ = std::thread(&AppService::stats_reporting_loop, this);

    LOG_INFO_COMP(logging::components::APP_SERVICE, "Service started successfully");

    // Main loop; returns once a stop is requested
    while (!stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::system_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - statistics_.start_time);
        statistics_.uptime_seconds.store(uptime.count());

        if (g_stats_requested.exchange(false)) {
            log_service_totals();
            print_service_stats();
        }
    }

    stop();
}

void AppService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO_COMP(logging::components::APP_SERVICE, "Stopping service...");
    stop_requested_.store(true);

    stats_running_.store(false);
    if (stats_thread_.joinable()) {
        stats_thread_.join();
    }

    stop_service();

    print_shutdown_banner();
}

void AppService::setup_signal_handlers() {
    g_instance.store(this);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, signal_handler);  // For statistics dump
}

void AppService::stats_reporting_loop() {
    auto last_report = std::chrono::steady_clock::now();
    while (stats_running_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_report < std::chrono::seconds(stats_interval_seconds_)) {
            continue;
        }
        last_report = now;

        log_service_totals();
        print_service_stats();
    }
}

void AppService::log_service_totals() {
    LOG_INFO_COMP(logging::components::APP_SERVICE,
                  service_name_ + " uptime=" + std::to_string(statistics_.uptime_seconds.load()) + "s" +
                  " processed=" + std::to_string(statistics_.messages_processed.load()) +
                  " errors=" + std::to_string(statistics_.errors_count.load()));
}

void AppService::signal_handler(int signal) {
    if (signal == SIGUSR1) {
        g_stats_requested.store(true);
        return;
    }
    AppService* instance = g_instance.load();
    if (instance) {
        instance->request_stop();
    }
}

void AppService::print_startup_banner() {
    LOG_INFO_COMP(logging::components::APP_SERVICE, "=========================================");
    LOG_INFO_COMP(logging::components::APP_SERVICE, "  " + service_name_ + " Service Starting");
    LOG_INFO_COMP(logging::components::APP_SERVICE, "=========================================");
}

void AppService::print_shutdown_banner() {
    LOG_INFO_COMP(logging::components::APP_SERVICE, "=========================================");
    LOG_INFO_COMP(logging::components::APP_SERVICE, "  " + service_name_ + " Service Stopped");
    LOG_INFO_COMP(logging::components::APP_SERVICE, "=========================================");
}

} // namespace app_service
