#include "rollup_service.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"
#include <chrono>
#include <climits>

namespace rollup {

namespace {

// HTTP timeouts are handed to curl as int milliseconds.
int load_timeout_ms(const config::ProcessConfigManager& config) {
    const int fallback = constants::rollup::DEFAULT_TIMEOUT_MS;
    if (!config.has_key("rollup", "timeout_ms")) {
        return fallback;
    }
    const uint64_t value = config.get_uint64("rollup", "timeout_ms", fallback);
    if (value == 0 || value > static_cast<uint64_t>(INT_MAX)) {
        LOG_ERROR_COMP(logging::components::CONFIG,
                       "Rejected [rollup] timeout_ms = " + std::to_string(value) +
                       ", keeping " + std::to_string(fallback));
        return fallback;
    }
    return static_cast<int>(value);
}

} // namespace

RollupService::RollupService()
    : AppService("rollup_server") {
}

RollupService::~RollupService() {
    stop();
    stop_service();
}

bool RollupService::configure_service() {
    config::ProcessConfigManager* config = get_config_manager();

    const auto defaults = matching::EngineDefaults::from_config(*config);
    processor_ = std::make_unique<matching::BatchProcessor>(defaults);

    const std::string url = config->get_string("rollup", "url", constants::rollup::DEFAULT_URL);
    const int timeout_ms = load_timeout_ms(*config);

    if (!http_) {
        try {
            http_ = HttpHandlerFactory::create(HttpHandlerFactory::Type::CURL);
        } catch (const std::exception& e) {
            LOG_ERROR_COMP(logging::components::ROLLUP_ADAPTER, "Cannot create HTTP handler: " + std::string(e.what()));
            return false;
        }
    }
    http_->set_default_timeout(timeout_ms);
    if (!http_->initialize()) {
        LOG_ERROR_COMP(logging::components::ROLLUP_ADAPTER, "HTTP handler failed to initialize");
        return false;
    }

    adapter_ = std::make_unique<RollupAdapter>(http_, url, *processor_, timeout_ms);
    LOG_INFO_COMP(logging::components::ROLLUP_ADAPTER, "Rollup host " + adapter_->base_url());
    return true;
}

bool RollupService::start_service() {
    if (!adapter_) {
        return false;
    }
    polling_.store(true);
    worker_thread_ = std::thread(&RollupService::poll_loop, this);
    return true;
}

void RollupService::stop_service() {
    polling_.store(false);
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void RollupService::poll_loop() {
    while (polling_.load()) {
        const PollOutcome outcome = adapter_->poll_once();
        if (outcome == PollOutcome::ADVANCED || outcome == PollOutcome::INSPECTED) {
            increment_message_count();
        } else {
            if (outcome == PollOutcome::FAILED) {
                increment_error_count();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(constants::rollup::IDLE_BACKOFF_MS));
        }
    }
}

void RollupService::print_service_stats() {
    if (!adapter_) {
        return;
    }
    const RollupStats& stats = adapter_->stats();
    LOG_INFO_COMP(logging::components::ROLLUP_ADAPTER,
                  "advances=" + std::to_string(stats.advances.load()) +
                  " inspects=" + std::to_string(stats.inspects.load()) +
                  " notices=" + std::to_string(stats.notices.load()) +
                  " reports=" + std::to_string(stats.reports.load()) +
                  " http_errors=" + std::to_string(stats.http_errors.load()) +
                  " batches=" + std::to_string(processor_->batches_processed()) +
                  " failed=" + std::to_string(processor_->batches_failed()));
}

} // namespace rollup
