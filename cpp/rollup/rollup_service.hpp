#pragma once

#include "rollup_adapter.hpp"
#include "../matching/batch_processor.hpp"
#include "../utils/app_service/app_service.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace rollup {

/**
 * Rollup service process: polls the host on a worker thread and feeds each
 * advance request through the batch processor, one batch at a time.
 */
class RollupService : public app_service::AppService {
public:
    RollupService();
    ~RollupService() override;

    // Replaces the curl handler; call before initialize().
    void set_http_handler(std::shared_ptr<IHttpHandler> http) { http_ = std::move(http); }

    const RollupAdapter* adapter() const { return adapter_.get(); }

protected:
    bool configure_service() override;
    bool start_service() override;
    void stop_service() override;
    void print_service_stats() override;

private:
    void poll_loop();

    std::shared_ptr<IHttpHandler> http_;
    std::unique_ptr<matching::BatchProcessor> processor_;
    std::unique_ptr<RollupAdapter> adapter_;

    std::thread worker_thread_;
    std::atomic<bool> polling_{false};
};

} // namespace rollup
