#pragma once

#include "../matching/batch_processor.hpp"
#include "../utils/http/i_http_handler.hpp"
#include <json/json.h>
#include <atomic>
#include <memory>
#include <string>

namespace rollup {

enum class FinishStatus {
    ACCEPT,
    REJECT
};

enum class PollOutcome {
    IDLE,       // 202, nothing pending
    ADVANCED,   // advance request processed
    INSPECTED,  // inspect request answered
    FAILED      // transport error or malformed host response
};

struct RollupStats {
    std::atomic<uint64_t> finishes{0};
    std::atomic<uint64_t> advances{0};
    std::atomic<uint64_t> inspects{0};
    std::atomic<uint64_t> notices{0};
    std::atomic<uint64_t> reports{0};
    std::atomic<uint64_t> http_errors{0};
};

/**
 * Drives the batch processor from the rollup host's HTTP API.
 *
 * Each poll posts /finish with the verdict on the previous request and
 * handles whatever request comes back: advance payloads are matched and
 * answered with a notice (accept) or a report (reject); inspect requests
 * get the processor status as a report.
 */
class RollupAdapter {
public:
    RollupAdapter(std::shared_ptr<IHttpHandler> http,
                  const std::string& base_url,
                  matching::BatchProcessor& processor,
                  int timeout_ms);

    PollOutcome poll_once();

    FinishStatus next_finish_status() const { return next_status_; }
    const RollupStats& stats() const { return stats_; }
    const std::string& base_url() const { return base_url_; }
    int timeout_ms() const { return timeout_ms_; }

    static const char* finish_status_name(FinishStatus status);

private:
    FinishStatus handle_advance(const std::string& payload_hex);
    void handle_inspect();

    bool send_notice(const std::string& payload_hex);
    // Failures are logged; the finish verdict does not depend on them.
    void send_report(const std::string& message);
    HttpResponse post_json(const std::string& path, const Json::Value& body);

    std::shared_ptr<IHttpHandler> http_;
    std::string base_url_;
    matching::BatchProcessor& processor_;
    int timeout_ms_;

    FinishStatus next_status_{FinishStatus::ACCEPT};
    RollupStats stats_;
};

} // namespace rollup
