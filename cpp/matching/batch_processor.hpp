#pragma once

#include "fee_model.hpp"
#include "types.hpp"
#include "../utils/error_handling.hpp"
#include <json/json.h>
#include <atomic>
#include <string>
#include <vector>

namespace matching {

enum class OutcomeType {
    NOTICE,
    REPORT
};

struct InstrumentError {
    Address instrument;
    std::string message;
};

struct BatchStats {
    size_t orders_received{0};
    size_t orders_kept{0};
    size_t dust_dropped{0};
    size_t instruments{0};
    size_t instruments_failed{0};
    size_t trades_emitted{0};
    size_t trades_dropped{0};
    size_t skipped_pairings{0};
};

/**
 * Result of one batch. A notice carries the encoded trades (and, in
 * best-effort mode, the instruments that failed). A report carries only the
 * error; it never carries a partial trade array.
 */
struct BatchOutcome {
    OutcomeType type{OutcomeType::REPORT};
    Bytes payload;
    std::vector<Trade> trades;
    std::vector<InstrumentError> instrument_errors;
    error_handling::ErrorKind error_kind{error_handling::ErrorKind::NONE};
    std::string message;
    std::string config_warning;
    BatchStats stats;

    bool is_notice() const { return type == OutcomeType::NOTICE; }
};

/**
 * What the shells see: {"type":"notice","payload":"0x.."} or
 * {"type":"report","message":".."}.
 */
struct RequestResult {
    std::string type;
    std::string payload;
    std::string message;
    std::vector<std::string> instrument_errors;

    bool is_notice() const { return type == "notice"; }
    Json::Value to_json() const;
    std::string to_json_line() const;
};

class BatchProcessor {
public:
    explicit BatchProcessor(const EngineDefaults& defaults);

    BatchOutcome process(const Bytes& payload);

    // Hex in, notice/report out. Invalid hex is reported as a DecodeError.
    RequestResult handle_request(const std::string& payload_hex);

    // Read-only view of the configured defaults.
    Json::Value status() const;

    const EngineDefaults& defaults() const { return defaults_; }
    uint64_t batches_processed() const { return batches_processed_.load(); }
    uint64_t batches_failed() const { return batches_failed_.load(); }

private:
    BatchOutcome report(error_handling::ErrorKind kind, const std::string& message, const BatchStats& stats);

    EngineDefaults defaults_;
    // Read by the stats thread of the rollup service.
    std::atomic<uint64_t> batches_processed_{0};
    std::atomic<uint64_t> batches_failed_{0};
};

} // namespace matching
