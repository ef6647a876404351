#pragma once

/**
 * Log level usage for the matching core and its shells.
 *
 * ERROR:   Batch-fatal conditions
 *          - Payload rejected by the decoder
 *          - Matching fault that aborts a strict batch
 *          - Rollup host unreachable, notice/report not delivered
 *
 * WARN:    Degraded but recoverable
 *          - Runtime config tuple rejected, defaults applied
 *          - Trades truncated by the batch cap
 *          - Instrument isolated in best-effort mode
 *          - Invalid value in the config file, default kept
 *
 * INFO:    Lifecycle and per-batch summaries
 *          - Service start/stop, config loaded
 *          - One line per processed batch (orders, trades, dust, mode)
 *
 * DEBUG:   Per-order and per-trade detail
 *          - Dust orders dropped
 *          - Each executed trade, each skipped pairing
 *
 * Usage Examples:
 *
 * LOG_ERROR_COMP("ABI_CODEC", "Decode failed: " + message);
 * LOG_WARN_COMP("BATCH_LIMITER", "Dropped " + std::to_string(n) + " trades");
 * LOG_INFO_COMP("BATCH_PROCESSOR", "Batch complete");
 * LOG_DEBUG_COMP("MATCHING_ENGINE", "Trade " + std::to_string(buy_id));
 */

namespace logging {

// Component tags used across the tree.
namespace components {
    constexpr const char* ABI_CODEC = "ABI_CODEC";
    constexpr const char* FEE_MODEL = "FEE_MODEL";
    constexpr const char* PARTITIONER = "PARTITIONER";
    constexpr const char* MATCHING_ENGINE = "MATCHING_ENGINE";
    constexpr const char* BATCH_LIMITER = "BATCH_LIMITER";
    constexpr const char* BATCH_PROCESSOR = "BATCH_PROCESSOR";
    constexpr const char* ROLLUP_ADAPTER = "ROLLUP_ADAPTER";
    constexpr const char* CONFIG = "CONFIG";
    constexpr const char* APP_SERVICE = "APP_SERVICE";
}

} // namespace logging
