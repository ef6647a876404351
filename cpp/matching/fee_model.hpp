#pragma once

#include "types.hpp"
#include "../utils/config/process_config_manager.hpp"
#include "../utils/error_handling.hpp"
#include <optional>
#include <string>

namespace matching {

enum class FeeMode {
    SPLIT,  // maker and taker rates from build-time configuration
    FLAT    // taker pays the single effective rate, maker pays nothing
};

enum class ProcessingMode {
    STRICT,
    BEST_EFFORT
};

const char* fee_mode_name(FeeMode mode);
const char* processing_mode_name(ProcessingMode mode);

// Throw std::invalid_argument on unknown names.
FeeMode parse_fee_mode(const std::string& name);
ProcessingMode parse_processing_mode(const std::string& name);

/**
 * Process-wide defaults, loaded once at startup and never mutated.
 */
struct EngineDefaults {
    uint64_t max_trades_per_batch;
    uint64_t min_trade_amount;
    uint64_t maker_fee_bps;
    uint64_t taker_fee_bps;
    FeeMode fee_mode{FeeMode::SPLIT};
    ProcessingMode processing_mode{ProcessingMode::STRICT};

    // Values from constants.hpp.
    static EngineDefaults build_time();

    // Build-time values overlaid by the [matching] section. Invalid entries
    // are logged and the build-time value is kept.
    static EngineDefaults from_config(const config::ProcessConfigManager& config);
};

/**
 * Per-batch configuration: defaults merged with the optional runtime tuple.
 */
struct EffectiveConfig {
    uint64_t max_trades_per_batch{0};
    Quantity min_trade_amount{0};
    uint64_t maker_fee_bps{0};
    uint64_t taker_fee_bps{0};
    uint64_t fee_bps{0};
    Uint256  timestamp{0};
    FeeMode fee_mode{FeeMode::SPLIT};
    ProcessingMode processing_mode{ProcessingMode::STRICT};
    bool runtime_override{false};

    uint64_t maker_rate() const { return fee_mode == FeeMode::FLAT ? 0 : maker_fee_bps; }
    uint64_t taker_rate() const { return fee_mode == FeeMode::FLAT ? fee_bps : taker_fee_bps; }
};

EffectiveConfig resolve(const EngineDefaults& defaults, const std::optional<RuntimeConfig>& runtime);

// CONFIG error when the tuple carries a fee rate above 100%.
error_handling::Result<RuntimeConfig> check_runtime_config(const RuntimeConfig& runtime);

/**
 * floor(quantity * price * bps / 10000), exact: the product of two uint256
 * values always fits in 512 bits and the division is split so nothing
 * wraps. Throws std::invalid_argument when bps exceeds 10000.
 */
Uint512 compute_fee(const Quantity& quantity, const Price& price, uint64_t bps);

struct FeeBreakdown {
    Uint256 maker_fee{0};
    Uint256 taker_fee{0};
    Uint256 total_fee{0};
};

// Throws error_handling::MatchingError if the total does not fit the
// 256-bit output word.
FeeBreakdown compute_trade_fees(const Quantity& quantity, const Price& price, const EffectiveConfig& config);

} // namespace matching
