#include "fee_model.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace matching {

namespace {

std::string normalise(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(value.begin(), value.end(), '-', '_');
    return value;
}

uint64_t load_bounded(const config::ProcessConfigManager& config, const std::string& key,
                      uint64_t fallback, uint64_t min_value, uint64_t max_value) {
    if (!config.has_key("matching", key)) {
        return fallback;
    }
    const uint64_t value = config.get_uint64("matching", key, fallback);
    if (value < min_value || value > max_value) {
        LOG_ERROR_COMP(logging::components::CONFIG,
                       "Rejected [matching] " + key + " = " + std::to_string(value) +
                       ", keeping " + std::to_string(fallback));
        return fallback;
    }
    return value;
}

} // namespace

const char* fee_mode_name(FeeMode mode) {
    return mode == FeeMode::FLAT ? "flat" : "split";
}

const char* processing_mode_name(ProcessingMode mode) {
    return mode == ProcessingMode::BEST_EFFORT ? "best_effort" : "strict";
}

FeeMode parse_fee_mode(const std::string& name) {
    const std::string value = normalise(name);
    if (value == "split") return FeeMode::SPLIT;
    if (value == "flat") return FeeMode::FLAT;
    throw std::invalid_argument("unknown fee mode: " + name);
}

ProcessingMode parse_processing_mode(const std::string& name) {
    const std::string value = normalise(name);
    if (value == "strict") return ProcessingMode::STRICT;
    if (value == "best_effort") return ProcessingMode::BEST_EFFORT;
    throw std::invalid_argument("unknown processing mode: " + name);
}

EngineDefaults EngineDefaults::build_time() {
    EngineDefaults defaults{};
    defaults.max_trades_per_batch = constants::matching::DEFAULT_MAX_TRADES_PER_BATCH;
    defaults.min_trade_amount = constants::matching::DEFAULT_MIN_TRADE_AMOUNT;
    defaults.maker_fee_bps = constants::matching::DEFAULT_MAKER_FEE_BPS;
    defaults.taker_fee_bps = constants::matching::DEFAULT_TAKER_FEE_BPS;
    defaults.fee_mode = FeeMode::SPLIT;
    defaults.processing_mode = ProcessingMode::STRICT;
    return defaults;
}

EngineDefaults EngineDefaults::from_config(const config::ProcessConfigManager& config) {
    using namespace constants::matching;
    EngineDefaults defaults = build_time();

    defaults.max_trades_per_batch = load_bounded(config, "max_trades_per_batch",
                                                 defaults.max_trades_per_batch, 1, UINT64_MAX);
    defaults.min_trade_amount = load_bounded(config, "min_trade_amount",
                                             defaults.min_trade_amount, 1, UINT64_MAX);
    defaults.maker_fee_bps = load_bounded(config, "maker_fee_bps", defaults.maker_fee_bps, 0, MAX_FEE_BPS);
    defaults.taker_fee_bps = load_bounded(config, "taker_fee_bps", defaults.taker_fee_bps, 0, MAX_FEE_BPS);

    if (config.has_key("matching", "fee_mode")) {
        try {
            defaults.fee_mode = parse_fee_mode(config.get_string("matching", "fee_mode"));
        } catch (const std::invalid_argument& e) {
            LOG_ERROR_COMP(logging::components::CONFIG, std::string(e.what()) + ", keeping split");
        }
    }

    if (config.has_key("matching", "processing_mode")) {
        try {
            defaults.processing_mode = parse_processing_mode(config.get_string("matching", "processing_mode"));
        } catch (const std::invalid_argument& e) {
            LOG_ERROR_COMP(logging::components::CONFIG, std::string(e.what()) + ", keeping strict");
        }
    }

    LOG_INFO_COMP(logging::components::FEE_MODEL,
                  "Defaults: max_trades=" + std::to_string(defaults.max_trades_per_batch) +
                  " min_trade=" + std::to_string(defaults.min_trade_amount) +
                  " maker_bps=" + std::to_string(defaults.maker_fee_bps) +
                  " taker_bps=" + std::to_string(defaults.taker_fee_bps) +
                  " fee_mode=" + fee_mode_name(defaults.fee_mode) +
                  " processing_mode=" + processing_mode_name(defaults.processing_mode));
    return defaults;
}

EffectiveConfig resolve(const EngineDefaults& defaults, const std::optional<RuntimeConfig>& runtime) {
    EffectiveConfig config;
    config.max_trades_per_batch = defaults.max_trades_per_batch;
    config.min_trade_amount = defaults.min_trade_amount;
    config.maker_fee_bps = defaults.maker_fee_bps;
    config.taker_fee_bps = defaults.taker_fee_bps;
    config.fee_bps = defaults.taker_fee_bps;
    config.fee_mode = defaults.fee_mode;
    config.processing_mode = defaults.processing_mode;

    if (runtime) {
        config.runtime_override = true;
        config.timestamp = runtime->timestamp;
        // check_runtime_config has bounded it to 10000
        config.fee_bps = runtime->fee_bps.convert_to<uint64_t>();
        if (runtime->min_trade_amount != 0) {
            config.min_trade_amount = runtime->min_trade_amount;
        }
    }
    return config;
}

error_handling::Result<RuntimeConfig> check_runtime_config(const RuntimeConfig& runtime) {
    if (runtime.fee_bps > constants::matching::MAX_FEE_BPS) {
        return error_handling::Result<RuntimeConfig>::error(
            error_handling::ErrorKind::CONFIG,
            "runtime feeBps " + to_string(runtime.fee_bps) + " exceeds " +
            std::to_string(constants::matching::MAX_FEE_BPS));
    }
    return error_handling::Result<RuntimeConfig>::success(runtime);
}

Uint512 compute_fee(const Quantity& quantity, const Price& price, uint64_t bps) {
    if (bps > constants::matching::MAX_FEE_BPS) {
        throw std::invalid_argument("fee rate above 10000 bps: " + std::to_string(bps));
    }
    const Uint512 value = Uint512(quantity) * Uint512(price);
    const uint64_t denominator = constants::matching::BPS_DENOMINATOR;
    return (value / denominator) * bps + ((value % denominator) * bps) / denominator;
}

FeeBreakdown compute_trade_fees(const Quantity& quantity, const Price& price, const EffectiveConfig& config) {
    const Uint512 maker = compute_fee(quantity, price, config.maker_rate());
    const Uint512 taker = compute_fee(quantity, price, config.taker_rate());
    const Uint512 total = maker + taker;
    if (total > Uint512(max_uint256())) {
        throw error_handling::MatchingError("fee total " + to_string(total) + " exceeds 256 bits at quantity " +
                                            to_string(quantity) + ", price " + to_string(price));
    }

    FeeBreakdown fees;
    fees.maker_fee = static_cast<Uint256>(maker);
    fees.taker_fee = static_cast<Uint256>(taker);
    fees.total_fee = static_cast<Uint256>(total);
    return fees;
}

} // namespace matching
