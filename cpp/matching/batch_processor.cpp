#include "batch_processor.hpp"
#include "abi_codec.hpp"
#include "batch_limiter.hpp"
#include "matching_engine.hpp"
#include "partitioner.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"

using error_handling::ErrorKind;

namespace matching {

Json::Value RequestResult::to_json() const {
    Json::Value root;
    root["type"] = type;
    if (is_notice()) {
        root["payload"] = payload;
    } else {
        root["message"] = message;
    }
    if (!instrument_errors.empty()) {
        Json::Value errors(Json::arrayValue);
        for (const auto& error : instrument_errors) {
            errors.append(error);
        }
        root["instrument_errors"] = errors;
    }
    return root;
}

std::string RequestResult::to_json_line() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, to_json());
}

BatchProcessor::BatchProcessor(const EngineDefaults& defaults)
    : defaults_(defaults) {
}

BatchOutcome BatchProcessor::report(ErrorKind kind, const std::string& message, const BatchStats& stats) {
    ++batches_failed_;
    BatchOutcome outcome;
    outcome.type = OutcomeType::REPORT;
    outcome.error_kind = kind;
    outcome.message = std::string(error_handling::error_kind_name(kind)) + ": " + message;
    outcome.stats = stats;
    LOG_ERROR_COMP(logging::components::BATCH_PROCESSOR, "Batch rejected, " + outcome.message);
    return outcome;
}

BatchOutcome BatchProcessor::process(const Bytes& payload) {
    ++batches_processed_;
    BatchStats stats;

    DecodeResult decoded = AbiCodec::decode_batch(payload);
    if (!decoded) {
        return report(decoded.kind(), decoded.error(), stats);
    }
    const DecodedBatch& batch = *decoded;

    std::string config_warning;
    if (!batch.config_error.empty()) {
        config_warning = std::string(error_handling::error_kind_name(ErrorKind::CONFIG)) + ": " + batch.config_error;
        LOG_WARN_COMP(logging::components::BATCH_PROCESSOR, config_warning + ", using defaults");
    }

    const EffectiveConfig config = resolve(defaults_, batch.runtime_config);
    stats.orders_received = batch.buy_orders.size() + batch.sell_orders.size();

    auto partitioned = error_handling::safe_execute(
        [&]() { return partition_orders(batch.buy_orders, batch.sell_orders, config.min_trade_amount); },
        ErrorKind::DECODE, logging::components::PARTITIONER, "partition_orders");
    if (!partitioned) {
        return report(partitioned.kind(), partitioned.error(), stats);
    }
    const PartitionResult& partition = *partitioned;
    stats.orders_kept = partition.orders_kept;
    stats.dust_dropped = partition.dust_dropped;
    stats.instruments = partition.groups.size();

    const MatchingEngine engine(config);
    BatchLimiter limiter(config.max_trades_per_batch);
    BatchOutcome outcome;

    for (const auto& group : partition.groups) {
        MatchResult result = engine.match_instrument(group);
        if (!result) {
            if (config.processing_mode == ProcessingMode::STRICT) {
                return report(result.kind(), "instrument " + group.instrument.to_hex() + ": " + result.error(), stats);
            }
            ++stats.instruments_failed;
            outcome.instrument_errors.push_back({group.instrument, result.error()});
            LOG_WARN_COMP(logging::components::BATCH_PROCESSOR,
                          "Isolated instrument " + group.instrument.to_hex() + ": " + result.error());
            continue;
        }

        InstrumentMatch& match = *result;
        stats.skipped_pairings += match.skipped_pairings;
        stats.trades_dropped += limiter.admit(match.trades, group.instrument);
        outcome.trades.insert(outcome.trades.end(), match.trades.begin(), match.trades.end());
    }

    stats.trades_emitted = outcome.trades.size();
    outcome.type = OutcomeType::NOTICE;
    outcome.payload = AbiCodec::encode_trades(outcome.trades);
    outcome.config_warning = config_warning;
    outcome.stats = stats;

    LOG_INFO_COMP(logging::components::BATCH_PROCESSOR,
                  "Batch matched: " + std::to_string(stats.orders_received) + " orders, " +
                  std::to_string(stats.instruments) + " instruments, " +
                  std::to_string(stats.trades_emitted) + " trades" +
                  (stats.trades_dropped ? ", " + std::to_string(stats.trades_dropped) + " over cap" : "") +
                  (stats.instruments_failed ? ", " + std::to_string(stats.instruments_failed) + " instruments failed" : ""));
    return outcome;
}

RequestResult BatchProcessor::handle_request(const std::string& payload_hex) {
    RequestResult result;

    Bytes payload;
    try {
        payload = from_hex(payload_hex);
    } catch (const error_handling::DecodeError& e) {
        ++batches_processed_;
        const BatchOutcome outcome = report(ErrorKind::DECODE, e.what(), BatchStats{});
        result.type = "report";
        result.message = outcome.message;
        return result;
    }

    const BatchOutcome outcome = process(payload);
    if (outcome.is_notice()) {
        result.type = "notice";
        result.payload = to_hex(outcome.payload);
        for (const auto& error : outcome.instrument_errors) {
            result.instrument_errors.push_back(error.instrument.to_hex() + ": " + error.message);
        }
    } else {
        result.type = "report";
        result.message = outcome.message;
    }
    return result;
}

Json::Value BatchProcessor::status() const {
    Json::Value root;
    root["max_trades_per_batch"] = Json::UInt64(defaults_.max_trades_per_batch);
    root["min_trade_amount"] = Json::UInt64(defaults_.min_trade_amount);
    root["maker_fee_bps"] = Json::UInt64(defaults_.maker_fee_bps);
    root["taker_fee_bps"] = Json::UInt64(defaults_.taker_fee_bps);
    root["fee_mode"] = fee_mode_name(defaults_.fee_mode);
    root["processing_mode"] = processing_mode_name(defaults_.processing_mode);

    Json::Value layouts(Json::arrayValue);
    layouts.append("legacy");
    layouts.append("current");
    root["payload_layouts"] = layouts;

    root["batches_processed"] = Json::UInt64(batches_processed_.load());
    root["batches_failed"] = Json::UInt64(batches_failed_.load());
    return root;
}

} // namespace matching
