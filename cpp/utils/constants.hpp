#pragma once

#include <cstddef>
#include <cstdint>

/**
 * System-wide constants
 *
 * Build-time defaults and wire-format sizes. Runtime values come from the
 * config file, the environment and the per-batch runtime tuple, layered on
 * top of these.
 */

namespace constants {

// Build-time matching defaults
namespace matching {
    constexpr uint64_t DEFAULT_MAX_TRADES_PER_BATCH = 1000;
    constexpr uint64_t DEFAULT_MIN_TRADE_AMOUNT = 1;
    constexpr uint64_t DEFAULT_MAKER_FEE_BPS = 10;        // 0.10%
    constexpr uint64_t DEFAULT_TAKER_FEE_BPS = 20;        // 0.20%
    constexpr uint64_t BPS_DENOMINATOR = 10000;
    constexpr uint64_t MAX_FEE_BPS = BPS_DENOMINATOR;     // 100%
}

// Ethereum ABI layout
namespace abi {
    constexpr size_t WORD_SIZE = 32;
    constexpr size_t ADDRESS_SIZE = 20;
    constexpr size_t ORDER_WORDS = 6;                     // id, trader, instrument, qty, price, isBuy
    constexpr size_t TRADE_WORDS = 8;                     // buyId, sellId, buyer, seller, instrument, price, qty, fee
    constexpr size_t RUNTIME_CONFIG_WORDS = 3;            // timestamp, feeBps, minTradeAmount

    // Head sizes double as version markers: the first head word is the buy
    // array offset, which equals the head size for canonical encodings.
    constexpr size_t LEGACY_HEAD_SIZE = 2 * WORD_SIZE;                               // 0x40
    constexpr size_t CURRENT_HEAD_SIZE = (2 + RUNTIME_CONFIG_WORDS) * WORD_SIZE;     // 0xA0
}

// Rollup host HTTP API
namespace rollup {
    constexpr const char* DEFAULT_URL = "http://127.0.0.1:5004";
    constexpr int DEFAULT_TIMEOUT_MS = 30000;
    constexpr int IDLE_BACKOFF_MS = 100;                  // sleep after an idle or failed /finish
    constexpr int STATUS_ACCEPTED = 200;
    constexpr int STATUS_NO_PENDING = 202;
}

// offchain_matcher exit codes
namespace cli {
    constexpr int EXIT_NOTICE = 0;
    constexpr int EXIT_REPORT = 1;
    constexpr int EXIT_USAGE = 2;                         // bad arguments or unreadable config
}

// Logging intervals
namespace logging {
    constexpr int STATUS_UPDATE_INTERVAL_SECONDS = 300;   // 5 minutes
}

} // namespace constants
