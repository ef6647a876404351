#pragma once
#include "../../matching/fee_model.hpp"
#include "../../matching/types.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace fixtures {

inline matching::Address addr(const std::string& hex) {
    return matching::Address::from_hex(hex);
}

// Token and trader addresses used across the tests
inline matching::Address token_a() { return addr("0x00000000000000000000000000000000000000aa"); }
inline matching::Address token_b() { return addr("0x00000000000000000000000000000000000000bb"); }
inline matching::Address alice() { return addr("0x1111111111111111111111111111111111111111"); }
inline matching::Address bob() { return addr("0x2222222222222222222222222222222222222222"); }
inline matching::Address carol() { return addr("0x3333333333333333333333333333333333333333"); }

// Whole token amounts in 18-decimal fixed point
inline matching::Uint256 tokens(uint64_t whole) {
    return matching::Uint256(whole) * 1000000000000000000ULL;
}

// Quantity and price large enough that any fee on their product overflows
// the 256-bit fee word.
inline matching::Uint256 huge() { return matching::max_uint256(); }

// Overwrites the ABI word at pos with low_bytes right-aligned, as an
// external encoder would write a wide value.
inline void patch_word(matching::Bytes& payload, size_t pos, const std::vector<uint8_t>& low_bytes) {
    std::fill(payload.begin() + pos, payload.begin() + pos + 32, 0);
    std::copy(low_bytes.begin(), low_bytes.end(), payload.begin() + pos + 32 - low_bytes.size());
}

// 100e18 as a big-endian word tail
inline std::vector<uint8_t> hundred_tokens_word() {
    return {0x05, 0x6b, 0xc7, 0x5e, 0x2d, 0x63, 0x10, 0x00, 0x00};
}

inline matching::Order make_order(matching::OrderId id, const matching::Address& trader,
                                  const matching::Address& instrument, matching::Quantity quantity,
                                  matching::Price price, matching::Side side) {
    matching::Order order;
    order.id = id;
    order.trader = trader;
    order.instrument = instrument;
    order.quantity = quantity;
    order.limit_price = price;
    order.side = side;
    return order;
}

inline matching::Order buy(matching::OrderId id, matching::Quantity quantity, matching::Price price,
                           const matching::Address& instrument = token_a(),
                           const matching::Address& trader = alice()) {
    return make_order(id, trader, instrument, quantity, price, matching::Side::BUY);
}

inline matching::Order sell(matching::OrderId id, matching::Quantity quantity, matching::Price price,
                            const matching::Address& instrument = token_a(),
                            const matching::Address& trader = bob()) {
    return make_order(id, trader, instrument, quantity, price, matching::Side::SELL);
}

inline matching::EngineDefaults defaults(uint64_t max_trades = 1000, uint64_t min_trade = 1,
                                         uint64_t maker_bps = 10, uint64_t taker_bps = 20) {
    matching::EngineDefaults value = matching::EngineDefaults::build_time();
    value.max_trades_per_batch = max_trades;
    value.min_trade_amount = min_trade;
    value.maker_fee_bps = maker_bps;
    value.taker_fee_bps = taker_bps;
    return value;
}

inline matching::EffectiveConfig effective(uint64_t min_trade = 1, uint64_t maker_bps = 10, uint64_t taker_bps = 20) {
    return matching::resolve(defaults(1000, min_trade, maker_bps, taker_bps), std::nullopt);
}

} // namespace fixtures
