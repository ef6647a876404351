#include "matching_engine.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"
#include <algorithm>

using error_handling::MatchingError;

namespace matching {

MatchingEngine::MatchingEngine(const EffectiveConfig& config)
    : config_(config) {
}

MatchResult MatchingEngine::match_instrument(const InstrumentGroup& group) const {
    return error_handling::safe_execute([this, &group]() { return match_or_throw(group); },
                                        error_handling::ErrorKind::MATCHING,
                                        logging::components::MATCHING_ENGINE,
                                        "match_instrument " + group.instrument.to_hex());
}

InstrumentMatch MatchingEngine::match_or_throw(const InstrumentGroup& group) const {
    std::vector<Order> buys;
    std::vector<Order> sells;
    for (const auto& order : group.orders) {
        if (order.instrument != group.instrument) {
            throw MatchingError("order " + to_string(order.id) + " belongs to " +
                                order.instrument.to_hex() + ", not " + group.instrument.to_hex());
        }
        if (order.filled > order.quantity) {
            throw MatchingError("order " + to_string(order.id) + " overfilled on entry");
        }
        (order.is_buy() ? buys : sells).push_back(order);
    }

    std::sort(buys.begin(), buys.end(), [](const Order& a, const Order& b) {
        return a.limit_price != b.limit_price ? a.limit_price > b.limit_price : a.id < b.id;
    });
    std::sort(sells.begin(), sells.end(), [](const Order& a, const Order& b) {
        return a.limit_price != b.limit_price ? a.limit_price < b.limit_price : a.id < b.id;
    });

    InstrumentMatch result;
    result.instrument = group.instrument;

    const Quantity min_trade = config_.min_trade_amount;
    const size_t step_budget = buys.size() + sells.size();
    size_t i = 0;
    size_t j = 0;

    while (i < buys.size() && j < sells.size() && buys[i].limit_price >= sells[j].limit_price) {
        if (++result.steps > step_budget) {
            throw MatchingError("step budget of " + std::to_string(step_budget) + " exceeded");
        }

        Order& buy = buys[i];
        Order& sell = sells[j];
        const Quantity tradable = std::min(buy.remaining(), sell.remaining());

        if (tradable >= min_trade) {
            result.trades.push_back(execute_trade(buy, sell, tradable));
        } else {
            ++result.skipped_pairings;
            LOG_DEBUG_COMP(logging::components::MATCHING_ENGINE,
                           "Skipping pair " + to_string(buy.id) + "/" + to_string(sell.id) +
                           ": tradable " + to_string(tradable) + " below minimum " +
                           to_string(min_trade));
        }

        const bool advance_buy = buy.remaining() < min_trade;
        const bool advance_sell = sell.remaining() < min_trade;
        if (!advance_buy && !advance_sell) {
            throw MatchingError("no progress at pair " + to_string(buy.id) + "/" + to_string(sell.id));
        }
        if (advance_buy) ++i;
        if (advance_sell) ++j;
    }

    result.orders.reserve(buys.size() + sells.size());
    result.orders.insert(result.orders.end(), buys.begin(), buys.end());
    result.orders.insert(result.orders.end(), sells.begin(), sells.end());
    return result;
}

Trade MatchingEngine::execute_trade(Order& buy, Order& sell, const Quantity& quantity) const {
    const Order& maker = buy.id < sell.id ? buy : sell;
    const Price price = maker.limit_price;
    const FeeBreakdown fees = compute_trade_fees(quantity, price, config_);

    buy.filled += quantity;
    sell.filled += quantity;
    if (buy.filled > buy.quantity || sell.filled > sell.quantity) {
        throw MatchingError("fill exceeds quantity at pair " + to_string(buy.id) + "/" +
                            to_string(sell.id));
    }

    Trade trade;
    trade.buy_order_id = buy.id;
    trade.sell_order_id = sell.id;
    trade.buyer = buy.trader;
    trade.seller = sell.trader;
    trade.instrument = buy.instrument;
    trade.execution_price = price;
    trade.quantity = quantity;
    trade.total_fee = fees.total_fee;

    LOG_DEBUG_COMP(logging::components::MATCHING_ENGINE,
                   "Trade " + to_string(buy.id) + "/" + to_string(sell.id) + " " +
                   to_string(quantity) + " @ " + to_string(price) +
                   " fee " + to_string(fees.total_fee));
    return trade;
}

} // namespace matching
