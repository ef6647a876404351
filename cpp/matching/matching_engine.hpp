#pragma once

#include "fee_model.hpp"
#include "partitioner.hpp"
#include "types.hpp"
#include "../utils/error_handling.hpp"
#include <vector>

namespace matching {

struct InstrumentMatch {
    Address instrument;
    std::vector<Trade> trades;

    // Orders after matching (buys in priority order, then sells), with fills.
    std::vector<Order> orders;

    size_t steps{0};
    size_t skipped_pairings{0};   // crossing pairs below the minimum trade
};

using MatchResult = error_handling::Result<InstrumentMatch>;

/**
 * Price-time priority crossing for one instrument at a time.
 *
 * Buys are ranked by (price desc, id asc), sells by (price asc, id asc).
 * The lower id of a pair is the maker and sets the execution price. After
 * each step every order whose remaining quantity is below the minimum
 * trade is passed over, so a group of n orders finishes in at most n steps.
 */
class MatchingEngine {
public:
    explicit MatchingEngine(const EffectiveConfig& config);

    // MATCHING error on an internal fault; groups never share state.
    MatchResult match_instrument(const InstrumentGroup& group) const;

private:
    InstrumentMatch match_or_throw(const InstrumentGroup& group) const;
    Trade execute_trade(Order& buy, Order& sell, const Quantity& quantity) const;

    EffectiveConfig config_;
};

} // namespace matching
