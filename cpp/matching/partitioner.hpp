#pragma once

#include "types.hpp"
#include <vector>

namespace matching {

struct InstrumentGroup {
    Address instrument;
    std::vector<Order> orders;
};

struct PartitionResult {
    // Ordered by first occurrence of the instrument (buys array, then sells).
    std::vector<InstrumentGroup> groups;
    size_t orders_kept{0};
    size_t dust_dropped{0};
};

// Drops orders below min_trade_amount and groups the rest by instrument.
// Throws error_handling::DecodeError if two kept orders share an id; a
// dust order is dropped before that check and never aborts the batch.
PartitionResult partition_orders(const std::vector<Order>& buy_orders,
                                 const std::vector<Order>& sell_orders,
                                 const Quantity& min_trade_amount);

} // namespace matching
