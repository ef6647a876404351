#pragma once

#include "types.hpp"
#include <cstdint>
#include <vector>

namespace matching {

/**
 * Global trade cap across instruments. Groups are admitted in partitioner
 * order and the overflow of the group that crosses the cap is cut off; no
 * weighting between instruments.
 */
class BatchLimiter {
public:
    explicit BatchLimiter(uint64_t max_trades);

    // Truncates trades to the remaining budget; returns how many were dropped.
    size_t admit(std::vector<Trade>& trades, const Address& instrument);

    uint64_t remaining() const { return max_trades_ - emitted_; }
    uint64_t emitted() const { return emitted_; }
    uint64_t dropped() const { return dropped_; }
    bool exhausted() const { return emitted_ >= max_trades_; }

private:
    uint64_t max_trades_;
    uint64_t emitted_{0};
    uint64_t dropped_{0};
};

} // namespace matching
