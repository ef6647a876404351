#include "batch_limiter.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"

namespace matching {

BatchLimiter::BatchLimiter(uint64_t max_trades)
    : max_trades_(max_trades) {
}

size_t BatchLimiter::admit(std::vector<Trade>& trades, const Address& instrument) {
    const uint64_t budget = remaining();
    size_t dropped = 0;
    if (trades.size() > budget) {
        dropped = trades.size() - static_cast<size_t>(budget);
        trades.resize(static_cast<size_t>(budget));
        dropped_ += dropped;
        LOG_WARN_COMP(logging::components::BATCH_LIMITER,
                      "Trade cap " + std::to_string(max_trades_) + " reached at " + instrument.to_hex() +
                      ", dropped " + std::to_string(dropped) + " trades");
    }
    emitted_ += trades.size();
    return dropped;
}

} // namespace matching
