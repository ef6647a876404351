#include "partitioner.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_levels.hpp"
#include <map>
#include <set>

namespace matching {

PartitionResult partition_orders(const std::vector<Order>& buy_orders,
                                 const std::vector<Order>& sell_orders,
                                 const Quantity& min_trade_amount) {
    PartitionResult result;
    std::map<Address, size_t> group_index;
    std::set<OrderId> seen;

    for (const auto* orders : {&buy_orders, &sell_orders}) {
        for (const auto& order : *orders) {
            if (order.quantity < min_trade_amount) {
                ++result.dust_dropped;
                LOG_DEBUG_COMP(logging::components::PARTITIONER,
                               "Dropping dust order " + to_string(order.id) +
                               " (quantity " + to_string(order.quantity) +
                               " < " + to_string(min_trade_amount) + ")");
                continue;
            }
            if (!seen.insert(order.id).second) {
                throw error_handling::DecodeError("duplicate order id " + to_string(order.id));
            }

            auto [it, inserted] = group_index.emplace(order.instrument, result.groups.size());
            if (inserted) {
                InstrumentGroup group;
                group.instrument = order.instrument;
                result.groups.push_back(std::move(group));
            }

            Order copy = order;
            copy.filled = 0;
            result.groups[it->second].orders.push_back(copy);
            ++result.orders_kept;
        }
    }

    LOG_DEBUG_COMP(logging::components::PARTITIONER,
                   std::to_string(result.orders_kept) + " orders in " +
                   std::to_string(result.groups.size()) + " instruments, " +
                   std::to_string(result.dust_dropped) + " dust dropped");
    return result;
}

} // namespace matching
