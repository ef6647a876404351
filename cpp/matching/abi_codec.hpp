#pragma once

#include "types.hpp"
#include "../utils/error_handling.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace matching {

using DecodeResult = error_handling::Result<DecodedBatch>;

// Ethereum ABI encoding of batch payloads (32-byte big-endian words)
//
// Input, current layout:
//   abi.encode(Order[] buys, Order[] sells, (uint256 timestamp, uint256 feeBps, uint256 minTradeAmount))
// Input, legacy layout:
//   abi.encode(Order[] buys, Order[] sells)
// with Order = (uint256 id, address trader, address instrument, uint256 quantity, uint256 price, bool isBuy)
//
// Output:
//   abi.encode((uint256,uint256,address,address,address,uint256,uint256,uint256)[])
class AbiCodec {
public:
  static constexpr size_t ORDER_SIZE = 6 * 32;
  static constexpr size_t TRADE_SIZE = 8 * 32;

  // Picks the layout from the first head word, then decodes with that
  // schema only. Malformed input yields a DECODE error. A rejected runtime
  // tuple is not an error: it is reported through DecodedBatch::config_error.
  static DecodeResult decode_batch(const Bytes& payload);

  static Bytes encode_trades(const std::vector<Trade>& trades);

  // Inverse of encode_trades, for inspecting notices.
  static error_handling::Result<std::vector<Trade>> decode_trades(const Bytes& payload);

  // Builds a legacy payload when runtime is empty, a current one otherwise.
  static Bytes encode_batch(const std::vector<Order>& buys,
                            const std::vector<Order>& sells,
                            const std::optional<RuntimeConfig>& runtime);

private:
  static DecodedBatch decode_or_throw(const Bytes& payload);
};

} // namespace matching
