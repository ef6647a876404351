#include "abi_codec.hpp"
#include "fee_model.hpp"
#include "../utils/constants.hpp"
#include "../utils/logging/log_helper.hpp"
#include "../utils/logging/log_levels.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <string>

using error_handling::DecodeError;
using error_handling::ErrorKind;

namespace matching {

namespace {

constexpr size_t WORD = constants::abi::WORD_SIZE;

std::string hex_offset(size_t value) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  do {
    out.insert(out.begin(), digits[value & 0x0f]);
    value >>= 4;
  } while (value != 0);
  return "0x" + out;
}

const uint8_t* word_at(const Bytes& payload, size_t pos, const std::string& field) {
  if (pos > payload.size() || payload.size() - pos < WORD) {
    throw DecodeError(field + " at " + hex_offset(pos) + " runs past end of payload (" +
                      std::to_string(payload.size()) + " bytes)");
  }
  return payload.data() + pos;
}

bool upper_bytes_zero(const uint8_t* word, size_t count) {
  for (size_t i = 0; i < count; ++i) {
    if (word[i] != 0) {
      return false;
    }
  }
  return true;
}

// Offsets and lengths only; amounts go through read_u256.
uint64_t read_u64(const Bytes& payload, size_t pos, const std::string& field) {
  const uint8_t* word = word_at(payload, pos, field);
  if (!upper_bytes_zero(word, WORD - 8)) {
    throw DecodeError(field + " exceeds 64 bits");
  }
  uint64_t value = 0;
  for (size_t i = WORD - 8; i < WORD; ++i) {
    value = (value << 8) | word[i];
  }
  return value;
}

Uint256 read_u256(const Bytes& payload, size_t pos, const std::string& field) {
  const uint8_t* word = word_at(payload, pos, field);
  Uint256 value;
  boost::multiprecision::import_bits(value, word, word + WORD);
  return value;
}

Address read_address(const Bytes& payload, size_t pos, const std::string& field) {
  const uint8_t* word = word_at(payload, pos, field);
  if (!upper_bytes_zero(word, WORD - constants::abi::ADDRESS_SIZE)) {
    throw DecodeError(field + " has non-zero upper bytes");
  }
  Address address;
  std::copy(word + WORD - constants::abi::ADDRESS_SIZE, word + WORD, address.bytes.begin());
  return address;
}

bool read_bool(const Bytes& payload, size_t pos, const std::string& field) {
  const uint8_t* word = word_at(payload, pos, field);
  if (!upper_bytes_zero(word, WORD - 1) || word[WORD - 1] > 1) {
    throw DecodeError(field + " is not a valid bool");
  }
  return word[WORD - 1] == 1;
}

std::vector<Order> read_order_array(const Bytes& payload, size_t offset, Side side, const char* name) {
  const std::string array = name;
  const uint64_t length = read_u64(payload, offset, array + " length");
  const size_t available = (payload.size() - offset - WORD) / AbiCodec::ORDER_SIZE;
  if (length > available) {
    throw DecodeError(array + " length " + std::to_string(length) + " runs past end of payload");
  }

  std::vector<Order> orders;
  orders.reserve(static_cast<size_t>(length));
  for (size_t i = 0; i < length; ++i) {
    const size_t base = offset + WORD + i * AbiCodec::ORDER_SIZE;
    const std::string prefix = array + "[" + std::to_string(i) + "].";

    Order order;
    order.id = read_u256(payload, base, prefix + "id");
    order.trader = read_address(payload, base + WORD, prefix + "trader");
    order.instrument = read_address(payload, base + 2 * WORD, prefix + "instrument");
    order.quantity = read_u256(payload, base + 3 * WORD, prefix + "quantity");
    order.limit_price = read_u256(payload, base + 4 * WORD, prefix + "price");
    const bool is_buy = read_bool(payload, base + 5 * WORD, prefix + "isBuy");
    if (is_buy != (side == Side::BUY)) {
      throw DecodeError(prefix + "isBuy disagrees with " + array);
    }
    order.side = side;
    orders.push_back(order);
  }
  return orders;
}

size_t read_array_offset(const Bytes& payload, size_t pos, size_t head_size, const std::string& field) {
  const uint64_t offset = read_u64(payload, pos, field);
  if (offset < head_size || offset > payload.size()) {
    throw DecodeError(field + " " + hex_offset(static_cast<size_t>(offset)) + " out of bounds");
  }
  return static_cast<size_t>(offset);
}

void append_uint(Bytes& out, Uint256 value) {
  uint8_t word[WORD] = {};
  for (size_t i = 0; i < WORD; ++i) {
    word[WORD - 1 - i] = static_cast<uint8_t>((value & 0xff).convert_to<unsigned>());
    value >>= 8;
  }
  out.insert(out.end(), word, word + WORD);
}

void append_address(Bytes& out, const Address& address) {
  out.insert(out.end(), WORD - constants::abi::ADDRESS_SIZE, 0);
  out.insert(out.end(), address.bytes.begin(), address.bytes.end());
}

void append_orders(Bytes& out, const std::vector<Order>& orders, bool is_buy) {
  append_uint(out, orders.size());
  for (const auto& order : orders) {
    append_uint(out, order.id);
    append_address(out, order.trader);
    append_address(out, order.instrument);
    append_uint(out, order.quantity);
    append_uint(out, order.limit_price);
    append_uint(out, is_buy ? 1 : 0);
  }
}

} // namespace

DecodeResult AbiCodec::decode_batch(const Bytes& payload) {
  return error_handling::safe_execute([&payload]() { return decode_or_throw(payload); },
                                      ErrorKind::DECODE, logging::components::ABI_CODEC, "decode_batch");
}

DecodedBatch AbiCodec::decode_or_throw(const Bytes& payload) {
  const uint64_t first = read_u64(payload, 0, "head");

  DecodedBatch batch;
  size_t head_size = 0;
  if (first == constants::abi::CURRENT_HEAD_SIZE) {
    batch.version = PayloadVersion::CURRENT;
    head_size = constants::abi::CURRENT_HEAD_SIZE;
  } else if (first == constants::abi::LEGACY_HEAD_SIZE) {
    batch.version = PayloadVersion::LEGACY;
    head_size = constants::abi::LEGACY_HEAD_SIZE;
  } else {
    throw DecodeError("unknown payload layout (buy array offset " + std::to_string(first) + ")");
  }
  if (payload.size() < head_size) {
    throw DecodeError("payload shorter than its head (" + std::to_string(payload.size()) + " bytes)");
  }

  const size_t buys_offset = read_array_offset(payload, 0, head_size, "buyOrders offset");
  const size_t sells_offset = read_array_offset(payload, WORD, head_size, "sellOrders offset");
  batch.buy_orders = read_order_array(payload, buys_offset, Side::BUY, "buyOrders");
  batch.sell_orders = read_order_array(payload, sells_offset, Side::SELL, "sellOrders");

  if (batch.version == PayloadVersion::CURRENT) {
    RuntimeConfig runtime;
    runtime.timestamp = read_u256(payload, 2 * WORD, "timestamp");
    runtime.fee_bps = read_u256(payload, 3 * WORD, "feeBps");
    runtime.min_trade_amount = read_u256(payload, 4 * WORD, "minTradeAmount");
    auto checked = check_runtime_config(runtime);
    if (checked) {
      batch.runtime_config = *checked;
    } else {
      batch.config_error = checked.error();
    }
  }

  LOG_DEBUG_COMP(logging::components::ABI_CODEC,
                 std::string("Decoded ") + (batch.version == PayloadVersion::CURRENT ? "current" : "legacy") +
                 " payload: " + std::to_string(batch.buy_orders.size()) + " buys, " +
                 std::to_string(batch.sell_orders.size()) + " sells");
  return batch;
}

Bytes AbiCodec::encode_trades(const std::vector<Trade>& trades) {
  Bytes out;
  out.reserve(2 * WORD + trades.size() * TRADE_SIZE);
  append_uint(out, WORD);
  append_uint(out, trades.size());
  for (const auto& trade : trades) {
    append_uint(out, trade.buy_order_id);
    append_uint(out, trade.sell_order_id);
    append_address(out, trade.buyer);
    append_address(out, trade.seller);
    append_address(out, trade.instrument);
    append_uint(out, trade.execution_price);
    append_uint(out, trade.quantity);
    append_uint(out, trade.total_fee);
  }
  return out;
}

error_handling::Result<std::vector<Trade>> AbiCodec::decode_trades(const Bytes& payload) {
  auto decode = [&payload]() {
    const uint64_t offset = read_u64(payload, 0, "trades offset");
    if (offset > payload.size()) {
      throw DecodeError("trades offset out of bounds");
    }
    const uint64_t length = read_u64(payload, static_cast<size_t>(offset), "trades length");
    if (length > (payload.size() - offset - WORD) / TRADE_SIZE) {
      throw DecodeError("trades length " + std::to_string(length) + " runs past end of payload");
    }

    std::vector<Trade> trades;
    for (size_t i = 0; i < length; ++i) {
      const size_t base = static_cast<size_t>(offset) + WORD + i * TRADE_SIZE;
      const std::string prefix = "trades[" + std::to_string(i) + "].";
      Trade trade;
      trade.buy_order_id = read_u256(payload, base, prefix + "buyOrderId");
      trade.sell_order_id = read_u256(payload, base + WORD, prefix + "sellOrderId");
      trade.buyer = read_address(payload, base + 2 * WORD, prefix + "buyer");
      trade.seller = read_address(payload, base + 3 * WORD, prefix + "seller");
      trade.instrument = read_address(payload, base + 4 * WORD, prefix + "instrument");
      trade.execution_price = read_u256(payload, base + 5 * WORD, prefix + "price");
      trade.quantity = read_u256(payload, base + 6 * WORD, prefix + "quantity");
      trade.total_fee = read_u256(payload, base + 7 * WORD, prefix + "totalFee");
      trades.push_back(trade);
    }
    return trades;
  };
  return error_handling::safe_execute(decode, ErrorKind::DECODE, logging::components::ABI_CODEC, "decode_trades");
}

Bytes AbiCodec::encode_batch(const std::vector<Order>& buys,
                             const std::vector<Order>& sells,
                             const std::optional<RuntimeConfig>& runtime) {
  const size_t head_size = runtime ? constants::abi::CURRENT_HEAD_SIZE : constants::abi::LEGACY_HEAD_SIZE;
  const size_t buys_size = WORD + buys.size() * ORDER_SIZE;

  Bytes out;
  out.reserve(head_size + buys_size + WORD + sells.size() * ORDER_SIZE);
  append_uint(out, head_size);
  append_uint(out, head_size + buys_size);
  if (runtime) {
    append_uint(out, runtime->timestamp);
    append_uint(out, runtime->fee_bps);
    append_uint(out, runtime->min_trade_amount);
  }
  append_orders(out, buys, true);
  append_orders(out, sells, false);
  return out;
}

} // namespace matching
