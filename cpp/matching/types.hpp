#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace matching {

// ABI uint256 words are carried at full width. Amounts and prices are
// 18-decimal fixed point, so 100 tokens is already past 2^64.
using Uint256  = boost::multiprecision::uint256_t;
// quantity * price before the fee division
using Uint512  = boost::multiprecision::uint512_t;

using OrderId  = Uint256;
using Quantity = Uint256;
using Price    = Uint256;
using Bytes    = std::vector<std::uint8_t>;

const Uint256& max_uint256();

enum class Side : uint8_t {
    BUY,
    SELL
};

/**
 * 20-byte account or token identifier, compared bytewise.
 */
struct Address {
    std::array<std::uint8_t, 20> bytes{};

    // Accepts up to 40 hex digits with optional 0x prefix, left-padded with
    // zeros. Throws std::invalid_argument on anything else.
    static Address from_hex(const std::string& hex);

    // Lower-case, 0x-prefixed, always 40 digits.
    std::string to_hex() const;

    bool operator==(const Address& other) const { return bytes == other.bytes; }
    bool operator!=(const Address& other) const { return bytes != other.bytes; }
    bool operator<(const Address& other) const { return bytes < other.bytes; }
};

struct Order {
    OrderId  id{0};
    Address  trader;
    Address  instrument;
    Quantity quantity{0};
    Price    limit_price{0};
    Side     side{Side::BUY};

    // Only field that changes during a batch.
    Quantity filled{0};

    Quantity remaining() const noexcept { return quantity - filled; }
    bool is_buy() const noexcept { return side == Side::BUY; }
};

/**
 * Optional per-batch tuple appended to the current payload layout.
 */
struct RuntimeConfig {
    Uint256  timestamp{0};
    Uint256  fee_bps{0};
    Quantity min_trade_amount{0};
};

struct Trade {
    OrderId  buy_order_id{0};
    OrderId  sell_order_id{0};
    Address  buyer;
    Address  seller;
    Address  instrument;
    Price    execution_price{0};
    Quantity quantity{0};
    Uint256  total_fee{0};
};

enum class PayloadVersion : uint8_t {
    LEGACY,     // two order arrays
    CURRENT     // two order arrays + runtime config tuple
};

struct DecodedBatch {
    PayloadVersion version{PayloadVersion::LEGACY};
    std::vector<Order> buy_orders;
    std::vector<Order> sell_orders;

    // Set when the payload carried a usable runtime tuple.
    std::optional<RuntimeConfig> runtime_config;

    // Non-empty when a runtime tuple was present but rejected.
    std::string config_error;
};

// Hex helpers shared by the codec and the shells. from_hex throws
// error_handling::DecodeError on odd length or non-hex characters.
std::string to_hex(const Bytes& data);
Bytes from_hex(const std::string& hex);

// Decimal rendering for log and error messages.
std::string to_string(const Uint256& value);
std::string to_string(const Uint512& value);

const char* side_name(Side side);

} // namespace matching
