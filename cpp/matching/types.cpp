#include "types.hpp"
#include "../utils/error_handling.hpp"
#include <limits>
#include <stdexcept>

namespace matching {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string strip_prefix(const std::string& hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        return hex.substr(2);
    }
    return hex;
}

} // namespace

Address Address::from_hex(const std::string& hex) {
    std::string digits = strip_prefix(hex);
    if (digits.size() > 40) {
        throw std::invalid_argument("address longer than 20 bytes: " + hex);
    }
    digits.insert(0, 40 - digits.size(), '0');

    Address address;
    for (size_t i = 0; i < address.bytes.size(); ++i) {
        const int hi = hex_value(digits[2 * i]);
        const int lo = hex_value(digits[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex in address: " + hex);
        }
        address.bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return address;
}

std::string Address::to_hex() const {
    std::string out = "0x";
    out.reserve(2 + 2 * bytes.size());
    for (std::uint8_t b : bytes) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0f]);
    }
    return out;
}

std::string to_hex(const Bytes& data) {
    std::string out = "0x";
    out.reserve(2 + 2 * data.size());
    for (std::uint8_t b : data) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0f]);
    }
    return out;
}

Bytes from_hex(const std::string& hex) {
    const std::string digits = strip_prefix(hex);
    if (digits.size() % 2 != 0) {
        throw error_handling::DecodeError("hex payload has odd length " + std::to_string(digits.size()));
    }

    Bytes out;
    out.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        const int hi = hex_value(digits[i]);
        const int lo = hex_value(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw error_handling::DecodeError("invalid hex character at offset " + std::to_string(i));
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

const Uint256& max_uint256() {
    static const Uint256 value = std::numeric_limits<Uint256>::max();
    return value;
}

std::string to_string(const Uint256& value) {
    return value.str();
}

std::string to_string(const Uint512& value) {
    return value.str();
}

const char* side_name(Side side) {
    return side == Side::BUY ? "BUY" : "SELL";
}

} // namespace matching
