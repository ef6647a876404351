#include <doctest/doctest.h>
#include "../../../matching/abi_codec.hpp"
#include "../../fixtures/order_fixtures.hpp"
#include <stdexcept>

using matching::AbiCodec;
using matching::Bytes;

namespace codec_test {

// Legacy layout offsets for the first buy order
constexpr size_t BUY_LENGTH = 0x40;
constexpr size_t BUY0 = 0x60;
constexpr size_t SELL0 = 0x140;

Bytes legacy_payload() {
    return AbiCodec::encode_batch({fixtures::buy(1, 100, 10)}, {fixtures::sell(2, 50, 9)}, std::nullopt);
}

Bytes current_payload(const matching::RuntimeConfig& runtime) {
    return AbiCodec::encode_batch({fixtures::buy(1, 100, 10)}, {fixtures::sell(2, 50, 9)}, runtime);
}

uint64_t word_u64(const Bytes& data, size_t pos) {
    uint64_t value = 0;
    for (size_t i = pos + 24; i < pos + 32; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

} // namespace codec_test

TEST_CASE("AbiCodec - Legacy Layout Decodes") {
    Bytes payload = codec_test::legacy_payload();
    CHECK(payload.size() == 0x40 + 2 * (32 + AbiCodec::ORDER_SIZE));

    auto decoded = AbiCodec::decode_batch(payload);
    REQUIRE(decoded.is_success());

    const auto& batch = decoded.value();
    CHECK(batch.version == matching::PayloadVersion::LEGACY);
    CHECK_FALSE(batch.runtime_config.has_value());
    CHECK(batch.config_error.empty());
    REQUIRE(batch.buy_orders.size() == 1);
    REQUIRE(batch.sell_orders.size() == 1);

    const auto& buy = batch.buy_orders[0];
    CHECK(buy.id == 1);
    CHECK(buy.trader == fixtures::alice());
    CHECK(buy.instrument == fixtures::token_a());
    CHECK(buy.quantity == 100);
    CHECK(buy.limit_price == 10);
    CHECK(buy.side == matching::Side::BUY);
    CHECK(buy.filled == 0);
    CHECK(batch.sell_orders[0].side == matching::Side::SELL);
}

TEST_CASE("AbiCodec - Current Layout Decodes Runtime Config") {
    auto decoded = AbiCodec::decode_batch(codec_test::current_payload({1700000000, 25, 3}));
    REQUIRE(decoded.is_success());

    const auto& batch = decoded.value();
    CHECK(batch.version == matching::PayloadVersion::CURRENT);
    REQUIRE(batch.runtime_config.has_value());
    CHECK(batch.runtime_config->timestamp == 1700000000);
    CHECK(batch.runtime_config->fee_bps == 25);
    CHECK(batch.runtime_config->min_trade_amount == 3);
    CHECK(batch.buy_orders.size() == 1);
    CHECK(batch.sell_orders.size() == 1);
}

TEST_CASE("AbiCodec - Empty Order Arrays") {
    auto decoded = AbiCodec::decode_batch(AbiCodec::encode_batch({}, {}, std::nullopt));
    REQUIRE(decoded.is_success());
    CHECK(decoded.value().buy_orders.empty());
    CHECK(decoded.value().sell_orders.empty());
}

TEST_CASE("AbiCodec - Malformed Payloads Are Decode Errors") {
    Bytes payload = codec_test::legacy_payload();

    SUBCASE("empty payload") {
        payload.clear();
    }
    SUBCASE("unknown head offset") {
        payload[31] = 0x60;
    }
    SUBCASE("truncated payload") {
        payload.resize(payload.size() - 1);
    }
    SUBCASE("array length past end") {
        payload[codec_test::BUY_LENGTH + 31] = 200;
    }
    SUBCASE("sell offset out of bounds") {
        payload[32 + 30] = 0xff;
    }
    SUBCASE("address with dirty upper bytes") {
        payload[codec_test::BUY0 + 32] = 0x01;
    }
    SUBCASE("bool other than 0 or 1") {
        payload[codec_test::BUY0 + 5 * 32 + 31] = 2;
    }
    SUBCASE("isBuy disagrees with its array") {
        payload[codec_test::BUY0 + 5 * 32 + 31] = 0;
    }
    SUBCASE("array length wider than 64 bits") {
        payload[codec_test::BUY_LENGTH + 23] = 0x01;
    }

    auto decoded = AbiCodec::decode_batch(payload);
    CHECK(decoded.is_error());
    CHECK(decoded.kind() == error_handling::ErrorKind::DECODE);
    CHECK_FALSE(decoded.error().empty());
}

TEST_CASE("AbiCodec - Full Width Order Words") {
    Bytes payload = codec_test::legacy_payload();
    fixtures::patch_word(payload, codec_test::BUY0 + 3 * 32, fixtures::hundred_tokens_word());
    fixtures::patch_word(payload, codec_test::SELL0 + 3 * 32, fixtures::hundred_tokens_word());

    auto decoded = AbiCodec::decode_batch(payload);
    REQUIRE(decoded.is_success());
    CHECK(decoded.value().buy_orders[0].quantity == fixtures::tokens(100));
    CHECK(decoded.value().sell_orders[0].quantity == fixtures::tokens(100));

    SUBCASE("every bit of the word is kept") {
        const matching::Uint256 id = matching::max_uint256() - 1;
        Bytes wide = AbiCodec::encode_batch({fixtures::buy(id, fixtures::huge(), fixtures::tokens(2))}, {},
                                            std::nullopt);
        auto batch = AbiCodec::decode_batch(wide);
        REQUIRE(batch.is_success());
        CHECK(batch.value().buy_orders[0].id == id);
        CHECK(batch.value().buy_orders[0].quantity == fixtures::huge());
        CHECK(batch.value().buy_orders[0].limit_price == fixtures::tokens(2));
        CHECK(wide[codec_test::BUY0] == 0xff);
        CHECK(wide[codec_test::BUY0 + 31] == 0xfe);
    }
}

TEST_CASE("AbiCodec - Duplicate Order Ids Decode") {
    // Uniqueness is checked once dust is gone, in the partitioner.
    Bytes payload = AbiCodec::encode_batch({fixtures::buy(7, 10, 10)}, {fixtures::sell(7, 10, 10)}, std::nullopt);

    auto decoded = AbiCodec::decode_batch(payload);
    REQUIRE(decoded.is_success());
    CHECK(decoded.value().buy_orders[0].id == decoded.value().sell_orders[0].id);
}

TEST_CASE("AbiCodec - Malformed Runtime Tuple Falls Back") {
    SUBCASE("fee above 100%") {
        auto decoded = AbiCodec::decode_batch(codec_test::current_payload({0, 10001, 1}));
        REQUIRE(decoded.is_success());
        CHECK_FALSE(decoded.value().runtime_config.has_value());
        CHECK(decoded.value().config_error.find("feeBps") != std::string::npos);
    }

    SUBCASE("fee word far above 100%") {
        Bytes payload = codec_test::current_payload({0, 10, 1});
        payload[3 * 32] = 0x01;
        auto decoded = AbiCodec::decode_batch(payload);
        REQUIRE(decoded.is_success());
        CHECK_FALSE(decoded.value().runtime_config.has_value());
        CHECK(decoded.value().config_error.find("feeBps") != std::string::npos);
        CHECK(decoded.value().buy_orders.size() == 1);
    }
}

TEST_CASE("AbiCodec - Wide Runtime Words Are Accepted") {
    Bytes payload = codec_test::current_payload({0, 10, 1});
    fixtures::patch_word(payload, 4 * 32, fixtures::hundred_tokens_word());
    payload[2 * 32] = 0x01;

    auto decoded = AbiCodec::decode_batch(payload);
    REQUIRE(decoded.is_success());
    REQUIRE(decoded.value().runtime_config.has_value());
    CHECK(decoded.value().runtime_config->timestamp == (matching::Uint256(1) << 248));
    CHECK(decoded.value().runtime_config->min_trade_amount == fixtures::tokens(100));
}

TEST_CASE("AbiCodec - Encode Trades Layout") {
    matching::Trade trade;
    trade.buy_order_id = 1;
    trade.sell_order_id = 2;
    trade.buyer = fixtures::alice();
    trade.seller = fixtures::bob();
    trade.instrument = fixtures::token_a();
    trade.execution_price = 10;
    trade.quantity = 50;
    trade.total_fee = 1;

    Bytes encoded = AbiCodec::encode_trades({trade});

    REQUIRE(encoded.size() == 64 + AbiCodec::TRADE_SIZE);
    CHECK(codec_test::word_u64(encoded, 0) == 0x20);
    CHECK(codec_test::word_u64(encoded, 32) == 1);
    CHECK(codec_test::word_u64(encoded, 64) == 1);
    CHECK(codec_test::word_u64(encoded, 96) == 2);
    CHECK(encoded[128 + 12] == 0x11);
    CHECK(encoded[160 + 12] == 0x22);
    CHECK(encoded[192 + 31] == 0xaa);
    CHECK(codec_test::word_u64(encoded, 224) == 10);
    CHECK(codec_test::word_u64(encoded, 256) == 50);
    CHECK(codec_test::word_u64(encoded, 288) == 1);

    auto decoded = AbiCodec::decode_trades(encoded);
    REQUIRE(decoded.is_success());
    REQUIRE(decoded.value().size() == 1);
    CHECK(decoded.value()[0].seller == fixtures::bob());
    CHECK(decoded.value()[0].total_fee == 1);
}

TEST_CASE("AbiCodec - Empty Trade List") {
    Bytes encoded = AbiCodec::encode_trades({});
    CHECK(matching::to_hex(encoded) ==
          "0x0000000000000000000000000000000000000000000000000000000000000020"
          "0000000000000000000000000000000000000000000000000000000000000000");
}

TEST_CASE("AbiCodec - Trade Words Are Written At Full Width") {
    matching::Trade trade;
    trade.buy_order_id = fixtures::huge();
    trade.quantity = fixtures::tokens(100);
    trade.execution_price = fixtures::tokens(2);
    trade.total_fee = matching::max_uint256() - 5;

    Bytes encoded = AbiCodec::encode_trades({trade});
    CHECK(encoded[64] == 0xff);
    CHECK(codec_test::word_u64(encoded, 64 + 6 * 32) == 0x6bc75e2d63100000);
    CHECK(encoded[64 + 6 * 32 + 23] == 0x05);

    auto decoded = AbiCodec::decode_trades(encoded);
    REQUIRE(decoded.is_success());
    CHECK(decoded.value()[0].buy_order_id == fixtures::huge());
    CHECK(decoded.value()[0].quantity == fixtures::tokens(100));
    CHECK(decoded.value()[0].execution_price == fixtures::tokens(2));
    CHECK(decoded.value()[0].total_fee == matching::max_uint256() - 5);
}

TEST_CASE("Hex - Encoding And Decoding") {
    CHECK(matching::to_hex({0x00, 0xab, 0xff}) == "0x00abff");
    CHECK(matching::from_hex("0x00ABff") == Bytes{0x00, 0xab, 0xff});
    CHECK(matching::from_hex("00abff") == Bytes{0x00, 0xab, 0xff});
    CHECK(matching::from_hex("0x").empty());
    CHECK_THROWS_AS(matching::from_hex("0xabc"), error_handling::DecodeError);
    CHECK_THROWS_AS(matching::from_hex("0xzz"), error_handling::DecodeError);
}

TEST_CASE("Address - Hex Forms") {
    auto short_form = matching::Address::from_hex("0xAA");
    CHECK(short_form == fixtures::token_a());
    CHECK(short_form.to_hex() == "0x00000000000000000000000000000000000000aa");
    CHECK(fixtures::token_a() < fixtures::token_b());
    CHECK_THROWS_AS(matching::Address::from_hex("0x" + std::string(42, '1')), std::invalid_argument);
    CHECK_THROWS_AS(matching::Address::from_hex("0xgg"), std::invalid_argument);
}
