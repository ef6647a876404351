#include <doctest/doctest.h>
#include "../../../matching/abi_codec.hpp"
#include "../../../matching/batch_processor.hpp"
#include "../../fixtures/order_fixtures.hpp"

using fixtures::buy;
using fixtures::sell;
using matching::AbiCodec;

namespace processor_test {

std::vector<matching::Trade> trades_of(const matching::BatchOutcome& outcome) {
    auto decoded = AbiCodec::decode_trades(outcome.payload);
    REQUIRE(decoded.is_success());
    return decoded.value();
}

matching::EngineDefaults best_effort() {
    auto defaults = fixtures::defaults(1000, 1, 10000, 10000);
    defaults.processing_mode = matching::ProcessingMode::BEST_EFFORT;
    return defaults;
}

} // namespace processor_test

TEST_CASE("BatchProcessor - Multi Instrument Batch") {
    matching::BatchProcessor processor(fixtures::defaults());
    auto payload = AbiCodec::encode_batch(
        {buy(1, 100, 10, fixtures::token_a()), buy(3, 40, 20, fixtures::token_b(), fixtures::carol())},
        {sell(2, 100, 10, fixtures::token_a()), sell(4, 40, 19, fixtures::token_b())},
        std::nullopt);

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    CHECK(outcome.instrument_errors.empty());
    CHECK(outcome.stats.instruments == 2);
    CHECK(outcome.stats.trades_emitted == 2);

    auto trades = processor_test::trades_of(outcome);
    REQUIRE(trades.size() == 2);
    CHECK(trades[0].instrument == fixtures::token_a());
    CHECK(trades[1].instrument == fixtures::token_b());
    CHECK(trades[1].buyer == fixtures::carol());
    CHECK(trades[1].execution_price == 20);
}

TEST_CASE("BatchProcessor - Dust Never Trades And Never Blocks") {
    matching::BatchProcessor processor(fixtures::defaults(1000, 10));
    auto payload = AbiCodec::encode_batch({buy(1, 5, 50), buy(2, 20, 10)}, {sell(3, 20, 10)}, std::nullopt);

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    CHECK(outcome.stats.dust_dropped == 1);
    auto trades = processor_test::trades_of(outcome);
    REQUIRE(trades.size() == 1);
    CHECK(trades[0].buy_order_id == 2);
}

TEST_CASE("BatchProcessor - Duplicate Ids") {
    matching::BatchProcessor processor(fixtures::defaults(1000, 10));

    SUBCASE("between kept orders the batch is a decode report") {
        auto outcome = processor.process(
            AbiCodec::encode_batch({buy(7, 20, 10)}, {sell(7, 20, 10)}, std::nullopt));
        CHECK_FALSE(outcome.is_notice());
        CHECK(outcome.error_kind == error_handling::ErrorKind::DECODE);
        CHECK(outcome.message == "DecodeError: duplicate order id 7");
    }

    SUBCASE("a dust order reusing an id does not block the batch") {
        auto outcome = processor.process(
            AbiCodec::encode_batch({buy(7, 20, 10), buy(8, 5, 10)}, {sell(8, 20, 10)}, std::nullopt));
        REQUIRE(outcome.is_notice());
        CHECK(outcome.stats.dust_dropped == 1);
        auto trades = processor_test::trades_of(outcome);
        REQUIRE(trades.size() == 1);
        CHECK(trades[0].buy_order_id == 7);
        CHECK(trades[0].sell_order_id == 8);
    }
}

TEST_CASE("BatchProcessor - 18 Decimal Quantities") {
    SUBCASE("legacy payload with 100e18 quantity words") {
        matching::BatchProcessor processor(matching::EngineDefaults::build_time());
        auto payload = AbiCodec::encode_batch({buy(1, 100, 10)}, {sell(2, 50, 9)}, std::nullopt);
        fixtures::patch_word(payload, 0x60 + 3 * 32, fixtures::hundred_tokens_word());
        fixtures::patch_word(payload, 0x140 + 3 * 32, fixtures::hundred_tokens_word());

        auto outcome = processor.process(payload);

        REQUIRE(outcome.is_notice());
        auto trades = processor_test::trades_of(outcome);
        REQUIRE(trades.size() == 1);
        CHECK(trades[0].quantity == fixtures::tokens(100));
        CHECK(trades[0].execution_price == 10);
        // 1e21 * 30 bps
        CHECK(trades[0].total_fee == fixtures::tokens(3));
    }

    SUBCASE("100e18 at 2e18") {
        matching::BatchProcessor processor(fixtures::defaults());
        auto payload = AbiCodec::encode_batch({buy(1, fixtures::tokens(100), fixtures::tokens(2))},
                                              {sell(2, fixtures::tokens(100), fixtures::tokens(2))},
                                              std::nullopt);

        auto outcome = processor.process(payload);

        REQUIRE(outcome.is_notice());
        auto trades = processor_test::trades_of(outcome);
        REQUIRE(trades.size() == 1);
        CHECK(trades[0].buy_order_id == 1);
        CHECK(trades[0].sell_order_id == 2);
        CHECK(trades[0].quantity == matching::Uint256("100000000000000000000"));
        CHECK(trades[0].execution_price == matching::Uint256("2000000000000000000"));
        // value 2e38 at 10 + 20 bps
        CHECK(trades[0].total_fee == matching::Uint256("600000000000000000000000000000000000"));
        CHECK(outcome.trades[0].total_fee == trades[0].total_fee);
    }
}

TEST_CASE("BatchProcessor - Runtime Minimum Overrides Default") {
    matching::BatchProcessor processor(fixtures::defaults());
    auto payload = AbiCodec::encode_batch({buy(1, 5, 10)}, {sell(2, 5, 10)}, matching::RuntimeConfig{42, 20, 6});

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    CHECK(outcome.stats.dust_dropped == 2);
    CHECK(processor_test::trades_of(outcome).empty());
}

TEST_CASE("BatchProcessor - Malformed Runtime Tuple Uses Defaults") {
    matching::BatchProcessor processor(fixtures::defaults());
    auto payload = AbiCodec::encode_batch({buy(1, 5, 10)}, {sell(2, 5, 10)}, matching::RuntimeConfig{0, 20000, 6});

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    CHECK(outcome.config_warning.find("ConfigError") == 0);
    // Default minimum of 1 applies, so the orders trade.
    CHECK(processor_test::trades_of(outcome).size() == 1);
}

TEST_CASE("BatchProcessor - Decode Error Is A Report") {
    matching::BatchProcessor processor(fixtures::defaults());
    auto outcome = processor.process(matching::Bytes(16, 0));

    CHECK_FALSE(outcome.is_notice());
    CHECK(outcome.error_kind == error_handling::ErrorKind::DECODE);
    CHECK(outcome.message.find("DecodeError: ") == 0);
    CHECK(outcome.payload.empty());
    CHECK(processor.batches_failed() == 1);
}

TEST_CASE("BatchProcessor - Batch Cap Applies Across Instruments") {
    matching::BatchProcessor processor(fixtures::defaults(3));
    auto payload = AbiCodec::encode_batch(
        {buy(1, 10, 10, fixtures::token_a()), buy(2, 10, 10, fixtures::token_a()),
         buy(5, 10, 10, fixtures::token_b()), buy(6, 10, 10, fixtures::token_b())},
        {sell(3, 10, 10, fixtures::token_a()), sell(4, 10, 10, fixtures::token_a()),
         sell(7, 10, 10, fixtures::token_b()), sell(8, 10, 10, fixtures::token_b())},
        std::nullopt);

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    CHECK(outcome.stats.trades_emitted == 3);
    CHECK(outcome.stats.trades_dropped == 1);
    auto trades = processor_test::trades_of(outcome);
    REQUIRE(trades.size() == 3);
    CHECK(trades[2].instrument == fixtures::token_b());
}

TEST_CASE("BatchProcessor - Strict Mode Aborts On Matching Error") {
    auto defaults = processor_test::best_effort();
    defaults.processing_mode = matching::ProcessingMode::STRICT;
    matching::BatchProcessor processor(defaults);

    auto payload = AbiCodec::encode_batch(
        {buy(1, 10, 10, fixtures::token_a()), buy(3, fixtures::huge(), fixtures::huge(), fixtures::token_b())},
        {sell(2, 10, 10, fixtures::token_a()), sell(4, fixtures::huge(), fixtures::huge(), fixtures::token_b())},
        std::nullopt);

    auto outcome = processor.process(payload);

    CHECK_FALSE(outcome.is_notice());
    CHECK(outcome.error_kind == error_handling::ErrorKind::MATCHING);
    CHECK(outcome.message.find(fixtures::token_b().to_hex()) != std::string::npos);
    CHECK(outcome.trades.empty());
    CHECK(outcome.payload.empty());
}

TEST_CASE("BatchProcessor - Best Effort Isolates The Failing Instrument") {
    matching::BatchProcessor processor(processor_test::best_effort());

    auto payload = AbiCodec::encode_batch(
        {buy(1, 10, 10, fixtures::token_a()), buy(3, fixtures::huge(), fixtures::huge(), fixtures::token_b())},
        {sell(2, 10, 10, fixtures::token_a()), sell(4, fixtures::huge(), fixtures::huge(), fixtures::token_b())},
        std::nullopt);

    auto outcome = processor.process(payload);

    REQUIRE(outcome.is_notice());
    REQUIRE(outcome.instrument_errors.size() == 1);
    CHECK(outcome.instrument_errors[0].instrument == fixtures::token_b());
    CHECK(outcome.stats.instruments_failed == 1);

    auto trades = processor_test::trades_of(outcome);
    REQUIRE(trades.size() == 1);
    CHECK(trades[0].instrument == fixtures::token_a());
    // 100 at 100% maker + 100% taker
    CHECK(trades[0].total_fee == 200);
}

TEST_CASE("BatchProcessor - Identical Input Gives Identical Output") {
    matching::BatchProcessor processor(fixtures::defaults());
    auto payload = AbiCodec::encode_batch(
        {buy(1, 30, 12), buy(2, 50, 11), buy(5, 10, 20, fixtures::token_b())},
        {sell(3, 40, 10), sell(4, 40, 11), sell(6, 10, 15, fixtures::token_b())},
        matching::RuntimeConfig{99, 15, 1});

    auto first = processor.process(payload);
    auto second = processor.process(payload);

    REQUIRE(first.is_notice());
    CHECK(first.payload == second.payload);
}

TEST_CASE("BatchProcessor - Handle Request") {
    matching::BatchProcessor processor(fixtures::defaults());

    SUBCASE("notice") {
        auto payload = AbiCodec::encode_batch({buy(1, 100, 10)}, {sell(2, 50, 9)}, std::nullopt);
        auto result = processor.handle_request(matching::to_hex(payload));

        CHECK(result.is_notice());
        CHECK(result.payload.rfind("0x", 0) == 0);
        CHECK(result.to_json_line().find("\"type\":\"notice\"") != std::string::npos);
    }

    SUBCASE("invalid hex") {
        auto result = processor.handle_request("0x123");

        CHECK_FALSE(result.is_notice());
        CHECK(result.message.find("DecodeError") == 0);
        CHECK(result.to_json_line().find("\"type\":\"report\"") != std::string::npos);
    }
}

TEST_CASE("BatchProcessor - Status Record") {
    auto defaults = fixtures::defaults(500, 2, 5, 15);
    defaults.fee_mode = matching::FeeMode::FLAT;
    matching::BatchProcessor processor(defaults);

    Json::Value status = processor.status();

    CHECK(status["max_trades_per_batch"].asUInt64() == 500);
    CHECK(status["min_trade_amount"].asUInt64() == 2);
    CHECK(status["maker_fee_bps"].asUInt64() == 5);
    CHECK(status["taker_fee_bps"].asUInt64() == 15);
    CHECK(status["fee_mode"].asString() == "flat");
    CHECK(status["processing_mode"].asString() == "strict");
    CHECK(status["batches_processed"].asUInt64() == 0);
}
