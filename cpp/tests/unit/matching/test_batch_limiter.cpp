#include <doctest/doctest.h>
#include "../../../matching/batch_limiter.hpp"
#include "../../fixtures/order_fixtures.hpp"

namespace limiter_test {

std::vector<matching::Trade> trades(size_t count) {
    std::vector<matching::Trade> result(count);
    for (size_t i = 0; i < count; ++i) {
        result[i].buy_order_id = i + 1;
    }
    return result;
}

} // namespace limiter_test

TEST_CASE("BatchLimiter - Admits Within Budget") {
    matching::BatchLimiter limiter(5);
    auto batch = limiter_test::trades(3);

    CHECK(limiter.admit(batch, fixtures::token_a()) == 0);
    CHECK(batch.size() == 3);
    CHECK(limiter.emitted() == 3);
    CHECK(limiter.remaining() == 2);
    CHECK_FALSE(limiter.exhausted());
}

TEST_CASE("BatchLimiter - Truncates The Group That Crosses The Cap") {
    matching::BatchLimiter limiter(5);
    auto first = limiter_test::trades(3);
    auto second = limiter_test::trades(4);
    auto third = limiter_test::trades(2);

    limiter.admit(first, fixtures::token_a());
    CHECK(limiter.admit(second, fixtures::token_b()) == 2);
    REQUIRE(second.size() == 2);
    // Emission order is kept; the tail is cut.
    CHECK(second[0].buy_order_id == 1);
    CHECK(second[1].buy_order_id == 2);

    CHECK(limiter.admit(third, fixtures::token_a()) == 2);
    CHECK(third.empty());
    CHECK(limiter.exhausted());
    CHECK(limiter.emitted() == 5);
    CHECK(limiter.dropped() == 4);
}
