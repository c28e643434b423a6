// predix - Trader Profile Tests

#include <catch2/catch.hpp>
#include <limits>
#include "predix/profile.hpp"
#include "test_helpers.hpp"

using namespace predix;
using namespace predix::test;

TEST_CASE("Profile aggregates", "[profile]") {
    TraderProfile t = profile::open(ALICE, START);
    REQUIRE(t.owner == ALICE);
    REQUIRE(t.created_at == START);
    REQUIRE(t.win_rate_bps() == 0);

    REQUIRE(profile::record_bet(t, 300, true, START + 1) == errors::OK);
    REQUIRE(profile::record_bet(t, 200, false, START + 2) == errors::OK);
    REQUIRE(profile::record_bet(t, 500, true, START + 3) == errors::OK);
    REQUIRE(t.total_volume == 1000);
    REQUIRE(t.total_bets == 3);
    REQUIRE(t.markets_traded == 2);
    REQUIRE(t.last_active == START + 3);

    SECTION("One win, one loss") {
        REQUIRE(profile::record_settlement(t, 500, 980, START + 10) == errors::OK);
        REQUIRE(profile::record_settlement(t, 500, 0, START + 11) == errors::OK);
        REQUIRE(t.markets_settled == 2);
        REQUIRE(t.markets_won == 1);
        REQUIRE(t.total_payout == 980);
        REQUIRE(t.total_pnl == -20);
        REQUIRE(t.win_rate_bps() == 5000);
        REQUIRE(t.last_active == START + 11);
    }

    SECTION("Overflow leaves the profile untouched") {
        t.total_volume = std::numeric_limits<uint64_t>::max();
        REQUIRE(profile::record_bet(t, 1, false, START + 5) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(t.total_bets == 3);
        REQUIRE(t.last_active == START + 3);

        t.total_pnl = std::numeric_limits<int64_t>::max();
        REQUIRE(profile::record_settlement(t, 0, 1, START + 5) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(t.markets_settled == 0);

        t.total_pnl = std::numeric_limits<int64_t>::min();
        REQUIRE(profile::record_settlement(t, 1, 0, START + 5) == errors::ARITHMETIC_UNDERFLOW);
        REQUIRE(t.markets_settled == 0);
    }
}
