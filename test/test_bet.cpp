// predix - Bet & Odds Tests

#include <catch2/catch.hpp>
#include "predix/bet.hpp"
#include "test_helpers.hpp"

using namespace predix;
using namespace predix::test;

namespace {

// Market with the given stakes already recorded
Market market_with(std::vector<uint64_t> stakes) {
    MarketParams params = binary_params(1);
    params.outcomes.resize(stakes.size(), "Other");
    Market m = market::make(CREATOR, params, EngineConfig{}, START);
    for (size_t i = 0; i < stakes.size(); ++i) {
        m.outcomes[i].total_amount = stakes[i];
        m.total_volume += stakes[i];
    }
    refresh_odds(m);
    return m;
}

} // namespace

TEST_CASE("Odds computation", "[bet]") {
    SECTION("Empty pool is even") {
        REQUIRE(compute_odds({0, 0}) == std::vector<uint64_t>{10000, 10000});
    }

    SECTION("Outcome holding the whole pool") {
        REQUIRE(compute_odds({1000, 0}) == std::vector<uint64_t>{10000, 0});
    }

    SECTION("Balanced and skewed pools") {
        REQUIRE(compute_odds({1000, 1000}) == std::vector<uint64_t>{20000, 20000});
        REQUIRE(compute_odds({1000, 3000}) == std::vector<uint64_t>{40000, 13333});
        REQUIRE(compute_odds({500, 250, 250}) == std::vector<uint64_t>{20000, 40000, 40000});
    }

    SECTION("Idempotent") {
        std::vector<uint64_t> totals{123, 4567, 89};
        REQUIRE(compute_odds(totals) == compute_odds(totals));
    }
}

TEST_CASE("Bet quoting", "[bet]") {
    SECTION("No opposition pays double") {
        Market m = market_with({0, 0});
        BetQuote q{};
        REQUIRE(bet::quote(m, 0, 100, START, q) == errors::OK);
        REQUIRE(q.potential_payout == 200);
        REQUIRE(q.odds_bps == ODDS_NO_OPPOSITION);
    }

    SECTION("Parimutuel payout with pre-bet totals") {
        Market m = market_with({1000, 1000});
        BetQuote q{};
        REQUIRE(bet::quote(m, 0, 500, START, q) == errors::OK);
        REQUIRE(q.potential_payout == 1000);
        REQUIRE(q.odds_bps == 20000);
    }

    SECTION("Rejections") {
        Market m = market_with({0, 0});
        BetQuote q{};
        REQUIRE(bet::quote(m, 0, 0, START, q) == errors::INVALID_BET_AMOUNT);
        REQUIRE(bet::quote(m, 2, 100, START, q) == errors::INVALID_OUTCOME);
        REQUIRE(bet::quote(m, 0, 100, m.resolution_deadline, q) == errors::MARKET_EXPIRED);

        m.min_bet = 10;
        m.max_bet = 1000;
        REQUIRE(bet::quote(m, 0, 9, START, q) == errors::BET_BELOW_MINIMUM);
        REQUIRE(bet::quote(m, 0, 1001, START, q) == errors::BET_ABOVE_MAXIMUM);

        m.max_payout_per_bet = 150;
        REQUIRE(bet::quote(m, 0, 100, START, q) == errors::PAYOUT_TOO_HIGH);

        m.status = MarketStatus::PAUSED;
        REQUIRE(bet::quote(m, 0, 100, START, q) == errors::MARKET_NOT_ACTIVE);
    }
}

TEST_CASE("Bet application", "[bet]") {
    Market m = market_with({0, 0});
    Position p = bet::open_position(m, ALICE, START);
    REQUIRE(p.legs.size() == 2);

    BetQuote q{};
    REQUIRE(bet::quote(m, 0, 1000, START, q) == errors::OK);
    REQUIRE(bet::apply(m, p, true, 0, 1000, q, START) == errors::OK);

    REQUIRE(p.total_amount == 1000);
    REQUIRE(p.legs[0].amount == 1000);
    REQUIRE(p.legs[0].odds_at_bet_bps == 20000);
    REQUIRE(m.total_volume == 1000);
    REQUIRE(m.unique_bettors == 1);
    REQUIRE(m.outcomes[0].current_odds_bps == 10000);
    REQUIRE(m.outcomes[1].current_odds_bps == 0);

    SECTION("Opposing bet reprices both outcomes") {
        Position bob = bet::open_position(m, BOB, START + 1);
        REQUIRE(bet::quote(m, 1, 1000, START + 1, q) == errors::OK);
        REQUIRE(bet::apply(m, bob, true, 1, 1000, q, START + 1) == errors::OK);
        REQUIRE(m.unique_bettors == 2);
        REQUIRE(m.outcomes[0].current_odds_bps == 20000);
        REQUIRE(m.outcomes[1].current_odds_bps == 20000);
    }

    SECTION("Leg odds are fixed by the first bet, fills keep their own") {
        m.outcomes[1].total_amount = 3000;
        m.total_volume += 3000;

        REQUIRE(bet::quote(m, 0, 500, START + 5, q) == errors::OK);
        REQUIRE(q.odds_bps == 13333);
        REQUIRE(bet::apply(m, p, false, 0, 500, q, START + 5) == errors::OK);

        REQUIRE(p.legs[0].amount == 1500);
        REQUIRE(p.legs[0].odds_at_bet_bps == 20000);
        REQUIRE(p.fills.size() == 2);
        REQUIRE(p.fills[0].odds_bps == 20000);
        REQUIRE(p.fills[1].odds_bps == 13333);
        REQUIRE(p.fills[1].timestamp == START + 5);
        REQUIRE(p.bet_count == 2);
        REQUIRE(m.unique_bettors == 1);
        REQUIRE(m.outcomes[0].total_amount == 1500);
    }
}

TEST_CASE("Refund preconditions", "[bet]") {
    Market m = market_with({0, 0});
    Position p = bet::open_position(m, ALICE, START);
    p.total_amount = 100;
    p.legs[0].amount = 100;

    REQUIRE(bet::check_refund(m, p) == errors::MARKET_NOT_CANCELLED);
    m.status = MarketStatus::CANCELLED;
    REQUIRE(bet::check_refund(m, p) == errors::OK);
    p.claimed = true;
    REQUIRE(bet::check_refund(m, p) == errors::ALREADY_CLAIMED);
}
