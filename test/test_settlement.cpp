// predix - Resolution & Payout Tests

#include <catch2/catch.hpp>
#include "predix/settlement.hpp"
#include "test_helpers.hpp"

using namespace predix;
using namespace predix::test;

namespace {

Market staked_market(uint64_t yes, uint64_t no, uint16_t creator_fee_bps = 0) {
    MarketParams params = binary_params(1);
    params.creator_fee_bps = creator_fee_bps;
    Market m = market::make(CREATOR, params, EngineConfig{}, START);
    m.outcomes[0].total_amount = yes;
    m.outcomes[1].total_amount = no;
    m.total_volume = yes + no;
    return m;
}

Position position_on(uint8_t outcome, uint64_t amount) {
    Position p;
    p.market_id = 1;
    p.owner = ALICE;
    p.legs.resize(2);
    p.legs[outcome].amount = amount;
    p.total_amount = amount;
    return p;
}

} // namespace

TEST_CASE("Resolution planning", "[settlement]") {
    EngineConfig config;

    SECTION("Protocol fee then parimutuel ratio") {
        Market m = staked_market(1000, 1000);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 0, ORACLE, "rain gauge 12mm", config,
                                 m.resolution_deadline, r) == errors::OK);
        REQUIRE(r.resolved);
        REQUIRE(r.total_pool == 2000);
        REQUIRE(r.winning_pool == 1000);
        REQUIRE(r.protocol_fee == 40);
        REQUIRE(r.payout_ratio_bps == 19600);
        REQUIRE(r.retained_amount == 0);
        REQUIRE(r.dispute_period_end == 0);
    }

    SECTION("Creator fee rate leaves the payout ratio alone") {
        Market m = staked_market(1000, 1000, 100);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 0, ORACLE, "", config, m.resolution_deadline, r) == errors::OK);
        REQUIRE(r.protocol_fee == 40);
        REQUIRE(r.payout_ratio_bps == 19600);

        settlement::apply(m, r);
        uint64_t payout = 0;
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1000), m.resolution_deadline, payout) ==
                errors::OK);
        REQUIRE(payout == 1960);
    }

    SECTION("Nobody backed the winner") {
        Market m = staked_market(2000, 0);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 1, ORACLE, "", config, m.resolution_deadline, r) == errors::OK);
        REQUIRE(r.payout_ratio_bps == 0);
        REQUIRE(r.retained_amount == 1960);
        REQUIRE(r.protocol_fee + r.retained_amount == r.total_pool);
    }

    SECTION("Dispute window") {
        config.dispute_period = 3600;
        Market m = staked_market(10, 10);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 0, ORACLE, "", config, m.resolution_deadline, r) == errors::OK);
        REQUIRE(r.dispute_period_end == m.resolution_deadline + 3600);
    }

    SECTION("Preconditions") {
        Market m = staked_market(10, 10);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 0, ORACLE, "", config, m.resolution_deadline - 1, r) ==
                errors::MARKET_NOT_EXPIRED);
        REQUIRE(settlement::plan(m, 3, ORACLE, "", config, m.resolution_deadline, r) ==
                errors::INVALID_OUTCOME);
        REQUIRE(settlement::plan(m, 0, ORACLE, std::string(300, 'e'), config, m.resolution_deadline, r) ==
                errors::RESOLUTION_DATA_TOO_LARGE);
        REQUIRE_FALSE(r.resolved);
    }

    SECTION("Applying marks the market resolved") {
        Market m = staked_market(1000, 1000);
        MarketResolution r;
        REQUIRE(settlement::plan(m, 1, ORACLE, "", config, m.resolution_deadline, r) == errors::OK);
        settlement::apply(m, r);
        REQUIRE(m.status == MarketStatus::RESOLVED);
        REQUIRE(m.resolved_outcome == std::optional<uint8_t>{1});
        REQUIRE(m.payout_ratio_bps == 19600);
        REQUIRE(m.protocol_fee == 40);
    }
}

TEST_CASE("Claim quoting", "[settlement]") {
    EngineConfig config;
    Market m = staked_market(1000, 1000);
    MarketResolution r;
    uint64_t payout = 0;

    SECTION("Unresolved market") {
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1000), START, payout) ==
                errors::MARKET_NOT_RESOLVED);
    }

    REQUIRE(settlement::plan(m, 0, ORACLE, "", config, m.resolution_deadline, r) == errors::OK);
    settlement::apply(m, r);
    const Timestamp now = m.resolution_deadline;

    SECTION("Winner receives stake times ratio") {
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1000), now, payout) == errors::OK);
        REQUIRE(payout == 1960);
    }

    SECTION("Loser receives nothing without error") {
        payout = 99;
        REQUIRE(settlement::quote_claim(m, r, position_on(1, 1000), now, payout) == errors::OK);
        REQUIRE(payout == 0);
    }

    SECTION("Already claimed") {
        Position p = position_on(0, 1000);
        p.claimed = true;
        REQUIRE(settlement::quote_claim(m, r, p, now, payout) == errors::ALREADY_CLAIMED);
    }

    SECTION("Winning stake rounding to nothing") {
        r.payout_ratio_bps = 1;
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1), now, payout) == errors::NO_WINNINGS);
    }

    SECTION("Held during the dispute window") {
        r.dispute_period_end = now + 60;
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1000), now + 59, payout) ==
                errors::DISPUTE_PERIOD_ACTIVE);
        REQUIRE(settlement::quote_claim(m, r, position_on(0, 1000), now + 60, payout) == errors::OK);
    }
}
