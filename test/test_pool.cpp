// predix - Liquidity Pool Tests

#include <catch2/catch.hpp>
#include "predix/pool.hpp"
#include "predix/math.hpp"
#include "test_helpers.hpp"

using namespace predix;
using namespace predix::test;

namespace {

struct PoolFixture {
    EngineConfig config;
    Market market = market::make(CREATOR, binary_params(1), EngineConfig{}, START);
    LiquidityPool pool = pool::make(market, START);
    LiquidityPosition alice = pool::open_position(1, ALICE, START);
    LiquidityPosition bob = pool::open_position(1, BOB, START);

    uint64_t add(LiquidityPosition& pos, uint64_t a, uint64_t b) {
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(pool, a, b, 0, config, q) == errors::OK);
        REQUIRE(pool::apply_add(pool, pos, q, START) == errors::OK);
        return q.lp_minted;
    }

    uint64_t remove(LiquidityPosition& pos, uint64_t lp, bool charge_fee) {
        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(pool, pos, lp, 0, 0, charge_fee, q) == errors::OK);
        REQUIRE(pool::apply_remove(pool, pos, q, START) == errors::OK);
        return q.net_a;
    }
};

// k / S^2 compared by cross multiplication
bool per_share_not_lower(U128 k_before, uint64_t s_before, U128 k_after, uint64_t s_after) {
    return k_after * checked::wide_mul(s_before, s_before) >=
           k_before * checked::wide_mul(s_after, s_after);
}

} // namespace

TEST_CASE("Initial liquidity", "[pool]") {
    PoolFixture f;

    SECTION("Geometric mean") {
        REQUIRE(f.add(f.alice, 10000, 10000) == 10000);
        REQUIRE(f.pool.reserve_a == 10000);
        REQUIRE(f.pool.total_lp_supply == 10000);
        REQUIRE(f.pool.k == checked::wide_mul(10000, 10000));
        REQUIRE(f.pool.active_providers == 1);
        REQUIRE(f.alice.active);
    }

    SECTION("Minimum liquidity floor") {
        REQUIRE(f.add(f.alice, 10, 10) == 1000);
    }

    SECTION("Zero amounts") {
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(f.pool, 0, 10, 0, f.config, q) == errors::INVALID_AMOUNT);
        REQUIRE(pool::quote_add(f.pool, 10, 0, 0, f.config, q) == errors::INVALID_AMOUNT);
    }
}

TEST_CASE("Proportional deposits", "[pool]") {
    PoolFixture f;
    f.add(f.alice, 10000, 10000);

    SECTION("Balanced deposit") {
        REQUIRE(f.add(f.bob, 5000, 5000) == 5000);
        REQUIRE(f.pool.total_lp_supply == 15000);
        REQUIRE(f.pool.active_providers == 2);
    }

    SECTION("Imbalanced deposit keeps the excess in the pool by default") {
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(f.pool, 5000, 2000, 0, f.config, q) == errors::OK);
        REQUIRE(q.lp_minted == 2000);
        REQUIRE(q.used_a == 5000);
        REQUIRE(q.used_b == 2000);
    }

    SECTION("Imbalanced deposit with excess refund") {
        f.config.refund_excess_liquidity = true;
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(f.pool, 5000, 2000, 0, f.config, q) == errors::OK);
        REQUIRE(q.lp_minted == 2000);
        REQUIRE(q.used_a == 2000);
        REQUIRE(q.used_b == 2000);
    }

    SECTION("Slippage") {
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(f.pool, 5000, 5000, 5001, f.config, q) == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(pool::quote_add(f.pool, 5000, 5000, 5000, f.config, q) == errors::OK);
    }

    SECTION("Dust deposit mints nothing") {
        f.add(f.bob, 5000, 5000);
        LiquidityPosition carol = pool::open_position(1, CAROL, START);
        // Skew the pool so one unit is worth less than a share
        f.pool.reserve_a = 40000;
        AddLiquidityQuote q{};
        REQUIRE(pool::quote_add(f.pool, 1, 1, 0, f.config, q) == errors::INVALID_AMOUNT);
        REQUIRE(carol.lp_shares == 0);
    }
}

TEST_CASE("Withdrawals", "[pool]") {
    PoolFixture f;
    f.add(f.alice, 10000, 10000);
    f.add(f.bob, 5000, 5000);

    SECTION("Fee stays in the reserve while trading is open") {
        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(f.pool, f.alice, 1500, 0, 0, true, q) == errors::OK);
        REQUIRE(q.gross_a == 1500);
        REQUIRE(q.fee_a == 4);
        REQUIRE(q.net_a == 1496);

        REQUIRE(pool::apply_remove(f.pool, f.alice, q, START) == errors::OK);
        REQUIRE(f.pool.reserve_a == 13504);
        REQUIRE(f.pool.accumulated_fee_a == 4);
        REQUIRE(f.pool.total_lp_supply == 13500);
        REQUIRE(f.alice.withdrawn_a == 1496);
    }

    SECTION("No fee once trading has closed") {
        REQUIRE(f.remove(f.alice, 1500, false) == 1500);
        REQUIRE(f.pool.accumulated_fee_a == 0);
    }

    SECTION("Proportionality") {
        // 20% of supply returns 20% of each reserve before fees
        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(f.pool, f.alice, 3000, 0, 0, false, q) == errors::OK);
        REQUIRE(q.gross_a == f.pool.reserve_a / 5);
        REQUIRE(q.gross_b == f.pool.reserve_b / 5);
    }

    SECTION("Slippage and share checks") {
        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(f.pool, f.alice, 1500, 1500, 0, true, q) == errors::SLIPPAGE_EXCEEDED);
        REQUIRE(pool::quote_remove(f.pool, f.bob, 5001, 0, 0, true, q) == errors::INSUFFICIENT_LP_TOKENS);
        REQUIRE(pool::quote_remove(f.pool, f.bob, 0, 0, 0, true, q) == errors::INVALID_AMOUNT);
    }

    SECTION("Full exit deactivates the position") {
        f.remove(f.bob, 5000, true);
        REQUIRE(f.bob.lp_shares == 0);
        REQUIRE_FALSE(f.bob.active);
        REQUIRE(f.pool.active_providers == 1);
    }

    SECTION("Last provider out takes the retained fees") {
        f.remove(f.alice, 1500, true);
        f.remove(f.bob, 5000, true);
        REQUIRE(f.pool.accumulated_fee_a > 0);
        REQUIRE(f.alice.lp_shares == f.pool.total_lp_supply);

        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(f.pool, f.alice, f.alice.lp_shares, 0, 0, true, q) == errors::OK);
        REQUIRE(q.fee_a == 0);
        REQUIRE(q.fee_b == 0);
        REQUIRE(q.net_a == f.pool.reserve_a);
        REQUIRE(q.net_b == f.pool.reserve_b);

        REQUIRE(pool::apply_remove(f.pool, f.alice, q, START) == errors::OK);
        REQUIRE(f.pool.reserve_a == 0);
        REQUIRE(f.pool.reserve_b == 0);
        REQUIRE(f.pool.total_lp_supply == 0);
        REQUIRE(f.pool.k == 0);

        // Next deposit starts from an empty pool
        REQUIRE(f.add(f.bob, 2000, 2000) == 2000);
        REQUIRE(f.pool.reserve_a == 2000);
    }

    SECTION("Empty pool") {
        LiquidityPool empty = pool::make(f.market, START);
        RemoveLiquidityQuote q{};
        REQUIRE(pool::quote_remove(empty, f.alice, 1, 0, 0, true, q) == errors::EMPTY_POOL);
    }
}

TEST_CASE("Per-share invariant", "[pool]") {
    PoolFixture f;
    f.add(f.alice, 7919, 104729);

    auto check = [&](auto&& op) {
        U128 k = f.pool.k;
        uint64_t s = f.pool.total_lp_supply;
        op();
        REQUIRE(per_share_not_lower(k, s, f.pool.k, f.pool.total_lp_supply));
    };

    check([&] { f.add(f.bob, 3331, 9973); });
    check([&] { f.remove(f.alice, 1237, true); });
    check([&] { f.remove(f.bob, f.bob.lp_shares / 3, false); });
    check([&] { f.add(f.alice, 1, 50); });
    check([&] { f.remove(f.alice, f.alice.lp_shares, true); });
}
