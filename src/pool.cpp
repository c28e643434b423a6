// =============================================================================
// pool.cpp - Constant-product liquidity pool
// =============================================================================

#include "predix/pool.hpp"
#include "predix/math.hpp"
#include <algorithm>

namespace predix {
namespace pool {

LiquidityPool make(const Market& m, Timestamp now) {
    LiquidityPool p;
    p.market_id = m.market_id;
    p.fee_bps = m.lp_fee_bps;
    p.lp_mint = addresses::lp_mint(m.market_id);
    p.last_update = now;
    return p;
}

LiquidityPosition open_position(uint64_t market_id, const Address& provider, Timestamp now) {
    LiquidityPosition pos;
    pos.market_id = market_id;
    pos.provider = provider;
    pos.created_at = now;
    pos.last_update = now;
    return pos;
}

// =============================================================================
// Add Liquidity
// =============================================================================

int32_t quote_add(const LiquidityPool& p, uint64_t amount_a, uint64_t amount_b,
                  uint64_t min_lp_out, const EngineConfig& config, AddLiquidityQuote& out) {
    if (amount_a == 0 || amount_b == 0) {
        return errors::INVALID_AMOUNT;
    }

    AddLiquidityQuote q{0, amount_a, amount_b};
    int32_t rc = errors::OK;

    if (p.total_lp_supply == 0) {
        uint64_t root = 0;
        rc = checked::narrow(isqrt(checked::wide_mul(amount_a, amount_b)), root);
        if (rc != errors::OK) return rc;
        q.lp_minted = std::max(config.minimum_liquidity, root);
    } else {
        uint64_t from_a = 0;
        uint64_t from_b = 0;
        rc = checked::mul_div(amount_a, p.total_lp_supply, p.reserve_a, from_a);
        if (rc != errors::OK) return rc;
        rc = checked::mul_div(amount_b, p.total_lp_supply, p.reserve_b, from_b);
        if (rc != errors::OK) return rc;
        q.lp_minted = std::min(from_a, from_b);

        if (config.refund_excess_liquidity && q.lp_minted > 0) {
            // Take only the proportional share, rounded in the pool's favour
            rc = checked::mul_div_up(q.lp_minted, p.reserve_a, p.total_lp_supply, q.used_a);
            if (rc != errors::OK) return rc;
            rc = checked::mul_div_up(q.lp_minted, p.reserve_b, p.total_lp_supply, q.used_b);
            if (rc != errors::OK) return rc;
            q.used_a = std::min(q.used_a, amount_a);
            q.used_b = std::min(q.used_b, amount_b);
        }
    }

    if (q.lp_minted == 0) {
        return errors::INVALID_AMOUNT;
    }
    if (q.lp_minted < min_lp_out) {
        return errors::SLIPPAGE_EXCEEDED;
    }

    out = q;
    return errors::OK;
}

int32_t apply_add(LiquidityPool& p, LiquidityPosition& pos,
                  const AddLiquidityQuote& q, Timestamp now) {
    int32_t rc = errors::OK;

    if ((rc = checked::add_to(p.reserve_a, q.used_a)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.reserve_b, q.used_b)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.total_lp_supply, q.lp_minted)) != errors::OK) return rc;
    p.k = checked::wide_mul(p.reserve_a, p.reserve_b);
    p.last_update = now;

    if ((rc = checked::add_to(pos.lp_shares, q.lp_minted)) != errors::OK) return rc;
    if ((rc = checked::add_to(pos.contributed_a, q.used_a)) != errors::OK) return rc;
    if ((rc = checked::add_to(pos.contributed_b, q.used_b)) != errors::OK) return rc;
    pos.last_update = now;

    if (!pos.active) {
        pos.active = true;
        if ((rc = checked::add_to(p.active_providers, 1)) != errors::OK) return rc;
    }
    return errors::OK;
}

// =============================================================================
// Remove Liquidity
// =============================================================================

int32_t quote_remove(const LiquidityPool& p, const LiquidityPosition& pos, uint64_t lp_amount,
                     uint64_t min_out_a, uint64_t min_out_b, bool charge_fee,
                     RemoveLiquidityQuote& out) {
    if (lp_amount == 0) {
        return errors::INVALID_AMOUNT;
    }
    if (p.total_lp_supply == 0) {
        return errors::EMPTY_POOL;
    }
    if (pos.lp_shares < lp_amount) {
        return errors::INSUFFICIENT_LP_TOKENS;
    }

    RemoveLiquidityQuote q{};
    q.lp_burned = lp_amount;

    int32_t rc = checked::mul_div(p.reserve_a, lp_amount, p.total_lp_supply, q.gross_a);
    if (rc != errors::OK) return rc;
    rc = checked::mul_div(p.reserve_b, lp_amount, p.total_lp_supply, q.gross_b);
    if (rc != errors::OK) return rc;

    if (q.gross_a == 0 && q.gross_b == 0) {
        return errors::INVALID_AMOUNT;
    }

    // The last shares out take the whole reserve, earlier fees included
    const bool final_exit = lp_amount == p.total_lp_supply;
    if (charge_fee && !final_exit) {
        if ((rc = bps::apply(q.gross_a, p.fee_bps, q.fee_a)) != errors::OK) return rc;
        if ((rc = bps::apply(q.gross_b, p.fee_bps, q.fee_b)) != errors::OK) return rc;
    }
    q.net_a = q.gross_a - q.fee_a;
    q.net_b = q.gross_b - q.fee_b;

    if (q.net_a < min_out_a || q.net_b < min_out_b) {
        return errors::SLIPPAGE_EXCEEDED;
    }

    out = q;
    return errors::OK;
}

int32_t apply_remove(LiquidityPool& p, LiquidityPosition& pos,
                     const RemoveLiquidityQuote& q, Timestamp now) {
    int32_t rc = errors::OK;

    // Fees are not paid out, so only the net leaves the reserves
    if ((rc = checked::sub_from(p.reserve_a, q.net_a)) != errors::OK) return rc;
    if ((rc = checked::sub_from(p.reserve_b, q.net_b)) != errors::OK) return rc;
    if ((rc = checked::sub_from(p.total_lp_supply, q.lp_burned)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.accumulated_fee_a, q.fee_a)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.accumulated_fee_b, q.fee_b)) != errors::OK) return rc;
    p.k = checked::wide_mul(p.reserve_a, p.reserve_b);
    p.last_update = now;

    if ((rc = checked::sub_from(pos.lp_shares, q.lp_burned)) != errors::OK) return rc;
    if ((rc = checked::add_to(pos.withdrawn_a, q.net_a)) != errors::OK) return rc;
    if ((rc = checked::add_to(pos.withdrawn_b, q.net_b)) != errors::OK) return rc;
    pos.last_update = now;

    if (pos.lp_shares == 0 && pos.active) {
        pos.active = false;
        if ((rc = checked::sub_from(p.active_providers, 1)) != errors::OK) return rc;
    }
    return errors::OK;
}

int32_t total_liquidity(const LiquidityPool& p, uint64_t& out) {
    return checked::add(p.reserve_a, p.reserve_b, out);
}

} // namespace pool
} // namespace predix
