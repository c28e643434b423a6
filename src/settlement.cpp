// =============================================================================
// settlement.cpp - Resolution and parimutuel payout
// =============================================================================

#include "predix/settlement.hpp"
#include "predix/math.hpp"

namespace predix {
namespace settlement {

int32_t plan(const Market& m, uint8_t outcome, const Address& resolver,
             const std::string& evidence, const EngineConfig& config,
             Timestamp now, MarketResolution& out) {
    int32_t rc = market::check_resolve(m, outcome, evidence.size(), config, now);
    if (rc != errors::OK) return rc;

    MarketResolution r;
    r.market_id = m.market_id;
    r.resolved = true;
    r.winning_outcome = outcome;
    r.resolver = resolver;
    r.evidence = evidence;
    r.resolved_at = now;
    r.dispute_period_end = config.dispute_period > 0 ? now + config.dispute_period : 0;
    r.total_pool = m.total_volume;
    r.winning_pool = m.outcomes[outcome].total_amount;

    if ((rc = bps::apply(r.total_pool, m.platform_fee_bps, r.protocol_fee)) != errors::OK) return rc;

    uint64_t remaining = 0;
    if ((rc = checked::sub(r.total_pool, r.protocol_fee, remaining)) != errors::OK) return rc;

    if (r.winning_pool > 0) {
        rc = bps::ratio(remaining, r.winning_pool, r.payout_ratio_bps);
        if (rc != errors::OK) return rc;
    } else {
        r.payout_ratio_bps = 0;
        r.retained_amount = remaining;
    }

    out = std::move(r);
    return errors::OK;
}

void apply(Market& m, const MarketResolution& r) {
    m.status = MarketStatus::RESOLVED;
    m.resolved_outcome = r.winning_outcome;
    m.resolved_at = r.resolved_at;
    m.protocol_fee = r.protocol_fee;
    m.payout_ratio_bps = r.payout_ratio_bps;
}

int32_t quote_claim(const Market& m, const MarketResolution& r, const Position& p,
                    Timestamp now, uint64_t& out) {
    if (m.status != MarketStatus::RESOLVED || !r.resolved) {
        return errors::MARKET_NOT_RESOLVED;
    }
    if (p.claimed) {
        return errors::ALREADY_CLAIMED;
    }
    if (r.dispute_period_end != 0 && now < r.dispute_period_end) {
        return errors::DISPUTE_PERIOD_ACTIVE;
    }

    uint64_t stake = p.stake_on(r.winning_outcome);
    if (stake == 0) {
        out = 0;
        return errors::OK;
    }

    uint64_t net = 0;
    int32_t rc = bps::apply(stake, r.payout_ratio_bps, net);
    if (rc != errors::OK) return rc;
    if (net == 0) {
        return errors::NO_WINNINGS;
    }

    out = net;
    return errors::OK;
}

} // namespace settlement
} // namespace predix
