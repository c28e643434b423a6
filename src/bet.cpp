// =============================================================================
// bet.cpp - Parimutuel bets, odds and refunds
// =============================================================================

#include "predix/bet.hpp"
#include "predix/math.hpp"
#include <limits>

namespace predix {

// =============================================================================
// Odds
// =============================================================================

std::vector<uint64_t> compute_odds(const std::vector<uint64_t>& outcome_totals) {
    U128 total = 0;
    for (uint64_t t : outcome_totals) total += t;

    std::vector<uint64_t> odds;
    odds.reserve(outcome_totals.size());
    for (uint64_t t : outcome_totals) {
        if (static_cast<U128>(t) == total) {
            odds.push_back(ODDS_EVEN);
        } else if (t == 0) {
            odds.push_back(0);
        } else {
            U128 v = total * BPS_DENOMINATOR / t;
            odds.push_back(v > std::numeric_limits<uint64_t>::max()
                               ? std::numeric_limits<uint64_t>::max()
                               : static_cast<uint64_t>(v));
        }
    }
    return odds;
}

void refresh_odds(Market& m) {
    std::vector<uint64_t> totals;
    totals.reserve(m.outcomes.size());
    for (const auto& o : m.outcomes) totals.push_back(o.total_amount);

    auto odds = compute_odds(totals);
    for (size_t i = 0; i < m.outcomes.size(); ++i) {
        m.outcomes[i].current_odds_bps = odds[i];
    }
}

namespace bet {

// =============================================================================
// Quote
// =============================================================================

int32_t quote(const Market& m, uint8_t outcome, uint64_t amount, Timestamp now, BetQuote& out) {
    if (amount == 0) {
        return errors::INVALID_BET_AMOUNT;
    }

    int32_t rc = market::check_open(m, now);
    if (rc != errors::OK) return rc;

    if (!m.has_outcome(outcome)) {
        return errors::INVALID_OUTCOME;
    }
    if (amount < m.min_bet) {
        return errors::BET_BELOW_MINIMUM;
    }
    if (amount > m.max_bet) {
        return errors::BET_ABOVE_MAXIMUM;
    }

    const uint64_t total = m.total_volume;
    const uint64_t opposing = m.opposing_pool(outcome);

    BetQuote q{};
    if (opposing > 0) {
        rc = checked::mul_div(amount, total, opposing, q.potential_payout);
        if (rc != errors::OK) return rc;
        rc = bps::ratio(total, opposing, q.odds_bps);
        if (rc != errors::OK) return rc;
    } else {
        rc = checked::mul(amount, 2, q.potential_payout);
        if (rc != errors::OK) return rc;
        q.odds_bps = ODDS_NO_OPPOSITION;
    }

    if (q.potential_payout > m.max_payout_per_bet) {
        return errors::PAYOUT_TOO_HIGH;
    }

    out = q;
    return errors::OK;
}

// =============================================================================
// Apply
// =============================================================================

Position open_position(const Market& m, const Address& owner, Timestamp now) {
    Position p;
    p.market_id = m.market_id;
    p.owner = owner;
    p.legs.resize(m.outcomes.size());
    p.created_at = now;
    return p;
}

int32_t apply(Market& m, Position& p, bool new_position, uint8_t outcome,
              uint64_t amount, const BetQuote& q, Timestamp now) {
    if (!m.has_outcome(outcome) || outcome >= p.legs.size()) {
        return errors::INVALID_OUTCOME;
    }
    if (p.claimed) {
        return errors::ALREADY_CLAIMED;
    }

    int32_t rc = errors::OK;
    PositionLeg& leg = p.legs[outcome];
    OutcomeState& o = m.outcomes[outcome];

    // First bet on this outcome fixes the leg's odds
    if (leg.amount == 0) leg.odds_at_bet_bps = q.odds_bps;

    if ((rc = checked::add_to(leg.amount, amount)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.total_amount, amount)) != errors::OK) return rc;
    if ((rc = checked::add_to(p.bet_count, 1)) != errors::OK) return rc;
    p.fills.push_back(BetFill{outcome, amount, q.odds_bps, now});
    p.last_bet_at = now;

    if ((rc = checked::add_to(o.total_amount, amount)) != errors::OK) return rc;
    if ((rc = checked::add_to(o.bet_count, 1)) != errors::OK) return rc;
    if ((rc = checked::add_to(m.total_volume, amount)) != errors::OK) return rc;
    if ((rc = checked::add_to(m.total_bets, 1)) != errors::OK) return rc;
    if (new_position) {
        if ((rc = checked::add_to(m.unique_bettors, 1)) != errors::OK) return rc;
    }
    m.last_bet_at = now;

    refresh_odds(m);
    return errors::OK;
}

// =============================================================================
// Refund
// =============================================================================

int32_t check_refund(const Market& m, const Position& p) {
    if (m.status != MarketStatus::CANCELLED) {
        return errors::MARKET_NOT_CANCELLED;
    }
    if (p.claimed) {
        return errors::ALREADY_CLAIMED;
    }
    if (p.total_amount == 0) {
        return errors::NO_WINNINGS;
    }
    return errors::OK;
}

} // namespace bet

} // namespace predix
