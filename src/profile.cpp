// =============================================================================
// profile.cpp - Per-trader aggregates
// =============================================================================

#include "predix/profile.hpp"
#include "predix/math.hpp"
#include <limits>

namespace predix {

uint64_t TraderProfile::win_rate_bps() const {
    if (markets_settled == 0) return 0;
    return markets_won * BPS_DENOMINATOR / markets_settled;
}

namespace profile {

namespace {

// pnl + (payout - staked), failing outside the int64 range
int32_t add_pnl(int64_t pnl, uint64_t payout, uint64_t staked, int64_t& out) {
    constexpr uint64_t max = std::numeric_limits<int64_t>::max();
    if (payout >= staked) {
        uint64_t gain = payout - staked;
        if (gain > max || pnl > static_cast<int64_t>(max - gain)) {
            return errors::ARITHMETIC_OVERFLOW;
        }
        out = pnl + static_cast<int64_t>(gain);
    } else {
        uint64_t loss = staked - payout;
        if (loss > max || pnl < std::numeric_limits<int64_t>::min() + static_cast<int64_t>(loss)) {
            return errors::ARITHMETIC_UNDERFLOW;
        }
        out = pnl - static_cast<int64_t>(loss);
    }
    return errors::OK;
}

} // namespace

TraderProfile open(const Address& owner, Timestamp now) {
    TraderProfile t;
    t.owner = owner;
    t.created_at = now;
    t.last_active = now;
    return t;
}

int32_t record_bet(TraderProfile& t, uint64_t amount, bool new_market, Timestamp now) {
    TraderProfile next = t;
    int32_t rc;
    if ((rc = checked::add_to(next.total_volume, amount)) != errors::OK) return rc;
    if ((rc = checked::add_to(next.total_bets, 1)) != errors::OK) return rc;
    if (new_market && (rc = checked::add_to(next.markets_traded, 1)) != errors::OK) return rc;
    next.last_active = now;
    t = next;
    return errors::OK;
}

int32_t record_settlement(TraderProfile& t, uint64_t staked, uint64_t payout, Timestamp now) {
    TraderProfile next = t;
    int32_t rc;
    if ((rc = checked::add_to(next.markets_settled, 1)) != errors::OK) return rc;
    if (payout > 0 && (rc = checked::add_to(next.markets_won, 1)) != errors::OK) return rc;
    if ((rc = checked::add_to(next.total_payout, payout)) != errors::OK) return rc;
    if ((rc = add_pnl(next.total_pnl, payout, staked, next.total_pnl)) != errors::OK) return rc;
    next.last_active = now;
    t = next;
    return errors::OK;
}

} // namespace profile
} // namespace predix
