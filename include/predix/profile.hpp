#ifndef PREDIX_PROFILE_HPP
#define PREDIX_PROFILE_HPP

#include <cstdint>

#include "types.hpp"

namespace predix {

// =============================================================================
// Trader Profile
// Aggregates across every market a bettor has staked in.
// =============================================================================

struct TraderProfile {
    Address owner{};
    uint64_t total_volume = 0;      // Sum of stakes
    uint64_t total_bets = 0;
    uint64_t markets_traded = 0;
    uint64_t markets_settled = 0;   // Claimed after resolution
    uint64_t markets_won = 0;       // Settled with a non-zero payout
    uint64_t total_payout = 0;
    int64_t total_pnl = 0;          // Payouts minus stakes of settled markets
    Timestamp created_at = 0;
    Timestamp last_active = 0;

    // markets_won / markets_settled in bps, 0 before the first settlement
    uint64_t win_rate_bps() const;
};

namespace profile {

TraderProfile open(const Address& owner, Timestamp now);

// A stake of `amount`; `new_market` on the bettor's first bet in a market
int32_t record_bet(TraderProfile& t, uint64_t amount, bool new_market, Timestamp now);

// A resolved position closed with `payout` against `staked`
int32_t record_settlement(TraderProfile& t, uint64_t staked, uint64_t payout, Timestamp now);

} // namespace profile

} // namespace predix

#endif // PREDIX_PROFILE_HPP
