#ifndef PREDIX_BET_HPP
#define PREDIX_BET_HPP

#include <cstdint>
#include <vector>

#include "types.hpp"
#include "market.hpp"

namespace predix {

// =============================================================================
// Position (one per market and bettor)
// =============================================================================

struct PositionLeg {
    uint64_t amount = 0;
    uint64_t odds_at_bet_bps = 0;   // Set by the first bet on this outcome
};

// Single bet as placed; never modified
struct BetFill {
    uint8_t outcome;
    uint64_t amount;
    uint64_t odds_bps;
    Timestamp timestamp;
};

struct Position {
    uint64_t market_id = 0;
    Address owner{};
    uint64_t total_amount = 0;
    std::vector<PositionLeg> legs;     // Indexed by outcome
    std::vector<BetFill> fills;        // Append-only
    uint64_t bet_count = 0;
    bool claimed = false;
    Timestamp claimed_at = 0;
    uint64_t payout = 0;
    Timestamp created_at = 0;
    Timestamp last_bet_at = 0;

    uint64_t stake_on(uint8_t outcome) const {
        return outcome < legs.size() ? legs[outcome].amount : 0;
    }
};

// =============================================================================
// Odds
// current_odds = total * 10000 / outcome_total
//   outcome holds the whole pool (or pool empty) -> 10000
//   outcome holds no stake while others do      -> 0 (undefined)
// Values beyond u64 saturate.
// =============================================================================

std::vector<uint64_t> compute_odds(const std::vector<uint64_t>& outcome_totals);

// Recompute every outcome's current_odds_bps from its totals
void refresh_odds(Market& m);

// =============================================================================
// Bet Quoting & Application
// =============================================================================

struct BetQuote {
    uint64_t potential_payout;   // With pre-bet totals
    uint64_t odds_bps;           // total * 10000 / opposing, or 20000
};

namespace bet {

// All placement preconditions except market existence
int32_t quote(const Market& m, uint8_t outcome, uint64_t amount, Timestamp now, BetQuote& out);

// Empty position for `owner`, one leg per outcome
Position open_position(const Market& m, const Address& owner, Timestamp now);

// Record a quoted bet on the market and the position
int32_t apply(Market& m, Position& p, bool new_position, uint8_t outcome,
              uint64_t amount, const BetQuote& q, Timestamp now);

// Market must be CANCELLED and the position unclaimed
int32_t check_refund(const Market& m, const Position& p);

} // namespace bet

} // namespace predix

#endif // PREDIX_BET_HPP
