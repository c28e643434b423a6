#ifndef PREDIX_SETTLEMENT_HPP
#define PREDIX_SETTLEMENT_HPP

#include <cstdint>
#include <string>

#include "types.hpp"
#include "config.hpp"
#include "market.hpp"
#include "bet.hpp"

namespace predix {

// =============================================================================
// Market Resolution Record
// Outcome and ratio are immutable once `resolved` is set.
// =============================================================================

struct MarketResolution {
    uint64_t market_id = 0;
    bool resolved = false;
    uint8_t winning_outcome = 0;
    Address resolver{};
    std::string evidence;
    Timestamp resolved_at = 0;
    Timestamp dispute_period_end = 0;   // 0 = no dispute window
    uint64_t total_pool = 0;
    uint64_t winning_pool = 0;
    uint64_t protocol_fee = 0;
    uint64_t retained_amount = 0;       // Remaining pool kept when nobody won
    uint64_t payout_ratio_bps = 0;
};

namespace settlement {

// Fees and payout ratio for resolving `m` to `outcome`
//   protocol_fee = total * platform_fee_bps / 10000
//   ratio        = (total - protocol_fee) * 10000 / winning_pool, 0 if nobody won
int32_t plan(const Market& m, uint8_t outcome, const Address& resolver,
             const std::string& evidence, const EngineConfig& config,
             Timestamp now, MarketResolution& out);

// Write a planned resolution onto the market (status RESOLVED)
void apply(Market& m, const MarketResolution& r);

// Winnings owed to `p`: leg * ratio / 10000, 0 with no winning stake.
// NO_WINNINGS when a winning stake rounds to nothing.
int32_t quote_claim(const Market& m, const MarketResolution& r, const Position& p,
                    Timestamp now, uint64_t& out);

} // namespace settlement

} // namespace predix

#endif // PREDIX_SETTLEMENT_HPP
