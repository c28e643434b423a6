#ifndef PREDIX_POOL_HPP
#define PREDIX_POOL_HPP

#include <cstdint>

#include "types.hpp"
#include "config.hpp"
#include "market.hpp"

namespace predix {

// =============================================================================
// Liquidity Pool (constant product, binary markets only)
// Reserves are held by addresses::pool_vault in the two outcome-token
// currencies. Independent of the parimutuel stakes.
// =============================================================================

struct LiquidityPool {
    uint64_t market_id = 0;
    uint64_t reserve_a = 0;
    uint64_t reserve_b = 0;
    uint64_t total_lp_supply = 0;
    U128 k = 0;                     // reserve_a * reserve_b
    uint16_t fee_bps = 0;           // Withdrawal fee while trading is open
    uint64_t accumulated_fee_a = 0;
    uint64_t accumulated_fee_b = 0;
    uint64_t active_providers = 0;
    Currency lp_mint;
    Timestamp last_update = 0;
};

// =============================================================================
// Liquidity Position (one per market and provider)
// =============================================================================

struct LiquidityPosition {
    uint64_t market_id = 0;
    Address provider{};
    uint64_t lp_shares = 0;
    uint64_t contributed_a = 0;
    uint64_t contributed_b = 0;
    uint64_t withdrawn_a = 0;
    uint64_t withdrawn_b = 0;
    Timestamp created_at = 0;
    Timestamp last_update = 0;
    bool active = false;
};

// =============================================================================
// Quotes
// =============================================================================

struct AddLiquidityQuote {
    uint64_t lp_minted;
    uint64_t used_a;       // Amount actually taken from the provider
    uint64_t used_b;
};

struct RemoveLiquidityQuote {
    uint64_t lp_burned;
    uint64_t gross_a;
    uint64_t gross_b;
    uint64_t fee_a;        // Stays in the reserve
    uint64_t fee_b;
    uint64_t net_a;        // Paid to the provider
    uint64_t net_b;
};

namespace pool {

// Empty pool for a binary market
LiquidityPool make(const Market& m, Timestamp now);

LiquidityPosition open_position(uint64_t market_id, const Address& provider, Timestamp now);

// Empty pool:  minted = max(minimum_liquidity, isqrt(a * b))
// Otherwise:   minted = min(a * S / reserve_a, b * S / reserve_b)
int32_t quote_add(const LiquidityPool& p, uint64_t amount_a, uint64_t amount_b,
                  uint64_t min_lp_out, const EngineConfig& config, AddLiquidityQuote& out);

int32_t apply_add(LiquidityPool& p, LiquidityPosition& pos,
                  const AddLiquidityQuote& q, Timestamp now);

// gross_i = reserve_i * lp / S; fee charged only when `charge_fee` and
// `lp` is less than the whole supply
int32_t quote_remove(const LiquidityPool& p, const LiquidityPosition& pos, uint64_t lp_amount,
                     uint64_t min_out_a, uint64_t min_out_b, bool charge_fee,
                     RemoveLiquidityQuote& out);

int32_t apply_remove(LiquidityPool& p, LiquidityPosition& pos,
                     const RemoveLiquidityQuote& q, Timestamp now);

// reserve_a + reserve_b, as tracked on the market
int32_t total_liquidity(const LiquidityPool& p, uint64_t& out);

} // namespace pool

} // namespace predix

#endif // PREDIX_POOL_HPP
