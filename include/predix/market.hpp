#ifndef PREDIX_MARKET_HPP
#define PREDIX_MARKET_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "config.hpp"

namespace predix {

// =============================================================================
// Market Status
// ACTIVE -> {RESOLVED, CANCELLED}, ACTIVE <-> PAUSED. RESOLVED and CANCELLED
// are terminal.
// =============================================================================

enum class MarketStatus : uint8_t {
    ACTIVE = 0,
    PAUSED = 1,
    RESOLVED = 2,
    CANCELLED = 3
};

const char* to_string(MarketStatus status);
std::optional<MarketStatus> market_status_from_string(std::string_view s);

// =============================================================================
// Outcome State
// =============================================================================

struct OutcomeState {
    std::string label;
    uint64_t total_amount = 0;
    uint64_t bet_count = 0;
    uint64_t current_odds_bps = ODDS_EVEN;
};

// =============================================================================
// Market Creation Parameters
// =============================================================================

struct MarketParams {
    uint64_t market_id = 0;
    Address oracle{};
    Currency collateral;
    std::string title;
    std::string description;
    std::string category;
    std::string resolution_source;
    std::vector<std::string> outcomes;
    Timestamp resolution_deadline = 0;
    uint16_t creator_fee_bps = 0;
    uint16_t platform_fee_bps = 0;
    std::optional<uint16_t> lp_fee_bps;     // Unset = EngineConfig::default_lp_fee_bps
    uint64_t min_bet = 0;
    uint64_t max_bet = 0;
    uint64_t max_payout_per_bet = 0;
};

// =============================================================================
// Market
// =============================================================================

struct Market {
    uint64_t market_id = 0;
    Address creator{};
    Address oracle{};
    Currency collateral;

    std::string title;
    std::string description;
    std::string category;
    std::string resolution_source;

    Timestamp created_at = 0;
    Timestamp resolution_deadline = 0;
    MarketStatus status = MarketStatus::ACTIVE;

    std::vector<OutcomeState> outcomes;

    // Fee rates (bps)
    uint16_t creator_fee_bps = 0;       // Recorded, never taken from the pool
    uint16_t platform_fee_bps = 0;
    uint16_t lp_fee_bps = 0;

    // Bet bounds
    uint64_t min_bet = 0;
    uint64_t max_bet = 0;
    uint64_t max_payout_per_bet = 0;

    std::optional<uint8_t> resolved_outcome;
    std::optional<Timestamp> resolved_at;

    // Aggregates
    uint64_t total_volume = 0;
    uint64_t total_bets = 0;
    uint64_t unique_bettors = 0;
    uint64_t total_liquidity = 0;
    uint64_t total_claimed = 0;
    uint64_t total_refunded = 0;
    uint64_t protocol_fee = 0;
    uint64_t payout_ratio_bps = 0;
    Timestamp last_bet_at = 0;

    bool is_binary() const { return outcomes.size() == 2; }
    bool has_outcome(uint8_t outcome) const { return outcome < outcomes.size(); }
    bool expired(Timestamp now) const { return now >= resolution_deadline; }

    // Sum of the stakes on every outcome except `outcome`
    uint64_t opposing_pool(uint8_t outcome) const;
};

// =============================================================================
// State Machine
// Preconditions are checked here; authorization is the caller's.
// =============================================================================

namespace market {

// Validate creation parameters against the configured caps
int32_t validate(const MarketParams& params, const EngineConfig& config, Timestamp now);

// Build a fresh ACTIVE market (params must already be valid)
Market make(const Address& creator, const MarketParams& params, const EngineConfig& config,
            Timestamp now);

int32_t pause(Market& m);
int32_t unpause(Market& m);
int32_t cancel(Market& m, Timestamp now);

// Status, time, outcome range and evidence size, in that order
int32_t check_resolve(const Market& m, uint8_t outcome, size_t evidence_size,
                      const EngineConfig& config, Timestamp now);

// Status and time checks shared by bets and liquidity deposits
int32_t check_open(const Market& m, Timestamp now);

} // namespace market

} // namespace predix

#endif // PREDIX_MARKET_HPP
