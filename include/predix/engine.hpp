#ifndef PREDIX_ENGINE_HPP
#define PREDIX_ENGINE_HPP

#include <atomic>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "market.hpp"
#include "bet.hpp"
#include "pool.hpp"
#include "profile.hpp"
#include "settlement.hpp"

namespace predix {

// =============================================================================
// Operation Results
// =============================================================================

struct BetResult {
    int32_t error_code;
    uint64_t potential_payout;
    uint64_t odds_bps;
};

struct ClaimResult {
    int32_t error_code;
    uint64_t payout;
};

struct AddLiquidityResult {
    int32_t error_code;
    uint64_t lp_minted;
    uint64_t amount_a;
    uint64_t amount_b;
};

struct RemoveLiquidityResult {
    int32_t error_code;
    uint64_t amount_a;
    uint64_t amount_b;
    uint64_t fee_a;
    uint64_t fee_b;
};

// =============================================================================
// PXEngine - Prediction market settlement engine
//
// Every mutating operation validates against current state, computes new
// entity values on copies, moves value through the ledger inside one
// LedgerTransaction and writes the entities back only after commit. Any
// failure leaves both the ledger and the entities untouched.
// =============================================================================

class PXEngine {
public:
    // Throws ConfigError when `config` is out of range
    explicit PXEngine(ILedger& ledger, EngineConfig config);
    ~PXEngine() = default;

    // Non-copyable
    PXEngine(const PXEngine&) = delete;
    PXEngine& operator=(const PXEngine&) = delete;

    const EngineConfig& config() const { return config_; }

    // =========================================================================
    // Market Lifecycle
    // =========================================================================

    int32_t create_market(const Address& creator, const MarketParams& params);

    // Admin only
    int32_t pause_market(const Address& signer, uint64_t market_id);
    int32_t unpause_market(const Address& signer, uint64_t market_id);

    // Creator or oracle, before the deadline
    int32_t cancel_market(const Address& signer, uint64_t market_id);

    // Oracle only, after the deadline; extracts fees and fixes the payout ratio
    int32_t resolve_market(const Address& signer, uint64_t market_id,
                           uint8_t outcome, const std::string& evidence);

    // =========================================================================
    // Bets
    // =========================================================================

    BetResult place_bet(const Address& bettor, uint64_t market_id,
                        uint8_t outcome, uint64_t amount);

    ClaimResult claim_winnings(const Address& signer, uint64_t market_id, const Address& owner);

    // Full stake back from a cancelled market
    ClaimResult refund_bet(const Address& signer, uint64_t market_id, const Address& owner);

    // =========================================================================
    // Liquidity
    // =========================================================================

    AddLiquidityResult add_liquidity(const Address& provider, uint64_t market_id,
                                     uint64_t amount_a, uint64_t amount_b, uint64_t min_lp_out);

    RemoveLiquidityResult remove_liquidity(const Address& provider, uint64_t market_id,
                                           uint64_t lp_amount, uint64_t min_out_a, uint64_t min_out_b);

    // =========================================================================
    // Queries
    // =========================================================================

    std::optional<Market> get_market(uint64_t market_id) const;
    std::optional<LiquidityPool> get_pool(uint64_t market_id) const;
    std::optional<Position> get_position(uint64_t market_id, const Address& owner) const;
    std::optional<LiquidityPosition> get_lp_position(uint64_t market_id, const Address& provider) const;
    std::optional<MarketResolution> get_resolution(uint64_t market_id) const;
    std::optional<TraderProfile> get_profile(const Address& owner) const;

    // Odds per outcome recomputed from the current totals
    std::optional<std::vector<uint64_t>> current_odds(uint64_t market_id) const;

    bool market_exists(uint64_t market_id) const;
    size_t market_count() const;

    // =========================================================================
    // Persistence
    // =========================================================================

    // Every entity, losslessly
    nlohmann::json snapshot() const;

    // Replace all entities; throws on malformed input and leaves state intact
    void restore(const nlohmann::json& snapshot);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_markets;
        uint64_t total_bets;
        uint64_t total_volume;
        uint64_t total_claims;
        uint64_t total_paid_out;
        uint64_t total_refunds;
        uint64_t liquidity_adds;
        uint64_t liquidity_removes;
        uint64_t rejected;
    };
    Stats get_stats() const;

private:
    using PositionKey = std::pair<uint64_t, Address>;

    ILedger& ledger_;
    EngineConfig config_;

    std::map<uint64_t, Market> markets_;
    std::map<uint64_t, LiquidityPool> pools_;
    std::map<uint64_t, MarketResolution> resolutions_;
    std::map<PositionKey, Position> positions_;
    std::map<PositionKey, LiquidityPosition> lp_positions_;
    std::map<Address, TraderProfile> profiles_;
    mutable std::shared_mutex mutex_;

    // Statistics
    std::atomic<uint64_t> total_markets_{0};
    std::atomic<uint64_t> total_bets_{0};
    std::atomic<uint64_t> total_volume_{0};
    std::atomic<uint64_t> total_claims_{0};
    std::atomic<uint64_t> total_paid_out_{0};
    std::atomic<uint64_t> total_refunds_{0};
    std::atomic<uint64_t> liquidity_adds_{0};
    std::atomic<uint64_t> liquidity_removes_{0};
    std::atomic<uint64_t> rejected_{0};

    // Count and log a rejected operation, returns `code`
    int32_t reject(const char* op, uint64_t market_id, int32_t code);

    // Ledger transfer skipping zero amounts
    int32_t pay(const LedgerAccount& from, const LedgerAccount& to, uint64_t amount);

    int32_t set_paused(const Address& signer, uint64_t market_id, bool paused);
};

} // namespace predix

#endif // PREDIX_ENGINE_HPP
