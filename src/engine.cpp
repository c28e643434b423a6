// =============================================================================
// engine.cpp - PXEngine implementation
// =============================================================================

#include "predix/engine.hpp"
#include "predix/log.hpp"
#include "predix/math.hpp"
#include "predix/serialize.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace predix {

using json = nlohmann::json;

namespace {

constexpr int SNAPSHOT_VERSION = 1;

LedgerAccount vault_account(const Market& m) {
    return LedgerAccount{addresses::market_vault(m.market_id), m.collateral};
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

PXEngine::PXEngine(ILedger& ledger, EngineConfig config)
    : ledger_(ledger), config_(std::move(config)) {
    config_.validate();
    set_log_level(config_.log_level);
}

// =============================================================================
// Internal Helpers
// =============================================================================

int32_t PXEngine::reject(const char* op, uint64_t market_id, int32_t code) {
    rejected_.fetch_add(1, std::memory_order_relaxed);
    log()->debug("{} rejected on market {}: {} ({})", op, market_id, errors::message(code), code);
    return code;
}

int32_t PXEngine::pay(const LedgerAccount& from, const LedgerAccount& to, uint64_t amount) {
    if (amount == 0) return errors::OK;
    return ledger_.transfer(from, to, amount);
}

// =============================================================================
// Market Lifecycle
// =============================================================================

int32_t PXEngine::create_market(const Address& creator, const MarketParams& params) {
    std::unique_lock lock(mutex_);
    const Timestamp now = ledger_.current_time();

    if (markets_.count(params.market_id)) {
        return reject("create_market", params.market_id, errors::MARKET_ALREADY_EXISTS);
    }
    int32_t rc = market::validate(params, config_, now);
    if (rc != errors::OK) return reject("create_market", params.market_id, rc);

    Market m = market::make(creator, params, config_, now);

    std::optional<LiquidityPool> amm;
    if (m.is_binary()) amm = pool::make(m, now);

    LedgerTransaction tx(ledger_);
    if (amm) {
        rc = ledger_.initialize_mint(amm->lp_mint, addresses::pool_authority(m.market_id));
        if (rc != errors::OK) return reject("create_market", m.market_id, rc);
    }
    tx.commit();

    log()->info("market {} created by {}: \"{}\" ({} outcomes, deadline {})",
                m.market_id, to_hex(creator), m.title, m.outcomes.size(), m.resolution_deadline);

    if (amm) pools_.emplace(m.market_id, std::move(*amm));
    markets_.emplace(m.market_id, std::move(m));
    total_markets_.fetch_add(1, std::memory_order_relaxed);
    return errors::OK;
}

int32_t PXEngine::set_paused(const Address& signer, uint64_t market_id, bool paused) {
    const char* op = paused ? "pause_market" : "unpause_market";

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        return reject(op, market_id, errors::MARKET_NOT_FOUND);
    }
    if (!ledger_.verify_authority(signer, config_.admin)) {
        return reject(op, market_id, errors::UNAUTHORIZED);
    }

    Market m = it->second;
    int32_t rc = paused ? market::pause(m) : market::unpause(m);
    if (rc != errors::OK) return reject(op, market_id, rc);

    it->second = std::move(m);
    log()->info("market {} {}", market_id, paused ? "paused" : "unpaused");
    return errors::OK;
}

int32_t PXEngine::pause_market(const Address& signer, uint64_t market_id) {
    return set_paused(signer, market_id, true);
}

int32_t PXEngine::unpause_market(const Address& signer, uint64_t market_id) {
    return set_paused(signer, market_id, false);
}

int32_t PXEngine::cancel_market(const Address& signer, uint64_t market_id) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        return reject("cancel_market", market_id, errors::MARKET_NOT_FOUND);
    }
    if (!ledger_.verify_authority(signer, it->second.creator) &&
        !ledger_.verify_authority(signer, it->second.oracle)) {
        return reject("cancel_market", market_id, errors::UNAUTHORIZED);
    }

    Market m = it->second;
    int32_t rc = market::cancel(m, ledger_.current_time());
    if (rc != errors::OK) return reject("cancel_market", market_id, rc);

    it->second = std::move(m);
    log()->info("market {} cancelled by {}", market_id, to_hex(signer));
    return errors::OK;
}

int32_t PXEngine::resolve_market(const Address& signer, uint64_t market_id,
                                 uint8_t outcome, const std::string& evidence) {
    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        return reject("resolve_market", market_id, errors::MARKET_NOT_FOUND);
    }
    if (!ledger_.verify_authority(signer, it->second.oracle)) {
        return reject("resolve_market", market_id, errors::UNAUTHORIZED_RESOLVER);
    }

    Market m = it->second;
    const Timestamp now = ledger_.current_time();

    MarketResolution r;
    int32_t rc = settlement::plan(m, outcome, signer, evidence, config_, now, r);
    if (rc != errors::OK) return reject("resolve_market", market_id, rc);

    const LedgerAccount vault = vault_account(m);
    const LedgerAccount protocol{config_.protocol_fee_recipient, m.collateral};

    LedgerTransaction tx(ledger_);
    if ((rc = pay(vault, protocol, r.protocol_fee)) != errors::OK ||
        (rc = pay(vault, protocol, r.retained_amount)) != errors::OK) {
        return reject("resolve_market", market_id, rc);
    }
    tx.commit();

    settlement::apply(m, r);
    it->second = std::move(m);
    resolutions_[market_id] = r;

    log()->info("market {} resolved to outcome {} (pool {}, winning {}, ratio {} bps)",
                market_id, outcome, r.total_pool, r.winning_pool, r.payout_ratio_bps);
    if (r.retained_amount > 0) {
        log()->warn("market {} had no winning stake, {} retained", market_id, r.retained_amount);
    }
    return errors::OK;
}

// =============================================================================
// Bets
// =============================================================================

BetResult PXEngine::place_bet(const Address& bettor, uint64_t market_id,
                              uint8_t outcome, uint64_t amount) {
    BetResult result{errors::OK, 0, 0};

    if (amount == 0) {
        result.error_code = reject("place_bet", market_id, errors::INVALID_BET_AMOUNT);
        return result;
    }

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        result.error_code = reject("place_bet", market_id, errors::MARKET_NOT_FOUND);
        return result;
    }

    const Timestamp now = ledger_.current_time();
    Market m = it->second;

    BetQuote q{};
    int32_t rc = bet::quote(m, outcome, amount, now, q);
    if (rc != errors::OK) {
        result.error_code = reject("place_bet", market_id, rc);
        return result;
    }

    const PositionKey key{market_id, bettor};
    auto pos_it = positions_.find(key);
    const bool new_position = pos_it == positions_.end();
    Position p = new_position ? bet::open_position(m, bettor, now) : pos_it->second;

    auto prof_it = profiles_.find(bettor);
    TraderProfile t = prof_it == profiles_.end() ? profile::open(bettor, now) : prof_it->second;

    if ((rc = bet::apply(m, p, new_position, outcome, amount, q, now)) != errors::OK ||
        (rc = profile::record_bet(t, amount, new_position, now)) != errors::OK) {
        result.error_code = reject("place_bet", market_id, rc);
        return result;
    }

    LedgerTransaction tx(ledger_);
    rc = ledger_.transfer(LedgerAccount{bettor, m.collateral}, vault_account(m), amount);
    if (rc != errors::OK) {
        result.error_code = reject("place_bet", market_id, rc);
        return result;
    }
    tx.commit();

    it->second = std::move(m);
    positions_[key] = std::move(p);
    profiles_[bettor] = std::move(t);

    total_bets_.fetch_add(1, std::memory_order_relaxed);
    total_volume_.fetch_add(amount, std::memory_order_relaxed);
    log()->debug("bet on market {}: {} staked {} on outcome {} at {} bps",
                 market_id, to_hex(bettor), amount, outcome, q.odds_bps);

    result.potential_payout = q.potential_payout;
    result.odds_bps = q.odds_bps;
    return result;
}

ClaimResult PXEngine::claim_winnings(const Address& signer, uint64_t market_id, const Address& owner) {
    ClaimResult result{errors::OK, 0};

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        result.error_code = reject("claim_winnings", market_id, errors::MARKET_NOT_FOUND);
        return result;
    }
    auto res_it = resolutions_.find(market_id);
    if (it->second.status != MarketStatus::RESOLVED || res_it == resolutions_.end()) {
        result.error_code = reject("claim_winnings", market_id, errors::MARKET_NOT_RESOLVED);
        return result;
    }
    auto pos_it = positions_.find(PositionKey{market_id, owner});
    if (pos_it == positions_.end()) {
        result.error_code = reject("claim_winnings", market_id, errors::POSITION_NOT_FOUND);
        return result;
    }
    if (!ledger_.verify_authority(signer, owner)) {
        result.error_code = reject("claim_winnings", market_id, errors::INVALID_POSITION);
        return result;
    }

    const Timestamp now = ledger_.current_time();
    Market m = it->second;
    Position p = pos_it->second;

    uint64_t payout = 0;
    int32_t rc = settlement::quote_claim(m, res_it->second, p, now, payout);
    if (rc != errors::OK) {
        result.error_code = reject("claim_winnings", market_id, rc);
        return result;
    }

    p.claimed = true;
    p.claimed_at = now;
    p.payout = payout;

    auto prof_it = profiles_.find(owner);
    TraderProfile t = prof_it == profiles_.end() ? profile::open(owner, now) : prof_it->second;

    if ((rc = checked::add_to(m.total_claimed, payout)) != errors::OK ||
        (rc = profile::record_settlement(t, p.total_amount, payout, now)) != errors::OK) {
        result.error_code = reject("claim_winnings", market_id, rc);
        return result;
    }

    LedgerTransaction tx(ledger_);
    rc = pay(vault_account(m), LedgerAccount{owner, m.collateral}, payout);
    if (rc != errors::OK) {
        result.error_code = reject("claim_winnings", market_id, rc);
        return result;
    }
    tx.commit();

    it->second = std::move(m);
    pos_it->second = std::move(p);
    profiles_[owner] = std::move(t);

    total_claims_.fetch_add(1, std::memory_order_relaxed);
    total_paid_out_.fetch_add(payout, std::memory_order_relaxed);
    log()->debug("claim on market {}: {} paid {}", market_id, to_hex(owner), payout);

    result.payout = payout;
    return result;
}

ClaimResult PXEngine::refund_bet(const Address& signer, uint64_t market_id, const Address& owner) {
    ClaimResult result{errors::OK, 0};

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        result.error_code = reject("refund_bet", market_id, errors::MARKET_NOT_FOUND);
        return result;
    }
    if (it->second.status != MarketStatus::CANCELLED) {
        result.error_code = reject("refund_bet", market_id, errors::MARKET_NOT_CANCELLED);
        return result;
    }
    auto pos_it = positions_.find(PositionKey{market_id, owner});
    if (pos_it == positions_.end()) {
        result.error_code = reject("refund_bet", market_id, errors::POSITION_NOT_FOUND);
        return result;
    }
    if (!ledger_.verify_authority(signer, owner)) {
        result.error_code = reject("refund_bet", market_id, errors::INVALID_POSITION);
        return result;
    }

    Market m = it->second;
    Position p = pos_it->second;

    int32_t rc = bet::check_refund(m, p);
    if (rc != errors::OK) {
        result.error_code = reject("refund_bet", market_id, rc);
        return result;
    }

    const Timestamp now = ledger_.current_time();
    const uint64_t amount = p.total_amount;
    p.claimed = true;
    p.claimed_at = now;
    p.payout = amount;
    if ((rc = checked::add_to(m.total_refunded, amount)) != errors::OK) {
        result.error_code = reject("refund_bet", market_id, rc);
        return result;
    }

    LedgerTransaction tx(ledger_);
    rc = ledger_.transfer(vault_account(m), LedgerAccount{owner, m.collateral}, amount);
    if (rc != errors::OK) {
        result.error_code = reject("refund_bet", market_id, rc);
        return result;
    }
    tx.commit();

    it->second = std::move(m);
    pos_it->second = std::move(p);

    total_refunds_.fetch_add(1, std::memory_order_relaxed);
    log()->debug("refund on market {}: {} returned {}", market_id, to_hex(owner), amount);

    result.payout = amount;
    return result;
}

// =============================================================================
// Liquidity
// =============================================================================

AddLiquidityResult PXEngine::add_liquidity(const Address& provider, uint64_t market_id,
                                           uint64_t amount_a, uint64_t amount_b, uint64_t min_lp_out) {
    AddLiquidityResult result{errors::OK, 0, 0, 0};

    if (amount_a == 0 || amount_b == 0) {
        result.error_code = reject("add_liquidity", market_id, errors::INVALID_AMOUNT);
        return result;
    }

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        result.error_code = reject("add_liquidity", market_id, errors::MARKET_NOT_FOUND);
        return result;
    }

    const Timestamp now = ledger_.current_time();
    int32_t rc = market::check_open(it->second, now);
    if (rc != errors::OK) {
        result.error_code = reject("add_liquidity", market_id, rc);
        return result;
    }
    auto pool_it = pools_.find(market_id);
    if (pool_it == pools_.end()) {
        result.error_code = reject("add_liquidity", market_id, errors::POOL_NOT_AVAILABLE);
        return result;
    }

    Market m = it->second;
    LiquidityPool p = pool_it->second;

    AddLiquidityQuote q{};
    rc = pool::quote_add(p, amount_a, amount_b, min_lp_out, config_, q);
    if (rc != errors::OK) {
        result.error_code = reject("add_liquidity", market_id, rc);
        return result;
    }

    const PositionKey key{market_id, provider};
    auto pos_it = lp_positions_.find(key);
    LiquidityPosition pos = pos_it == lp_positions_.end()
        ? pool::open_position(market_id, provider, now)
        : pos_it->second;

    if ((rc = pool::apply_add(p, pos, q, now)) != errors::OK ||
        (rc = pool::total_liquidity(p, m.total_liquidity)) != errors::OK) {
        result.error_code = reject("add_liquidity", market_id, rc);
        return result;
    }

    const Address vault = addresses::pool_vault(market_id);
    const Currency token_a = addresses::outcome_token(market_id, 0);
    const Currency token_b = addresses::outcome_token(market_id, 1);

    LedgerTransaction tx(ledger_);
    if ((rc = ledger_.transfer({provider, token_a}, {vault, token_a}, q.used_a)) != errors::OK ||
        (rc = ledger_.transfer({provider, token_b}, {vault, token_b}, q.used_b)) != errors::OK ||
        (rc = ledger_.mint(addresses::pool_authority(market_id), p.lp_mint,
                           {provider, p.lp_mint}, q.lp_minted)) != errors::OK) {
        result.error_code = reject("add_liquidity", market_id, rc);
        return result;
    }
    tx.commit();

    it->second = std::move(m);
    pool_it->second = std::move(p);
    lp_positions_[key] = std::move(pos);

    liquidity_adds_.fetch_add(1, std::memory_order_relaxed);
    log()->debug("liquidity added to market {}: {} deposited {}/{} for {} LP",
                 market_id, to_hex(provider), q.used_a, q.used_b, q.lp_minted);

    result.lp_minted = q.lp_minted;
    result.amount_a = q.used_a;
    result.amount_b = q.used_b;
    return result;
}

RemoveLiquidityResult PXEngine::remove_liquidity(const Address& provider, uint64_t market_id,
                                                 uint64_t lp_amount, uint64_t min_out_a, uint64_t min_out_b) {
    RemoveLiquidityResult result{errors::OK, 0, 0, 0, 0};

    if (lp_amount == 0) {
        result.error_code = reject("remove_liquidity", market_id, errors::INVALID_AMOUNT);
        return result;
    }

    std::unique_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) {
        result.error_code = reject("remove_liquidity", market_id, errors::MARKET_NOT_FOUND);
        return result;
    }
    auto pool_it = pools_.find(market_id);
    if (pool_it == pools_.end()) {
        result.error_code = reject("remove_liquidity", market_id, errors::POOL_NOT_AVAILABLE);
        return result;
    }

    const Timestamp now = ledger_.current_time();
    Market m = it->second;
    LiquidityPool p = pool_it->second;

    const PositionKey key{market_id, provider};
    auto pos_it = lp_positions_.find(key);
    LiquidityPosition pos = pos_it == lp_positions_.end()
        ? pool::open_position(market_id, provider, now)
        : pos_it->second;

    // Withdrawal fee only while trading is open
    const bool charge_fee = m.status == MarketStatus::ACTIVE || m.status == MarketStatus::PAUSED;

    RemoveLiquidityQuote q{};
    int32_t rc = pool::quote_remove(p, pos, lp_amount, min_out_a, min_out_b, charge_fee, q);
    if (rc != errors::OK) {
        result.error_code = reject("remove_liquidity", market_id, rc);
        return result;
    }

    if ((rc = pool::apply_remove(p, pos, q, now)) != errors::OK ||
        (rc = pool::total_liquidity(p, m.total_liquidity)) != errors::OK) {
        result.error_code = reject("remove_liquidity", market_id, rc);
        return result;
    }

    const Address vault = addresses::pool_vault(market_id);
    const Currency token_a = addresses::outcome_token(market_id, 0);
    const Currency token_b = addresses::outcome_token(market_id, 1);

    LedgerTransaction tx(ledger_);
    if ((rc = ledger_.burn({provider, p.lp_mint}, q.lp_burned)) != errors::OK ||
        (rc = pay({vault, token_a}, {provider, token_a}, q.net_a)) != errors::OK ||
        (rc = pay({vault, token_b}, {provider, token_b}, q.net_b)) != errors::OK) {
        result.error_code = reject("remove_liquidity", market_id, rc);
        return result;
    }
    tx.commit();

    it->second = std::move(m);
    pool_it->second = std::move(p);
    lp_positions_[key] = std::move(pos);

    liquidity_removes_.fetch_add(1, std::memory_order_relaxed);
    log()->debug("liquidity removed from market {}: {} burned {} LP for {}/{} (fees {}/{})",
                 market_id, to_hex(provider), q.lp_burned, q.net_a, q.net_b, q.fee_a, q.fee_b);

    result.amount_a = q.net_a;
    result.amount_b = q.net_b;
    result.fee_a = q.fee_a;
    result.fee_b = q.fee_b;
    return result;
}

// =============================================================================
// Queries
// =============================================================================

std::optional<Market> PXEngine::get_market(uint64_t market_id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) return std::nullopt;
    return it->second;
}

std::optional<LiquidityPool> PXEngine::get_pool(uint64_t market_id) const {
    std::shared_lock lock(mutex_);
    auto it = pools_.find(market_id);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::optional<Position> PXEngine::get_position(uint64_t market_id, const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = positions_.find(PositionKey{market_id, owner});
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::optional<LiquidityPosition> PXEngine::get_lp_position(uint64_t market_id,
                                                           const Address& provider) const {
    std::shared_lock lock(mutex_);
    auto it = lp_positions_.find(PositionKey{market_id, provider});
    if (it == lp_positions_.end()) return std::nullopt;
    return it->second;
}

std::optional<MarketResolution> PXEngine::get_resolution(uint64_t market_id) const {
    std::shared_lock lock(mutex_);
    auto it = resolutions_.find(market_id);
    if (it == resolutions_.end()) return std::nullopt;
    return it->second;
}

std::optional<TraderProfile> PXEngine::get_profile(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = profiles_.find(owner);
    if (it == profiles_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::vector<uint64_t>> PXEngine::current_odds(uint64_t market_id) const {
    std::shared_lock lock(mutex_);
    auto it = markets_.find(market_id);
    if (it == markets_.end()) return std::nullopt;

    std::vector<uint64_t> totals;
    totals.reserve(it->second.outcomes.size());
    for (const auto& o : it->second.outcomes) totals.push_back(o.total_amount);
    return compute_odds(totals);
}

bool PXEngine::market_exists(uint64_t market_id) const {
    std::shared_lock lock(mutex_);
    return markets_.count(market_id) > 0;
}

size_t PXEngine::market_count() const {
    std::shared_lock lock(mutex_);
    return markets_.size();
}

// =============================================================================
// Persistence
// =============================================================================

json PXEngine::snapshot() const {
    std::shared_lock lock(mutex_);

    json markets = json::array();
    for (const auto& [id, m] : markets_) markets.push_back(m);

    json pools = json::array();
    for (const auto& [id, p] : pools_) pools.push_back(p);

    json resolutions = json::array();
    for (const auto& [id, r] : resolutions_) resolutions.push_back(r);

    json positions = json::array();
    for (const auto& [key, p] : positions_) positions.push_back(p);

    json lp_positions = json::array();
    for (const auto& [key, p] : lp_positions_) lp_positions.push_back(p);

    json profiles = json::array();
    for (const auto& [owner, t] : profiles_) profiles.push_back(t);

    return json{
        {"version", SNAPSHOT_VERSION},
        {"markets", std::move(markets)},
        {"pools", std::move(pools)},
        {"resolutions", std::move(resolutions)},
        {"positions", std::move(positions)},
        {"lp_positions", std::move(lp_positions)},
        {"profiles", std::move(profiles)}
    };
}

void PXEngine::restore(const json& snapshot) {
    if (snapshot.at("version").get<int>() != SNAPSHOT_VERSION) {
        throw std::runtime_error("Unsupported snapshot version");
    }

    std::map<uint64_t, Market> markets;
    std::map<uint64_t, LiquidityPool> pools;
    std::map<uint64_t, MarketResolution> resolutions;
    std::map<PositionKey, Position> positions;
    std::map<PositionKey, LiquidityPosition> lp_positions;
    std::map<Address, TraderProfile> profiles;

    for (const auto& j : snapshot.at("markets")) {
        auto m = j.get<Market>();
        const uint64_t id = m.market_id;
        if (!markets.emplace(id, std::move(m)).second) {
            throw std::runtime_error("Duplicate market in snapshot: " + std::to_string(id));
        }
    }

    auto require_market = [&](uint64_t id) {
        if (!markets.count(id)) {
            throw std::runtime_error("Snapshot references unknown market " + std::to_string(id));
        }
    };

    for (const auto& j : snapshot.at("pools")) {
        auto p = j.get<LiquidityPool>();
        require_market(p.market_id);
        pools[p.market_id] = std::move(p);
    }
    for (const auto& j : snapshot.at("resolutions")) {
        auto r = j.get<MarketResolution>();
        require_market(r.market_id);
        resolutions[r.market_id] = std::move(r);
    }
    for (const auto& j : snapshot.at("positions")) {
        auto p = j.get<Position>();
        require_market(p.market_id);
        positions[PositionKey{p.market_id, p.owner}] = std::move(p);
    }
    for (const auto& j : snapshot.at("lp_positions")) {
        auto p = j.get<LiquidityPosition>();
        require_market(p.market_id);
        lp_positions[PositionKey{p.market_id, p.provider}] = std::move(p);
    }
    for (const auto& j : snapshot.at("profiles")) {
        auto t = j.get<TraderProfile>();
        const Address owner = t.owner;
        if (!profiles.emplace(owner, std::move(t)).second) {
            throw std::runtime_error("Duplicate profile in snapshot: " + to_hex(owner));
        }
    }

    std::unique_lock lock(mutex_);
    markets_ = std::move(markets);
    pools_ = std::move(pools);
    resolutions_ = std::move(resolutions);
    positions_ = std::move(positions);
    lp_positions_ = std::move(lp_positions);
    profiles_ = std::move(profiles);

    log()->info("restored {} markets, {} positions, {} liquidity positions",
                markets_.size(), positions_.size(), lp_positions_.size());
}

// =============================================================================
// Statistics
// =============================================================================

PXEngine::Stats PXEngine::get_stats() const {
    return Stats{
        total_markets_.load(),
        total_bets_.load(),
        total_volume_.load(),
        total_claims_.load(),
        total_paid_out_.load(),
        total_refunds_.load(),
        liquidity_adds_.load(),
        liquidity_removes_.load(),
        rejected_.load()
    };
}

} // namespace predix
