// =============================================================================
// serialize.cpp - JSON encoding of engine entities
// =============================================================================

#include "predix/serialize.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace predix {

using json = nlohmann::json;

namespace {

Address read_address(const json& j, const char* key) {
    auto addr = address_from_hex(j.at(key).get<std::string>());
    if (!addr) {
        throw std::runtime_error(std::string("Malformed address in field ") + key);
    }
    return *addr;
}

U128 read_u128(const json& j, const char* key) {
    auto v = u128_from_string(j.at(key).get<std::string>());
    if (!v) {
        throw std::runtime_error(std::string("Malformed 128-bit value in field ") + key);
    }
    return *v;
}

} // namespace

// =============================================================================
// Currency / Status
// =============================================================================

void to_json(json& j, const Currency& c) {
    j = to_hex(c.addr);
}

void from_json(const json& j, Currency& c) {
    auto addr = address_from_hex(j.get<std::string>());
    if (!addr) {
        throw std::runtime_error("Malformed currency address");
    }
    c = Currency{*addr};
}

void to_json(json& j, const MarketStatus& s) {
    j = to_string(s);
}

void from_json(const json& j, MarketStatus& s) {
    auto status = market_status_from_string(j.get<std::string>());
    if (!status) {
        throw std::runtime_error("Unknown market status: " + j.get<std::string>());
    }
    s = *status;
}

// =============================================================================
// Market
// =============================================================================

void to_json(json& j, const OutcomeState& o) {
    j = json{
        {"label", o.label},
        {"total_amount", o.total_amount},
        {"bet_count", o.bet_count},
        {"current_odds_bps", o.current_odds_bps}
    };
}

void from_json(const json& j, OutcomeState& o) {
    j.at("label").get_to(o.label);
    j.at("total_amount").get_to(o.total_amount);
    j.at("bet_count").get_to(o.bet_count);
    j.at("current_odds_bps").get_to(o.current_odds_bps);
}

void to_json(json& j, const MarketParams& p) {
    j = json{
        {"market_id", p.market_id},
        {"oracle", to_hex(p.oracle)},
        {"collateral", p.collateral},
        {"title", p.title},
        {"description", p.description},
        {"category", p.category},
        {"resolution_source", p.resolution_source},
        {"outcomes", p.outcomes},
        {"resolution_deadline", p.resolution_deadline},
        {"creator_fee_bps", p.creator_fee_bps},
        {"platform_fee_bps", p.platform_fee_bps},
        {"lp_fee_bps", p.lp_fee_bps ? json(*p.lp_fee_bps) : json(nullptr)},
        {"min_bet", p.min_bet},
        {"max_bet", p.max_bet},
        {"max_payout_per_bet", p.max_payout_per_bet}
    };
}

void from_json(const json& j, MarketParams& p) {
    j.at("market_id").get_to(p.market_id);
    p.oracle = read_address(j, "oracle");
    j.at("collateral").get_to(p.collateral);
    p.title = j.value("title", std::string{});
    p.description = j.value("description", std::string{});
    p.category = j.value("category", std::string{});
    p.resolution_source = j.value("resolution_source", std::string{});
    j.at("outcomes").get_to(p.outcomes);
    j.at("resolution_deadline").get_to(p.resolution_deadline);
    p.creator_fee_bps = j.value("creator_fee_bps", uint16_t{0});
    p.platform_fee_bps = j.value("platform_fee_bps", uint16_t{0});
    if (j.contains("lp_fee_bps") && !j.at("lp_fee_bps").is_null()) {
        p.lp_fee_bps = j.at("lp_fee_bps").get<uint16_t>();
    } else {
        p.lp_fee_bps.reset();
    }
    j.at("min_bet").get_to(p.min_bet);
    j.at("max_bet").get_to(p.max_bet);
    j.at("max_payout_per_bet").get_to(p.max_payout_per_bet);
}

void to_json(json& j, const Market& m) {
    j = json{
        {"market_id", m.market_id},
        {"creator", to_hex(m.creator)},
        {"oracle", to_hex(m.oracle)},
        {"collateral", m.collateral},
        {"title", m.title},
        {"description", m.description},
        {"category", m.category},
        {"resolution_source", m.resolution_source},
        {"created_at", m.created_at},
        {"resolution_deadline", m.resolution_deadline},
        {"status", m.status},
        {"outcomes", m.outcomes},
        {"creator_fee_bps", m.creator_fee_bps},
        {"platform_fee_bps", m.platform_fee_bps},
        {"lp_fee_bps", m.lp_fee_bps},
        {"min_bet", m.min_bet},
        {"max_bet", m.max_bet},
        {"max_payout_per_bet", m.max_payout_per_bet},
        {"resolved_outcome", nullptr},
        {"resolved_at", nullptr},
        {"total_volume", m.total_volume},
        {"total_bets", m.total_bets},
        {"unique_bettors", m.unique_bettors},
        {"total_liquidity", m.total_liquidity},
        {"total_claimed", m.total_claimed},
        {"total_refunded", m.total_refunded},
        {"protocol_fee", m.protocol_fee},
        {"payout_ratio_bps", m.payout_ratio_bps},
        {"last_bet_at", m.last_bet_at}
    };
    if (m.resolved_outcome) j["resolved_outcome"] = *m.resolved_outcome;
    if (m.resolved_at) j["resolved_at"] = *m.resolved_at;
}

void from_json(const json& j, Market& m) {
    j.at("market_id").get_to(m.market_id);
    m.creator = read_address(j, "creator");
    m.oracle = read_address(j, "oracle");
    j.at("collateral").get_to(m.collateral);
    j.at("title").get_to(m.title);
    j.at("description").get_to(m.description);
    j.at("category").get_to(m.category);
    j.at("resolution_source").get_to(m.resolution_source);
    j.at("created_at").get_to(m.created_at);
    j.at("resolution_deadline").get_to(m.resolution_deadline);
    j.at("status").get_to(m.status);
    j.at("outcomes").get_to(m.outcomes);
    j.at("creator_fee_bps").get_to(m.creator_fee_bps);
    j.at("platform_fee_bps").get_to(m.platform_fee_bps);
    j.at("lp_fee_bps").get_to(m.lp_fee_bps);
    j.at("min_bet").get_to(m.min_bet);
    j.at("max_bet").get_to(m.max_bet);
    j.at("max_payout_per_bet").get_to(m.max_payout_per_bet);

    const auto& outcome = j.at("resolved_outcome");
    if (outcome.is_null()) m.resolved_outcome.reset();
    else m.resolved_outcome = outcome.get<uint8_t>();

    const auto& at = j.at("resolved_at");
    if (at.is_null()) m.resolved_at.reset();
    else m.resolved_at = at.get<Timestamp>();

    j.at("total_volume").get_to(m.total_volume);
    j.at("total_bets").get_to(m.total_bets);
    j.at("unique_bettors").get_to(m.unique_bettors);
    j.at("total_liquidity").get_to(m.total_liquidity);
    j.at("total_claimed").get_to(m.total_claimed);
    j.at("total_refunded").get_to(m.total_refunded);
    j.at("protocol_fee").get_to(m.protocol_fee);
    j.at("payout_ratio_bps").get_to(m.payout_ratio_bps);
    j.at("last_bet_at").get_to(m.last_bet_at);
}

// =============================================================================
// Position
// =============================================================================

void to_json(json& j, const PositionLeg& l) {
    j = json{{"amount", l.amount}, {"odds_at_bet_bps", l.odds_at_bet_bps}};
}

void from_json(const json& j, PositionLeg& l) {
    j.at("amount").get_to(l.amount);
    j.at("odds_at_bet_bps").get_to(l.odds_at_bet_bps);
}

void to_json(json& j, const BetFill& f) {
    j = json{
        {"outcome", f.outcome},
        {"amount", f.amount},
        {"odds_bps", f.odds_bps},
        {"timestamp", f.timestamp}
    };
}

void from_json(const json& j, BetFill& f) {
    j.at("outcome").get_to(f.outcome);
    j.at("amount").get_to(f.amount);
    j.at("odds_bps").get_to(f.odds_bps);
    j.at("timestamp").get_to(f.timestamp);
}

void to_json(json& j, const Position& p) {
    j = json{
        {"market_id", p.market_id},
        {"owner", to_hex(p.owner)},
        {"total_amount", p.total_amount},
        {"legs", p.legs},
        {"fills", p.fills},
        {"bet_count", p.bet_count},
        {"claimed", p.claimed},
        {"claimed_at", p.claimed_at},
        {"payout", p.payout},
        {"created_at", p.created_at},
        {"last_bet_at", p.last_bet_at}
    };
}

void from_json(const json& j, Position& p) {
    j.at("market_id").get_to(p.market_id);
    p.owner = read_address(j, "owner");
    j.at("total_amount").get_to(p.total_amount);
    j.at("legs").get_to(p.legs);
    j.at("fills").get_to(p.fills);
    j.at("bet_count").get_to(p.bet_count);
    j.at("claimed").get_to(p.claimed);
    j.at("claimed_at").get_to(p.claimed_at);
    j.at("payout").get_to(p.payout);
    j.at("created_at").get_to(p.created_at);
    j.at("last_bet_at").get_to(p.last_bet_at);
}

// =============================================================================
// Liquidity
// =============================================================================

void to_json(json& j, const LiquidityPool& p) {
    j = json{
        {"market_id", p.market_id},
        {"reserve_a", p.reserve_a},
        {"reserve_b", p.reserve_b},
        {"total_lp_supply", p.total_lp_supply},
        {"k", u128_to_string(p.k)},
        {"fee_bps", p.fee_bps},
        {"accumulated_fee_a", p.accumulated_fee_a},
        {"accumulated_fee_b", p.accumulated_fee_b},
        {"active_providers", p.active_providers},
        {"lp_mint", p.lp_mint},
        {"last_update", p.last_update}
    };
}

void from_json(const json& j, LiquidityPool& p) {
    j.at("market_id").get_to(p.market_id);
    j.at("reserve_a").get_to(p.reserve_a);
    j.at("reserve_b").get_to(p.reserve_b);
    j.at("total_lp_supply").get_to(p.total_lp_supply);
    p.k = read_u128(j, "k");
    j.at("fee_bps").get_to(p.fee_bps);
    j.at("accumulated_fee_a").get_to(p.accumulated_fee_a);
    j.at("accumulated_fee_b").get_to(p.accumulated_fee_b);
    j.at("active_providers").get_to(p.active_providers);
    j.at("lp_mint").get_to(p.lp_mint);
    j.at("last_update").get_to(p.last_update);
}

void to_json(json& j, const LiquidityPosition& p) {
    j = json{
        {"market_id", p.market_id},
        {"provider", to_hex(p.provider)},
        {"lp_shares", p.lp_shares},
        {"contributed_a", p.contributed_a},
        {"contributed_b", p.contributed_b},
        {"withdrawn_a", p.withdrawn_a},
        {"withdrawn_b", p.withdrawn_b},
        {"created_at", p.created_at},
        {"last_update", p.last_update},
        {"active", p.active}
    };
}

void from_json(const json& j, LiquidityPosition& p) {
    j.at("market_id").get_to(p.market_id);
    p.provider = read_address(j, "provider");
    j.at("lp_shares").get_to(p.lp_shares);
    j.at("contributed_a").get_to(p.contributed_a);
    j.at("contributed_b").get_to(p.contributed_b);
    j.at("withdrawn_a").get_to(p.withdrawn_a);
    j.at("withdrawn_b").get_to(p.withdrawn_b);
    j.at("created_at").get_to(p.created_at);
    j.at("last_update").get_to(p.last_update);
    j.at("active").get_to(p.active);
}

// =============================================================================
// Resolution
// =============================================================================

void to_json(json& j, const MarketResolution& r) {
    j = json{
        {"market_id", r.market_id},
        {"resolved", r.resolved},
        {"winning_outcome", r.winning_outcome},
        {"resolver", to_hex(r.resolver)},
        {"evidence", r.evidence},
        {"resolved_at", r.resolved_at},
        {"dispute_period_end", r.dispute_period_end},
        {"total_pool", r.total_pool},
        {"winning_pool", r.winning_pool},
        {"protocol_fee", r.protocol_fee},
        {"retained_amount", r.retained_amount},
        {"payout_ratio_bps", r.payout_ratio_bps}
    };
}

void from_json(const json& j, MarketResolution& r) {
    j.at("market_id").get_to(r.market_id);
    j.at("resolved").get_to(r.resolved);
    j.at("winning_outcome").get_to(r.winning_outcome);
    r.resolver = read_address(j, "resolver");
    j.at("evidence").get_to(r.evidence);
    j.at("resolved_at").get_to(r.resolved_at);
    j.at("dispute_period_end").get_to(r.dispute_period_end);
    j.at("total_pool").get_to(r.total_pool);
    j.at("winning_pool").get_to(r.winning_pool);
    j.at("protocol_fee").get_to(r.protocol_fee);
    j.at("retained_amount").get_to(r.retained_amount);
    j.at("payout_ratio_bps").get_to(r.payout_ratio_bps);
}

// =============================================================================
// Trader Profile
// =============================================================================

void to_json(json& j, const TraderProfile& t) {
    j = json{
        {"owner", to_hex(t.owner)},
        {"total_volume", t.total_volume},
        {"total_bets", t.total_bets},
        {"markets_traded", t.markets_traded},
        {"markets_settled", t.markets_settled},
        {"markets_won", t.markets_won},
        {"total_payout", t.total_payout},
        {"total_pnl", t.total_pnl},
        {"created_at", t.created_at},
        {"last_active", t.last_active}
    };
}

void from_json(const json& j, TraderProfile& t) {
    t.owner = read_address(j, "owner");
    j.at("total_volume").get_to(t.total_volume);
    j.at("total_bets").get_to(t.total_bets);
    j.at("markets_traded").get_to(t.markets_traded);
    j.at("markets_settled").get_to(t.markets_settled);
    j.at("markets_won").get_to(t.markets_won);
    j.at("total_payout").get_to(t.total_payout);
    j.at("total_pnl").get_to(t.total_pnl);
    j.at("created_at").get_to(t.created_at);
    j.at("last_active").get_to(t.last_active);
}

} // namespace predix
