#ifndef PREDIX_SERIALIZE_HPP
#define PREDIX_SERIALIZE_HPP

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "market.hpp"
#include "bet.hpp"
#include "pool.hpp"
#include "settlement.hpp"
#include "profile.hpp"

namespace predix {

// =============================================================================
// JSON Serialization
// Addresses and currencies are "0x"-prefixed hex, 128-bit values decimal
// strings. from_json throws nlohmann::json::exception on missing or mistyped
// fields and std::runtime_error on malformed encodings.
// =============================================================================

void to_json(nlohmann::json& j, const Currency& c);
void from_json(const nlohmann::json& j, Currency& c);

void to_json(nlohmann::json& j, const MarketStatus& s);
void from_json(const nlohmann::json& j, MarketStatus& s);

void to_json(nlohmann::json& j, const OutcomeState& o);
void from_json(const nlohmann::json& j, OutcomeState& o);

void to_json(nlohmann::json& j, const MarketParams& p);
void from_json(const nlohmann::json& j, MarketParams& p);

void to_json(nlohmann::json& j, const Market& m);
void from_json(const nlohmann::json& j, Market& m);

void to_json(nlohmann::json& j, const PositionLeg& l);
void from_json(const nlohmann::json& j, PositionLeg& l);

void to_json(nlohmann::json& j, const BetFill& f);
void from_json(const nlohmann::json& j, BetFill& f);

void to_json(nlohmann::json& j, const Position& p);
void from_json(const nlohmann::json& j, Position& p);

void to_json(nlohmann::json& j, const LiquidityPool& p);
void from_json(const nlohmann::json& j, LiquidityPool& p);

void to_json(nlohmann::json& j, const LiquidityPosition& p);
void from_json(const nlohmann::json& j, LiquidityPosition& p);

void to_json(nlohmann::json& j, const MarketResolution& r);
void from_json(const nlohmann::json& j, MarketResolution& r);

void to_json(nlohmann::json& j, const TraderProfile& t);
void from_json(const nlohmann::json& j, TraderProfile& t);

} // namespace predix

#endif // PREDIX_SERIALIZE_HPP
