#ifndef PREDIX_PREDIX_HPP
#define PREDIX_PREDIX_HPP

// =============================================================================
// predix - Prediction Market Settlement Engine
//
//   PXLedger : in-memory account ledger (ILedger reference implementation)
//   PXEngine : market lifecycle, parimutuel bets, constant-product pool,
//              resolution and payouts
//
// =============================================================================

#include "types.hpp"
#include "math.hpp"
#include "config.hpp"
#include "log.hpp"
#include "ledger.hpp"
#include "market.hpp"
#include "bet.hpp"
#include "pool.hpp"
#include "settlement.hpp"
#include "profile.hpp"
#include "serialize.hpp"
#include "engine.hpp"

namespace predix {

constexpr const char* version() { return "1.0.0"; }

} // namespace predix

#endif // PREDIX_PREDIX_HPP
