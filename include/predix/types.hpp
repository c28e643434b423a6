#ifndef PREDIX_TYPES_HPP
#define PREDIX_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <optional>

namespace predix {

// =============================================================================
// Primitive Types
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Timestamp = int64_t;  // Unix seconds

using U128 = unsigned __int128;

// Basis points: 1 bps = 1/10000
constexpr uint64_t BPS_DENOMINATOR = 10000;

// Odds are expressed as a payout multiplier in bps (10000 = 1.0x)
constexpr uint64_t ODDS_EVEN = 10000;
constexpr uint64_t ODDS_NO_OPPOSITION = 20000;

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// Hex encoding ("0x" + 40 hex chars)
std::string to_hex(const Address& addr);
std::optional<Address> address_from_hex(const std::string& hex);

// Decimal encoding for 128-bit values
std::string u128_to_string(U128 v);
std::optional<U128> u128_from_string(const std::string& s);

// =============================================================================
// Currency Type (Token Mint)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Ledger Account Handle (owner + currency)
// =============================================================================

struct LedgerAccount {
    Address owner;
    Currency currency;

    bool operator==(const LedgerAccount& other) const {
        return owner == other.owner && currency == other.currency;
    }

    uint64_t hash() const {
        uint64_t h = 0;
        for (auto b : owner) h = h * 31 + b;
        for (auto b : currency.addr) h = h * 31 + b;
        return h;
    }
};

struct LedgerAccountHash {
    size_t operator()(const LedgerAccount& a) const { return static_cast<size_t>(a.hash()); }
};

// =============================================================================
// Derived Addresses
// Format: 0x00..00 | tag (1 byte) | market_id (8 bytes BE) | index (1 byte)
// =============================================================================

namespace addresses {

constexpr uint8_t TAG_MARKET_VAULT   = 0x01;
constexpr uint8_t TAG_POOL_VAULT     = 0x02;
constexpr uint8_t TAG_POOL_AUTHORITY = 0x03;
constexpr uint8_t TAG_LP_MINT        = 0x04;
constexpr uint8_t TAG_OUTCOME_TOKEN  = 0x05;

constexpr Address derive(uint8_t tag, uint64_t market_id, uint8_t index = 0) {
    Address addr = {};
    addr[10] = tag;
    for (size_t i = 0; i < 8; ++i) {
        addr[11 + i] = static_cast<uint8_t>((market_id >> (56 - 8 * i)) & 0xFF);
    }
    addr[19] = index;
    return addr;
}

// Holds the parimutuel stakes of a market
constexpr Address market_vault(uint64_t market_id) {
    return derive(TAG_MARKET_VAULT, market_id);
}

// Holds the outcome-token reserves of a market's pool
constexpr Address pool_vault(uint64_t market_id) {
    return derive(TAG_POOL_VAULT, market_id);
}

// Mint authority of the pool's LP shares
constexpr Address pool_authority(uint64_t market_id) {
    return derive(TAG_POOL_AUTHORITY, market_id);
}

inline Currency lp_mint(uint64_t market_id) {
    return Currency{derive(TAG_LP_MINT, market_id)};
}

inline Currency outcome_token(uint64_t market_id, uint8_t outcome) {
    return Currency{derive(TAG_OUTCOME_TOKEN, market_id, outcome)};
}

} // namespace addresses

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t INVALID_BET_AMOUNT = -1;
constexpr int32_t BET_BELOW_MINIMUM = -2;
constexpr int32_t BET_ABOVE_MAXIMUM = -3;
constexpr int32_t INVALID_OUTCOME = -4;
constexpr int32_t INVALID_OUTCOME_COUNT = -5;
constexpr int32_t MARKET_TITLE_TOO_LONG = -6;
constexpr int32_t MARKET_DESCRIPTION_TOO_LONG = -7;
constexpr int32_t CATEGORY_TOO_LONG = -8;
constexpr int32_t RESOLUTION_SOURCE_TOO_LONG = -9;
constexpr int32_t OUTCOME_LABEL_TOO_LONG = -10;
constexpr int32_t INVALID_CONFIGURATION = -11;
constexpr int32_t INVALID_AMOUNT = -12;
constexpr int32_t RESOLUTION_DATA_TOO_LARGE = -13;
constexpr int32_t PAYOUT_TOO_HIGH = -14;

// State preconditions
constexpr int32_t MARKET_NOT_FOUND = -20;
constexpr int32_t MARKET_ALREADY_EXISTS = -21;
constexpr int32_t MARKET_NOT_ACTIVE = -22;
constexpr int32_t MARKET_NOT_PAUSED = -23;
constexpr int32_t MARKET_EXPIRED = -24;
constexpr int32_t MARKET_NOT_EXPIRED = -25;
constexpr int32_t MARKET_NOT_RESOLVED = -26;
constexpr int32_t MARKET_NOT_CANCELLED = -27;
constexpr int32_t POSITION_NOT_FOUND = -28;
constexpr int32_t ALREADY_CLAIMED = -29;
constexpr int32_t NO_WINNINGS = -30;
constexpr int32_t DISPUTE_PERIOD_ACTIVE = -31;

// Authorization
constexpr int32_t UNAUTHORIZED = -40;
constexpr int32_t UNAUTHORIZED_RESOLVER = -41;
constexpr int32_t INVALID_AUTHORITY = -42;
constexpr int32_t INVALID_POSITION = -43;

// Arithmetic
constexpr int32_t ARITHMETIC_OVERFLOW = -50;
constexpr int32_t ARITHMETIC_UNDERFLOW = -51;
constexpr int32_t DIVISION_BY_ZERO = -52;

// Liquidity / slippage
constexpr int32_t SLIPPAGE_EXCEEDED = -60;
constexpr int32_t INSUFFICIENT_LP_TOKENS = -61;
constexpr int32_t EMPTY_POOL = -62;
constexpr int32_t POOL_NOT_AVAILABLE = -63;

// Ledger / transfer
constexpr int32_t INSUFFICIENT_BALANCE = -70;
constexpr int32_t TRANSFER_FAILED = -71;
constexpr int32_t MINT_NOT_FOUND = -72;
constexpr int32_t MINT_ALREADY_EXISTS = -73;

const char* message(int32_t code);

} // namespace errors

} // namespace predix

#endif // PREDIX_TYPES_HPP
