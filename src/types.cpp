// =============================================================================
// types.cpp - Encoding helpers and error messages
// =============================================================================

#include "predix/types.hpp"
#include <algorithm>

namespace predix {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string to_hex(const Address& addr) {
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(HEX_DIGITS[b >> 4]);
        out.push_back(HEX_DIGITS[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        start = 2;
    }
    if (hex.size() - start != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(hex[start + 2 * i]);
        int lo = hex_value(hex[start + 2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

std::string u128_to_string(U128 v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<U128> u128_from_string(const std::string& s) {
    if (s.empty() || s.size() > 39) return std::nullopt;
    constexpr U128 MAX = ~U128(0);
    U128 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        U128 digit = static_cast<U128>(c - '0');
        if (v > (MAX - digit) / 10) return std::nullopt;
        v = v * 10 + digit;
    }
    return v;
}

namespace errors {

const char* message(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_BET_AMOUNT: return "bet amount must be greater than zero";
        case BET_BELOW_MINIMUM: return "minimum bet amount not met";
        case BET_ABOVE_MAXIMUM: return "maximum bet amount exceeded";
        case INVALID_OUTCOME: return "invalid market outcome";
        case INVALID_OUTCOME_COUNT: return "invalid number of outcomes";
        case MARKET_TITLE_TOO_LONG: return "market title too long";
        case MARKET_DESCRIPTION_TOO_LONG: return "market description too long";
        case CATEGORY_TOO_LONG: return "market category too long";
        case RESOLUTION_SOURCE_TOO_LONG: return "resolution source too long";
        case OUTCOME_LABEL_TOO_LONG: return "outcome label empty or too long";
        case INVALID_CONFIGURATION: return "invalid configuration";
        case INVALID_AMOUNT: return "invalid amount";
        case RESOLUTION_DATA_TOO_LARGE: return "resolution evidence too large";
        case PAYOUT_TOO_HIGH: return "potential payout exceeds per-bet cap";
        case MARKET_NOT_FOUND: return "market not found";
        case MARKET_ALREADY_EXISTS: return "market already exists";
        case MARKET_NOT_ACTIVE: return "market is not active";
        case MARKET_NOT_PAUSED: return "market is not paused";
        case MARKET_EXPIRED: return "market resolution deadline has passed";
        case MARKET_NOT_EXPIRED: return "market resolution deadline has not passed";
        case MARKET_NOT_RESOLVED: return "market is not resolved";
        case MARKET_NOT_CANCELLED: return "market is not cancelled";
        case POSITION_NOT_FOUND: return "position not found";
        case ALREADY_CLAIMED: return "position already claimed";
        case NO_WINNINGS: return "no winnings to claim";
        case DISPUTE_PERIOD_ACTIVE: return "dispute period active";
        case UNAUTHORIZED: return "unauthorized";
        case UNAUTHORIZED_RESOLVER: return "only the market oracle can resolve";
        case INVALID_AUTHORITY: return "invalid authority";
        case INVALID_POSITION: return "position owner mismatch";
        case ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case ARITHMETIC_UNDERFLOW: return "arithmetic underflow";
        case DIVISION_BY_ZERO: return "division by zero";
        case SLIPPAGE_EXCEEDED: return "slippage tolerance exceeded";
        case INSUFFICIENT_LP_TOKENS: return "insufficient LP tokens";
        case EMPTY_POOL: return "liquidity pool is empty";
        case POOL_NOT_AVAILABLE: return "market has no liquidity pool";
        case INSUFFICIENT_BALANCE: return "insufficient balance";
        case TRANSFER_FAILED: return "transfer failed";
        case MINT_NOT_FOUND: return "mint not found";
        case MINT_ALREADY_EXISTS: return "mint already exists";
        default: return "unknown error";
    }
}

} // namespace errors

} // namespace predix
