#ifndef PREDIX_MATH_HPP
#define PREDIX_MATH_HPP

#include <cstdint>
#include <limits>

#include "types.hpp"

namespace predix {

// =============================================================================
// Checked Integer Arithmetic
// Every operation reports failure through an errors:: code and leaves `out`
// untouched on failure. Nothing wraps.
// =============================================================================

namespace checked {

inline int32_t add(uint64_t a, uint64_t b, uint64_t& out) {
    if (a > std::numeric_limits<uint64_t>::max() - b) return errors::ARITHMETIC_OVERFLOW;
    out = a + b;
    return errors::OK;
}

inline int32_t sub(uint64_t a, uint64_t b, uint64_t& out) {
    if (b > a) return errors::ARITHMETIC_UNDERFLOW;
    out = a - b;
    return errors::OK;
}

inline int32_t mul(uint64_t a, uint64_t b, uint64_t& out) {
    U128 p = static_cast<U128>(a) * b;
    if (p > std::numeric_limits<uint64_t>::max()) return errors::ARITHMETIC_OVERFLOW;
    out = static_cast<uint64_t>(p);
    return errors::OK;
}

inline int32_t div(uint64_t a, uint64_t b, uint64_t& out) {
    if (b == 0) return errors::DIVISION_BY_ZERO;
    out = a / b;
    return errors::OK;
}

// Narrow a widened intermediate back to 64 bits
inline int32_t narrow(U128 v, uint64_t& out) {
    if (v > std::numeric_limits<uint64_t>::max()) return errors::ARITHMETIC_OVERFLOW;
    out = static_cast<uint64_t>(v);
    return errors::OK;
}

// In-place accumulate, for counters
inline int32_t add_to(uint64_t& acc, uint64_t v) { return add(acc, v, acc); }
inline int32_t sub_from(uint64_t& acc, uint64_t v) { return sub(acc, v, acc); }

// floor(a * b / denom) with a 128-bit intermediate
int32_t mul_div(uint64_t a, uint64_t b, uint64_t denom, uint64_t& out);

// ceil(a * b / denom) with a 128-bit intermediate
int32_t mul_div_up(uint64_t a, uint64_t b, uint64_t denom, uint64_t& out);

// Product of two 64-bit magnitudes (never overflows 128 bits)
inline U128 wide_mul(uint64_t a, uint64_t b) {
    return static_cast<U128>(a) * b;
}

} // namespace checked

// =============================================================================
// Basis-Point Math
// =============================================================================

namespace bps {

// floor(amount * rate_bps / 10000)
int32_t apply(uint64_t amount, uint64_t rate_bps, uint64_t& out);

// floor(numerator * 10000 / denominator)
int32_t ratio(uint64_t numerator, uint64_t denominator, uint64_t& out);

} // namespace bps

// =============================================================================
// Integer Square Root
// =============================================================================

// floor(sqrt(x)) via Newton-Raphson
U128 isqrt(U128 x);

} // namespace predix

#endif // PREDIX_MATH_HPP
