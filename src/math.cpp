// =============================================================================
// math.cpp - Checked fixed-point helpers
// =============================================================================

#include "predix/math.hpp"

namespace predix {

namespace checked {

int32_t mul_div(uint64_t a, uint64_t b, uint64_t denom, uint64_t& out) {
    if (denom == 0) return errors::DIVISION_BY_ZERO;
    U128 product = wide_mul(a, b);
    return narrow(product / denom, out);
}

int32_t mul_div_up(uint64_t a, uint64_t b, uint64_t denom, uint64_t& out) {
    if (denom == 0) return errors::DIVISION_BY_ZERO;
    U128 product = wide_mul(a, b);
    U128 q = product / denom;
    if (product % denom != 0) q += 1;
    return narrow(q, out);
}

} // namespace checked

namespace bps {

int32_t apply(uint64_t amount, uint64_t rate_bps, uint64_t& out) {
    return checked::mul_div(amount, rate_bps, BPS_DENOMINATOR, out);
}

int32_t ratio(uint64_t numerator, uint64_t denominator, uint64_t& out) {
    return checked::mul_div(numerator, BPS_DENOMINATOR, denominator, out);
}

} // namespace bps

U128 isqrt(U128 x) {
    if (x < 2) return x;

    // Initial guess from the bit length keeps the iteration count small
    int bits = 0;
    for (U128 t = x; t != 0; t >>= 1) ++bits;
    U128 y = U128(1) << ((bits + 1) / 2);

    // y starts above the root; Newton steps decrease monotonically to it
    while (true) {
        U128 z = (y + x / y) / 2;
        if (z >= y) break;
        y = z;
    }
    return y;
}

} // namespace predix
