// predix - Checked Math Tests

#include <catch2/catch.hpp>
#include "predix/math.hpp"

#include <limits>

using namespace predix;

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

TEST_CASE("Checked add/sub/mul/div", "[math]") {
    uint64_t out = 7;

    SECTION("Addition overflow leaves output untouched") {
        REQUIRE(checked::add(U64_MAX, 1, out) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(out == 7);
        REQUIRE(checked::add(U64_MAX - 1, 1, out) == errors::OK);
        REQUIRE(out == U64_MAX);
    }

    SECTION("Subtraction underflow") {
        REQUIRE(checked::sub(1, 2, out) == errors::ARITHMETIC_UNDERFLOW);
        REQUIRE(checked::sub(5, 5, out) == errors::OK);
        REQUIRE(out == 0);
    }

    SECTION("Multiplication overflow") {
        REQUIRE(checked::mul(U64_MAX, 2, out) == errors::ARITHMETIC_OVERFLOW);
        REQUIRE(checked::mul(1ULL << 32, (1ULL << 32) - 1, out) == errors::OK);
    }

    SECTION("Division by zero") {
        REQUIRE(checked::div(10, 0, out) == errors::DIVISION_BY_ZERO);
        REQUIRE(checked::div(10, 3, out) == errors::OK);
        REQUIRE(out == 3);
    }

    SECTION("Accumulators") {
        uint64_t acc = 10;
        REQUIRE(checked::add_to(acc, 5) == errors::OK);
        REQUIRE(acc == 15);
        REQUIRE(checked::sub_from(acc, 16) == errors::ARITHMETIC_UNDERFLOW);
        REQUIRE(acc == 15);
    }
}

TEST_CASE("Mul-div with wide intermediate", "[math]") {
    uint64_t out = 0;

    SECTION("Rounds down and up") {
        REQUIRE(checked::mul_div(10, 3, 4, out) == errors::OK);
        REQUIRE(out == 7);
        REQUIRE(checked::mul_div_up(10, 3, 4, out) == errors::OK);
        REQUIRE(out == 8);
        REQUIRE(checked::mul_div_up(8, 3, 4, out) == errors::OK);
        REQUIRE(out == 6);
    }

    SECTION("Intermediate above 64 bits") {
        REQUIRE(checked::mul_div(U64_MAX, U64_MAX, U64_MAX, out) == errors::OK);
        REQUIRE(out == U64_MAX);
    }

    SECTION("Result above 64 bits") {
        REQUIRE(checked::mul_div(U64_MAX, 2, 1, out) == errors::ARITHMETIC_OVERFLOW);
    }

    SECTION("Zero denominator") {
        REQUIRE(checked::mul_div(1, 1, 0, out) == errors::DIVISION_BY_ZERO);
        REQUIRE(checked::mul_div_up(1, 1, 0, out) == errors::DIVISION_BY_ZERO);
    }
}

TEST_CASE("Basis-point helpers", "[math]") {
    uint64_t out = 0;

    REQUIRE(bps::apply(2000, 200, out) == errors::OK);
    REQUIRE(out == 40);

    REQUIRE(bps::apply(1499, 30, out) == errors::OK);
    REQUIRE(out == 4);

    REQUIRE(bps::ratio(1960, 1000, out) == errors::OK);
    REQUIRE(out == 19600);

    REQUIRE(bps::ratio(1, 0, out) == errors::DIVISION_BY_ZERO);
}

TEST_CASE("Integer square root", "[math]") {
    REQUIRE(isqrt(0) == 0);
    REQUIRE(isqrt(1) == 1);
    REQUIRE(isqrt(3) == 1);
    REQUIRE(isqrt(4) == 2);
    REQUIRE(isqrt(15) == 3);
    REQUIRE(isqrt(16) == 4);
    REQUIRE(isqrt(17) == 4);
    REQUIRE(isqrt(checked::wide_mul(10000, 10000)) == 10000);
    REQUIRE(isqrt(checked::wide_mul(10000, 10000) - 1) == 9999);

    U128 max_square = checked::wide_mul(U64_MAX, U64_MAX);
    REQUIRE(isqrt(max_square) == U64_MAX);
}
