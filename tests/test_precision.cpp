#include <doctest/doctest.h>

#include "precision.hpp"

#include <cmath>

namespace {

PrecisionMode mode_around(const char* center, const char* span, int width)
{
    const Decimal c(center), s(span);
    return select_mode(c - s / 2, c + s / 2, width);
}

} // namespace

TEST_CASE("precision: mantissa capacities")
{
    CHECK(mantissa_bits(PrecisionMode::Double) == 52);
    CHECK(mantissa_bits(PrecisionMode::Quad) == 112);
    CHECK(mantissa_bits(PrecisionMode::ExtendedDouble) >= 52);
    CHECK(mantissa_bits(PrecisionMode::ExtendedDouble) <= 112);
}

TEST_CASE("precision: full set view uses double")
{
    CHECK(select_mode(Decimal("-2.5"), Decimal("1.0"), 400) == PrecisionMode::Double);
    CHECK(get_precision_mode("-2.5", "1.0", 400) == 0);
}

TEST_CASE("precision: modes step up as the span shrinks")
{
    CHECK(mode_around("-0.75", "1e-11", 800) == PrecisionMode::Double);
    CHECK(mode_around("-0.75", "1e-13", 800) == PrecisionMode::ExtendedDouble);
    CHECK(mode_around("-0.75", "1e-25", 800) == PrecisionMode::Quad);
    CHECK(mode_around("-0.75", "1e-40", 800) == PrecisionMode::Perturbation);
    CHECK(mode_around("0", "1e-60", 800) == PrecisionMode::Perturbation);
}

TEST_CASE("precision: deep zoom below 1e-12 at width 800 selects perturbation")
{
    CHECK(mode_around("-0.743643887037158704752191506114774",
                      "1e-40", 800) == PrecisionMode::Perturbation);
    CHECK(get_precision_mode("-1.00000000000000000000000000000000000000001",
                             "-0.99999999999999999999999999999999999999999", 800) == 3);
}

TEST_CASE("precision: coordinate magnitude raises the requirement")
{
    // Same span, larger |x|: more bits to resolve adjacent pixels
    CHECK(required_bits(Decimal("1000"), Decimal("1000.001"), 800)
          > required_bits(Decimal("0"), Decimal("0.001"), 800));
    CHECK(required_bits(Decimal("0"), Decimal("1"), 1600)
          > required_bits(Decimal("0"), Decimal("1"), 800));
}

TEST_CASE("precision: total on degenerate input")
{
    CHECK(select_mode(Decimal("1"), Decimal("1"), 800) == PrecisionMode::Perturbation);
    CHECK(select_mode(Decimal("1"), Decimal("0"), 800) == PrecisionMode::Perturbation);
    CHECK(select_mode(Decimal("-2"), Decimal("2"), 0) == PrecisionMode::Double);
    CHECK(select_mode(Decimal("-2"), Decimal("2"), -5) == PrecisionMode::Double);
    CHECK(std::isinf(required_bits(Decimal("1"), Decimal("1"), 800)));
    CHECK(get_precision_mode("abc", "1.0", 800) == 3);
    CHECK(get_precision_mode("", "", 800) == 3);
}

TEST_CASE("precision: deterministic for repeated calls")
{
    const Decimal lo("-0.7436438870371587047"), hi("-0.7436438870371587046");
    const PrecisionMode first = select_mode(lo, hi, 1024);
    for (int i = 0; i < 10; ++i)
        CHECK(select_mode(lo, hi, 1024) == first);
    CHECK(precision_mode_name(first) != nullptr);
}
