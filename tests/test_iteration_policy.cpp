#include <doctest/doctest.h>

#include "iteration_policy.hpp"

#include <limits>
#include <string>

TEST_CASE("iteration policy: staircase values")
{
    CHECK(cap_for(Decimal("1")) == 512);
    CHECK(cap_for(Decimal("9.999")) == 512);
    CHECK(cap_for(Decimal("10")) == 1024);
    CHECK(cap_for(Decimal("99999")) == 8192);
    CHECK(cap_for(Decimal("100000")) == 16384);
    CHECK(cap_for(Decimal("1e12")) == 32768);
    CHECK(cap_for(Decimal("5e20")) == 131072);
    CHECK(cap_for(Decimal("9.99e29")) == 1048576);
    CHECK(cap_for(Decimal("1e30")) == 2097152);
    CHECK(cap_for(Decimal("1e75")) == 2097152);
}

TEST_CASE("iteration policy: non-positive and NaN zoom take the first step")
{
    CHECK(cap_for(Decimal(0)) == 512);
    CHECK(cap_for(Decimal(-3)) == 512);
    CHECK(cap_for(std::numeric_limits<double>::quiet_NaN()) == 512);
}

TEST_CASE("iteration policy: monotonically non-decreasing in zoom")
{
    int prev = 0;
    // zoom = 10^(k/4) from 1e-2 to 1e40
    for (int k = -8; k <= 160; ++k) {
        const std::string exp = std::to_string(k / 4.0);
        const Decimal zoom = boost::multiprecision::pow(Decimal(10), Decimal(exp));
        const int cap = cap_for(zoom);
        CHECK(cap >= prev);
        CHECK(cap > 0);
        prev = cap;
    }
}

TEST_CASE("iteration policy: deterministic for equal zoom")
{
    const Decimal a("123456.789");
    const Decimal b("1.23456789e5");
    CHECK(cap_for(a) == cap_for(a));
    CHECK(cap_for(a) == cap_for(b));
}
