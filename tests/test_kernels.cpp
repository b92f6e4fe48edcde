#include <doctest/doctest.h>

#include "compute_engine.hpp"
#include "fractal.hpp"

#include <boost/multiprecision/float128.hpp>

#include <cmath>
#include <stdexcept>

using boost::multiprecision::float128;

namespace {

const PrecisionMode kAllModes[] = {
    PrecisionMode::Double, PrecisionMode::ExtendedDouble,
    PrecisionMode::Quad,   PrecisionMode::Perturbation,
};

ComputeRequest make_request(const char* xmin, const char* xmax, int w,
                            const char* ymin, const char* ymax, int h, int max_iter)
{
    ComputeRequest req;
    req.xmin = Decimal(xmin);
    req.xmax = Decimal(xmax);
    req.ymin = Decimal(ymin);
    req.ymax = Decimal(ymax);
    req.width    = w;
    req.height   = h;
    req.max_iter = max_iter;
    return req;
}

EngineConfig small_config(int threads)
{
    EngineConfig cfg;
    cfg.thread_count = threads;
    cfg.tile_size    = 16;
    return cfg;
}

} // namespace

TEST_CASE("kernels: origin never escapes in any width")
{
    CHECK(escape_time<double, false>(0.0, 0.0, 1000) == kInterior);
    CHECK(escape_time<long double, false>(0.0L, 0.0L, 1000) == kInterior);
    CHECK(escape_time<float128, false>(float128(0), float128(0), 1000) == kInterior);
    CHECK(escape_time<Decimal, false>(Decimal(0), Decimal(0), 200) == kInterior);
}

TEST_CASE("kernels: |c| > 2 escapes on the first update in any width")
{
    const double d = escape_time<double>(2.0001, 0.0, 100);
    CHECK(d >= 0.0);
    CHECK(d < 1.0);
    CHECK(d == doctest::Approx(0.9999).epsilon(1e-3));
    CHECK(escape_time<long double>(2.0001L, 0.0L, 100) == doctest::Approx(d));
    CHECK(escape_time<float128>(float128(2.0001), float128(0), 100) == doctest::Approx(d));
    CHECK(escape_time<Decimal>(Decimal("2.0001"), Decimal(0), 100) == doctest::Approx(d));

    // Far outside the smooth value clamps to 0
    CHECK(escape_time<double>(3.0, 4.0, 100) == 0.0);
    CHECK(escape_time<double>(-2.5, 0.0, 100) == doctest::Approx(0.597).epsilon(1e-2));
}

TEST_CASE("kernels: cardioid and bulb shortcut")
{
    CHECK(in_main_cardioid_or_bulb(0.0, 0.0));
    CHECK(in_main_cardioid_or_bulb(-0.5, 0.3));
    CHECK(in_main_cardioid_or_bulb(-1.0, 0.0));
    CHECK(in_main_cardioid_or_bulb(-1.1, 0.1));
    CHECK_FALSE(in_main_cardioid_or_bulb(0.3, 0.0));
    CHECK_FALSE(in_main_cardioid_or_bulb(-0.75, 0.2));
    CHECK_FALSE(in_main_cardioid_or_bulb(-2.0, 0.5));

    // Shortcut and full iteration agree on a cardioid point
    CHECK(escape_time<double, true>(-0.1, 0.1, 500) == kInterior);
    CHECK(escape_time<double, false>(-0.1, 0.1, 500) == kInterior);
}

TEST_CASE("kernels: origin pixel and |c| > 2 grid through every mode")
{
    ComputeEngine engine(small_config(2));
    CHECK(engine.config().thread_count == 2);
    CHECK(engine.config().tile_size == 16);

    // 2x2 grid on [-1,1]^2: pixel (1,1) samples c = 0
    const ComputeRequest origin = make_request("-1", "1", 2, "-1", "1", 2, 300);
    // Every pixel of [2.5,3.5]^2 has |c| > 3.5
    const ComputeRequest outside = make_request("2.5", "3.5", 4, "2.5", "3.5", 4, 300);

    for (PrecisionMode mode : kAllModes) {
        CAPTURE(precision_mode_name(mode));
        const IterationBuffer a = engine.compute(origin, mode);
        CHECK(a.at(1, 1) == kInterior);
        CHECK(engine.last_mode == mode);

        const IterationBuffer b = engine.compute(outside, mode);
        for (double v : b.values) {
            CHECK(v >= 0.0);
            CHECK(v < 1.0);
        }
    }
}

TEST_CASE("kernels: full set view at 400x300 in double")
{
    const ComputeRequest req = make_request("-2.5", "1.0", 400, "-1.25", "1.25", 300, 256);
    CHECK(select_mode(req.xmin, req.xmax, req.width) == PrecisionMode::Double);

    ComputeEngine engine(small_config(0));
    const IterationBuffer buf = engine.compute(req);
    REQUIRE(buf.values.size() == 400u * 300u);
    CHECK(engine.last_mode == PrecisionMode::Double);

    int escaped = 0;
    for (double v : buf.values) {
        if (v == kInterior) continue;
        CHECK(v >= 0.0);
        CHECK(v < 256.0);
        ++escaped;
    }
    const double fraction = static_cast<double>(escaped) / buf.values.size();
    CHECK(fraction > 0.78);
    CHECK(fraction < 0.87);

    // c = -1.00375 + 0i, inside the period-2 bulb
    CHECK(buf.at(171, 150) == kInterior);
    // c = -2.5 + 0i escapes immediately
    CHECK(buf.at(0, 150) >= 0.0);
    CHECK(buf.at(0, 150) < 1.0);
}

TEST_CASE("kernels: rows run bottom to top")
{
    // One column at x = -0.1: row 0 samples -0.1 + 0i, row 1 samples -0.1 + 2i
    const ComputeRequest req = make_request("-0.1", "0.9", 1, "0", "4", 2, 100);
    ComputeEngine engine(small_config(1));
    const IterationBuffer buf = engine.compute(req, PrecisionMode::Double);
    CHECK(buf.at(0, 0) == kInterior);
    CHECK(buf.at(0, 1) >= 0.0);
}

TEST_CASE("kernels: result does not depend on thread count")
{
    const ComputeRequest req = make_request("-0.8", "-0.7", 130, "0.05", "0.15", 70, 400);
    ComputeEngine one(small_config(1));
    ComputeEngine many(small_config(4));

    for (PrecisionMode mode : { PrecisionMode::Double, PrecisionMode::ExtendedDouble }) {
        const IterationBuffer a = one.compute(req, mode);
        const IterationBuffer b = many.compute(req, mode);
        CHECK(a.values == b.values);
    }
}

TEST_CASE("kernels: AVX and scalar double paths agree")
{
    const ComputeRequest req = make_request("-0.8", "-0.7", 130, "0.05", "0.15", 70, 400);
    ComputeEngine engine(small_config(2));

    engine.set_avx(true);
    const IterationBuffer vec = engine.compute(req, PrecisionMode::Double);
    engine.set_avx(false);
    CHECK_FALSE(engine.avx_active);
    const IterationBuffer scalar = engine.compute(req, PrecisionMode::Double);

    REQUIRE(vec.values.size() == scalar.values.size());
    int mismatched = 0;
    for (size_t i = 0; i < vec.values.size(); ++i) {
        const double a = vec.values[i], b = scalar.values[i];
        if ((a == kInterior) != (b == kInterior) || std::abs(a - b) > 1e-9) ++mismatched;
    }
    CHECK(mismatched == 0);
}

TEST_CASE("kernels: fixed widths agree away from the boundary")
{
    const ComputeRequest req = make_request("0.5", "1.5", 24, "0.5", "1.5", 16, 200);
    ComputeEngine engine(small_config(2));
    const IterationBuffer d = engine.compute(req, PrecisionMode::Double);
    const IterationBuffer e = engine.compute(req, PrecisionMode::ExtendedDouble);
    const IterationBuffer q = engine.compute(req, PrecisionMode::Quad);
    for (size_t i = 0; i < d.values.size(); ++i) {
        CHECK(d.values[i] == doctest::Approx(e.values[i]).epsilon(1e-9));
        CHECK(d.values[i] == doctest::Approx(q.values[i]).epsilon(1e-9));
    }
}

TEST_CASE("kernels: decimal string entry point")
{
    ComputeEngine engine(small_config(2));
    const IterationBuffer buf = engine.compute("-2.5", "1.0", 40, "-1.25", "1.25", 30, 64);
    CHECK(buf.width == 40);
    CHECK(buf.height == 30);
    CHECK(buf.values.size() == 1200u);

    CHECK_THROWS_AS(engine.compute("-2.5", "one", 40, "-1.25", "1.25", 30, 64),
                    std::invalid_argument);
}

TEST_CASE("kernels: invalid requests are rejected before dispatch")
{
    ComputeEngine engine(small_config(1));
    CHECK_THROWS_AS(engine.compute(make_request("1", "-1", 8, "-1", "1", 8, 10)),
                    std::invalid_argument);
    CHECK_THROWS_AS(engine.compute(make_request("-1", "1", 8, "1", "1", 8, 10)),
                    std::invalid_argument);
    CHECK_THROWS_AS(engine.compute(make_request("-1", "1", 0, "-1", "1", 8, 10)),
                    std::invalid_argument);
    CHECK_THROWS_AS(engine.compute(make_request("-1", "1", 8, "-1", "1", 8, 0)),
                    std::invalid_argument);
    CHECK_NOTHROW(validate_request(make_request("-1", "1", 8, "-1", "1", 8, 10)));
}

TEST_CASE("kernels: request_for covers the viewport")
{
    ViewState vs;
    const ComputeRequest req = request_for(vs, 800, 600);
    CHECK(req.width == 800);
    CHECK(req.height == 600);
    CHECK(req.max_iter == vs.max_iter);
    CHECK(req.ymin == Decimal("-0.5"));
    CHECK(req.ymax == Decimal("0.5"));
}
