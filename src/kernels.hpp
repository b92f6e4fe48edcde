#pragma once

#include "engine_config.hpp"
#include "fractal.hpp"
#include "iteration_buffer.hpp"
#include "perturbation.hpp"
#include "precision.hpp"

#include <boost/multiprecision/float128.hpp>

#include <algorithm>
#include <atomic>
#include <memory>
#include <variant>

// Every kernel fills one rectangular tile of the request's pixel grid.
// Tiles are independent; the pass result does not depend on tile order.

struct DoubleKernel {
    double x0 = 0.0, y0 = 0.0;
    double dx = 0.0, dy = 0.0;
    int    max_iter = 0;
    bool   use_avx  = false;

    void render_tile(IterationBuffer& buf, int tx, int ty, int tw, int th) const;
};

template<typename Real>
struct FixedKernel {
    Real x0 {0}, y0 {0};
    Real dx {0}, dy {0};
    int  max_iter = 0;

    void render_tile(IterationBuffer& buf, int tx, int ty, int tw, int th) const
    {
        const int W = buf.width;
        for (int py = ty; py < ty + th && py < buf.height; ++py) {
            const Real im  = y0 + Real(py) * dy;
            double*    row = buf.values.data() + static_cast<size_t>(py) * W;
            const int  end = std::min(tx + tw, W);
            for (int px = tx; px < end; ++px)
                row[px] = escape_time<Real>(x0 + Real(px) * dx, im, max_iter);
        }
    }
};

using ExtendedKernel = FixedKernel<long double>;
using QuadKernel     = FixedKernel<boost::multiprecision::float128>;

struct PerturbationCounters {
    std::atomic<long long> rebases   {0};
    std::atomic<long long> fallbacks {0};
};

struct PerturbationKernel {
    std::shared_ptr<const ReferenceOrbit> orbit;
    SeriesSkip         series;
    PerturbationParams params;

    // Pixel offsets from the reference point, which sits at the grid center
    double dx = 0.0, dy = 0.0;
    double half_w = 0.0, half_h = 0.0;
    int    max_iter = 0;

    // Exact pixel coordinates for direct evaluation when a pixel
    // exhausts its rebase budget
    Decimal xmin, ymin;
    Decimal dx_exact, dy_exact;

    std::shared_ptr<PerturbationCounters> counters;

    void render_tile(IterationBuffer& buf, int tx, int ty, int tw, int th) const;
};

// Alternative index == static_cast<int>(PrecisionMode).
using Kernel = std::variant<DoubleKernel, ExtendedKernel, QuadKernel, PerturbationKernel>;

inline PrecisionMode kernel_mode(const Kernel& k)
{
    return static_cast<PrecisionMode>(k.index());
}

// Binds a request to the kernel of `mode`. For Perturbation this computes the
// reference orbit and the series skip, so it may take a while at high caps.
Kernel make_kernel(const ComputeRequest& req, PrecisionMode mode,
                   const EngineConfig& cfg, bool avx_available);
