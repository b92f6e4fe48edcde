#include "kernels.hpp"
#include "fractal_avx.hpp"
#include "log.hpp"

#include <cmath>

// -----------------------------------------------------------------------
// Double: AVX for runs of 4 pixels, scalar for the remainder
// -----------------------------------------------------------------------
void DoubleKernel::render_tile(IterationBuffer& buf, int tx, int ty, int tw, int th) const
{
    const int W = buf.width;
    for (int py = ty; py < ty + th && py < buf.height; ++py) {
        const double im  = y0 + static_cast<double>(py) * dy;
        double*      row = buf.values.data() + static_cast<size_t>(py) * W;
        int          px  = tx;
        const int    end = std::min(tx + tw, W);

        if (use_avx) {
            for (; px + 4 <= end; px += 4) {
                double re4[4];
                for (int k = 0; k < 4; ++k)
                    re4[k] = x0 + static_cast<double>(px + k) * dx;
                avx_mandelbrot_4(re4, im, max_iter, row + px);
            }
        }

        for (; px < end; ++px)
            row[px] = escape_time<double>(x0 + static_cast<double>(px) * dx, im, max_iter);
    }
}

// -----------------------------------------------------------------------
// Perturbation: double deltas against the reference orbit
// -----------------------------------------------------------------------
void PerturbationKernel::render_tile(IterationBuffer& buf, int tx, int ty, int tw, int th) const
{
    const int W = buf.width;
    long long rebases = 0, fallbacks = 0;

    for (int py = ty; py < ty + th && py < buf.height; ++py) {
        const double dci = (static_cast<double>(py) - half_h) * dy;
        double*      row = buf.values.data() + static_cast<size_t>(py) * W;
        const int    end = std::min(tx + tw, W);

        for (int px = tx; px < end; ++px) {
            const double dcr = (static_cast<double>(px) - half_w) * dx;
            const DeltaOutcome r = iterate_delta(*orbit, series, dcr, dci, max_iter, params);
            rebases += r.rebases;
            if (r.exhausted) {
                ++fallbacks;
                row[px] = escape_time<Decimal>(xmin + Decimal(px) * dx_exact,
                                               ymin + Decimal(py) * dy_exact, max_iter);
            } else {
                row[px] = r.value;
            }
        }
    }

    counters->rebases   += rebases;
    counters->fallbacks += fallbacks;
}

// -----------------------------------------------------------------------
// Kernel selection
// -----------------------------------------------------------------------
namespace {

template<typename Real>
FixedKernel<Real> bind_fixed(const ComputeRequest& req, const Decimal& dx, const Decimal& dy)
{
    FixedKernel<Real> k;
    k.x0       = static_cast<Real>(req.xmin);
    k.y0       = static_cast<Real>(req.ymin);
    k.dx       = static_cast<Real>(dx);
    k.dy       = static_cast<Real>(dy);
    k.max_iter = req.max_iter;
    return k;
}

PerturbationKernel bind_perturbation(const ComputeRequest& req, const Decimal& dx,
                                     const Decimal& dy, const EngineConfig& cfg)
{
    PerturbationKernel k;
    k.max_iter = req.max_iter;
    k.half_w   = req.width * 0.5;
    k.half_h   = req.height * 0.5;
    k.dx       = static_cast<double>(dx);
    k.dy       = static_cast<double>(dy);
    k.xmin     = req.xmin;
    k.ymin     = req.ymin;
    k.dx_exact = dx;
    k.dy_exact = dy;
    k.params.glitch_tolerance = cfg.glitch_tolerance;
    k.params.max_rebases      = cfg.max_rebases;
    k.counters = std::make_shared<PerturbationCounters>();

    const Decimal cr = (req.xmin + req.xmax) / 2;
    const Decimal ci = (req.ymin + req.ymax) / 2;
    auto orbit = std::make_shared<ReferenceOrbit>(
        compute_reference_orbit(cr, ci, req.max_iter));

    if (cfg.series_approximation) {
        const double max_dc = std::hypot(k.dx * k.half_w, k.dy * k.half_h);
        k.series = series_skip(*orbit, max_dc, cfg.series_threshold);
    }

    engine_log()->debug("perturbation: reference orbit {} entries ({}), series skip {}",
                        orbit->size(), orbit->escaped ? "escaped" : "bounded",
                        k.series.skip);
    k.orbit = std::move(orbit);
    return k;
}

} // namespace

Kernel make_kernel(const ComputeRequest& req, PrecisionMode mode,
                   const EngineConfig& cfg, bool avx_available)
{
    const Decimal dx = (req.xmax - req.xmin) / req.width;
    const Decimal dy = (req.ymax - req.ymin) / req.height;

    switch (mode) {
        case PrecisionMode::Double: {
            DoubleKernel k;
            k.x0       = static_cast<double>(req.xmin);
            k.y0       = static_cast<double>(req.ymin);
            k.dx       = static_cast<double>(dx);
            k.dy       = static_cast<double>(dy);
            k.max_iter = req.max_iter;
            k.use_avx  = avx_available;
            return k;
        }
        case PrecisionMode::ExtendedDouble:
            return bind_fixed<long double>(req, dx, dy);
        case PrecisionMode::Quad:
            return bind_fixed<boost::multiprecision::float128>(req, dx, dy);
        case PrecisionMode::Perturbation:
            break;
    }
    return bind_perturbation(req, dx, dy, cfg);
}
