#include "perturbation.hpp"
#include "fractal.hpp"

#include <cmath>

ReferenceOrbit compute_reference_orbit(const Decimal& cr, const Decimal& ci, int max_iter)
{
    ReferenceOrbit orbit;
    orbit.cr = cr;
    orbit.ci = ci;
    if (max_iter < 0) max_iter = 0;
    orbit.zr.reserve(static_cast<size_t>(max_iter) + 1);
    orbit.zi.reserve(static_cast<size_t>(max_iter) + 1);

    orbit.zr.push_back(0.0);
    orbit.zi.push_back(0.0);

    const Decimal bailout(kBailoutSq);
    Decimal zr(0), zi(0);
    for (int n = 0; n < max_iter; ++n) {
        const Decimal zr2 = zr * zr;
        const Decimal zi2 = zi * zi;
        zi = (zr + zr) * zi + ci;
        zr = zr2 - zi2 + cr;
        orbit.zr.push_back(static_cast<double>(zr));
        orbit.zi.push_back(static_cast<double>(zi));
        if (zr * zr + zi * zi > bailout) {
            orbit.escaped = true;
            break;
        }
    }
    return orbit;
}

SeriesSkip series_skip(const ReferenceOrbit& orbit, double max_dc, double threshold)
{
    SeriesSkip s;
    if (!(max_dc > 0.0) || !(threshold > 0.0)) return s;

    const int last = orbit.size() - 1;
    double br = 0.0, bi = 0.0;
    for (int i = 0; i + 1 < last; ++i) {
        const double zr = orbit.zr[i], zi = orbit.zi[i];
        const double nbr = 2.0 * (zr * br - zi * bi) + 1.0;
        const double nbi = 2.0 * (zr * bi + zi * br);
        if (std::hypot(nbr, nbi) * max_dc > threshold) break;
        br     = nbr;
        bi     = nbi;
        s.skip = i + 1;
    }
    s.br = br;
    s.bi = bi;
    return s;
}

DeltaOutcome iterate_delta(const ReferenceOrbit& orbit, const SeriesSkip& series,
                           double dcr, double dci, int max_iter,
                           const PerturbationParams& params)
{
    DeltaOutcome out;
    const int     size = orbit.size();
    const double* ref_r = orbit.zr.data();
    const double* ref_i = orbit.zi.data();

    int    m  = series.skip;
    double dr = series.br * dcr - series.bi * dci;
    double di = series.br * dci + series.bi * dcr;

    for (int n = series.skip; n < max_iter; ) {
        // delta <- (2 Z_m + delta) delta + dc
        const double tr  = 2.0 * ref_r[m] + dr;
        const double ti  = 2.0 * ref_i[m] + di;
        const double ndr = tr * dr - ti * di + dcr;
        const double ndi = tr * di + ti * dr + dci;
        dr = ndr;
        di = ndi;
        ++m;
        ++n;

        const double zr     = ref_r[m] + dr;
        const double zi     = ref_i[m] + di;
        const double z_mag2 = zr * zr + zi * zi;
        if (z_mag2 > kBailoutSq) {
            out.value = smooth_value(n, z_mag2, max_iter);
            return out;
        }
        if (n >= max_iter) break;

        const double ref_mag2 = ref_r[m] * ref_r[m] + ref_i[m] * ref_i[m];
        if (needs_rebase(z_mag2, dr * dr + di * di, ref_mag2, m, size,
                         params.glitch_tolerance)) {
            if (out.rebases >= params.max_rebases) {
                out.exhausted = true;
                return out;
            }
            ++out.rebases;
            dr = zr;
            di = zi;
            m  = 0;
        }
    }
    out.value = kInterior;
    return out;
}
