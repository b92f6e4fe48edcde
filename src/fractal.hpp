#pragma once

#include <algorithm>
#include <cmath>

// Stored for points that reach max_iter without escaping. Never a valid
// escape value: those lie in [0, max_iter).
constexpr double kInterior = -1.0;

// |z|^2 above which a point has escaped (bailout radius 2).
constexpr double kBailoutSq = 4.0;

// Continuous escape value ("normalized iteration count", log-log formula).
// `updates` is the number of z <- z^2 + c steps taken when |z|^2 = mag2 first
// exceeded the bailout. Clamped into [0, max_iter).
inline double smooth_value(int updates, double mag2, int max_iter)
{
    static const double log2 = std::log(2.0);
    const double log_zn = std::log(mag2) * 0.5;
    const double nu     = std::log(log_zn / log2) / log2;
    const double v      = static_cast<double>(updates) - nu;
    const double top    = std::nextafter(static_cast<double>(max_iter), 0.0);
    return std::min(std::max(0.0, v), top);
}

// Main cardioid and period-2 bulb tests, evaluated in the caller's width.
template<typename Real>
inline bool in_main_cardioid_or_bulb(const Real& x, const Real& y)
{
    const Real y2 = y * y;
    const Real xq = x - Real(0.25);
    const Real q  = xq * xq + y2;
    if (q * (q + xq) < y2 * Real(0.25)) return true;
    const Real xb = x + Real(1);
    return xb * xb + y2 < Real(0.0625);
}

// Direct escape-time evaluation of z_{n+1} = z_n^2 + c, z_0 = 0, in `Real`.
// Instantiated for double, long double, float128 and Decimal. The update
// order matches the AVX kernel so both paths iterate bit-identically.
template<typename Real, bool InteriorShortcut = true>
inline double escape_time(const Real& cr, const Real& ci, int max_iter)
{
    if constexpr (InteriorShortcut) {
        if (in_main_cardioid_or_bulb(cr, ci)) return kInterior;
    }

    const Real bailout(kBailoutSq);
    Real zr(0), zi(0);
    for (int n = 0; n < max_iter; ++n) {
        const Real new_zr = zr * zr + (cr - zi * zi);
        zi = (zr + zr) * zi + ci;
        zr = new_zr;
        const Real mag2 = zr * zr + zi * zi;
        if (mag2 > bailout)
            return smooth_value(n + 1, static_cast<double>(mag2), max_iter);
    }
    return kInterior;
}
