#pragma once

#include "decimal.hpp"

#include <vector>

// Full-precision orbit of one reference point C, rounded to double per step.
// Z_0 = 0; iteration stops after the first escaped Z or at Z_max_iter.
struct ReferenceOrbit {
    Decimal             cr, ci;
    std::vector<double> zr, zi;
    bool                escaped = false;   // last entry lies outside the bailout

    int size() const { return static_cast<int>(zr.size()); }
};

ReferenceOrbit compute_reference_orbit(const Decimal& cr, const Decimal& ci, int max_iter);

// Linear series start: delta_skip ~= B_skip * dc with
// B_0 = 0, B_{n+1} = 2 Z_n B_n + 1.
struct SeriesSkip {
    int    skip = 0;
    double br   = 0.0;
    double bi   = 0.0;
};

// Largest skip with |B_skip| * max_dc <= threshold, never reaching the last
// orbit entry.
SeriesSkip series_skip(const ReferenceOrbit& orbit, double max_dc, double threshold);

// Rebase test for the pixel orbit z = Z_m + delta (squared moduli):
//  - the reference orbit is exhausted (m is its last index)
//  - |z| < |delta|: z is a better base than Z_m + delta
//  - |z| < tolerance * |Z_m|: cancellation glitch
inline bool needs_rebase(double z_mag2, double delta_mag2, double ref_mag2,
                         int m, int orbit_size, double tolerance)
{
    if (m >= orbit_size - 1) return true;
    if (z_mag2 < delta_mag2) return true;
    return z_mag2 < tolerance * tolerance * ref_mag2;
}

struct PerturbationParams {
    double glitch_tolerance = 1e-3;
    int    max_rebases      = 10000;
};

struct DeltaOutcome {
    double value     = 0.0;    // smooth value or kInterior
    int    rebases   = 0;
    bool   exhausted = false;  // rebase budget spent; value is meaningless
};

// Iterates delta_{n+1} = (2 Z_m + delta_n) delta_n + dc against `orbit`,
// starting at the series skip, rebasing to m = 0 whenever needs_rebase().
DeltaOutcome iterate_delta(const ReferenceOrbit& orbit, const SeriesSkip& series,
                           double dcr, double dci, int max_iter,
                           const PerturbationParams& params);
