#pragma once

#include "engine_config.hpp"
#include "iteration_buffer.hpp"

#include <cmath>
#include <cstdint>
#include <vector>

// Display range of one result, in display_transform() units.
// Always max_val > min_val.
struct NormalizationStats {
    double min_val = 0.0;
    double max_val = 1.0;
    int    samples = 0;     // escaped values the range was taken from
};

// Added to min_val when all sampled values coincide.
constexpr double kFlatRangeSpan = 1.0;

inline double display_transform(double v)
{
    return std::log(std::log(v + 2.0) + 1.0);
}

// min_val = smallest transformed escaped value, max_val = `percentile`-th
// percentile (linear interpolation between closest ranks). At most
// `max_samples` values are drawn, with replacement, from larger inputs.
// No escaped value gives the fallback range (0, 1).
NormalizationStats compute_normalization(const std::vector<double>& values,
                                         int max_samples, double percentile,
                                         std::uint64_t seed);

inline NormalizationStats compute_normalization(const IterationBuffer& buf,
                                                const EngineConfig& cfg)
{
    return compute_normalization(buf.values, cfg.normalization_samples,
                                 cfg.normalization_percentile, cfg.normalization_seed);
}
