#include "normalization.hpp"

#include <algorithm>
#include <random>

namespace {

// Percentile with linear interpolation between closest ranks; reorders `v`.
double percentile_of(std::vector<double>& v, double p)
{
    p = std::min(std::max(p, 0.0), 100.0);
    const double pos  = p / 100.0 * static_cast<double>(v.size() - 1);
    const size_t lo   = static_cast<size_t>(pos);
    const double frac = pos - static_cast<double>(lo);

    std::nth_element(v.begin(), v.begin() + lo, v.end());
    const double a = v[lo];
    if (frac == 0.0 || lo + 1 >= v.size()) return a;

    // Next rank is the smallest element of the upper partition
    const double b = *std::min_element(v.begin() + lo + 1, v.end());
    return a + frac * (b - a);
}

} // namespace

NormalizationStats compute_normalization(const std::vector<double>& values,
                                         int max_samples, double percentile,
                                         std::uint64_t seed)
{
    std::vector<double> escaped;
    escaped.reserve(values.size());
    for (double v : values)
        if (v >= 0.0 && std::isfinite(v)) escaped.push_back(v);

    NormalizationStats stats;
    if (escaped.empty()) return stats;

    std::vector<double> sample;
    if (max_samples > 0 && escaped.size() > static_cast<size_t>(max_samples)) {
        std::mt19937_64 rng(seed);
        std::uniform_int_distribution<size_t> pick(0, escaped.size() - 1);
        sample.reserve(static_cast<size_t>(max_samples));
        for (int i = 0; i < max_samples; ++i)
            sample.push_back(display_transform(escaped[pick(rng)]));
    } else {
        sample.reserve(escaped.size());
        for (double v : escaped) sample.push_back(display_transform(v));
    }

    stats.samples = static_cast<int>(sample.size());
    stats.min_val = *std::min_element(sample.begin(), sample.end());
    stats.max_val = percentile_of(sample, percentile);
    if (!(stats.max_val > stats.min_val))
        stats.max_val = stats.min_val + kFlatRangeSpan;
    return stats;
}
