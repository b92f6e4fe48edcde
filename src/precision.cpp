#include "precision.hpp"
#include "log.hpp"

#include <boost/multiprecision/float128.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

const char* precision_mode_name(PrecisionMode m)
{
    switch (m) {
        case PrecisionMode::Double:         return "double";
        case PrecisionMode::ExtendedDouble: return "extended";
        case PrecisionMode::Quad:           return "quad";
        case PrecisionMode::Perturbation:   return "perturbation";
    }
    return "unknown";
}

int mantissa_bits(PrecisionMode m)
{
    switch (m) {
        case PrecisionMode::Double:
            return std::numeric_limits<double>::digits - 1;
        case PrecisionMode::ExtendedDouble:
            return std::numeric_limits<long double>::digits - 1;
        case PrecisionMode::Quad:
            return std::numeric_limits<boost::multiprecision::float128>::digits - 1;
        case PrecisionMode::Perturbation:
            break;
    }
    return std::numeric_limits<int>::max();
}

double required_bits(const Decimal& xmin, const Decimal& xmax, int width)
{
    using boost::multiprecision::abs;
    using boost::multiprecision::isfinite;
    using boost::multiprecision::log;

    constexpr double inf = std::numeric_limits<double>::infinity();

    if (!isfinite(xmin) || !isfinite(xmax)) return inf;
    const Decimal span = xmax - xmin;
    if (span <= 0) return inf;

    const Decimal mag = std::max({ abs(xmin), abs(xmax), Decimal(1) });
    static const Decimal ln2 = log(Decimal(2));

    const double span_bits = (log(mag / span) / ln2).convert_to<double>();
    const double pixel_bits = std::log2(static_cast<double>(std::max(width, 1)));
    const double bits = pixel_bits + span_bits + kGuardBits;
    return std::isfinite(bits) ? bits : inf;
}

PrecisionMode select_mode(const Decimal& xmin, const Decimal& xmax, int width)
{
    const double bits = required_bits(xmin, xmax, width);

    PrecisionMode mode = PrecisionMode::Perturbation;
    for (PrecisionMode m : { PrecisionMode::Double,
                             PrecisionMode::ExtendedDouble,
                             PrecisionMode::Quad }) {
        if (bits <= mantissa_bits(m)) { mode = m; break; }
    }

    engine_log()->debug("select_mode: {:.1f} bits for width {} -> {}",
                        bits, width, precision_mode_name(mode));
    return mode;
}

int get_precision_mode(const std::string& xmin, const std::string& xmax, int width)
{
    Decimal lo, hi;
    if (!parse_decimal(xmin, lo) || !parse_decimal(xmax, hi))
        return static_cast<int>(PrecisionMode::Perturbation);
    return static_cast<int>(select_mode(lo, hi, width));
}
