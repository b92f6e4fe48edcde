#pragma once

#include "decimal.hpp"

#include <string>

// Arithmetic used for one compute pass. Values are the numeric codes
// returned by get_precision_mode().
enum class PrecisionMode : int {
    Double         = 0,
    ExtendedDouble = 1,
    Quad           = 2,
    Perturbation   = 3,
};

const char* precision_mode_name(PrecisionMode m);

// Explicit mantissa bits of the fixed-width representations (52, 63, 112).
int mantissa_bits(PrecisionMode m);

// Extra bits kept below the pixel spacing so rounding stays sub-pixel.
constexpr int kGuardBits = 3;

// Bits needed to tell adjacent pixels apart:
//   log2(width) + log2(max(|xmin|, |xmax|, 1) / (xmax - xmin)) + kGuardBits
// Returns +inf for an empty, inverted or non-finite span.
double required_bits(const Decimal& xmin, const Decimal& xmax, int width);

// Cheapest representation whose mantissa covers required_bits().
// Total: anything that cannot be measured selects Perturbation.
PrecisionMode select_mode(const Decimal& xmin, const Decimal& xmax, int width);

// String form for callers that keep coordinates as text. Unparsable
// input selects Perturbation. Returns the numeric code 0..3.
int get_precision_mode(const std::string& xmin, const std::string& xmax, int width);
