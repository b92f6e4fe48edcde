#pragma once

#include <boost/multiprecision/cpp_dec_float.hpp>

#include <string>

// Decimal digit count of the view/orbit type. Override with
// -DDEEPZOOM_DEC_DIGITS10=<N>; anything below 50 is rejected.
#ifndef DEEPZOOM_DEC_DIGITS10
#define DEEPZOOM_DEC_DIGITS10 100
#endif

static_assert(DEEPZOOM_DEC_DIGITS10 >= 50,
              "view coordinates need at least 50 significant digits");

// Expression templates off: keeps `auto` and std::min/max on plain values.
using Decimal = boost::multiprecision::number<
    boost::multiprecision::cpp_dec_float<DEEPZOOM_DEC_DIGITS10>,
    boost::multiprecision::et_off>;

// Full-precision scientific text, suitable for re-parsing without loss.
inline std::string decimal_to_string(const Decimal& v)
{
    return v.str(DEEPZOOM_DEC_DIGITS10, std::ios_base::scientific);
}

// Returns false (and leaves `out` untouched) if `text` is not a number.
bool parse_decimal(const std::string& text, Decimal& out);
