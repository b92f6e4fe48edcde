#include "decimal.hpp"

#include <cctype>
#include <stdexcept>

namespace {

// [+-] digits [. digits] [(e|E) [+-] digits], at least one mantissa digit
bool is_decimal_literal(const std::string& s)
{
    size_t i = 0;
    const size_t n = s.size();
    auto digits = [&] {
        const size_t start = i;
        while (i < n && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        return i - start;
    };

    if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
    size_t mantissa = digits();
    if (i < n && s[i] == '.') {
        ++i;
        mantissa += digits();
    }
    if (mantissa == 0) return false;
    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        ++i;
        if (i < n && (s[i] == '+' || s[i] == '-')) ++i;
        if (digits() == 0) return false;
    }
    return i == n;
}

} // namespace

bool parse_decimal(const std::string& text, Decimal& out)
{
    if (!is_decimal_literal(text)) return false;
    try {
        Decimal v(text);
        if (!boost::multiprecision::isfinite(v)) return false;
        out = v;
        return true;
    } catch (const std::runtime_error&) {
        // exponent out of range for cpp_dec_float
        return false;
    }
}
