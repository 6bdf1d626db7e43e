#ifndef DECIMAL_HPP
#define DECIMAL_HPP

#include <string>

#include "cryptostats/types.hpp"

namespace cryptostats::core {

// Accepts [-]digits[.digits]; both sides of the point need a digit.
// No exponent, no whitespace.
bool try_parse_decimal(const std::string& text, Decimal& out);

// Throws std::invalid_argument on malformed text.
Decimal parse_decimal(const std::string& text);

// Rounds to `scale` fractional digits, ties away from zero.
Decimal round_half_up(const Decimal& value, unsigned scale);

// numerator / denominator rounded half-up to `scale` digits. The rounding
// decision is exact for operands that fit the decimal precision.
// Throws std::invalid_argument when denominator is zero.
Decimal divide_half_up(const Decimal& numerator, const Decimal& denominator, unsigned scale);

// Rounded half-up, exactly `scale` fractional digits.
std::string to_fixed_string(const Decimal& value, unsigned scale);

// Rounded half-up to at most `maxScale` digits, trailing zeros dropped.
std::string to_plain_string(const Decimal& value, unsigned maxScale, char separator = '.');

double to_double(const Decimal& value);

}

#endif
