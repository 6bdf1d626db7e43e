#include "cryptostats/core/decimal.hpp"

#include <cctype>
#include <ios>
#include <stdexcept>

namespace cryptostats::core {

namespace {

Decimal power_of_ten(unsigned scale)
{
    Decimal factor = 1;
    for (unsigned i = 0; i < scale; ++i) factor *= 10;
    return factor;
}

}

bool try_parse_decimal(const std::string& text, Decimal& out)
{
    std::size_t pos = 0;
    if (pos < text.size() && text[pos] == '-') ++pos;

    std::size_t intDigits = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
        ++intDigits;
    }

    if (intDigits == 0) return false;

    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t fracDigits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
            ++fracDigits;
        }
        if (fracDigits == 0) return false;
    }

    if (pos != text.size()) return false;

    out = Decimal(text.c_str());
    return true;
}

Decimal parse_decimal(const std::string& text)
{
    Decimal value;
    if (!try_parse_decimal(text, value)) {
        throw std::invalid_argument("not a decimal number: '" + text + "'");
    }
    return value;
}

Decimal round_half_up(const Decimal& value, unsigned scale)
{
    const Decimal factor = power_of_ten(scale);

    const Decimal scaled = boost::multiprecision::floor(boost::multiprecision::abs(value) * factor + Decimal("0.5"));
    const Decimal rounded = scaled / factor;
    return value < 0 ? Decimal(-rounded) : rounded;
}

Decimal divide_half_up(const Decimal& numerator, const Decimal& denominator, unsigned scale)
{
    if (denominator == 0) {
        throw std::invalid_argument("division by zero");
    }

    const Decimal factor  = power_of_ten(scale);
    const Decimal dividend = boost::multiprecision::abs(numerator) * factor;
    const Decimal divisor  = boost::multiprecision::abs(denominator);

    // The quotient estimate may sit one unit off when the division does not
    // terminate; the remainder is computed with exact multiplication.
    Decimal quotient  = boost::multiprecision::floor(dividend / divisor);
    Decimal remainder = dividend - quotient * divisor;
    while (remainder < 0) {
        quotient  -= 1;
        remainder += divisor;
    }
    while (remainder >= divisor) {
        quotient  += 1;
        remainder -= divisor;
    }
    if (remainder * 2 >= divisor) quotient += 1;

    const Decimal result = quotient / factor;
    const bool negative = (numerator < 0) != (denominator < 0);
    return negative && quotient != 0 ? Decimal(-result) : result;
}

std::string to_fixed_string(const Decimal& value, unsigned scale)
{
    const Decimal rounded = round_half_up(value, scale);
    return rounded.str(static_cast<std::streamsize>(scale), std::ios_base::fixed);
}

std::string to_plain_string(const Decimal& value, unsigned maxScale, char separator)
{
    std::string text = to_fixed_string(value, maxScale);

    const auto dot = text.find('.');
    if (dot != std::string::npos) {
        const auto last = text.find_last_not_of('0');
        text.erase(last == dot ? dot : last + 1);
        if (last != dot) text[dot] = separator;
    }
    if (text == "-0") text = "0";
    return text;
}

double to_double(const Decimal& value)
{
    return value.convert_to<double>();
}

}
