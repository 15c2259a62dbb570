#include "FormatValue.h"
#include "utils.h"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

IntegerDigits IntegerDigits::FromConfig(int value) {
    if (value == 0) return Zero();
    if (value > 0) return Fixed(value);
    return Auto();
}

bool parse_number(const std::string& value, double& out) {
    std::string s = trim(value);
    if (s.empty()) return false;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return false;
    // strtod accepts hex floats; sensor values never use them
    if (s.find_first_of("xX") != std::string::npos) return false;
    out = v;
    return true;
}

// More decimals than a double carries are padding only.
static const int MAX_DECIMAL_DIGITS = 15;
// Above 2^53 every double is an integer.
static const double EXACT_INTEGER_LIMIT = 9007199254740992.0;

static std::string zero_pad(std::string s, int width) {
    if (static_cast<int>(s.size()) < width) {
        s.insert(0, static_cast<size_t>(width) - s.size(), '0');
    }
    return s;
}

// Decimal digits of |v| for an integral v of any magnitude.
static std::string integer_digits_of(double v) {
    char buf[512];
    std::snprintf(buf, sizeof(buf), "%.0f", std::fabs(v));
    return buf;
}

std::string format_value(const std::string& value, IntegerDigits integer_digits,
                         int decimal_digits, const std::string& unit) {
    double num = 0.0;
    if (!parse_number(value, num) || !std::isfinite(num)) {
        return value + unit;
    }
    decimal_digits = std::clamp(decimal_digits, 0, MAX_DECIMAL_DIGITS);

    double factor = std::pow(10.0, decimal_digits);
    double rounded = num;
    if (std::fabs(num) < EXACT_INTEGER_LIMIT) {
        rounded = decimal_digits == 0 ? std::round(num) : std::round(num * factor) / factor;
    }

    // rounding may carry into the integer part, e.g. 9.999 -> 10.0
    double integer_value = std::trunc(rounded);
    bool negative = integer_value < 0.0;
    std::string magnitude = integer_digits_of(integer_value);

    std::string decimal_str;
    if (decimal_digits > 0) {
        double frac = std::fabs(rounded - integer_value);
        // frac < 1 and factor <= 1e15, so this fits
        long long dec = std::llround(frac * factor);
        if (static_cast<double>(dec) >= factor) {
            // carry already applied to the integer part
            dec = 0;
        }
        decimal_str = zero_pad(std::to_string(dec), decimal_digits);
    }

    std::string integer_str = negative ? "-" + magnitude : magnitude;
    std::string integer_filled;
    switch (integer_digits.kind) {
        case IntegerDigits::Kind::Auto:
            integer_filled = integer_str;
            break;
        case IntegerDigits::Kind::Zero:
            break;
        case IntegerDigits::Kind::Fixed: {
            int digits = integer_digits.digits;
            if (static_cast<int>(integer_str.size()) > digits) {
                integer_filled.assign(static_cast<size_t>(digits), '9');
            } else if (negative) {
                // sign counts towards the width
                integer_filled = "-" + zero_pad(magnitude, digits - 1);
            } else {
                integer_filled = zero_pad(magnitude, digits);
            }
            break;
        }
    }

    std::string formatted = decimal_digits > 0 ? integer_filled + "." + decimal_str : integer_filled;
    return formatted + unit;
}
