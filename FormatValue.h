#ifndef FORMAT_VALUE_H
#define FORMAT_VALUE_H

#include <string>

// Width policy for the integer part of a formatted sensor value.
struct IntegerDigits {
    enum class Kind {
        Auto,   // natural width
        Zero,   // integer part suppressed
        Fixed,  // zero padded to `digits`, all nines on overflow
    };

    Kind kind = Kind::Auto;
    int digits = 0;

    static IntegerDigits Auto() { return {Kind::Auto, 0}; }
    static IntegerDigits Zero() { return {Kind::Zero, 0}; }
    static IntegerDigits Fixed(int n) { return {Kind::Fixed, n}; }

    // Configuration encoding: -1 = auto, 0 = zero, n > 0 = fixed(n). Other values are auto.
    static IntegerDigits FromConfig(int value);
};

// Format a numeric sensor value string with a fixed number of decimals and append `unit`.
// Values that do not parse as a number are returned verbatim with the unit appended.
//   format_value("123.456", IntegerDigits::Fixed(5), 1, "°C") == "00123.5°C"
//   format_value("123.456", IntegerDigits::Fixed(2), 0, "°C") == "99°C"
std::string format_value(const std::string& value, IntegerDigits integer_digits,
                         int decimal_digits, const std::string& unit);

// Strict float parse of a whole (trimmed) string.
bool parse_number(const std::string& value, double& out);

#endif // FORMAT_VALUE_H
