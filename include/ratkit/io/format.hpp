// include/ratkit/io/format.hpp — Text rendering for bigint and rational values.

#pragma once

#include <algorithm>
#include <ostream>
#include <stdexcept>
#include <string>

#include <ratkit/core/bigint.hpp>
#include <ratkit/core/rational.hpp>

namespace ratkit::io {

    inline std::string to_string(const ratkit::core::bigint &value, int base = 10) {
        if (base < 2 || base > 36) {
            throw std::invalid_argument("supported bases are 2..36");
        }
        if (value.is_zero()) {
            return "0";
        }
        const bool negative = ratkit::core::is_negative(value);
        ratkit::core::bigint cursor = boost::multiprecision::abs(value);
        const ratkit::core::bigint base_value(base);
        std::string digits;
        while (!cursor.is_zero()) {
            ratkit::core::bigint quotient;
            ratkit::core::bigint remainder;
            boost::multiprecision::divide_qr(cursor, base_value, quotient, remainder);
            cursor = quotient;
            const int digit_value = remainder.convert_to<int>();
            if (digit_value < 10) {
                digits.push_back(static_cast<char>('0' + digit_value));
            } else {
                digits.push_back(static_cast<char>('a' + digit_value - 10));
            }
        }
        if (negative) {
            digits.push_back('-');
        }
        std::reverse(digits.begin(), digits.end());
        return digits;
    }

    // Renders the stored fields: "-3/2", "10/5", "7". No reduction happens here.
    inline std::string to_string(const ratkit::core::rational &value, int base = 10) {
        if (value.is_zero()) {
            return "0";
        }
        std::string text;
        if (value.is_negative()) {
            text.push_back('-');
        }
        text += to_string(value.numerator(), base);
        if (value.denominator() != 1) {
            text.push_back('/');
            text += to_string(value.denominator(), base);
        }
        return text;
    }

} // namespace ratkit::io

namespace ratkit::core {

    inline std::ostream &operator<<(std::ostream &os, const rational &value) {
        return os << ratkit::io::to_string(value);
    }

} // namespace ratkit::core
