#pragma once

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ddb {

// Shortest decimal text that parses back to exactly `x`, laid out like
// Python's float repr: fixed notation with at least one fractional digit
// when the decimal exponent is in [-4, 16), otherwise "d.ddde+XX".
inline std::string format_double(double x) {
    if (not std::isfinite(x)) throw std::domain_error("non-finite number has no decimal literal");
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), x, std::chars_format::scientific);
    if (res.ec != std::errc()) throw std::runtime_error("failed to format number");
    const std::string sci(buf, res.ptr);

    // split "-d.ddde-XX" into sign, significant digits and exponent
    size_t k = 0;
    std::string out;
    if (sci[k] == '-') {
        out.push_back('-');
        ++k;
    }
    size_t e_pos = sci.find('e', k);
    std::string digits;
    for (size_t j = k; j < e_pos; ++j) {
        if (sci[j] != '.') digits.push_back(sci[j]);
    }
    int exp = std::atoi(sci.c_str() + e_pos + 1);

    if (-4 <= exp and exp < 16) {
        if (exp < 0) {
            out += "0.";
            out.append(static_cast<size_t>(-exp - 1), '0');
            out += digits;
        } else {
            size_t int_digits = static_cast<size_t>(exp) + 1;
            if (digits.size() <= int_digits) {
                out += digits;
                out.append(int_digits - digits.size(), '0');
                out += ".0";
            } else {
                out += digits.substr(0, int_digits);
                out.push_back('.');
                out += digits.substr(int_digits);
            }
        }
        return out;
    }

    out.push_back(digits[0]);
    if (digits.size() > 1) {
        out.push_back('.');
        out += digits.substr(1);
    }
    out.push_back('e');
    out.push_back(exp < 0 ? '-' : '+');
    std::string exp_text = std::to_string(exp < 0 ? -exp : exp);
    if (exp_text.size() < 2) out.push_back('0');
    out += exp_text;
    return out;
}

namespace detail {
    // Decimal exponent of the leading non-zero digit of a validated decimal
    // literal, saturated well past the range of a double.
    inline long decimal_magnitude(const char* first, const char* last) {
        const char* p = first;
        if (p != last and (*p == '+' or *p == '-')) ++p;
        long int_digits = 0;
        long leading = 0;
        bool seen_point = false;
        bool found = false;
        long frac_index = 0;
        for (; p != last and *p != 'e' and *p != 'E'; ++p) {
            if (*p == '.') {
                seen_point = true;
                continue;
            }
            if (not seen_point) {
                if (not found and *p != '0') {
                    found = true;
                    leading = int_digits;
                }
                ++int_digits;
            } else {
                if (not found and *p != '0') {
                    found = true;
                    leading = -(frac_index + 1);
                }
                ++frac_index;
            }
        }
        if (not found) return -100000;
        long mag = leading >= 0 ? int_digits - 1 - leading : leading;

        if (p != last) {
            ++p;
            bool negative = false;
            if (p != last and (*p == '+' or *p == '-')) negative = *p++ == '-';
            long e = 0;
            for (; p != last; ++p) {
                if (e < 100000) e = e * 10 + (*p - '0');
            }
            mag += negative ? -e : e;
        }
        return mag;
    }
}

// Reads a decimal literal (no leading '+') as a double. Magnitudes too small
// for a double become the nearest subnormal or a signed zero. Returns false
// when the text is not a literal or the magnitude is too large.
inline bool read_double(const char* first, const char* last, double& out) {
    auto res = std::from_chars(first, last, out);
    if (res.ptr != last) return false;
    if (res.ec == std::errc()) return true;
    if (res.ec != std::errc::result_out_of_range) return false;
    if (detail::decimal_magnitude(first, last) >= 0) return false;
    out = std::strtod(std::string(first, last).c_str(), nullptr);
    return true;
}

}  // namespace ddb
