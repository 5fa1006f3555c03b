#include <ddb/number_literal.h>
#include <ddb/number_format.h>
#include <cctype>
#include <charconv>
#include <stdexcept>
#include <system_error>

namespace ddb {

namespace {
    size_t skip_digits(const std::string& t, size_t k) {
        while (k < t.size() and std::isdigit(static_cast<unsigned char>(t[k]))) ++k;
        return k;
    }
}

bool is_decimal_literal(const std::string& text) {
    size_t k = 0;
    if (k < text.size() and (text[k] == '+' or text[k] == '-')) ++k;

    size_t int_end = skip_digits(text, k);
    size_t digits = int_end - k;
    k = int_end;
    if (k < text.size() and text[k] == '.') {
        size_t frac_end = skip_digits(text, k + 1);
        digits += frac_end - (k + 1);
        k = frac_end;
    }
    if (digits == 0) return false;

    if (k < text.size() and (text[k] == 'e' or text[k] == 'E')) {
        ++k;
        if (k < text.size() and (text[k] == '+' or text[k] == '-')) ++k;
        size_t exp_end = skip_digits(text, k);
        if (exp_end == k) return false;
        k = exp_end;
    }
    return k == text.size();
}

std::optional<NumberLiteral> NumberLiteral::parse(const std::string& text) {
    if (not is_decimal_literal(text)) return std::nullopt;
    return NumberLiteral(text);
}

NumberLiteral NumberLiteral::fromInteger(int64_t n) { return NumberLiteral(std::to_string(n)); }

NumberLiteral NumberLiteral::fromDouble(double x) { return NumberLiteral(format_double(x)); }

bool NumberLiteral::isFloat() const noexcept {
    return text_.find_first_of(".eE") != std::string::npos;
}

Value NumberLiteral::toValue() const {
    // from_chars does not take a leading '+'
    const char* first = text_.data();
    const char* last = text_.data() + text_.size();
    if (first != last and *first == '+') ++first;

    if (isFloat()) {
        double d = 0.0;
        if (not read_double(first, last, d))
            throw std::out_of_range("number " + text_ + " is outside the range of a double");
        return Value(d);
    }

    int64_t n = 0;
    auto res = std::from_chars(first, last, n);
    if (res.ec == std::errc::result_out_of_range)
        throw std::out_of_range("integer " + text_ + " does not fit in 64 bits");
    if (res.ec != std::errc() or res.ptr != last)
        throw std::invalid_argument("not a decimal literal: " + text_);
    return Value(n);
}

}  // namespace ddb
