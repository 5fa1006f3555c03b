#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <ddb/value.h>

namespace ddb {

// True for an optional sign, digits with an optional fractional part (at
// least one digit overall) and an optional exponent: "7", "-0.5", ".5",
// "1e3", "+2.E-4". No whitespace, no "inf"/"nan".
bool is_decimal_literal(const std::string& text);

// The text of an N payload. Numbers on the DynamoDB side are carried as
// text and only become Integer or Double when converted with toValue().
class NumberLiteral {
  public:
    static std::optional<NumberLiteral> parse(const std::string& text);

    static NumberLiteral fromInteger(int64_t n);
    // throws std::domain_error for NaN and infinities
    static NumberLiteral fromDouble(double x);

    const std::string& text() const noexcept { return text_; }

    // A literal with '.' or an exponent marker is a Double, anything else an
    // Integer. "1e0" is therefore the Double 1.0, not the Integer 1.
    bool isFloat() const noexcept;

    // Throws std::out_of_range when the magnitude does not fit an int64_t
    // (Integer literals) or a finite double (Double literals).
    Value toValue() const;

    bool operator==(const NumberLiteral& rhs) const { return text_ == rhs.text_; }
    bool operator!=(const NumberLiteral& rhs) const { return not(*this == rhs); }

  private:
    explicit NumberLiteral(std::string text) : text_(std::move(text)) {}

    std::string text_;
};

}  // namespace ddb
