#pragma once

#include <cstdint>
#include <string>

namespace coop_catalog {

/// Monetary amount held as an exact number of cents.
class Money {
public:
    Money() = default;

    static Money fromCents(int64_t cents) { return Money(cents); }

    int64_t cents() const { return mCents; }

    /// Always two fractional digits: 600 cents -> "6.00", -5 -> "-0.05".
    std::string toString() const;

    bool operator==(const Money& other) const { return mCents == other.mCents; }
    bool operator!=(const Money& other) const { return mCents != other.mCents; }
    bool operator<(const Money& other) const  { return mCents <  other.mCents; }

private:
    explicit Money(int64_t cents) : mCents(cents) {}

    int64_t mCents = 0;
};

/// Exact decimal value: (-1)^negative * digits * 10^exponent.
/// digits carries no leading or trailing zeros; it is empty for zero.
struct DecimalNumber {
    bool        negative = false;
    std::string digits;
    int64_t     exponent = 0;

    bool isZero() const     { return digits.empty(); }
    bool isNegative() const { return negative && !isZero(); }

    /// Total digit count in the sense of decimal max-digits constraints:
    /// for integers the count of integer digits, otherwise at least the
    /// number of fractional digits.  0.005 -> 3, 12345678.9 -> 9, 1e3 -> 4.
    int64_t significantDigits() const;

    /// Round half-up (away from zero) to two fractional digits.
    /// Throws std::out_of_range if the result does not fit in int64 cents.
    Money roundToCents() const;
};

/// Parse decimal text such as "5.999", " 10 ", "-0.5", "1.5e+2", ".25".
/// Throws std::invalid_argument on anything that is not a finite decimal.
DecimalNumber parseDecimal(const std::string& text);

} // namespace coop_catalog
