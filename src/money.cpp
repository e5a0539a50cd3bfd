#include "money.hpp"
#include "util.hpp"

#include <algorithm>
#include <stdexcept>

namespace coop_catalog {

namespace {

// Exponents are saturated here; anything this large already fails every
// digit-count limit, so the exact value no longer matters.
constexpr int64_t kExponentCap = 1000000000;

// int64 holds any 18-digit cents value (plus one for rounding up).
constexpr int64_t kMaxCentsDigits = 18;

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

// ---------------------------------------------------------------------------
// Money
// ---------------------------------------------------------------------------

std::string Money::toString() const {
    const uint64_t magnitude = mCents < 0
        ? uint64_t{0} - static_cast<uint64_t>(mCents)
        : static_cast<uint64_t>(mCents);

    std::string out = mCents < 0 ? "-" : "";
    out += std::to_string(magnitude / 100);
    out += '.';
    const uint64_t fraction = magnitude % 100;
    if (fraction < 10) {
        out += '0';
    }
    out += std::to_string(fraction);
    return out;
}

// ---------------------------------------------------------------------------
// DecimalNumber
// ---------------------------------------------------------------------------

int64_t DecimalNumber::significantDigits() const {
    if (isZero()) {
        return 1;
    }
    const auto count = static_cast<int64_t>(digits.size());
    if (exponent >= 0) {
        return count + exponent;
    }
    return std::max(count, -exponent);
}

Money DecimalNumber::roundToCents() const {
    const auto count = static_cast<int64_t>(digits.size());
    const int64_t shift = exponent + 2;   // power of ten applied to digits, in cents
    int64_t cents = 0;

    if (shift >= 0) {
        if (count + shift > kMaxCentsDigits) {
            throw std::out_of_range("Amount too large: " + digits + "e" +
                                    std::to_string(exponent));
        }
        for (char c : digits) {
            cents = cents * 10 + (c - '0');
        }
        for (int64_t i = 0; i < shift; ++i) {
            cents *= 10;
        }
    } else {
        const int64_t keep = count + shift;
        if (keep > kMaxCentsDigits) {
            throw std::out_of_range("Amount too large: " + digits + "e" +
                                    std::to_string(exponent));
        }
        // keep < 0 means the value is below half a cent.
        if (keep >= 0) {
            for (int64_t i = 0; i < keep; ++i) {
                cents = cents * 10 + (digits[static_cast<std::size_t>(i)] - '0');
            }
            if (digits[static_cast<std::size_t>(keep)] >= '5') {
                ++cents;
            }
        }
    }

    return Money::fromCents(isNegative() ? -cents : cents);
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

DecimalNumber parseDecimal(const std::string& input) {
    const std::string text = trim(input);
    const std::size_t n = text.size();
    std::size_t pos = 0;

    DecimalNumber result;

    // --- sign ---
    if (pos < n && (text[pos] == '+' || text[pos] == '-')) {
        result.negative = (text[pos] == '-');
        ++pos;
    }

    // --- mantissa ---
    std::string intPart;
    std::string fracPart;
    while (pos < n && isDigit(text[pos])) {
        intPart += text[pos++];
    }
    if (pos < n && text[pos] == '.') {
        ++pos;
        while (pos < n && isDigit(text[pos])) {
            fracPart += text[pos++];
        }
    }
    if (intPart.empty() && fracPart.empty()) {
        throw std::invalid_argument("Invalid decimal number: '" + input + "'");
    }

    // --- exponent ---
    int64_t exponent = 0;
    if (pos < n && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        bool expNegative = false;
        if (pos < n && (text[pos] == '+' || text[pos] == '-')) {
            expNegative = (text[pos] == '-');
            ++pos;
        }
        if (pos >= n || !isDigit(text[pos])) {
            throw std::invalid_argument("Invalid decimal exponent: '" + input + "'");
        }
        while (pos < n && isDigit(text[pos])) {
            exponent = std::min(kExponentCap, exponent * 10 + (text[pos] - '0'));
            ++pos;
        }
        if (expNegative) {
            exponent = -exponent;
        }
    }

    if (pos != n) {
        throw std::invalid_argument("Invalid decimal number: '" + input + "'");
    }

    // --- normalize: digits without leading/trailing zeros ---
    std::string all = intPart + fracPart;
    exponent -= static_cast<int64_t>(fracPart.size());

    const auto first = all.find_first_not_of('0');
    if (first == std::string::npos) {
        return result;   // zero
    }
    all.erase(0, first);

    const auto last = all.find_last_not_of('0');
    exponent += static_cast<int64_t>(all.size() - 1 - last);
    all.erase(last + 1);

    result.digits   = all;
    result.exponent = exponent;
    return result;
}

} // namespace coop_catalog
