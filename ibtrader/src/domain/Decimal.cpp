#include "domain/Decimal.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace ibtrader::domain {

Decimal Decimal::fromString(const std::string& text) {
    size_t pos = 0;
    bool negative = false;

    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    int64_t units = 0;
    int64_t nanos = 0;
    int digits = 0;
    int fractionDigits = 0;
    bool inFraction = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.' && !inFraction) {
            inFraction = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Not a decimal: '" + text + "'");
        }
        ++digits;
        if (inFraction) {
            if (++fractionDigits > 9) {
                throw std::invalid_argument("Too many fraction digits: '" + text + "'");
            }
            nanos = nanos * 10 + (c - '0');
        } else {
            if (units > (INT64_MAX / NANO_SCALE) / 10) {
                throw std::invalid_argument("Decimal out of range: '" + text + "'");
            }
            units = units * 10 + (c - '0');
        }
    }

    if (digits == 0) {
        throw std::invalid_argument("Not a decimal: '" + text + "'");
    }

    for (int i = fractionDigits; i < 9; ++i) {
        nanos *= 10;
    }

    int64_t total = units * NANO_SCALE + nanos;
    return fromNanos(negative ? -total : total);
}

Decimal Decimal::fromDouble(double value) {
    return fromNanos(static_cast<int64_t>(std::llround(value * 1e9)));
}

std::string Decimal::toString() const {
    int64_t total = toNanos();
    bool negative = total < 0;
    if (negative) {
        total = -total;
    }

    std::string fraction = std::to_string(total % NANO_SCALE);
    fraction.insert(0, 9 - fraction.size(), '0');
    while (fraction.size() > 2 && fraction.back() == '0') {
        fraction.pop_back();
    }

    return (negative ? "-" : "") + std::to_string(total / NANO_SCALE) + "." + fraction;
}

Decimal Decimal::dividedBy(int64_t divisor) const {
    if (divisor == 0) {
        throw std::invalid_argument("Division by zero");
    }

    int64_t n = toNanos();
    int64_t q = n / divisor;
    int64_t r = n % divisor;

    // Половина и больше округляется от нуля
    if (2 * std::llabs(r) >= std::llabs(divisor)) {
        q += ((n < 0) != (divisor < 0)) ? -1 : 1;
    }
    return fromNanos(q);
}

Decimal Decimal::floorTo(const Decimal& increment) const {
    int64_t step = increment.toNanos();
    if (step <= 0) {
        throw std::invalid_argument("Increment must be positive");
    }

    int64_t n = toNanos();
    int64_t q = n / step;
    if (n % step != 0 && n < 0) {
        --q;
    }
    return fromNanos(q * step);
}

Decimal Decimal::ceilTo(const Decimal& increment) const {
    int64_t step = increment.toNanos();
    if (step <= 0) {
        throw std::invalid_argument("Increment must be positive");
    }

    int64_t n = toNanos();
    int64_t q = n / step;
    if (n % step != 0 && n > 0) {
        ++q;
    }
    return fromNanos(q * step);
}

} // namespace ibtrader::domain
