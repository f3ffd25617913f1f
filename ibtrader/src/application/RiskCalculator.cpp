#include "application/RiskCalculator.hpp"
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <limits>

namespace ibtrader::application {

using boost::multiprecision::int128_t;
using domain::Decimal;
using domain::EngineException;
using domain::ErrorCode;

namespace {

// 100% в нано-единицах
const int128_t HUNDRED_PERCENT = int128_t(100) * Decimal::NANO_SCALE;

int128_t floorDiv(const int128_t& a, const int128_t& b) {
    int128_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int128_t ceilDiv(const int128_t& a, const int128_t& b) {
    int128_t q = a / b;
    if ((a % b != 0) && ((a < 0) == (b < 0))) {
        ++q;
    }
    return q;
}

Decimal toDecimal(const int128_t& nanos) {
    if (nanos > std::numeric_limits<int64_t>::max() ||
        nanos < std::numeric_limits<int64_t>::min()) {
        throw EngineException(ErrorCode::INVALID_RISK_PARAMETER, "Price out of range");
    }
    return Decimal::fromNanos(static_cast<int64_t>(nanos));
}

void requirePositiveFill(const Decimal& fillPrice) {
    if (!fillPrice.isPositive()) {
        throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                              "Fill price must be positive, got " + fillPrice.toString());
    }
}

} // namespace

void RiskCalculator::validatePercent(const std::optional<Decimal>& pct, const char* name) {
    if (pct && !pct->isPositive()) {
        throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                              std::string(name) + " must be positive, got " + pct->toString());
    }
}

Decimal RiskCalculator::stopPrice(const Decimal& fillPrice, const Decimal& stopPct) const {
    requirePositiveFill(fillPrice);
    validatePercent(stopPct, "Stop loss percent");

    int128_t raw = floorDiv(int128_t(fillPrice.toNanos()) * (HUNDRED_PERCENT - stopPct.toNanos()),
                            HUNDRED_PERCENT);
    int128_t tick = tickSize_.tickFor(toDecimal(raw)).toNanos();
    Decimal level = toDecimal(floorDiv(raw, tick) * tick);

    if (!level.isPositive()) {
        throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                              "Stop price is not positive for fill " + fillPrice.toString() +
                              " and stop " + stopPct.toString() + "%");
    }
    return level;
}

Decimal RiskCalculator::takePrice(const Decimal& fillPrice, const Decimal& takePct) const {
    requirePositiveFill(fillPrice);
    validatePercent(takePct, "Take profit percent");

    int128_t raw = ceilDiv(int128_t(fillPrice.toNanos()) * (HUNDRED_PERCENT + takePct.toNanos()),
                           HUNDRED_PERCENT);
    int128_t tick = tickSize_.tickFor(toDecimal(raw)).toNanos();
    Decimal level = toDecimal(ceilDiv(raw, tick) * tick);

    if (!level.isPositive()) {
        throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                              "Take profit price is not positive for fill " + fillPrice.toString());
    }
    return level;
}

domain::BracketLevels RiskCalculator::computeLevels(
    const Decimal& fillPrice,
    const std::optional<Decimal>& stopPct,
    const std::optional<Decimal>& takePct
) const {
    requirePositiveFill(fillPrice);

    domain::BracketLevels levels;
    if (stopPct) {
        levels.stopPrice = stopPrice(fillPrice, *stopPct);
    }
    if (takePct) {
        levels.takePrice = takePrice(fillPrice, *takePct);
    }
    return levels;
}

} // namespace ibtrader::application
