#pragma once

#include "Decimal.hpp"
#include "EngineError.hpp"
#include <optional>
#include <string>

namespace ibtrader::domain {

/**
 * @brief Параметры защиты позиции для одного запроса
 *
 * Пустое значение процента означает, что соответствующая нога
 * не создаётся. Значение неизменяемое, вычисляется на каждый запрос.
 */
struct RiskProfile {
    std::optional<Decimal> stopLossPct;     ///< Стоп-лосс, % от цены исполнения
    std::optional<Decimal> takeProfitPct;   ///< Тейк-профит, % от цены исполнения

    bool hasStopLoss() const { return stopLossPct.has_value(); }
    bool hasTakeProfit() const { return takeProfitPct.has_value(); }

    bool isEmpty() const {
        return !hasStopLoss() && !hasTakeProfit();
    }

    /**
     * @brief Разобрать процент из текста интерфейса
     *
     * "--" и пустая строка означают "выключено".
     *
     * @throws EngineException(INVALID_RISK_PARAMETER) если текст не число
     */
    static std::optional<Decimal> parsePercent(const std::string& text) {
        if (text.empty() || text == "--") {
            return std::nullopt;
        }
        try {
            return Decimal::fromString(text);
        } catch (const std::invalid_argument&) {
            throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                                  "Invalid risk percentage: '" + text + "'");
        }
    }

    static RiskProfile parse(const std::string& stopLoss, const std::string& takeProfit) {
        RiskProfile profile;
        profile.stopLossPct = parsePercent(stopLoss);
        profile.takeProfitPct = parsePercent(takeProfit);
        return profile;
    }
};

/**
 * @brief Уровни защиты, рассчитанные от цены исполнения
 */
struct BracketLevels {
    std::optional<Decimal> stopPrice;
    std::optional<Decimal> takePrice;
};

} // namespace ibtrader::domain
