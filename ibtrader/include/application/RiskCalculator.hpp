#pragma once

#include "domain/Decimal.hpp"
#include "domain/RiskProfile.hpp"
#include "settings/EngineConfig.hpp"
#include <optional>

namespace ibtrader::application {

/**
 * @brief Расчёт уровней стоп-лосса и тейк-профита от цены исполнения
 *
 * Чистая функция, к брокеру не обращается.
 * - stop = fill * (1 - stopPct/100), округление вниз до шага цены
 * - take = fill * (1 + takePct/100), округление вверх до шага цены
 *
 * Шаг выбирается по неокруглённому уровню (TickSizeRule).
 * Промежуточные значения считаются в 128-битных целых.
 *
 * Пример: fill 3.00, stop 20%, take 30% -> 2.40 / 3.90
 */
class RiskCalculator {
public:
    explicit RiskCalculator(const settings::TickSizeRule& tickSize = settings::TickSizeRule{})
        : tickSize_(tickSize)
    {}

    /**
     * @throws EngineException(INVALID_RISK_PARAMETER) если процент <= 0,
     *         цена исполнения <= 0 или рассчитанная цена <= 0
     */
    domain::BracketLevels computeLevels(
        const domain::Decimal& fillPrice,
        const std::optional<domain::Decimal>& stopPct,
        const std::optional<domain::Decimal>& takePct
    ) const;

    domain::BracketLevels computeLevels(const domain::Decimal& fillPrice,
                                        const domain::RiskProfile& risk) const {
        return computeLevels(fillPrice, risk.stopLossPct, risk.takeProfitPct);
    }

    domain::Decimal stopPrice(const domain::Decimal& fillPrice, const domain::Decimal& stopPct) const;

    domain::Decimal takePrice(const domain::Decimal& fillPrice, const domain::Decimal& takePct) const;

    /**
     * @brief Проверить процент заранее, до отправки входной ноги
     * @throws EngineException(INVALID_RISK_PARAMETER) если процент <= 0
     */
    static void validatePercent(const std::optional<domain::Decimal>& pct, const char* name);

    const settings::TickSizeRule& tickSize() const { return tickSize_; }

private:
    settings::TickSizeRule tickSize_;
};

} // namespace ibtrader::application
