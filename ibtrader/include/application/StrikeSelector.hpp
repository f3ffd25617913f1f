#pragma once

#include "domain/Decimal.hpp"
#include "domain/OptionChain.hpp"
#include <string>
#include <vector>

namespace ibtrader::application {

/**
 * @brief Выбор экспирации и страйков для лестницы опционов
 *
 * Берёт ближайшую экспирацию не раньше сегодняшней даты и
 * ladderSize страйков вокруг страйка, ближайшего к цене базового
 * актива. У краёв цепочки окно сдвигается, чтобы страйков было
 * сколько нужно.
 */
class StrikeSelector {
public:
    explicit StrikeSelector(int ladderSize = 12) : ladderSize_(ladderSize) {}

    /**
     * @brief Ближайшая экспирация >= today (YYYYMMDD)
     *
     * Если все экспирации в прошлом - первая из списка.
     *
     * @throws EngineException(NO_OPTIONS_AVAILABLE) если экспираций нет
     */
    std::string nearestExpiry(const std::vector<std::string>& expirations,
                              const std::string& today) const;

    /**
     * @return Страйки по убыванию
     */
    std::vector<domain::Decimal> selectStrikes(const std::vector<domain::Decimal>& strikes,
                                               const domain::Decimal& price) const;

    domain::StrikeLadder buildLadder(const domain::OptionChainParams& chain,
                                     const domain::Decimal& price,
                                     const std::string& today) const;

private:
    int ladderSize_;
};

} // namespace ibtrader::application
