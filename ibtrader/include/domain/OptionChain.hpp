#pragma once

#include "Decimal.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ibtrader::domain {

/**
 * @brief Параметры опционной цепочки (reqSecDefOptParams)
 */
struct OptionChainParams {
    std::string symbol;
    int64_t underlyingConId = 0;
    std::string exchange;
    std::string tradingClass;
    int multiplier = 100;
    std::vector<std::string> expirations;   ///< YYYYMMDD, по возрастанию
    std::vector<Decimal> strikes;           ///< По возрастанию
};

/**
 * @brief Лестница страйков вокруг текущей цены базового актива
 */
struct StrikeLadder {
    std::string symbol;
    Decimal underlyingPrice;
    std::string expiry;                     ///< YYYYMMDD
    std::vector<Decimal> strikes;           ///< По убыванию
};

} // namespace ibtrader::domain
