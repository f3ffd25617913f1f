#pragma once

#include <string>
#include <stdexcept>

namespace ibtrader::domain {

/**
 * @brief Тип ордера (коды TWS)
 */
enum class OrderType {
    MARKET,     ///< MKT
    LIMIT,      ///< LMT
    STOP        ///< STP, цена в auxPrice
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET: return "MKT";
        case OrderType::LIMIT:  return "LMT";
        case OrderType::STOP:   return "STP";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderType orderTypeFromString(const std::string& str) {
    if (str == "MKT") return OrderType::MARKET;
    if (str == "LMT") return OrderType::LIMIT;
    if (str == "STP") return OrderType::STOP;
    throw std::invalid_argument("Unknown OrderType: " + str);
}

} // namespace ibtrader::domain
