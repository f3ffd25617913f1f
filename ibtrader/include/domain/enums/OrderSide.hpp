#pragma once

#include <string>
#include <stdexcept>

namespace ibtrader::domain {

/**
 * @brief Направление ордера (action в терминах TWS)
 */
enum class OrderSide {
    BUY,
    SELL
};

inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY:  return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

/**
 * @brief Противоположное направление (для ног защиты и закрытия позиции)
 */
inline OrderSide opposite(OrderSide side) {
    return side == OrderSide::BUY ? OrderSide::SELL : OrderSide::BUY;
}

} // namespace ibtrader::domain
