#pragma once

#include "Decimal.hpp"
#include <string>

namespace ibtrader::domain {

/**
 * @brief Тип ценной бумаги (secType в TWS)
 */
enum class SecurityType {
    STOCK,      ///< STK
    OPTION      ///< OPT
};

inline std::string toString(SecurityType type) {
    return type == SecurityType::OPTION ? "OPT" : "STK";
}

/**
 * @brief Тип опциона (right)
 */
enum class OptionRight {
    CALL,
    PUT
};

inline std::string toString(OptionRight right) {
    return right == OptionRight::CALL ? "C" : "P";
}

/**
 * @brief Контракт (акция или опцион), маршрутизация SMART, валюта USD
 */
struct Contract {
    std::string symbol;                     ///< Тикер базового актива
    SecurityType secType = SecurityType::STOCK;
    std::string expiry;                     ///< YYYYMMDD (только OPT)
    Decimal strike;                         ///< Страйк (только OPT)
    OptionRight right = OptionRight::CALL;  ///< C / P (только OPT)
    std::string exchange = "SMART";
    std::string currency = "USD";
    int multiplier = 1;                     ///< 100 для опционов

    static Contract stock(const std::string& symbol) {
        Contract c;
        c.symbol = symbol;
        return c;
    }

    static Contract option(
        const std::string& symbol,
        const std::string& expiry,
        const Decimal& strike,
        OptionRight right
    ) {
        Contract c;
        c.symbol = symbol;
        c.secType = SecurityType::OPTION;
        c.expiry = expiry;
        c.strike = strike;
        c.right = right;
        c.multiplier = 100;
        return c;
    }

    bool isOption() const {
        return secType == SecurityType::OPTION;
    }

    /**
     * @brief Ключ контракта: "SPY" или "SPY 20250117 450.00C"
     */
    std::string key() const {
        if (!isOption()) {
            return symbol;
        }
        return symbol + " " + expiry + " " + strike.toString() + toString(right);
    }

    bool operator==(const Contract& other) const {
        return key() == other.key();
    }
};

} // namespace ibtrader::domain
