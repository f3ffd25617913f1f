#pragma once

#include <stdexcept>
#include <string>

namespace ibtrader::domain {

/**
 * @brief Классификация ошибок движка
 *
 * Транзиентные (CONNECTION_ERROR, TIMEOUT) повторяются локально с
 * ограниченным числом попыток, остальные возвращаются вызывающему.
 */
enum class ErrorCode {
    NONE,
    CONNECTION_ERROR,       ///< Сокет не открылся или оборвался
    AUTH_REJECTED,          ///< Client ID уже занят
    TIMEOUT,                ///< Нет ответа на handshake
    UNKNOWN_SYMBOL,         ///< У брокера нет контракта
    NO_OPTIONS_AVAILABLE,   ///< Нет опционной цепочки
    VALIDATION_TIMEOUT,     ///< Нет ответа на проверку тикера
    INVALID_RISK_PARAMETER, ///< Процент <= 0 или цена <= 0
    MARKET_CLOSED,          ///< Вне торгового окна
    BROKER_REJECTED,        ///< Брокер отклонил ордер (текст брокера)
    NOT_CONNECTED,          ///< Сессия не в состоянии CONNECTED
    INVALID_REQUEST,        ///< Некорректные параметры запроса
    NOT_FOUND,              ///< Нет такой группы / позиции / тикера
    QUOTE_UNAVAILABLE       ///< Котировка ещё не получена
};

inline std::string toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                   return "NONE";
        case ErrorCode::CONNECTION_ERROR:       return "CONNECTION_ERROR";
        case ErrorCode::AUTH_REJECTED:          return "AUTH_REJECTED";
        case ErrorCode::TIMEOUT:                return "TIMEOUT";
        case ErrorCode::UNKNOWN_SYMBOL:         return "UNKNOWN_SYMBOL";
        case ErrorCode::NO_OPTIONS_AVAILABLE:   return "NO_OPTIONS_AVAILABLE";
        case ErrorCode::VALIDATION_TIMEOUT:     return "VALIDATION_TIMEOUT";
        case ErrorCode::INVALID_RISK_PARAMETER: return "INVALID_RISK_PARAMETER";
        case ErrorCode::MARKET_CLOSED:          return "MARKET_CLOSED";
        case ErrorCode::BROKER_REJECTED:        return "BROKER_REJECTED";
        case ErrorCode::NOT_CONNECTED:          return "NOT_CONNECTED";
        case ErrorCode::INVALID_REQUEST:        return "INVALID_REQUEST";
        case ErrorCode::NOT_FOUND:              return "NOT_FOUND";
        case ErrorCode::QUOTE_UNAVAILABLE:      return "QUOTE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

/**
 * @brief Можно ли повторить операцию после такой ошибки
 */
inline bool isTransient(ErrorCode code) {
    return code == ErrorCode::CONNECTION_ERROR ||
           code == ErrorCode::TIMEOUT ||
           code == ErrorCode::NOT_CONNECTED;
}

/**
 * @brief Исключение движка с кодом ошибки
 */
class EngineException : public std::runtime_error {
public:
    EngineException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace ibtrader::domain
