#pragma once

#include <string>
#include <stdexcept>

namespace ibtrader::domain {

/**
 * @brief Состояние сессии с TWS / IB Gateway
 */
enum class ConnectionState {
    DISCONNECTED,   ///< Сессии нет
    CONNECTING,     ///< Идёт попытка подключения
    CONNECTED,      ///< Сессия установлена, heartbeat в норме
    RECONNECTING,   ///< Потеря heartbeat, идут повторные попытки
    FAILED          ///< Попытки переподключения исчерпаны
};

inline std::string toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "DISCONNECTED";
        case ConnectionState::CONNECTING:   return "CONNECTING";
        case ConnectionState::CONNECTED:    return "CONNECTED";
        case ConnectionState::RECONNECTING: return "RECONNECTING";
        case ConnectionState::FAILED:       return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline ConnectionState connectionStateFromString(const std::string& str) {
    if (str == "DISCONNECTED") return ConnectionState::DISCONNECTED;
    if (str == "CONNECTING")   return ConnectionState::CONNECTING;
    if (str == "CONNECTED")    return ConnectionState::CONNECTED;
    if (str == "RECONNECTING") return ConnectionState::RECONNECTING;
    if (str == "FAILED")       return ConnectionState::FAILED;
    throw std::invalid_argument("Unknown ConnectionState: " + str);
}

} // namespace ibtrader::domain
