#pragma once

#include "enums/ConnectionState.hpp"
#include <string>

namespace ibtrader::domain {

/**
 * @brief Сессия с брокером. Ровно одна на экземпляр движка.
 */
struct Session {
    std::string host;
    int port = 0;
    int clientId = 0;
    ConnectionState state = ConnectionState::DISCONNECTED;
};

} // namespace ibtrader::domain
