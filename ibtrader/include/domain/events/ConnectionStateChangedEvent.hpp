#pragma once

#include "DomainEvent.hpp"
#include "domain/Session.hpp"

namespace ibtrader::domain {

/**
 * @brief Событие: сменилось состояние сессии с брокером
 */
struct ConnectionStateChangedEvent : public DomainEvent {
    static constexpr const char* TYPE = "connection.state_changed";

    Session session;
    ConnectionState previous = ConnectionState::DISCONNECTED;
    std::string reason;

    ConnectionStateChangedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ConnectionStateChangedEvent>(*this);
    }
};

} // namespace ibtrader::domain
