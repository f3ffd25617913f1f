#pragma once

#include "DomainEvent.hpp"
#include "domain/BracketOrder.hpp"
#include <optional>

namespace ibtrader::domain {

/**
 * @brief Событие: изменилось состояние ноги или группы
 *
 * Несёт полный снимок группы, чтобы интерфейсу не нужно было
 * собирать состояние из последовательности событий.
 */
struct OrderStateChangedEvent : public DomainEvent {
    static constexpr const char* TYPE = "order.state_changed";

    BracketOrder order;
    std::optional<LegRole> changedLeg;
    std::string message;

    OrderStateChangedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderStateChangedEvent>(*this);
    }
};

} // namespace ibtrader::domain
