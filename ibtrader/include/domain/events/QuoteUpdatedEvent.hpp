#pragma once

#include "DomainEvent.hpp"
#include "domain/Quote.hpp"

namespace ibtrader::domain {

/**
 * @brief Событие: пришёл тик, котировка обновилась
 */
struct QuoteUpdatedEvent : public DomainEvent {
    static constexpr const char* TYPE = "quote.updated";

    Quote quote;

    QuoteUpdatedEvent() : DomainEvent(TYPE) {}

    explicit QuoteUpdatedEvent(const Quote& q) : DomainEvent(TYPE), quote(q) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<QuoteUpdatedEvent>(*this);
    }
};

} // namespace ibtrader::domain
