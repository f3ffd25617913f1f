#pragma once

#include "DomainEvent.hpp"
#include "domain/AccountSnapshot.hpp"

namespace ibtrader::domain {

/**
 * @brief Событие: обновился снимок счёта
 */
struct AccountSnapshotUpdatedEvent : public DomainEvent {
    static constexpr const char* TYPE = "account.snapshot_updated";

    AccountSnapshot snapshot;

    AccountSnapshotUpdatedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<AccountSnapshotUpdatedEvent>(*this);
    }
};

} // namespace ibtrader::domain
