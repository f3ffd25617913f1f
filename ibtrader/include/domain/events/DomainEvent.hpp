#pragma once

#include "domain/Timestamp.hpp"
#include "utils/UuidGenerator.hpp"
#include <memory>
#include <string>

namespace ibtrader::domain {

/**
 * @brief Базовый класс для событий, уходящих в интерфейс
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (quote.updated, order.state_changed)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : eventId(utils::UuidGenerator::generate()), timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventId(utils::UuidGenerator::generate()), eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    /**
     * @brief Сериализовать в JSON
     */
    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace ibtrader::domain
