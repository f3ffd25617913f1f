#pragma once

#include "domain/events/DomainEvent.hpp"
#include <string>
#include <functional>
#include <memory>

namespace ibtrader::ports::output {

/**
 * @brief Callback для обработчиков событий
 */
using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port для публикации событий в сторону интерфейса
 * (котировки, состояние ордеров, соединения и счёта).
 *
 * Реализации:
 * - InMemoryEventBus - синхронная доставка в памяти
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие
     *
     * @note Может вызываться из любого потока event loop
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события (например, "order.state_changed")
     * @param handler Функция-обработчик
     *
     * @note Один eventType может иметь несколько handlers
     */
    virtual void subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Отписаться от типа события (удаляет ВСЕ handlers)
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace ibtrader::ports::output
