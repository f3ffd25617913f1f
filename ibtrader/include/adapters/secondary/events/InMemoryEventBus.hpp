#pragma once

#include "ports/output/IEventBus.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ibtrader::adapters::secondary {

/**
 * @brief In-memory реализация событийной шины
 *
 * Синхронная доставка в потоке издателя. Обработчики вызываются
 * вне блокировки, поэтому из обработчика можно публиковать и
 * подписываться.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    InMemoryEventBus() = default;

    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it == handlers_.end()) {
                return;
            }
            handlers = it->second;
        }

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                // Ошибка одного обработчика не прерывает остальные
                std::cerr << "[InMemoryEventBus] Handler for " << event.eventType
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    void subscribe(const std::string& eventType, ports::output::EventHandler handler) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_[eventType].push_back(std::move(handler));
    }

    /**
     * @brief Отписаться от типа события (удаляет ВСЕ handlers)
     */
    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

    /**
     * @brief Очистить все подписки (для тестов)
     */
    void clear() {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.clear();
    }

private:
    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<ports::output::EventHandler>> handlers_;
};

} // namespace ibtrader::adapters::secondary
