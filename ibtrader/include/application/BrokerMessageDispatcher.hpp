#pragma once

#include "application/EventLoop.hpp"
#include "ports/output/BrokerMessages.hpp"
#include <boost/asio/post.hpp>
#include <functional>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace ibtrader::application {

/**
 * @brief Единый входной канал сообщений брокера
 *
 * Адаптер брокера вызывает dispatch() из своего потока. Диспетчер
 * только ставит обработчики в strand компонента-владельца и сразу
 * возвращается, поэтому медленный компонент не задерживает остальных.
 *
 * Маршруты регистрируются при сборке движка:
 * @code
 * dispatcher.route<TickMessage>(strand_, [](const TickMessage& m) { ... });
 * @endcode
 */
class BrokerMessageDispatcher {
public:
    template <typename Message>
    void route(const Strand& strand, std::function<void(const Message&)> handler) {
        Route r{
            strand,
            [h = std::move(handler)](const ports::output::BrokerMessage& message) {
                h(std::get<Message>(message));
            }
        };

        std::unique_lock<std::shared_mutex> lock(mutex_);
        routes_[std::type_index(typeid(Message))].push_back(std::move(r));
    }

    /**
     * @brief Передать сообщение всем подписанным компонентам
     * @return false если сообщение никто не обрабатывает
     */
    bool dispatch(const ports::output::BrokerMessage& message) {
        std::type_index type = std::visit(
            [](const auto& m) { return std::type_index(typeid(m)); }, message);

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = routes_.find(type);
        if (it == routes_.end()) {
            return false;
        }
        for (const auto& r : it->second) {
            boost::asio::post(r.strand, [handler = r.handler, message]() {
                handler(message);
            });
        }
        return true;
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        routes_.clear();
    }

private:
    struct Route {
        Strand strand;
        std::function<void(const ports::output::BrokerMessage&)> handler;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::type_index, std::vector<Route>> routes_;
};

} // namespace ibtrader::application
