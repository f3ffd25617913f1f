#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/EventLoop.hpp"
#include "domain/Contract.hpp"
#include "domain/EngineError.hpp"
#include "domain/Quote.hpp"
#include "domain/TickerSubscription.hpp"
#include "ports/output/IEventBus.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ibtrader::application {

struct SubscribeResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    std::string key;                ///< Ключ контракта
    int tickerId = 0;
};

/**
 * @brief Потоковые котировки по тикерам и контрактам
 *
 * Тики обновляют кэш на strand'е фида и публикуются как
 * quote.updated. Читатели не ждут тиков: latestQuote() сразу
 * возвращает кэш, до первого тика - в состоянии UNKNOWN.
 *
 * При выходе сессии из CONNECTED все подписки сбрасываются.
 * Сам фид не переподписывается, это делает вызывающая сторона.
 */
class MarketDataFeed : public std::enable_shared_from_this<MarketDataFeed> {
public:
    MarketDataFeed(
        EventLoop& loop,
        std::shared_ptr<ConnectionManager> connection,
        std::shared_ptr<ports::output::IEventBus> eventBus
    );

    void attach(BrokerMessageDispatcher& dispatcher);

    /**
     * @brief Подписаться на акцию (символ приводится к верхнему регистру)
     */
    SubscribeResult subscribe(const std::string& ticker, bool optionsEligible = false);

    /**
     * @brief Подписаться на контракт. Повторная подписка возвращает
     *        существующую.
     */
    SubscribeResult subscribe(const domain::Contract& contract, bool optionsEligible = false);

    /**
     * @brief Отменить поток и забыть котировку
     * @return false если подписки не было
     */
    bool unsubscribe(const std::string& key);

    /**
     * @brief Последняя котировка; UNKNOWN если тиков не было или
     *        подписки нет
     */
    domain::Quote latestQuote(const std::string& key) const;

    std::optional<domain::TickerSubscription> subscription(const std::string& key) const;

    std::vector<domain::TickerSubscription> subscriptions() const;

    bool isSubscribed(const std::string& key) const;

    /**
     * @brief Реакция на смену состояния сессии
     */
    void onConnectionStateChanged(domain::ConnectionState previous,
                                  domain::ConnectionState current);

    void shutdown();

private:
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    Strand strand_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, domain::TickerSubscription> byKey_;
    std::unordered_map<int, std::string> keyByTicker_;
    std::atomic<bool> stopped_{false};

    void onTick(const ports::output::TickMessage& tick);
    void onError(const ports::output::ErrorMessage& message);
    void dropAll(const std::string& reason);
};

} // namespace ibtrader::application
