#include "application/MarketDataFeed.hpp"
#include "domain/events/QuoteUpdatedEvent.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ibtrader::application {

using domain::ConnectionState;
using domain::EngineException;
using domain::ErrorCode;
using ports::output::TickField;

MarketDataFeed::MarketDataFeed(
    EventLoop& loop,
    std::shared_ptr<ConnectionManager> connection,
    std::shared_ptr<ports::output::IEventBus> eventBus
) : connection_(std::move(connection))
  , eventBus_(std::move(eventBus))
  , strand_(loop.makeStrand())
{}

void MarketDataFeed::attach(BrokerMessageDispatcher& dispatcher) {
    std::weak_ptr<MarketDataFeed> weak = weak_from_this();
    dispatcher.route<ports::output::TickMessage>(strand_,
        [weak](const ports::output::TickMessage& tick) {
            if (auto self = weak.lock()) {
                self->onTick(tick);
            }
        });
    dispatcher.route<ports::output::ErrorMessage>(strand_,
        [weak](const ports::output::ErrorMessage& message) {
            if (auto self = weak.lock()) {
                self->onError(message);
            }
        });
}

SubscribeResult MarketDataFeed::subscribe(const std::string& ticker, bool optionsEligible) {
    std::string symbol = ticker;
    std::transform(symbol.begin(), symbol.end(), symbol.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return subscribe(domain::Contract::stock(symbol), optionsEligible);
}

SubscribeResult MarketDataFeed::subscribe(const domain::Contract& contract, bool optionsEligible) {
    SubscribeResult result;
    result.key = contract.key();

    if (stopped_) {
        result.code = ErrorCode::NOT_CONNECTED;
        result.error = "Market data feed is stopped";
        return result;
    }
    if (contract.symbol.empty()) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Symbol is empty";
        return result;
    }

    int tickerId = connection_->nextRequestId();
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = byKey_.find(result.key);
        if (it != byKey_.end()) {
            it->second.optionsEligible = it->second.optionsEligible || optionsEligible;
            result.success = true;
            result.tickerId = it->second.tickerId;
            return result;
        }

        // Регистрируем до запроса: первый тик может прийти сразу
        domain::TickerSubscription sub;
        sub.contract = contract;
        sub.tickerId = tickerId;
        sub.optionsEligible = optionsEligible;
        sub.lastQuote.key = result.key;
        byKey_[result.key] = sub;
        keyByTicker_[tickerId] = result.key;
    }

    try {
        connection_->send([&](ports::output::IBrokerSession& broker) {
            broker.requestMarketData(tickerId, contract);
        });
    } catch (const EngineException& e) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        byKey_.erase(result.key);
        keyByTicker_.erase(tickerId);
        result.code = e.code();
        result.error = e.what();
        return result;
    }

    std::cout << "[MarketDataFeed] Subscribed " << result.key
              << " (tickerId=" << tickerId << ")" << std::endl;
    result.success = true;
    result.tickerId = tickerId;
    return result;
}

bool MarketDataFeed::unsubscribe(const std::string& key) {
    int tickerId;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = byKey_.find(key);
        if (it == byKey_.end()) {
            return false;
        }
        tickerId = it->second.tickerId;
        keyByTicker_.erase(tickerId);
        byKey_.erase(it);
    }

    try {
        connection_->send([tickerId](ports::output::IBrokerSession& broker) {
            broker.cancelMarketData(tickerId);
        });
    } catch (const EngineException& e) {
        // Без сессии поток у брокера уже закрыт
        std::cerr << "[MarketDataFeed] cancelMarketData for " << key
                  << " not sent: " << e.what() << std::endl;
    }

    std::cout << "[MarketDataFeed] Unsubscribed " << key << std::endl;
    return true;
}

domain::Quote MarketDataFeed::latestQuote(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = byKey_.find(key);
    if (it == byKey_.end()) {
        domain::Quote unknown;
        unknown.key = key;
        return unknown;
    }
    return it->second.lastQuote;
}

std::optional<domain::TickerSubscription> MarketDataFeed::subscription(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = byKey_.find(key);
    if (it == byKey_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<domain::TickerSubscription> MarketDataFeed::subscriptions() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<domain::TickerSubscription> result;
    result.reserve(byKey_.size());
    for (const auto& entry : byKey_) {
        result.push_back(entry.second);
    }
    return result;
}

bool MarketDataFeed::isSubscribed(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return byKey_.count(key) > 0;
}

void MarketDataFeed::onConnectionStateChanged(ConnectionState previous, ConnectionState current) {
    if (previous == ConnectionState::CONNECTED && current != ConnectionState::CONNECTED) {
        dropAll("session left CONNECTED (" + toString(current) + ")");
    }
}

void MarketDataFeed::shutdown() {
    stopped_ = true;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    byKey_.clear();
    keyByTicker_.clear();
}

void MarketDataFeed::onTick(const ports::output::TickMessage& tick) {
    // TWS присылает -1, когда цены нет
    if (stopped_ || !tick.price.isPositive()) {
        return;
    }

    domain::Quote updated;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto keyIt = keyByTicker_.find(tick.tickerId);
        if (keyIt == keyByTicker_.end()) {
            return;     // Тик по уже отменённой подписке
        }
        auto& quote = byKey_[keyIt->second].lastQuote;

        switch (tick.field) {
            case TickField::BID:   quote.bid = tick.price; break;
            case TickField::ASK:   quote.ask = tick.price; break;
            case TickField::LAST:  quote.last = tick.price; break;
            case TickField::CLOSE: quote.close = tick.price; break;
        }
        quote.state = domain::QuoteState::LIVE;
        quote.updatedAt = domain::Timestamp::now();
        updated = quote;
    }

    domain::QuoteUpdatedEvent event;
    event.quote = updated;
    eventBus_->publish(event);
}

void MarketDataFeed::onError(const ports::output::ErrorMessage& message) {
    // 2100+ - уведомления фермы данных, подписку не затрагивают
    if (stopped_ || message.id <= 0 || message.code >= 2100) {
        return;
    }

    std::string key;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto keyIt = keyByTicker_.find(static_cast<int>(message.id));
        if (keyIt == keyByTicker_.end()) {
            return;     // Ошибка по запросу другого компонента
        }
        key = keyIt->second;
        byKey_.erase(key);
        keyByTicker_.erase(keyIt);
    }
    std::cerr << "[MarketDataFeed] Subscription " << key << " failed (" << message.code
              << "): " << message.text << std::endl;
}

void MarketDataFeed::dropAll(const std::string& reason) {
    size_t dropped;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        dropped = byKey_.size();
        byKey_.clear();
        keyByTicker_.clear();
    }
    if (dropped > 0) {
        std::cout << "[MarketDataFeed] Dropped " << dropped << " subscription(s): "
                  << reason << std::endl;
    }
}

} // namespace ibtrader::application
