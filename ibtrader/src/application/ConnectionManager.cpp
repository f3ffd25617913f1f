#include "application/ConnectionManager.hpp"
#include "domain/events/ConnectionStateChangedEvent.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>

namespace ibtrader::application {

using domain::ConnectionState;
using domain::ErrorCode;

ConnectionManager::ConnectionManager(
    EventLoop& loop,
    const settings::EngineConfig& config,
    std::shared_ptr<ports::output::IBrokerSession> broker,
    std::shared_ptr<ports::output::IEventBus> eventBus
) : config_(config)
  , broker_(std::move(broker))
  , eventBus_(std::move(eventBus))
  , strand_(loop.makeStrand())
  , heartbeatTimer_(strand_)
  , reconnectTimer_(strand_)
{
    session_.host = config_.host;
    session_.port = config_.port;
    session_.clientId = config_.clientId;
}

void ConnectionManager::attach(BrokerMessageDispatcher& dispatcher) {
    std::weak_ptr<ConnectionManager> weak = weak_from_this();

    dispatcher.route<ports::output::CurrentTimeMessage>(strand_,
        [weak](const ports::output::CurrentTimeMessage&) {
            if (auto self = weak.lock()) {
                self->onCurrentTime();
            }
        });

    dispatcher.route<ports::output::ConnectionClosedMessage>(strand_,
        [weak](const ports::output::ConnectionClosedMessage& message) {
            if (auto self = weak.lock()) {
                self->onConnectionLost(message.reason.empty() ? "Connection closed by broker"
                                                              : message.reason);
            }
        });
}

ConnectResult ConnectionManager::connect(const std::string& host, int port, int clientId) {
    uint64_t epoch;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == ConnectionState::CONNECTING ||
            session_.state == ConnectionState::CONNECTED ||
            session_.state == ConnectionState::RECONNECTING) {
            ConnectResult current;
            current.success = session_.state == ConnectionState::CONNECTED;
            current.state = session_.state;
            return current;
        }
        session_.host = host;
        session_.port = port;
        session_.clientId = clientId;
        epoch = epoch_;
        previous = session_.state;
        session_.state = ConnectionState::CONNECTING;
    }

    notify(previous, ConnectionState::CONNECTING,
           "Connecting to " + host + ":" + std::to_string(port));
    std::cout << "[ConnectionManager] Connecting to " << host << ":" << port
              << " with client ID " << clientId << std::endl;

    auto outcome = broker_->connect(host, port, clientId, config_.handshakeTimeout);

    if (outcome.success) {
        seedIds();
    }

    // Повторы только при потере уже установленной сессии
    auto failedState = outcome.code == ErrorCode::AUTH_REJECTED ? ConnectionState::FAILED
                                                                : ConnectionState::DISCONNECTED;

    ConnectResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != epoch_ || stopped_) {
            // disconnect() пришёл во время handshake
            result.code = ErrorCode::NOT_CONNECTED;
            result.error = "Connect aborted";
            result.state = session_.state;
        } else if (outcome.success) {
            // Проверка epoch и переход в CONNECTED под одной блокировкой
            previous = session_.state;
            session_.state = ConnectionState::CONNECTED;
            missedHeartbeats_ = 0;
        } else {
            previous = session_.state;
            session_.state = failedState;
        }
    }
    if (result.code == ErrorCode::NOT_CONNECTED) {
        if (outcome.success) {
            std::lock_guard<std::mutex> lock(writeMutex_);
            broker_->disconnect();
        }
        return result;
    }

    if (outcome.success) {
        notify(previous, ConnectionState::CONNECTED, "Connected");
        startHeartbeat();
        std::cout << "[ConnectionManager] Connected" << std::endl;
        result.success = true;
        result.state = ConnectionState::CONNECTED;
        return result;
    }

    std::cerr << "[ConnectionManager] Connect failed: " << toString(outcome.code)
              << " " << outcome.error << std::endl;

    if (previous != failedState) {
        notify(previous, failedState, outcome.error);
    }

    result.code = outcome.code;
    result.error = outcome.error;
    result.state = failedState;
    return result;
}

void ConnectionManager::disconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == ConnectionState::DISCONNECTED) {
            return;
        }
        ++epoch_;
    }

    cancelTimers();
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        broker_->disconnect();
    }
    setState(ConnectionState::DISCONNECTED, "Disconnected by user");
    std::cout << "[ConnectionManager] Disconnected" << std::endl;
}

domain::Session ConnectionManager::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

ConnectionState ConnectionManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

void ConnectionManager::addStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

void ConnectionManager::shutdown() {
    stopped_ = true;
    cancelTimers();
    std::cout << "[ConnectionManager] Shutdown" << std::endl;
}

void ConnectionManager::setState(ConnectionState next, const std::string& reason) {
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = session_.state;
        if (previous == next) {
            return;
        }
        session_.state = next;
    }
    notify(previous, next, reason);
}

void ConnectionManager::notify(ConnectionState previous, ConnectionState current,
                               const std::string& reason) {
    std::vector<StateListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }
    for (const auto& listener : listeners) {
        listener(previous, current);
    }

    domain::ConnectionStateChangedEvent event;
    event.session = session();
    event.session.state = current;
    event.previous = previous;
    event.reason = reason;
    eventBus_->publish(event);
}

void ConnectionManager::seedIds() {
    int64_t seed;
    try {
        std::lock_guard<std::mutex> lock(writeMutex_);
        seed = broker_->nextOrderId();
    } catch (const domain::EngineException& e) {
        std::cerr << "[ConnectionManager] Next valid id unavailable: " << e.what() << std::endl;
        return;
    }

    // Последовательность только растёт: id прошлой сессии не переиспользуются
    int64_t current = nextId_.load();
    while (current < seed && !nextId_.compare_exchange_weak(current, seed)) {
    }
    std::cout << "[ConnectionManager] Next valid id " << nextId_.load() << std::endl;
}

// ============================================================================
// Heartbeat
// ============================================================================

void ConnectionManager::startHeartbeat() {
    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    boost::asio::post(strand_, [weak]() {
        auto self = weak.lock();
        if (!self || self->stopped_) {
            return;
        }
        self->heartbeatTimer_.expires_after(self->config_.heartbeatInterval);
        self->heartbeatTimer_.async_wait(boost::asio::bind_executor(self->strand_,
            [weak](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (auto s = weak.lock()) {
                    s->onHeartbeatTick();
                }
            }));
    });
}

void ConnectionManager::onHeartbeatTick() {
    if (stopped_ || !isConnected()) {
        return;
    }

    if (missedHeartbeats_ >= config_.heartbeatMissLimit) {
        std::cerr << "[ConnectionManager] Heartbeat lost after "
                  << missedHeartbeats_ << " intervals" << std::endl;
        onConnectionLost("Heartbeat lost");
        return;
    }

    ++missedHeartbeats_;
    try {
        send([](ports::output::IBrokerSession& broker) { broker.requestCurrentTime(); });
    } catch (const domain::EngineException& e) {
        std::cerr << "[ConnectionManager] Heartbeat send failed: " << e.what() << std::endl;
        return;
    }
    startHeartbeat();
}

void ConnectionManager::onCurrentTime() {
    missedHeartbeats_ = 0;
}

// ============================================================================
// Reconnect
// ============================================================================

void ConnectionManager::postConnectionLost(const std::string& reason) {
    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    boost::asio::post(strand_, [weak, reason]() {
        if (auto self = weak.lock()) {
            self->onConnectionLost(reason);
        }
    });
}

void ConnectionManager::onConnectionLost(const std::string& reason) {
    if (stopped_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != ConnectionState::CONNECTED) {
            return;
        }
        reconnectAttempt_ = 0;
    }

    heartbeatTimer_.cancel();
    {
        std::lock_guard<std::mutex> lock(writeMutex_);
        broker_->disconnect();
    }

    std::cerr << "[ConnectionManager] Connection lost: " << reason << std::endl;
    setState(ConnectionState::RECONNECTING, reason);
    scheduleReconnect();
}

void ConnectionManager::scheduleReconnect() {
    int attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        attempt = reconnectAttempt_;
    }

    auto delay = config_.reconnectBaseDelay;
    for (int i = 0; i < attempt && delay < config_.reconnectMaxDelay; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, config_.reconnectMaxDelay);

    std::cout << "[ConnectionManager] Reconnect attempt " << (attempt + 1)
              << " in " << delay.count() << " ms" << std::endl;

    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    reconnectTimer_.expires_after(delay);
    reconnectTimer_.async_wait(boost::asio::bind_executor(strand_,
        [weak](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->tryReconnect();
            }
        }));
}

void ConnectionManager::tryReconnect() {
    domain::Session target;
    uint64_t epoch;
    int attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_ || session_.state != ConnectionState::RECONNECTING) {
            return;
        }
        target = session_;
        epoch = epoch_;
        attempt = ++reconnectAttempt_;
    }

    auto outcome = broker_->connect(target.host, target.port, target.clientId,
                                    config_.handshakeTimeout);
    if (outcome.success) {
        seedIds();
    }

    bool aborted;
    ConnectionState previous = ConnectionState::RECONNECTING;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted = epoch != epoch_ || stopped_;
        if (!aborted && outcome.success) {
            previous = session_.state;
            session_.state = ConnectionState::CONNECTED;
            missedHeartbeats_ = 0;
        }
    }
    if (aborted) {
        if (outcome.success) {
            std::lock_guard<std::mutex> lock(writeMutex_);
            broker_->disconnect();
        }
        return;
    }

    if (outcome.success) {
        notify(previous, ConnectionState::CONNECTED, "Reconnected");
        startHeartbeat();
        std::cout << "[ConnectionManager] Reconnected after " << attempt
                  << " attempt(s)" << std::endl;
        return;
    }

    std::cerr << "[ConnectionManager] Reconnect attempt " << attempt << " failed: "
              << toString(outcome.code) << " " << outcome.error << std::endl;

    if (outcome.code == ErrorCode::AUTH_REJECTED) {
        setState(ConnectionState::FAILED, outcome.error);
        return;
    }
    if (attempt >= config_.reconnectMaxRetries) {
        setState(ConnectionState::FAILED,
                 "Reconnect failed after " + std::to_string(attempt) + " attempts");
        return;
    }
    scheduleReconnect();
}

void ConnectionManager::cancelTimers() {
    std::weak_ptr<ConnectionManager> weak = weak_from_this();
    boost::asio::post(strand_, [weak]() {
        if (auto self = weak.lock()) {
            self->heartbeatTimer_.cancel();
            self->reconnectTimer_.cancel();
        }
    });
}

} // namespace ibtrader::application
