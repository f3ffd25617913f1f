#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/EventLoop.hpp"
#include "domain/EngineError.hpp"
#include "domain/Session.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/EngineConfig.hpp"
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace ibtrader::application {

/**
 * @brief Результат connect()
 */
struct ConnectResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    domain::ConnectionState state = domain::ConnectionState::DISCONNECTED;
};

/**
 * @brief Владелец сессии с брокером
 *
 * Единственный компонент, который открывает и закрывает сокет.
 * Ведёт heartbeat (reqCurrentTime), при потере связи переходит в
 * RECONNECTING и переподключается с экспоненциальной задержкой,
 * после исчерпания попыток - FAILED.
 *
 * Все записи в сокет идут через send(), который держит мьютекс записи.
 */
class ConnectionManager : public std::enable_shared_from_this<ConnectionManager> {
public:
    using StateListener = std::function<void(domain::ConnectionState previous,
                                             domain::ConnectionState current)>;

    ConnectionManager(
        EventLoop& loop,
        const settings::EngineConfig& config,
        std::shared_ptr<ports::output::IBrokerSession> broker,
        std::shared_ptr<ports::output::IEventBus> eventBus
    );

    /**
     * @brief Зарегистрировать обработчики heartbeat и обрыва сокета
     */
    void attach(BrokerMessageDispatcher& dispatcher);

    /**
     * @brief Установить сессию
     *
     * Блокирует вызывающий поток до handshake или таймаута.
     * Если сессия уже CONNECTING/CONNECTED/RECONNECTING - ничего не
     * делает и возвращает текущее состояние.
     */
    ConnectResult connect(const std::string& host, int port, int clientId);

    /**
     * @brief Закрыть сессию
     *
     * Живые ордера у брокера не отменяются.
     */
    void disconnect();

    domain::Session session() const;

    domain::ConnectionState state() const;

    bool isConnected() const {
        return state() == domain::ConnectionState::CONNECTED;
    }

    /**
     * @brief Выполнить запись в сокет под мьютексом записи
     *
     * @throws EngineException(NOT_CONNECTED) если сессия не CONNECTED
     * @throws EngineException(CONNECTION_ERROR) если сокет оборвался,
     *         сессия при этом уходит в RECONNECTING
     */
    template <typename Fn>
    auto send(Fn&& fn) -> decltype(fn(std::declval<ports::output::IBrokerSession&>())) {
        std::lock_guard<std::mutex> lock(writeMutex_);
        if (!isConnected()) {
            throw domain::EngineException(domain::ErrorCode::NOT_CONNECTED,
                                          "Session is not connected");
        }
        try {
            return fn(*broker_);
        } catch (const domain::EngineException& e) {
            if (e.code() == domain::ErrorCode::CONNECTION_ERROR) {
                postConnectionLost(e.what());
            }
            throw;
        }
    }

    /**
     * @brief Новый id для запросов рыночных данных и справочников
     *
     * Ошибки брокера адресуются голым id, поэтому запросы и ордера
     * берут id из одной последовательности.
     */
    int nextRequestId() {
        return static_cast<int>(nextId_++);
    }

    /**
     * @brief Новый id ордера из той же последовательности
     */
    int64_t nextOrderId() {
        return nextId_++;
    }

    /**
     * @brief Слушатель смены состояния (вызывается вне блокировок)
     */
    void addStateListener(StateListener listener);

    /**
     * @brief Остановить таймеры, дальнейшие обработчики - no-op
     */
    void shutdown();

private:
    settings::EngineConfig config_;
    std::shared_ptr<ports::output::IBrokerSession> broker_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;

    Strand strand_;
    boost::asio::steady_timer heartbeatTimer_;
    boost::asio::steady_timer reconnectTimer_;

    mutable std::mutex mutex_;
    std::mutex writeMutex_;
    domain::Session session_;
    uint64_t epoch_ = 0;                ///< Меняется при каждом disconnect()
    int reconnectAttempt_ = 0;

    std::atomic<int> missedHeartbeats_{0};
    std::atomic<int64_t> nextId_{1};     ///< Общий для запросов и ордеров
    std::atomic<bool> stopped_{false};

    std::mutex listenersMutex_;
    std::vector<StateListener> listeners_;

    void setState(domain::ConnectionState next, const std::string& reason);
    void notify(domain::ConnectionState previous, domain::ConnectionState current,
                const std::string& reason);

    void seedIds();
    void startHeartbeat();
    void onHeartbeatTick();
    void onCurrentTime();

    void postConnectionLost(const std::string& reason);
    void onConnectionLost(const std::string& reason);

    void scheduleReconnect();
    void tryReconnect();
    void cancelTimers();
};

} // namespace ibtrader::application
