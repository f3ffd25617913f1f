#pragma once

#include "ports/output/IBrokerSession.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ibtrader::adapters::secondary {

/**
 * @brief Инструмент симулятора
 */
struct SimulatedInstrument {
    std::string symbol;
    int64_t conId = 0;
    domain::Decimal price;
    bool hasOptions = true;
    std::vector<std::string> expirations;   ///< YYYYMMDD
    std::vector<domain::Decimal> strikes;
};

/**
 * @brief Ордер в книге симулятора
 */
struct SimulatedOrder {
    int64_t orderId = 0;
    domain::Contract contract;
    ports::output::BrokerOrder order;
    domain::LegStatus status = domain::LegStatus::SUBMITTED;
    int64_t filledQuantity = 0;
    domain::Decimal avgFillPrice;
    int revision = 0;                       ///< Сколько раз ордер пришёл с тем же id
};

/**
 * @brief Брокер TWS в памяти процесса
 *
 * Реализует IBrokerSession без сокета: рыночные ордера исполняются
 * по текущей цене, лимитные и стоп-ордера - при движении цены,
 * OCA-группы отменяют соседей, позиции и счёт пересчитываются после
 * каждого исполнения. Сообщения отправляются в обработчик только
 * пока сессия открыта; всё, что случилось при разрыве, видно через
 * requestAllOrders().
 *
 * Цены опционов: внутренняя стоимость + 1% цены базового актива,
 * округлённо до 0.05, если цена не задана явно через setPrice().
 *
 * Методы управления (setPrice, fillOrder, dropConnection, ...)
 * используются в тестах и в демо-режиме с фоновым тикером.
 *
 * Thread-safe: да
 */
class SimulatedTwsGateway : public ports::output::IBrokerSession {
public:
    SimulatedTwsGateway();
    ~SimulatedTwsGateway() override;

    SimulatedTwsGateway(const SimulatedTwsGateway&) = delete;
    SimulatedTwsGateway& operator=(const SimulatedTwsGateway&) = delete;

    // IBrokerSession
    ports::output::ConnectOutcome connect(const std::string& host, int port, int clientId,
                                          std::chrono::milliseconds handshakeTimeout) override;
    void disconnect() override;
    bool isConnected() const override;

    void requestCurrentTime() override;
    void requestMarketData(int tickerId, const domain::Contract& contract) override;
    void cancelMarketData(int tickerId) override;
    void requestContractDetails(int reqId, const domain::Contract& contract) override;
    void requestOptionParams(int reqId, const std::string& symbol, int64_t conId) override;

    int64_t nextOrderId() override;
    void placeOrder(int64_t orderId, const domain::Contract& contract,
                    const ports::output::BrokerOrder& order) override;
    void cancelOrder(int64_t orderId) override;
    void requestAllOrders() override;
    void requestAccountUpdates(bool subscribe) override;

    void setMessageHandler(ports::output::BrokerMessageHandler handler) override;

    // ------------------------------------------------------------------------
    // Управление симуляцией
    // ------------------------------------------------------------------------

    void addInstrument(const SimulatedInstrument& instrument);

    /**
     * @brief Задать цену по ключу контракта и прогнать триггеры ордеров
     */
    void setPrice(const std::string& key, const domain::Decimal& price);

    std::optional<domain::Decimal> priceOf(const domain::Contract& contract) const;

    /**
     * @brief Следующие count подключений завершатся ошибкой code
     */
    void failNextConnects(int count, domain::ErrorCode code);

    /**
     * @brief Этот clientId считается занятым (AUTH_REJECTED)
     */
    void rejectClientId(int clientId);

    /**
     * @brief Не отвечать на запросы справочников (проверка таймаутов)
     */
    void setReferenceDataResponding(bool responding);

    /**
     * @brief Не отвечать на requestCurrentTime (потеря heartbeat)
     */
    void setHeartbeatResponding(bool responding);

    /**
     * @brief Не отвечать на requestAllOrders
     */
    void setOrderListResponding(bool responding);

    void setAutoFillMarketOrders(bool enabled);

    /**
     * @brief Отклонить следующий ордер с текстом брокера
     */
    void rejectNextOrder(const std::string& reason);

    /**
     * @brief Следующие count отправок ордеров упадут на записи в сокет
     */
    void failNextPlacements(int count);

    /**
     * @brief Исполнить ордер по цене, даже если сессия разорвана
     * @return false если ордера нет или он уже завершён
     */
    bool fillOrder(int64_t orderId, const domain::Decimal& price);

    /**
     * @brief Оборвать сокет со стороны брокера
     */
    void dropConnection(const std::string& reason);

    void setAccountValue(const std::string& tag, const domain::Decimal& value);

    /**
     * @brief Положить позицию в портфель (averageCost - на контракт)
     */
    void setPosition(const domain::Contract& contract, const domain::Decimal& position,
                     const domain::Decimal& averageCost);

    std::vector<SimulatedOrder> orders() const;
    std::optional<SimulatedOrder> order(int64_t orderId) const;
    int cancelRequestCount() const;
    int connectAttempts() const;

    /**
     * @brief Фоновое случайное блуждание цен акций (демо-режим)
     */
    void startTicker(std::chrono::milliseconds interval);
    void stopTicker();

private:
    struct Position {
        domain::Contract contract;
        domain::Decimal quantity;
        domain::Decimal averageCost;        ///< На контракт, с учётом множителя
        domain::Decimal realizedPnl;
    };

    mutable std::mutex mutex_;
    ports::output::BrokerMessageHandler handler_;

    bool connected_ = false;
    int connectAttempts_ = 0;
    int failConnects_ = 0;
    domain::ErrorCode failConnectCode_ = domain::ErrorCode::CONNECTION_ERROR;
    std::set<int> rejectedClientIds_;
    bool referenceDataResponding_ = true;
    bool heartbeatResponding_ = true;
    bool orderListResponding_ = true;
    bool autoFillMarketOrders_ = true;
    std::optional<std::string> rejectNext_;
    int failPlacements_ = 0;

    std::map<std::string, SimulatedInstrument> instruments_;
    std::unordered_map<std::string, domain::Decimal> optionPrices_;
    std::unordered_map<int, domain::Contract> streams_;         ///< tickerId -> контракт
    std::map<int64_t, SimulatedOrder> orders_;
    std::map<std::string, Position> positions_;
    std::map<std::string, domain::Decimal> accountValues_;
    bool accountSubscribed_ = false;

    int64_t nextOrderId_ = 1;
    int64_t execCounter_ = 0;
    int cancelRequests_ = 0;

    std::atomic<bool> tickerRunning_{false};
    std::thread tickerThread_;
    std::mt19937 rng_;

    // Всё ниже вызывается под mutex_
    void emit(const ports::output::BrokerMessage& message);
    void requireConnected(const char* operation) const;
    std::optional<domain::Decimal> priceLocked(const domain::Contract& contract) const;
    void publishQuotes(const std::string& key);
    void evaluateTriggers();
    void execute(SimulatedOrder& order, const domain::Decimal& price);
    void cancelOcaSiblings(const SimulatedOrder& filled);
    void applyFill(const domain::Contract& contract, domain::OrderSide side,
                   int64_t quantity, const domain::Decimal& price);
    void publishAccount();
    void tickerLoop(std::chrono::milliseconds interval);
};

} // namespace ibtrader::adapters::secondary
