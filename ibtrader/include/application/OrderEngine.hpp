#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/EventLoop.hpp"
#include "application/MarketDataFeed.hpp"
#include "application/RiskCalculator.hpp"
#include "application/TradingCalendar.hpp"
#include "domain/AccountSnapshot.hpp"
#include "domain/BracketOrder.hpp"
#include "domain/EngineError.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/EngineConfig.hpp"
#include <ThreadSafeMap.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ibtrader::application {

/**
 * @brief Запрос на брекет-ордер
 *
 * Без limitPrice вход рыночный (MKT), иначе лимитный (LMT).
 */
struct BracketRequest {
    domain::Contract contract;
    domain::OrderSide side = domain::OrderSide::BUY;
    int64_t quantity = 0;
    std::optional<domain::Decimal> limitPrice;
    domain::RiskProfile risk;
};

/**
 * @brief Результат приёма группы
 *
 * Группа принимается сразу в AWAITING_ENTRY, дальнейшее - событиями
 * order.state_changed. estimatedLevels - уровни от текущей котировки,
 * пусто пока котировка UNKNOWN.
 */
struct SubmitResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    std::string groupId;
    domain::GroupState state = domain::GroupState::AWAITING_ENTRY;
    std::optional<domain::BracketLevels> estimatedLevels;
};

struct CancelResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    domain::GroupState state = domain::GroupState::AWAITING_ENTRY;
};

/**
 * @brief Машина состояний брекет-групп
 *
 * Ноги: PENDING -> SUBMITTED -> {FILLED, CANCELLED, REJECTED}
 * Группа: AWAITING_ENTRY -> ENTRY_FILLED -> BRACKET_ACTIVE -> CLOSED,
 *         либо AWAITING_ENTRY -> CANCELLED / REJECTED.
 *
 * Группы лежат в ThreadSafeMap слотов, у каждого слота свой мьютекс:
 * обновление статуса и действие пользователя по одной группе не
 * пересекаются, разные группы друг друга не ждут. Все сообщения
 * брокера по ордерам обрабатываются на одном strand'е в порядке
 * поступления.
 *
 * Ноги защиты создаются только после исполнения входа, от фактической
 * цены исполнения. Исполнение одной ноги защиты отменяет вторую ровно
 * один раз. После переподключения движок запрашивает у брокера статусы
 * всех ордеров и считает их истинными.
 */
class OrderEngine : public std::enable_shared_from_this<OrderEngine> {
public:
    OrderEngine(
        EventLoop& loop,
        const settings::EngineConfig& config,
        std::shared_ptr<ConnectionManager> connection,
        std::shared_ptr<MarketDataFeed> marketData,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ports::output::IClock> clock
    );

    void attach(BrokerMessageDispatcher& dispatcher);

    /**
     * @brief Принять брекет-группу
     *
     * Проверки до любого обращения к брокеру:
     * INVALID_REQUEST, INVALID_RISK_PARAMETER, MARKET_CLOSED, NOT_CONNECTED.
     * Во время CONNECTING / RECONNECTING группа принимается, вход ждёт
     * восстановления сессии в PENDING.
     */
    SubmitResult placeBracketOrder(const BracketRequest& request);

    /**
     * @brief Отменить группу
     *
     * Вход ещё не отправлен - отмена локально; вход у брокера - отмена
     * у брокера; брекет активен - отмена обеих живых ног защиты.
     */
    CancelResult cancelOrder(const std::string& groupId);

    /**
     * @brief Закрыть позицию рыночным ордером в обратную сторону
     *
     * Оформляется как группа из одной ноги без защиты.
     */
    SubmitResult closePosition(const domain::PositionPnl& position);

    std::optional<domain::BracketOrder> getOrder(const std::string& groupId) const;

    /**
     * @brief Все группы по времени создания
     */
    std::vector<domain::BracketOrder> listOrders() const;

    void onConnectionStateChanged(domain::ConnectionState previous,
                                  domain::ConnectionState current);

    /**
     * @brief Отменить таймеры повторов, дальнейшие обработчики - no-op
     */
    void shutdown();

private:
    struct GroupSlot {
        std::mutex mutex;
        domain::BracketOrder order;
        bool retired = false;       ///< Уже в очереди завершённых
    };

    settings::EngineConfig config_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<MarketDataFeed> marketData_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ports::output::IClock> clock_;
    RiskCalculator calculator_;
    TradingCalendar calendar_;
    Strand strand_;

    ThreadSafeMap<std::string, GroupSlot> groups_;
    ThreadSafeMap<int64_t, GroupSlot> byOrderId_;

    // Завершённые группы в порядке завершения, старые вытесняются
    std::mutex finishedMutex_;
    std::deque<std::string> finished_;

    // Только на strand_
    std::unordered_map<std::string, std::shared_ptr<boost::asio::steady_timer>> retryTimers_;
    bool reconciling_ = false;
    boost::asio::steady_timer reconcileTimer_;

    std::atomic<bool> stopped_{false};

    /**
     * @brief Общие проверки приёма: торговое окно и состояние сессии
     */
    bool admit(SubmitResult& result) const;

    SubmitResult acceptGroup(domain::BracketOrder order, const std::string& message);

    // Обработчики сообщений брокера (strand_)
    void onOrderStatus(const ports::output::OrderStatusMessage& message);
    void onExecution(const ports::output::ExecutionMessage& message);
    void onBrokerError(const ports::output::ErrorMessage& message);
    void onOrderListEnd();

    void submitLeg(const std::string& groupId, domain::LegRole role);
    void scheduleRetry(const std::string& groupId, domain::LegRole role, int attempt);
    void flushPending();
    void rejectPending(domain::ErrorCode code, const std::string& reason);
    void startReconcile();

    // Вызываются под мьютексом слота
    std::string applyLegStatus(domain::BracketOrder& order, domain::BracketLeg& leg,
                               domain::LegStatus status, domain::ErrorCode code,
                               const std::string& reason);
    std::string onEntryFinal(domain::BracketOrder& order);
    std::string activateBracket(domain::BracketOrder& order);
    void enforceInvariants(domain::BracketOrder& order);
    void requestCancel(domain::BracketOrder& order, domain::BracketLeg& leg);
    void closeIfDone(domain::BracketOrder& order);

    /**
     * @brief Поставить завершённую группу в очередь и вытеснить самые старые
     *        сверх finishedGroupsRetained
     */
    void retire(const std::string& groupId);

    void publish(const domain::BracketOrder& order,
                 std::optional<domain::LegRole> changedLeg,
                 const std::string& message);
};

} // namespace ibtrader::application
