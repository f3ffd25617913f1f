#include "application/OrderEngine.hpp"
#include "domain/events/OrderStateChangedEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <algorithm>
#include <iostream>

namespace ibtrader::application {

using domain::BracketLeg;
using domain::BracketOrder;
using domain::ConnectionState;
using domain::Decimal;
using domain::EngineException;
using domain::ErrorCode;
using domain::GroupState;
using domain::LegRole;
using domain::LegStatus;
using namespace ports::output;

namespace {

std::string timerKey(const std::string& groupId, LegRole role) {
    return groupId + ":" + toString(role);
}

std::string describe(const BracketLeg& leg) {
    std::string text = toString(leg.role) + " " + toString(leg.side) + " " +
                       std::to_string(leg.quantity) + " " + toString(leg.type);
    if (leg.stopPrice) text += " stop " + leg.stopPrice->toString();
    if (leg.limitPrice) text += " limit " + leg.limitPrice->toString();
    return text;
}

// Ответы брокера, которые не означают отклонения ордера
bool isInformational(int code) {
    return code == broker_codes::ORDER_CANCELLED || code == 399 || code >= 2100;
}

} // namespace

OrderEngine::OrderEngine(
    EventLoop& loop,
    const settings::EngineConfig& config,
    std::shared_ptr<ConnectionManager> connection,
    std::shared_ptr<MarketDataFeed> marketData,
    std::shared_ptr<IEventBus> eventBus,
    std::shared_ptr<IClock> clock
) : config_(config)
  , connection_(std::move(connection))
  , marketData_(std::move(marketData))
  , eventBus_(std::move(eventBus))
  , clock_(std::move(clock))
  , calculator_(config.tickSize)
  , calendar_(config.tradingWindow)
  , strand_(loop.makeStrand())
  , reconcileTimer_(strand_)
{}

void OrderEngine::attach(BrokerMessageDispatcher& dispatcher) {
    std::weak_ptr<OrderEngine> weak = weak_from_this();

    dispatcher.route<OrderStatusMessage>(strand_, [weak](const OrderStatusMessage& m) {
        if (auto self = weak.lock()) {
            self->onOrderStatus(m);
        }
    });
    dispatcher.route<ExecutionMessage>(strand_, [weak](const ExecutionMessage& m) {
        if (auto self = weak.lock()) {
            self->onExecution(m);
        }
    });
    dispatcher.route<OrderListEndMessage>(strand_, [weak](const OrderListEndMessage&) {
        if (auto self = weak.lock()) {
            self->onOrderListEnd();
        }
    });
    dispatcher.route<ErrorMessage>(strand_, [weak](const ErrorMessage& m) {
        if (auto self = weak.lock()) {
            self->onBrokerError(m);
        }
    });
}

// ============================================================================
// Команды пользователя
// ============================================================================

bool OrderEngine::admit(SubmitResult& result) const {
    if (stopped_) {
        result.code = ErrorCode::NOT_CONNECTED;
        result.error = "Order engine is stopped";
        return false;
    }

    auto market = calendar_.status(clock_->now());
    if (!market.open) {
        std::cout << "[OrderEngine] Order rejected: " << market.message << std::endl;
        result.code = ErrorCode::MARKET_CLOSED;
        result.error = market.message;
        return false;
    }

    auto state = connection_->state();
    if (state == ConnectionState::DISCONNECTED || state == ConnectionState::FAILED) {
        result.code = ErrorCode::NOT_CONNECTED;
        result.error = "Not connected to broker (" + toString(state) + ")";
        return false;
    }
    return true;
}

SubmitResult OrderEngine::placeBracketOrder(const BracketRequest& request) {
    SubmitResult result;

    if (request.contract.symbol.empty()) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Ticker is required";
        return result;
    }
    if (request.quantity <= 0) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Quantity must be positive";
        return result;
    }
    if (request.limitPrice && !request.limitPrice->isPositive()) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Limit price must be positive";
        return result;
    }

    try {
        RiskCalculator::validatePercent(request.risk.stopLossPct, "Stop loss percent");
        RiskCalculator::validatePercent(request.risk.takeProfitPct, "Take profit percent");
        if (request.risk.stopLossPct && *request.risk.stopLossPct >= Decimal(100, 0)) {
            throw EngineException(ErrorCode::INVALID_RISK_PARAMETER,
                                  "Stop loss percent must be below 100");
        }
    } catch (const EngineException& e) {
        result.code = e.code();
        result.error = e.what();
        return result;
    }

    if (!admit(result)) {
        return result;
    }

    BracketOrder order;
    order.groupId = utils::UuidGenerator::generateWithPrefix("brk");
    order.contract = request.contract;
    order.risk = request.risk;
    order.ocaGroup = "OCA_" + order.groupId;
    order.entry.role = LegRole::ENTRY;
    order.entry.side = request.side;
    order.entry.quantity = request.quantity;
    order.entry.type = request.limitPrice ? domain::OrderType::LIMIT : domain::OrderType::MARKET;
    order.entry.limitPrice = request.limitPrice;
    order.createdAt = clock_->now();
    order.updatedAt = order.createdAt;

    // Оценка уровней по текущей котировке (или лимитной цене)
    std::optional<Decimal> estimate = request.limitPrice;
    if (!estimate) {
        auto quote = marketData_->latestQuote(request.contract.key());
        if (quote.isKnown()) {
            estimate = quote.marketPrice();
        }
    }
    std::optional<domain::BracketLevels> preview;
    if (estimate && !request.risk.isEmpty()) {
        try {
            preview = calculator_.computeLevels(*estimate, request.risk);
        } catch (const EngineException& e) {
            std::cerr << "[OrderEngine] No bracket preview: " << e.what() << std::endl;
        }
    }

    std::cout << "[OrderEngine] Accepted " << order.groupId << ": "
              << describe(order.entry) << " " << order.contract.key()
              << " SL=" << (request.risk.stopLossPct ? request.risk.stopLossPct->toString() : "--")
              << " TP=" << (request.risk.takeProfitPct ? request.risk.takeProfitPct->toString() : "--")
              << std::endl;

    result = acceptGroup(std::move(order), "Order accepted");
    result.estimatedLevels = preview;
    return result;
}

SubmitResult OrderEngine::closePosition(const domain::PositionPnl& position) {
    SubmitResult result;

    int64_t quantity = position.position.abs().units;
    if (quantity == 0) {
        result.code = ErrorCode::INVALID_REQUEST;
        result.error = "Position " + position.symbol + " is flat";
        return result;
    }
    if (!admit(result)) {
        return result;
    }

    BracketOrder order;
    order.groupId = utils::UuidGenerator::generateWithPrefix("cls");
    order.contract = position.contract;
    order.contract.exchange = "SMART";
    order.entry.role = LegRole::ENTRY;
    order.entry.side = position.position.isPositive() ? domain::OrderSide::SELL
                                                      : domain::OrderSide::BUY;
    order.entry.quantity = quantity;
    order.entry.type = domain::OrderType::MARKET;
    order.createdAt = clock_->now();
    order.updatedAt = order.createdAt;

    std::cout << "[OrderEngine] Closing position " << position.symbol << ": "
              << describe(order.entry) << std::endl;

    return acceptGroup(std::move(order), "Closing position " + position.symbol);
}

SubmitResult OrderEngine::acceptGroup(BracketOrder order, const std::string& message) {
    auto slot = std::make_shared<GroupSlot>();
    slot->order = std::move(order);
    const std::string groupId = slot->order.groupId;

    BracketOrder snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        groups_.insert(groupId, slot);
        snapshot = slot->order;
    }
    publish(snapshot, LegRole::ENTRY, message);

    std::weak_ptr<OrderEngine> weak = weak_from_this();
    boost::asio::post(strand_, [weak, groupId]() {
        if (auto self = weak.lock()) {
            self->submitLeg(groupId, LegRole::ENTRY);
        }
    });

    SubmitResult result;
    result.success = true;
    result.groupId = groupId;
    result.state = GroupState::AWAITING_ENTRY;
    return result;
}

CancelResult OrderEngine::cancelOrder(const std::string& groupId) {
    CancelResult result;

    auto slot = groups_.find(groupId);
    if (!slot) {
        result.code = ErrorCode::NOT_FOUND;
        result.error = "Order group not found: " + groupId;
        return result;
    }

    BracketOrder snapshot;
    std::string message;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& order = slot->order;
        result.state = order.state;

        if (order.isTerminal()) {
            result.code = ErrorCode::INVALID_REQUEST;
            result.error = "Order group is already " + toString(order.state);
            return result;
        }

        if (order.state == GroupState::AWAITING_ENTRY) {
            auto& entry = order.entry;
            if (entry.status == LegStatus::PENDING) {
                entry.cancelRequested = !entry.brokerOrderId.has_value();
                message = applyLegStatus(order, entry, LegStatus::CANCELLED,
                                         ErrorCode::NONE, "Cancelled before submission");
            } else if (!entry.cancelRequested) {
                try {
                    int64_t orderId = *entry.brokerOrderId;
                    connection_->send([orderId](IBrokerSession& broker) {
                        broker.cancelOrder(orderId);
                    });
                } catch (const EngineException& e) {
                    result.code = e.code();
                    result.error = e.what();
                    return result;
                }
                entry.cancelRequested = true;
                message = "Entry cancel requested";
            }
        } else {
            bool liveAtBroker = false;
            for (auto* leg : order.legs()) {
                if (leg->role != LegRole::ENTRY && !leg->isFinal() &&
                    leg->status != LegStatus::PENDING) {
                    liveAtBroker = true;
                }
            }
            if (liveAtBroker && !connection_->isConnected()) {
                result.code = ErrorCode::NOT_CONNECTED;
                result.error = "Not connected to broker";
                return result;
            }
            for (auto* leg : order.legs()) {
                if (leg->role != LegRole::ENTRY) {
                    requestCancel(order, *leg);
                }
            }
            closeIfDone(order);
            message = "Bracket cancel requested";
        }

        order.updatedAt = clock_->now();
        result.state = order.state;
        snapshot = order;
    }

    std::cout << "[OrderEngine] Cancel " << groupId << ": " << message << std::endl;
    publish(snapshot, std::nullopt, message);
    result.success = true;
    return result;
}

std::optional<BracketOrder> OrderEngine::getOrder(const std::string& groupId) const {
    auto slot = groups_.find(groupId);
    if (!slot) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(slot->mutex);
    return slot->order;
}

std::vector<BracketOrder> OrderEngine::listOrders() const {
    std::vector<BracketOrder> result;
    for (const auto& slot : groups_.values()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        result.push_back(slot->order);
    }
    std::sort(result.begin(), result.end(), [](const BracketOrder& a, const BracketOrder& b) {
        return a.createdAt < b.createdAt ||
               (a.createdAt == b.createdAt && a.groupId < b.groupId);
    });
    return result;
}

void OrderEngine::onConnectionStateChanged(ConnectionState, ConnectionState current) {
    std::weak_ptr<OrderEngine> weak = weak_from_this();
    boost::asio::post(strand_, [weak, current]() {
        auto self = weak.lock();
        if (!self || self->stopped_) {
            return;
        }
        switch (current) {
            case ConnectionState::CONNECTED:
                self->startReconcile();
                break;
            case ConnectionState::FAILED:
                self->reconciling_ = false;
                self->rejectPending(ErrorCode::CONNECTION_ERROR, "Connection to broker failed");
                break;
            case ConnectionState::DISCONNECTED:
                self->reconciling_ = false;
                for (auto& entry : self->retryTimers_) {
                    entry.second->cancel();
                }
                self->retryTimers_.clear();
                self->rejectPending(ErrorCode::NOT_CONNECTED, "Session disconnected");
                break;
            case ConnectionState::CONNECTING:
            case ConnectionState::RECONNECTING:
                self->reconciling_ = false;
                break;
        }
    });
}

void OrderEngine::shutdown() {
    stopped_ = true;
    std::weak_ptr<OrderEngine> weak = weak_from_this();
    boost::asio::post(strand_, [weak]() {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        for (auto& entry : self->retryTimers_) {
            entry.second->cancel();
        }
        self->retryTimers_.clear();
        self->reconcileTimer_.cancel();
    });
    std::cout << "[OrderEngine] Shutdown" << std::endl;
}

// ============================================================================
// Отправка ног
// ============================================================================

void OrderEngine::submitLeg(const std::string& groupId, LegRole role) {
    if (stopped_) {
        return;
    }
    retryTimers_.erase(timerKey(groupId, role));

    auto slot = groups_.find(groupId);
    if (!slot) {
        return;
    }

    BracketOrder snapshot;
    std::string message;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& order = slot->order;
        BracketLeg* leg = order.legByRole(role);

        // Повторная отправка уже отправленной ноги - no-op
        if (!leg || leg->status != LegStatus::PENDING || reconciling_) {
            return;
        }
        if (role == LegRole::ENTRY && order.isTerminal()) {
            return;
        }

        auto state = connection_->state();
        if (state == ConnectionState::FAILED) {
            message = applyLegStatus(order, *leg, LegStatus::REJECTED, ErrorCode::CONNECTION_ERROR,
                                     "Connection to broker failed");
        } else if (state != ConnectionState::CONNECTED) {
            // Дождёмся CONNECTED, затем flushPending()
            return;
        } else {
            BrokerOrder brokerOrder;
            brokerOrder.side = leg->side;
            brokerOrder.quantity = leg->quantity;
            brokerOrder.type = leg->type;
            brokerOrder.limitPrice = leg->limitPrice;
            brokerOrder.stopPrice = leg->stopPrice;
            brokerOrder.orderRef = order.groupId;
            if (role != LegRole::ENTRY && order.stopLoss && order.takeProfit) {
                brokerOrder.ocaGroup = order.ocaGroup;
            }

            try {
                // id сохраняется между попытками: повтор с тем же id у брокера не дублирует ордер
                int64_t orderId = connection_->send([&](IBrokerSession& broker) {
                    int64_t id = leg->brokerOrderId ? *leg->brokerOrderId : connection_->nextOrderId();
                    leg->brokerOrderId = id;
                    byOrderId_.insert(id, slot);
                    broker.placeOrder(id, order.contract, brokerOrder);
                    return id;
                });
                leg->status = LegStatus::SUBMITTED;
                message = toString(role) + " submitted (orderId=" + std::to_string(orderId) + ")";
                std::cout << "[OrderEngine] " << order.groupId << ": " << describe(*leg)
                          << " submitted as " << orderId << std::endl;
            } catch (const EngineException& e) {
                if (!isTransient(e.code())) {
                    message = applyLegStatus(order, *leg, LegStatus::REJECTED, e.code(), e.what());
                } else if (++leg->submitAttempts >= config_.submitRetryLimit) {
                    message = applyLegStatus(order, *leg, LegStatus::REJECTED,
                        ErrorCode::CONNECTION_ERROR,
                        "Submission failed after " + std::to_string(leg->submitAttempts) +
                        " attempts: " + e.what());
                } else {
                    std::cerr << "[OrderEngine] " << order.groupId << ": " << toString(role)
                              << " submit attempt " << leg->submitAttempts << " failed: "
                              << e.what() << std::endl;
                    scheduleRetry(groupId, role, leg->submitAttempts);
                    return;
                }
            }
        }

        order.updatedAt = clock_->now();
        snapshot = order;
    }
    publish(snapshot, role, message);
}

void OrderEngine::scheduleRetry(const std::string& groupId, LegRole role, int attempt) {
    auto delay = config_.submitRetryDelay;
    for (int i = 1; i < attempt; ++i) {
        delay *= 2;
    }

    auto timer = std::make_shared<boost::asio::steady_timer>(strand_);
    retryTimers_[timerKey(groupId, role)] = timer;

    std::weak_ptr<OrderEngine> weak = weak_from_this();
    timer->expires_after(delay);
    timer->async_wait(boost::asio::bind_executor(strand_,
        [weak, groupId, role](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->submitLeg(groupId, role);
            }
        }));
}

void OrderEngine::flushPending() {
    std::vector<std::pair<std::string, LegRole>> pending;
    for (const auto& slot : groups_.values()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (auto* leg : slot->order.legs()) {
            if (leg->status == LegStatus::PENDING) {
                pending.emplace_back(slot->order.groupId, leg->role);
            }
        }
    }

    if (!pending.empty()) {
        std::cout << "[OrderEngine] Submitting " << pending.size() << " pending leg(s)" << std::endl;
    }
    for (const auto& item : pending) {
        submitLeg(item.first, item.second);
    }
}

void OrderEngine::rejectPending(ErrorCode code, const std::string& reason) {
    for (const auto& slot : groups_.values()) {
        BracketOrder snapshot;
        std::string message;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            auto& order = slot->order;
            for (auto* leg : order.legs()) {
                if (leg->status == LegStatus::PENDING) {
                    message = applyLegStatus(order, *leg, LegStatus::REJECTED, code, reason);
                }
            }
            if (message.empty()) {
                continue;
            }
            order.updatedAt = clock_->now();
            snapshot = order;
        }
        publish(snapshot, std::nullopt, message);
    }
}

// ============================================================================
// Сверка после переподключения
// ============================================================================

void OrderEngine::startReconcile() {
    bool hasBrokerOrders = false;
    for (const auto& slot : groups_.values()) {
        std::lock_guard<std::mutex> lock(slot->mutex);
        for (auto* leg : slot->order.legs()) {
            if (leg->brokerOrderId) {
                hasBrokerOrders = true;
            }
        }
    }

    if (!hasBrokerOrders) {
        flushPending();
        return;
    }

    try {
        connection_->send([](IBrokerSession& broker) { broker.requestAllOrders(); });
    } catch (const EngineException& e) {
        std::cerr << "[OrderEngine] Reconcile request failed: " << e.what() << std::endl;
        return;
    }

    std::cout << "[OrderEngine] Reconciling order table with broker" << std::endl;
    reconciling_ = true;

    std::weak_ptr<OrderEngine> weak = weak_from_this();
    reconcileTimer_.expires_after(config_.validationTimeout);
    reconcileTimer_.async_wait(boost::asio::bind_executor(strand_,
        [weak](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                if (self->reconciling_) {
                    std::cerr << "[OrderEngine] Order list did not arrive, "
                              << "continuing with local state" << std::endl;
                    self->onOrderListEnd();
                }
            }
        }));
}

void OrderEngine::onOrderListEnd() {
    if (stopped_ || !reconciling_) {
        return;
    }
    reconciling_ = false;
    reconcileTimer_.cancel();

    // OCO и отмены, которые не дошли до брокера, пока связи не было
    for (const auto& slot : groups_.values()) {
        BracketOrder snapshot;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            auto& order = slot->order;
            auto before = order.state;
            enforceInvariants(order);
            if (before == order.state) {
                continue;
            }
            order.updatedAt = clock_->now();
            snapshot = order;
        }
        publish(snapshot, std::nullopt, "Reconciled with broker");
    }

    std::cout << "[OrderEngine] Reconcile complete" << std::endl;
    flushPending();
}

// ============================================================================
// Сообщения брокера
// ============================================================================

void OrderEngine::onOrderStatus(const OrderStatusMessage& message) {
    if (stopped_) {
        return;
    }

    auto slot = byOrderId_.find(message.orderId);
    if (!slot) {
        std::cerr << "[OrderEngine] Status for unknown orderId " << message.orderId << std::endl;
        return;
    }

    BracketOrder snapshot;
    std::string text;
    LegRole role;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& order = slot->order;
        BracketLeg* leg = order.legByOrderId(message.orderId);
        if (!leg) {
            return;
        }
        role = leg->role;

        if (message.filledQuantity > leg->filledQuantity) {
            leg->filledQuantity = message.filledQuantity;
        }
        if (message.avgFillPrice.isPositive()) {
            leg->avgFillPrice = message.avgFillPrice;
        }

        if (leg->isFinal() && !isFinalStatus(message.status)) {
            // Ногу отменили локально, а брокер её всё же получил
            if (leg->status == LegStatus::CANCELLED && !leg->cancelRequested) {
                leg->cancelRequested = true;
                try {
                    int64_t orderId = message.orderId;
                    connection_->send([orderId](IBrokerSession& broker) { broker.cancelOrder(orderId); });
                } catch (const EngineException& e) {
                    leg->cancelRequested = false;
                    std::cerr << "[OrderEngine] Cancel of orderId " << message.orderId
                              << " not sent: " << e.what() << std::endl;
                }
            }
            return;
        }

        ErrorCode code = message.status == LegStatus::REJECTED ? ErrorCode::BROKER_REJECTED
                                                               : ErrorCode::NONE;
        text = applyLegStatus(order, *leg, message.status, code, message.reason);
        if (text.empty()) {
            return;
        }
        order.updatedAt = clock_->now();
        snapshot = order;
    }
    publish(snapshot, role, text);
}

void OrderEngine::onExecution(const ExecutionMessage& message) {
    auto slot = byOrderId_.find(message.orderId);
    if (!slot) {
        return;
    }

    std::lock_guard<std::mutex> lock(slot->mutex);
    BracketLeg* leg = slot->order.legByOrderId(message.orderId);
    if (!leg) {
        return;
    }

    domain::Execution execution;
    execution.execId = message.execId;
    execution.shares = message.shares;
    execution.price = message.price;
    execution.time = clock_->now();
    if (leg->addExecution(execution)) {
        std::cout << "[OrderEngine] Fill: " << message.shares << " @ $"
                  << message.price.toString() << " (orderId=" << message.orderId << ")" << std::endl;
    }
}

void OrderEngine::onBrokerError(const ErrorMessage& message) {
    if (stopped_ || message.id <= 0 || isInformational(message.code)) {
        return;
    }

    auto slot = byOrderId_.find(message.id);
    if (!slot) {
        return;     // Ошибка по запросу другого компонента
    }

    BracketOrder snapshot;
    std::string text;
    LegRole role;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        auto& order = slot->order;
        BracketLeg* leg = order.legByOrderId(message.id);
        if (!leg || leg->isFinal()) {
            return;
        }
        role = leg->role;
        text = applyLegStatus(order, *leg, LegStatus::REJECTED, ErrorCode::BROKER_REJECTED,
                              message.text);
        order.updatedAt = clock_->now();
        snapshot = order;
    }
    std::cerr << "[OrderEngine] Broker rejected orderId " << message.id << " ("
              << message.code << "): " << message.text << std::endl;
    publish(snapshot, role, text);
}

// ============================================================================
// Переходы (под мьютексом слота)
// ============================================================================

std::string OrderEngine::applyLegStatus(BracketOrder& order, BracketLeg& leg, LegStatus status,
                                        ErrorCode code, const std::string& reason) {
    if (!isForwardTransition(leg.status, status)) {
        return "";
    }

    leg.status = status;
    std::string message = toString(leg.role) + " " + toString(status);

    if (status == LegStatus::REJECTED) {
        leg.rejectReason = reason;
        order.recordFailure(leg.role, code, reason);
        message += ": " + reason;
    }

    if (leg.role == LegRole::ENTRY) {
        if (leg.isFinal()) {
            message = onEntryFinal(order);
        }
        return message;
    }

    if (status == LegStatus::FILLED) {
        auto fill = leg.fillPrice();
        message = toString(leg.role) + " filled" + (fill ? " @ $" + fill->toString() : "");
    }
    enforceInvariants(order);
    return message;
}

std::string OrderEngine::onEntryFinal(BracketOrder& order) {
    auto& entry = order.entry;

    // Частичное исполнение до отмены защищаем так же, как полное
    if (entry.status == LegStatus::FILLED ||
        (entry.status == LegStatus::CANCELLED && entry.filledQuantity > 0)) {
        order.state = GroupState::ENTRY_FILLED;
        return activateBracket(order);
    }

    order.state = entry.status == LegStatus::REJECTED ? GroupState::REJECTED
                                                      : GroupState::CANCELLED;
    enforceInvariants(order);

    std::string message = "Entry " + toString(entry.status);
    if (!entry.rejectReason.empty()) {
        message += ": " + entry.rejectReason;
    }
    std::cout << "[OrderEngine] " << order.groupId << " -> " << toString(order.state) << std::endl;
    return message;
}

std::string OrderEngine::activateBracket(BracketOrder& order) {
    auto& entry = order.entry;
    auto fill = entry.fillPrice();
    std::string message = "Entry filled" + (fill ? " @ $" + fill->toString() : std::string());

    if (order.risk.isEmpty()) {
        order.state = GroupState::CLOSED;
        return message;
    }
    if (!fill) {
        order.recordFailure(LegRole::ENTRY, ErrorCode::INVALID_RISK_PARAMETER,
                            "Could not determine fill price");
        order.state = GroupState::CLOSED;
        return message + ", could not determine fill price for bracket";
    }

    int64_t quantity = entry.filledQuantity > 0 ? entry.filledQuantity : entry.quantity;
    auto exitSide = opposite(entry.side);

    auto makeLeg = [&](LegRole role, domain::OrderType type) {
        BracketLeg leg;
        leg.role = role;
        leg.side = exitSide;
        leg.quantity = quantity;
        leg.type = type;
        return leg;
    };

    if (order.risk.stopLossPct) {
        try {
            auto leg = makeLeg(LegRole::STOP_LOSS, domain::OrderType::STOP);
            leg.stopPrice = calculator_.stopPrice(*fill, *order.risk.stopLossPct);
            order.stopLoss = leg;
            message += ", stop loss at $" + leg.stopPrice->toString();
        } catch (const EngineException& e) {
            order.recordFailure(LegRole::STOP_LOSS, e.code(), e.what());
            message += ", stop loss failed: " + std::string(e.what());
        }
    }
    if (order.risk.takeProfitPct) {
        try {
            auto leg = makeLeg(LegRole::TAKE_PROFIT, domain::OrderType::LIMIT);
            leg.limitPrice = calculator_.takePrice(*fill, *order.risk.takeProfitPct);
            order.takeProfit = leg;
            message += ", take profit at $" + leg.limitPrice->toString();
        } catch (const EngineException& e) {
            order.recordFailure(LegRole::TAKE_PROFIT, e.code(), e.what());
            message += ", take profit failed: " + std::string(e.what());
        }
    }

    if (!order.hasRiskLegs()) {
        order.state = GroupState::CLOSED;
        return message;
    }

    order.state = GroupState::BRACKET_ACTIVE;
    std::cout << "[OrderEngine] " << order.groupId << ": " << message << std::endl;

    std::weak_ptr<OrderEngine> weak = weak_from_this();
    for (auto* leg : order.legs()) {
        if (leg->role == LegRole::ENTRY) {
            continue;
        }
        boost::asio::post(strand_, [weak, groupId = order.groupId, role = leg->role]() {
            if (auto self = weak.lock()) {
                self->submitLeg(groupId, role);
            }
        });
    }
    return message;
}

void OrderEngine::enforceInvariants(BracketOrder& order) {
    if (order.state == GroupState::CANCELLED || order.state == GroupState::REJECTED) {
        for (auto* leg : order.legs()) {
            if (leg->role != LegRole::ENTRY) {
                requestCancel(order, *leg);
            }
        }
        return;
    }

    // OCO: исполнение одной ноги защиты отменяет вторую
    for (auto role : {LegRole::STOP_LOSS, LegRole::TAKE_PROFIT}) {
        BracketLeg* leg = order.legByRole(role);
        if (leg && leg->status == LegStatus::FILLED) {
            if (BracketLeg* sibling = order.siblingOf(role)) {
                requestCancel(order, *sibling);
            }
        }
    }
    closeIfDone(order);
}

void OrderEngine::requestCancel(BracketOrder& order, BracketLeg& leg) {
    if (leg.isFinal() || leg.cancelRequested) {
        return;
    }

    if (leg.status == LegStatus::PENDING) {
        // Брокеру ещё не передана - отменяем локально. Если id уже выдан,
        // отмену отправим, когда брокер пришлёт статус по этому id.
        leg.status = LegStatus::CANCELLED;
        leg.cancelRequested = !leg.brokerOrderId.has_value();
        return;
    }

    leg.cancelRequested = true;

    try {
        int64_t orderId = *leg.brokerOrderId;
        connection_->send([orderId](IBrokerSession& broker) { broker.cancelOrder(orderId); });
        std::cout << "[OrderEngine] " << order.groupId << ": cancel sent for "
                  << toString(leg.role) << " (orderId=" << orderId << ")" << std::endl;
    } catch (const EngineException& e) {
        // Повторим при сверке после переподключения
        leg.cancelRequested = false;
        std::cerr << "[OrderEngine] " << order.groupId << ": cancel of " << toString(leg.role)
                  << " not sent: " << e.what() << std::endl;
    }
}

void OrderEngine::closeIfDone(BracketOrder& order) {
    if (order.state == GroupState::BRACKET_ACTIVE && order.allRiskLegsFinal()) {
        order.state = GroupState::CLOSED;
        std::cout << "[OrderEngine] " << order.groupId << " -> CLOSED" << std::endl;
    }
}

void OrderEngine::publish(const BracketOrder& order,
                          std::optional<LegRole> changedLeg,
                          const std::string& message) {
    domain::OrderStateChangedEvent event;
    event.order = order;
    event.changedLeg = changedLeg;
    event.message = message;
    eventBus_->publish(event);

    if (order.isTerminal()) {
        retire(order.groupId);
    }
}

void OrderEngine::retire(const std::string& groupId) {
    auto slot = groups_.find(groupId);
    if (!slot) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (slot->retired) {
            return;
        }
        slot->retired = true;
    }

    std::vector<std::string> evicted;
    {
        std::lock_guard<std::mutex> lock(finishedMutex_);
        finished_.push_back(groupId);
        while (finished_.size() > config_.finishedGroupsRetained) {
            evicted.push_back(finished_.front());
            finished_.pop_front();
        }
    }

    for (const auto& id : evicted) {
        auto old = groups_.find(id);
        if (!old) {
            continue;
        }
        {
            std::lock_guard<std::mutex> lock(old->mutex);
            for (auto* leg : old->order.legs()) {
                if (leg->brokerOrderId) {
                    byOrderId_.erase(*leg->brokerOrderId);
                }
            }
        }
        groups_.erase(id);
        std::cout << "[OrderEngine] Evicted finished group " << id << std::endl;
    }
}

} // namespace ibtrader::application
