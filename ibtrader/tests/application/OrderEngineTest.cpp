/**
 * @file OrderEngineTest.cpp
 * @brief Автомат состояний группы: вход, активация защиты, OCO, отмена,
 *        повторы отправки, сверка после переподключения
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/MarketDataFeed.hpp"
#include "application/OrderEngine.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/MockBrokerSession.hpp"
#include "../mocks/TestSupport.hpp"

using namespace ibtrader;
using namespace ibtrader::application;
using namespace ibtrader::ports::output;
using domain::ConnectionState;
using domain::Decimal;
using domain::ErrorCode;
using domain::GroupState;
using domain::LegRole;
using domain::LegStatus;
using domain::OrderSide;
using domain::OrderType;
using tests::FixedClock;
using tests::MockBrokerSession;
using tests::OrderEventRecorder;
using tests::waitFor;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

struct PlacedOrder {
    int64_t orderId = 0;
    domain::Contract contract;
    BrokerOrder order;
};

} // namespace

class OrderEngineTest : public ::testing::Test {
protected:
    EventLoop loop_{2};
    settings::EngineConfig config_;
    std::shared_ptr<NiceMock<MockBrokerSession>> broker_;
    std::shared_ptr<adapters::secondary::InMemoryEventBus> eventBus_;
    std::shared_ptr<FixedClock> clock_;
    BrokerMessageDispatcher dispatcher_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<MarketDataFeed> feed_;
    std::shared_ptr<OrderEngine> engine_;
    std::unique_ptr<OrderEventRecorder> recorder_;

    std::mutex placedMutex_;
    std::vector<PlacedOrder> placed_;

    void SetUp() override {
        config_.defaultStopLossPct = Decimal(20, 0);
        config_.defaultTakeProfitPct = Decimal(30, 0);
        config_.submitRetryLimit = 3;
        config_.submitRetryDelay = std::chrono::milliseconds(10);
        config_.reconnectBaseDelay = std::chrono::milliseconds(10);
        config_.reconnectMaxDelay = std::chrono::milliseconds(20);
        config_.reconnectMaxRetries = 3;
        config_.validationTimeout = std::chrono::milliseconds(200);
        loop_.start();
        build();
    }

    void build() {
        broker_ = std::make_shared<NiceMock<MockBrokerSession>>();
        eventBus_ = std::make_shared<adapters::secondary::InMemoryEventBus>();
        clock_ = std::make_shared<FixedClock>(FixedClock::WEDNESDAY_10_00_ET);
        recorder_ = std::make_unique<OrderEventRecorder>(*eventBus_);

        connection_ = std::make_shared<ConnectionManager>(loop_, config_, broker_, eventBus_);
        feed_ = std::make_shared<MarketDataFeed>(loop_, connection_, eventBus_);
        engine_ = std::make_shared<OrderEngine>(loop_, config_, connection_, feed_, eventBus_, clock_);

        connection_->attach(dispatcher_);
        feed_->attach(dispatcher_);
        engine_->attach(dispatcher_);
        broker_->setMessageHandler([this](const BrokerMessage& m) { dispatcher_.dispatch(m); });
        connection_->addStateListener([this](ConnectionState prev, ConnectionState cur) {
            feed_->onConnectionStateChanged(prev, cur);
            engine_->onConnectionStateChanged(prev, cur);
        });

        ON_CALL(*broker_, placeOrder(_, _, _))
            .WillByDefault(Invoke([this](int64_t id, const domain::Contract& c, const BrokerOrder& o) {
                std::lock_guard<std::mutex> lock(placedMutex_);
                placed_.push_back(PlacedOrder{id, c, o});
            }));
    }

    void shutdownComponents() {
        engine_->shutdown();
        feed_->shutdown();
        connection_->shutdown();
    }

    /**
     * @brief Пересобрать компоненты после правки config_ в тесте
     */
    void rebuild() {
        shutdownComponents();
        dispatcher_.clear();
        eventBus_->clear();
        build();
    }

    void TearDown() override {
        shutdownComponents();
        loop_.stop();
    }

    void connect() {
        ASSERT_TRUE(connection_->connect("127.0.0.1", 7497, 1).success);
    }

    BracketRequest optionRequest(int64_t quantity = 2,
                                 std::optional<Decimal> limit = Decimal(3, 0)) {
        BracketRequest request;
        request.contract = domain::Contract::option("SPY", "20250117", Decimal(450, 0),
                                                    domain::OptionRight::CALL);
        request.side = OrderSide::BUY;
        request.quantity = quantity;
        request.limitPrice = limit;
        request.risk.stopLossPct = config_.defaultStopLossPct;
        request.risk.takeProfitPct = config_.defaultTakeProfitPct;
        return request;
    }

    size_t placedCount() {
        std::lock_guard<std::mutex> lock(placedMutex_);
        return placed_.size();
    }

    PlacedOrder placedAt(size_t index) {
        std::lock_guard<std::mutex> lock(placedMutex_);
        return placed_.at(index);
    }

    std::optional<PlacedOrder> placedFor(OrderSide side, OrderType type) {
        std::lock_guard<std::mutex> lock(placedMutex_);
        for (const auto& p : placed_) {
            if (p.order.side == side && p.order.type == type) return p;
        }
        return std::nullopt;
    }

    GroupState stateOf(const std::string& groupId) {
        auto order = engine_->getOrder(groupId);
        return order ? order->state : GroupState::AWAITING_ENTRY;
    }

    bool waitState(const std::string& groupId, GroupState state) {
        return waitFor([&] { return stateOf(groupId) == state; });
    }

    void fill(int64_t orderId, int64_t shares, const char* price) {
        broker_->emit(ExecutionMessage{orderId, "exec." + std::to_string(orderId), shares,
                                       Decimal::fromString(price)});
        broker_->emit(OrderStatusMessage{orderId, LegStatus::FILLED, shares,
                                         Decimal::fromString(price), ""});
    }

    void status(int64_t orderId, LegStatus legStatus, int64_t filled = 0) {
        broker_->emit(OrderStatusMessage{orderId, legStatus, filled, Decimal(), ""});
    }

    /**
     * @brief Вход BUY 2 @ 3.00 исполнен, обе ноги защиты отправлены
     */
    std::string activeBracket() {
        auto result = engine_->placeBracketOrder(optionRequest());
        EXPECT_TRUE(result.success) << result.error;
        EXPECT_TRUE(waitFor([this] { return placedCount() == 1; }));
        fill(placedAt(0).orderId, 2, "3.00");
        EXPECT_TRUE(waitFor([this] { return placedCount() == 3; }));
        EXPECT_TRUE(waitFor([&] {
            auto order = engine_->getOrder(result.groupId);
            return order && order->stopLoss && order->takeProfit &&
                   order->stopLoss->status == LegStatus::SUBMITTED &&
                   order->takeProfit->status == LegStatus::SUBMITTED;
        }));
        return result.groupId;
    }
};

// ============================================================================
// ПРИЁМ ЗАЯВКИ
// ============================================================================

TEST_F(OrderEngineTest, Place_MarketClosed_RejectedWithoutBrokerCall) {
    connect();
    clock_->set(FixedClock::SATURDAY_10_00_ET);
    EXPECT_CALL(*broker_, placeOrder(_, _, _)).Times(0);

    auto result = engine_->placeBracketOrder(optionRequest());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::MARKET_CLOSED);
    EXPECT_EQ(result.error, "Market is closed (weekend)");
    EXPECT_TRUE(engine_->listOrders().empty());
}

TEST_F(OrderEngineTest, Place_BeforeOpen_MessageNamesOpeningTime) {
    connect();
    clock_->set(FixedClock::WEDNESDAY_09_00_ET);

    auto result = engine_->placeBracketOrder(optionRequest());

    EXPECT_EQ(result.code, ErrorCode::MARKET_CLOSED);
    EXPECT_NE(result.error.find("opens at 9:30 AM ET"), std::string::npos);
}

TEST_F(OrderEngineTest, Place_NonPositiveRisk_InvalidRiskParameter) {
    connect();
    EXPECT_CALL(*broker_, placeOrder(_, _, _)).Times(0);

    auto request = optionRequest();
    request.risk.stopLossPct = Decimal(0, 0);
    EXPECT_EQ(engine_->placeBracketOrder(request).code, ErrorCode::INVALID_RISK_PARAMETER);

    request = optionRequest();
    request.risk.takeProfitPct = Decimal(-5, 0);
    EXPECT_EQ(engine_->placeBracketOrder(request).code, ErrorCode::INVALID_RISK_PARAMETER);

    request = optionRequest();
    request.risk.stopLossPct = Decimal(100, 0);
    EXPECT_EQ(engine_->placeBracketOrder(request).code, ErrorCode::INVALID_RISK_PARAMETER);
}

TEST_F(OrderEngineTest, Place_BadQuantityOrPrice_InvalidRequest) {
    connect();

    EXPECT_EQ(engine_->placeBracketOrder(optionRequest(0)).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(engine_->placeBracketOrder(optionRequest(2, Decimal(0, 0))).code,
              ErrorCode::INVALID_REQUEST);

    auto noSymbol = optionRequest();
    noSymbol.contract.symbol.clear();
    EXPECT_EQ(engine_->placeBracketOrder(noSymbol).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(OrderEngineTest, Place_Disconnected_NotConnected) {
    auto result = engine_->placeBracketOrder(optionRequest());
    EXPECT_EQ(result.code, ErrorCode::NOT_CONNECTED);
}

TEST_F(OrderEngineTest, Place_Accepted_EntrySubmittedAsLimitWithPreview) {
    connect();

    auto result = engine_->placeBracketOrder(optionRequest());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.state, GroupState::AWAITING_ENTRY);
    ASSERT_TRUE(result.estimatedLevels.has_value());
    EXPECT_EQ(*result.estimatedLevels->stopPrice, Decimal::fromString("2.40"));
    EXPECT_EQ(*result.estimatedLevels->takePrice, Decimal::fromString("3.90"));

    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    auto entry = placedAt(0);
    EXPECT_EQ(entry.order.type, OrderType::LIMIT);
    EXPECT_EQ(entry.order.side, OrderSide::BUY);
    EXPECT_EQ(entry.order.quantity, 2);
    EXPECT_EQ(*entry.order.limitPrice, Decimal(3, 0));
    EXPECT_EQ(entry.order.orderRef, result.groupId);
    EXPECT_TRUE(entry.order.ocaGroup.empty());
    EXPECT_EQ(entry.contract.key(), "SPY 20250117 450.00C");

    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    EXPECT_EQ(*engine_->getOrder(result.groupId)->entry.brokerOrderId, entry.orderId);
}

TEST_F(OrderEngineTest, Place_MarketOrder_PreviewFromLatestQuote) {
    connect();
    auto sub = feed_->subscribe("SPY");
    broker_->emit(TickMessage{sub.tickerId, TickField::LAST, Decimal(450, 0)});
    ASSERT_TRUE(waitFor([this] { return feed_->latestQuote("SPY").isKnown(); }));

    BracketRequest request;
    request.contract = domain::Contract::stock("SPY");
    request.quantity = 10;
    request.risk.stopLossPct = Decimal(2, 0);

    auto result = engine_->placeBracketOrder(request);

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.estimatedLevels.has_value());
    EXPECT_EQ(*result.estimatedLevels->stopPrice, Decimal(441, 0));
    EXPECT_FALSE(result.estimatedLevels->takePrice.has_value());

    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    EXPECT_EQ(placedAt(0).order.type, OrderType::MARKET);
}

TEST_F(OrderEngineTest, Place_PublishesAcceptedEvent) {
    connect();

    auto result = engine_->placeBracketOrder(optionRequest());

    ASSERT_TRUE(waitFor([this] { return recorder_->count() >= 1; }));
    auto first = recorder_->events().front();
    EXPECT_EQ(first.order.groupId, result.groupId);
    ASSERT_TRUE(first.changedLeg.has_value());
    EXPECT_EQ(*first.changedLeg, LegRole::ENTRY);
    EXPECT_EQ(first.order.state, GroupState::AWAITING_ENTRY);
}

// ============================================================================
// АКТИВАЦИЯ ЗАЩИТЫ
// ============================================================================

TEST_F(OrderEngineTest, EntryFilled_BothRiskLegsLinkedByOca) {
    connect();
    auto groupId = activeBracket();

    auto stop = placedFor(OrderSide::SELL, OrderType::STOP);
    auto take = placedFor(OrderSide::SELL, OrderType::LIMIT);
    ASSERT_TRUE(stop.has_value());
    ASSERT_TRUE(take.has_value());

    EXPECT_EQ(stop->order.quantity, 2);
    EXPECT_EQ(*stop->order.stopPrice, Decimal::fromString("2.40"));
    EXPECT_EQ(take->order.quantity, 2);
    EXPECT_EQ(*take->order.limitPrice, Decimal::fromString("3.90"));

    EXPECT_EQ(stop->order.ocaGroup, "OCA_" + groupId);
    EXPECT_EQ(take->order.ocaGroup, "OCA_" + groupId);
    EXPECT_EQ(stateOf(groupId), GroupState::BRACKET_ACTIVE);
}

TEST_F(OrderEngineTest, EntryFilled_StopOnly_NoOcaGroup) {
    connect();
    auto request = optionRequest();
    request.risk.takeProfitPct.reset();

    auto result = engine_->placeBracketOrder(request);
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    fill(placedAt(0).orderId, 2, "3.00");
    ASSERT_TRUE(waitFor([this] { return placedCount() == 2; }));

    auto stop = placedAt(1);
    EXPECT_EQ(stop.order.type, OrderType::STOP);
    EXPECT_TRUE(stop.order.ocaGroup.empty());

    auto order = engine_->getOrder(result.groupId);
    EXPECT_TRUE(order->stopLoss.has_value());
    EXPECT_FALSE(order->takeProfit.has_value());
}

TEST_F(OrderEngineTest, EntryFilled_NoRisk_GroupClosed) {
    connect();
    auto request = optionRequest();
    request.risk = domain::RiskProfile{};

    auto result = engine_->placeBracketOrder(request);
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    fill(placedAt(0).orderId, 2, "3.00");

    ASSERT_TRUE(waitState(result.groupId, GroupState::CLOSED));
    EXPECT_EQ(placedCount(), 1u);
}

TEST_F(OrderEngineTest, EntryFilled_LevelsFromActualFillNotLimit) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));

    fill(placedAt(0).orderId, 2, "2.50");
    ASSERT_TRUE(waitFor([this] { return placedCount() == 3; }));

    auto stop = placedFor(OrderSide::SELL, OrderType::STOP);
    ASSERT_TRUE(stop.has_value());
    EXPECT_EQ(*stop->order.stopPrice, Decimal::fromString("2.00"));
}

TEST_F(OrderEngineTest, EntryPartiallyFilledThenCancelled_BracketSizedToFill) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest(3));
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    auto entryId = placedAt(0).orderId;

    broker_->emit(ExecutionMessage{entryId, "exec.partial", 1, Decimal(3, 0)});
    broker_->emit(OrderStatusMessage{entryId, LegStatus::CANCELLED, 1, Decimal(3, 0), ""});

    ASSERT_TRUE(waitFor([this] { return placedCount() == 3; }));
    EXPECT_EQ(placedAt(1).order.quantity, 1);
    EXPECT_EQ(placedAt(2).order.quantity, 1);
    EXPECT_EQ(stateOf(result.groupId), GroupState::BRACKET_ACTIVE);
}

// ============================================================================
// OCO
// ============================================================================

TEST_F(OrderEngineTest, TakeProfitFilled_StopCancelledExactlyOnce) {
    connect();
    auto groupId = activeBracket();
    auto order = *engine_->getOrder(groupId);
    int64_t stopId = *order.stopLoss->brokerOrderId;
    int64_t takeId = *order.takeProfit->brokerOrderId;

    EXPECT_CALL(*broker_, cancelOrder(stopId)).Times(1);
    EXPECT_CALL(*broker_, cancelOrder(takeId)).Times(0);

    fill(takeId, 2, "3.90");
    // Повторный статус от брокера не порождает вторую отмену
    status(takeId, LegStatus::FILLED, 2);

    ASSERT_TRUE(waitFor([&] { return engine_->getOrder(groupId)->stopLoss->cancelRequested; }));
    EXPECT_EQ(stateOf(groupId), GroupState::BRACKET_ACTIVE);

    status(stopId, LegStatus::CANCELLED);
    ASSERT_TRUE(waitState(groupId, GroupState::CLOSED));

    auto closed = *engine_->getOrder(groupId);
    EXPECT_EQ(closed.takeProfit->status, LegStatus::FILLED);
    EXPECT_EQ(closed.stopLoss->status, LegStatus::CANCELLED);
}

TEST_F(OrderEngineTest, StopFilled_TakeProfitCancelled) {
    connect();
    auto groupId = activeBracket();
    auto order = *engine_->getOrder(groupId);
    int64_t stopId = *order.stopLoss->brokerOrderId;
    int64_t takeId = *order.takeProfit->brokerOrderId;

    EXPECT_CALL(*broker_, cancelOrder(takeId)).Times(1);

    fill(stopId, 2, "2.40");
    ASSERT_TRUE(waitFor([&] { return engine_->getOrder(groupId)->takeProfit->cancelRequested; }));

    status(takeId, LegStatus::CANCELLED);
    ASSERT_TRUE(waitState(groupId, GroupState::CLOSED));
}

TEST_F(OrderEngineTest, BothRiskLegsFilled_GroupStillClosesWithoutExtraCancels) {
    connect();
    auto groupId = activeBracket();
    auto order = *engine_->getOrder(groupId);
    int64_t stopId = *order.stopLoss->brokerOrderId;
    int64_t takeId = *order.takeProfit->brokerOrderId;

    EXPECT_CALL(*broker_, cancelOrder(_)).Times(1);

    fill(takeId, 2, "3.90");
    fill(stopId, 2, "2.40");

    ASSERT_TRUE(waitState(groupId, GroupState::CLOSED));
}

// ============================================================================
// ОТМЕНА
// ============================================================================

TEST_F(OrderEngineTest, CancelBeforeFill_EntryCancelled_NoRiskLegsEver) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    int64_t entryId = placedAt(0).orderId;
    EXPECT_CALL(*broker_, cancelOrder(entryId)).Times(1);

    auto cancel = engine_->cancelOrder(result.groupId);
    EXPECT_TRUE(cancel.success);

    status(entryId, LegStatus::CANCELLED);
    ASSERT_TRUE(waitState(result.groupId, GroupState::CANCELLED));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(placedCount(), 1u);
    auto order = engine_->getOrder(result.groupId);
    EXPECT_FALSE(order->stopLoss.has_value());
    EXPECT_FALSE(order->takeProfit.has_value());
}

TEST_F(OrderEngineTest, CancelActiveBracket_CancelsBothRiskLegs) {
    connect();
    auto groupId = activeBracket();
    auto order = *engine_->getOrder(groupId);
    int64_t stopId = *order.stopLoss->brokerOrderId;
    int64_t takeId = *order.takeProfit->brokerOrderId;

    EXPECT_CALL(*broker_, cancelOrder(stopId)).Times(1);
    EXPECT_CALL(*broker_, cancelOrder(takeId)).Times(1);

    EXPECT_TRUE(engine_->cancelOrder(groupId).success);

    status(stopId, LegStatus::CANCELLED);
    status(takeId, LegStatus::CANCELLED);
    ASSERT_TRUE(waitState(groupId, GroupState::CLOSED));
}

TEST_F(OrderEngineTest, Cancel_UnknownGroup_NotFound) {
    auto result = engine_->cancelOrder("brk-missing");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::NOT_FOUND);
}

TEST_F(OrderEngineTest, Cancel_TerminalGroup_InvalidRequest) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    status(placedAt(0).orderId, LegStatus::CANCELLED);
    ASSERT_TRUE(waitState(result.groupId, GroupState::CANCELLED));

    auto cancel = engine_->cancelOrder(result.groupId);

    EXPECT_EQ(cancel.code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(cancel.error, "Order group is already CANCELLED");
}

TEST_F(OrderEngineTest, FinishedGroups_OldestEvictedBeyondRetention) {
    config_.finishedGroupsRetained = 2;
    rebuild();
    connect();

    std::vector<std::string> groupIds;
    for (size_t i = 0; i < 3; ++i) {
        auto result = engine_->placeBracketOrder(optionRequest());
        ASSERT_TRUE(waitFor([&] { return placedCount() == i + 1; }));
        status(placedAt(i).orderId, LegStatus::CANCELLED);
        ASSERT_TRUE(waitFor([&] {
            auto order = engine_->getOrder(result.groupId);
            return order && order->state == GroupState::CANCELLED;
        }));
        groupIds.push_back(result.groupId);
    }

    ASSERT_TRUE(waitFor([&] { return !engine_->getOrder(groupIds[0]).has_value(); }));
    EXPECT_TRUE(engine_->getOrder(groupIds[1]).has_value());
    EXPECT_TRUE(engine_->getOrder(groupIds[2]).has_value());
    EXPECT_EQ(engine_->listOrders().size(), 2u);
    EXPECT_EQ(engine_->cancelOrder(groupIds[0]).code, ErrorCode::NOT_FOUND);

    // Поздний статус по вытесненному ордеру игнорируется
    status(placedAt(0).orderId, LegStatus::FILLED, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(engine_->listOrders().size(), 2u);
}

TEST_F(OrderEngineTest, ActiveGroups_NeverEvicted) {
    config_.finishedGroupsRetained = 0;
    rebuild();
    connect();

    auto live = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    auto done = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 2; }));
    status(placedAt(1).orderId, LegStatus::CANCELLED);

    ASSERT_TRUE(waitFor([&] { return !engine_->getOrder(done.groupId).has_value(); }));
    ASSERT_TRUE(engine_->getOrder(live.groupId).has_value());
    EXPECT_EQ(engine_->getOrder(live.groupId)->state, GroupState::AWAITING_ENTRY);
}

// ============================================================================
// ОТКЛОНЕНИЯ БРОКЕРА
// ============================================================================

TEST_F(OrderEngineTest, BrokerRejectsEntry_GroupRejectedWithBrokerText) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));

    broker_->emit(ErrorMessage{placedAt(0).orderId, broker_codes::ORDER_REJECTED,
                               "Order rejected - reason: insufficient margin"});

    ASSERT_TRUE(waitState(result.groupId, GroupState::REJECTED));
    auto order = *engine_->getOrder(result.groupId);
    ASSERT_TRUE(order.failure.has_value());
    EXPECT_EQ(order.failure->code, ErrorCode::BROKER_REJECTED);
    EXPECT_EQ(order.failure->message, "Order rejected - reason: insufficient margin");
    EXPECT_EQ(order.entry.status, LegStatus::REJECTED);
}

TEST_F(OrderEngineTest, InformationalBrokerMessage_DoesNotReject) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));

    broker_->emit(ErrorMessage{placedAt(0).orderId, 2104, "Market data farm connection is OK"});
    broker_->emit(ErrorMessage{placedAt(0).orderId, 399, "Order will not be placed until open"});

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(stateOf(result.groupId), GroupState::AWAITING_ENTRY);
}

TEST_F(OrderEngineTest, MarketDataError_NeverRejectsLiveOrder) {
    ON_CALL(*broker_, nextOrderId()).WillByDefault(Return(1001));
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    EXPECT_EQ(placedAt(0).orderId, 1001);

    auto sub = feed_->subscribe("NOPE");
    ASSERT_TRUE(sub.success);
    EXPECT_NE(sub.tickerId, placedAt(0).orderId);

    broker_->emit(ErrorMessage{sub.tickerId, broker_codes::NO_SECURITY_DEFINITION,
                               "No security definition has been found for the request"});

    ASSERT_TRUE(waitFor([this] { return !feed_->isSubscribed("NOPE"); }));
    auto order = *engine_->getOrder(result.groupId);
    EXPECT_EQ(order.entry.status, LegStatus::SUBMITTED);
    EXPECT_EQ(order.state, GroupState::AWAITING_ENTRY);
    EXPECT_FALSE(order.failure.has_value());

    // Позднее исполнение по-прежнему выставляет защиту
    fill(placedAt(0).orderId, 2, "3.00");
    ASSERT_TRUE(waitState(result.groupId, GroupState::BRACKET_ACTIVE));
}

// ============================================================================
// ПОВТОРЫ ОТПРАВКИ
// ============================================================================

TEST_F(OrderEngineTest, Submit_TransientFailures_RejectedAfterRetryLimit) {
    connect();
    // id выдаёт ConnectionManager, брокер спрашивается только при подключении
    EXPECT_CALL(*broker_, nextOrderId()).Times(0);
    EXPECT_CALL(*broker_, placeOrder(_, _, _))
        .Times(3)
        .WillRepeatedly(Throw(domain::EngineException(ErrorCode::TIMEOUT, "Socket write timed out")));

    auto result = engine_->placeBracketOrder(optionRequest());

    ASSERT_TRUE(waitState(result.groupId, GroupState::REJECTED));
    auto order = *engine_->getOrder(result.groupId);
    ASSERT_TRUE(order.failure.has_value());
    EXPECT_EQ(order.failure->code, ErrorCode::CONNECTION_ERROR);
    EXPECT_NE(order.failure->message.find("Submission failed after 3 attempts"), std::string::npos);
}

TEST_F(OrderEngineTest, Submit_TransientThenSuccess_SameOrderIdReused) {
    connect();
    std::vector<int64_t> ids;
    std::mutex idsMutex;
    int calls = 0;
    EXPECT_CALL(*broker_, placeOrder(_, _, _))
        .Times(2)
        .WillRepeatedly(Invoke([&](int64_t id, const domain::Contract&, const BrokerOrder&) {
            std::lock_guard<std::mutex> lock(idsMutex);
            ids.push_back(id);
            if (++calls == 1) {
                throw domain::EngineException(ErrorCode::TIMEOUT, "Socket write timed out");
            }
        }));

    auto result = engine_->placeBracketOrder(optionRequest());

    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    std::lock_guard<std::mutex> lock(idsMutex);
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], ids[1]);
}

TEST_F(OrderEngineTest, Submit_NonTransientFailure_RejectedImmediately) {
    connect();
    EXPECT_CALL(*broker_, placeOrder(_, _, _))
        .Times(1)
        .WillOnce(Throw(domain::EngineException(ErrorCode::BROKER_REJECTED, "Invalid contract")));

    auto result = engine_->placeBracketOrder(optionRequest());

    ASSERT_TRUE(waitState(result.groupId, GroupState::REJECTED));
    EXPECT_EQ(engine_->getOrder(result.groupId)->failure->code, ErrorCode::BROKER_REJECTED);
}

TEST_F(OrderEngineTest, Shutdown_StopsRetryTimers) {
    config_.submitRetryDelay = std::chrono::milliseconds(100);
    rebuild();
    connect();

    EXPECT_CALL(*broker_, placeOrder(_, _, _))
        .Times(1)
        .WillRepeatedly(Throw(domain::EngineException(ErrorCode::TIMEOUT, "Socket write timed out")));

    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([&] { return engine_->getOrder(result.groupId)->entry.submitAttempts == 1; }));

    engine_->shutdown();
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    EXPECT_EQ(engine_->getOrder(result.groupId)->entry.status, LegStatus::PENDING);
}

// ============================================================================
// СЕССИЯ
// ============================================================================

TEST_F(OrderEngineTest, Reconnect_FillReportedInOrderList_BracketActivated) {
    connect();
    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    int64_t entryId = placedAt(0).orderId;

    // Пока связи не было, вход исполнился
    ON_CALL(*broker_, requestAllOrders()).WillByDefault(Invoke([this, entryId]() {
        broker_->emit(OrderStatusMessage{entryId, LegStatus::FILLED, 2, Decimal(3, 0), ""});
        broker_->emit(OrderListEndMessage{});
    }));
    EXPECT_CALL(*broker_, requestAllOrders()).Times(AtLeast(1));

    broker_->emit(ConnectionClosedMessage{"Socket closed"});

    ASSERT_TRUE(waitState(result.groupId, GroupState::BRACKET_ACTIVE));
    ASSERT_TRUE(waitFor([this] { return placedCount() == 3; }));
}

TEST_F(OrderEngineTest, Reconnect_PendingLegWaitsThenSubmits) {
    connect();
    // Переподключение первый раз не удаётся: нога ждёт CONNECTED
    EXPECT_CALL(*broker_, connect(_, _, _, _))
        .WillOnce(Return(ConnectOutcome::fail(ErrorCode::CONNECTION_ERROR, "refused")))
        .WillRepeatedly(Return(ConnectOutcome::ok()));

    broker_->emit(ConnectionClosedMessage{"Socket closed"});
    ASSERT_TRUE(waitFor([this] { return connection_->state() == ConnectionState::RECONNECTING; }));

    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(result.success);

    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    ASSERT_TRUE(waitFor([&] {
        return engine_->getOrder(result.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
}

TEST_F(OrderEngineTest, ConnectionFailed_PendingLegsRejected) {
    config_.reconnectBaseDelay = std::chrono::milliseconds(100);
    config_.reconnectMaxDelay = std::chrono::milliseconds(100);
    config_.reconnectMaxRetries = 2;
    rebuild();
    connect();
    EXPECT_CALL(*broker_, connect(_, _, _, _))
        .WillRepeatedly(Return(ConnectOutcome::fail(ErrorCode::CONNECTION_ERROR, "refused")));
    EXPECT_CALL(*broker_, placeOrder(_, _, _)).Times(0);

    broker_->emit(ConnectionClosedMessage{"Socket closed"});
    ASSERT_TRUE(waitFor([this] { return connection_->state() == ConnectionState::RECONNECTING; }));

    auto result = engine_->placeBracketOrder(optionRequest());
    ASSERT_TRUE(result.success);

    ASSERT_TRUE(waitState(result.groupId, GroupState::REJECTED));
    EXPECT_EQ(engine_->getOrder(result.groupId)->failure->code, ErrorCode::CONNECTION_ERROR);
}

// ============================================================================
// ЗАКРЫТИЕ ПОЗИЦИИ / СПИСОК
// ============================================================================

TEST_F(OrderEngineTest, ClosePosition_Long_MarketSellForWholeSize) {
    connect();
    domain::PositionPnl position;
    position.symbol = "SPY 20250117 450.00C";
    position.contract = domain::Contract::option("SPY", "20250117", Decimal(450, 0),
                                                 domain::OptionRight::CALL);
    position.contract.exchange = "CBOE";
    position.position = Decimal(2, 0);

    auto result = engine_->closePosition(position);

    ASSERT_TRUE(result.success);
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    auto order = placedAt(0);
    EXPECT_EQ(order.order.side, OrderSide::SELL);
    EXPECT_EQ(order.order.type, OrderType::MARKET);
    EXPECT_EQ(order.order.quantity, 2);
    EXPECT_EQ(order.contract.exchange, "SMART");
}

TEST_F(OrderEngineTest, ClosePosition_Short_MarketBuy) {
    connect();
    domain::PositionPnl position;
    position.symbol = "QQQ";
    position.contract = domain::Contract::stock("QQQ");
    position.position = Decimal(-5, 0);

    ASSERT_TRUE(engine_->closePosition(position).success);
    ASSERT_TRUE(waitFor([this] { return placedCount() == 1; }));
    EXPECT_EQ(placedAt(0).order.side, OrderSide::BUY);
    EXPECT_EQ(placedAt(0).order.quantity, 5);
}

TEST_F(OrderEngineTest, ClosePosition_Flat_InvalidRequest) {
    connect();
    domain::PositionPnl position;
    position.symbol = "SPY";
    position.contract = domain::Contract::stock("SPY");

    EXPECT_EQ(engine_->closePosition(position).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(OrderEngineTest, ListOrders_SortedByCreation) {
    connect();
    auto first = engine_->placeBracketOrder(optionRequest());
    clock_->advance(std::chrono::milliseconds(1000));
    auto second = engine_->placeBracketOrder(optionRequest());

    auto orders = engine_->listOrders();

    ASSERT_EQ(orders.size(), 2u);
    EXPECT_EQ(orders[0].groupId, first.groupId);
    EXPECT_EQ(orders[1].groupId, second.groupId);
}
