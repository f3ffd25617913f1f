/**
 * @file TradingFlowTest.cpp
 * @brief Сквозные сценарии: терминал + брокер в памяти
 *
 * Проверяет:
 * - Подключение, список наблюдения, лестницу страйков
 * - Полный цикл брекета на опционе с OCO у брокера
 * - Сверку после обрыва связи
 * - Закрытие всех позиций
 */

#include <gtest/gtest.h>

#include "adapters/secondary/broker/SimulatedTwsGateway.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "application/TradingTerminal.hpp"
#include "domain/events/ConnectionStateChangedEvent.hpp"
#include "../mocks/FixedClock.hpp"
#include "../mocks/TestSupport.hpp"
#include <algorithm>
#include <mutex>

using namespace ibtrader;
using namespace ibtrader::ports::input;
using adapters::secondary::InMemoryEventBus;
using adapters::secondary::SimulatedInstrument;
using adapters::secondary::SimulatedTwsGateway;
using application::TradingTerminal;
using domain::Decimal;
using domain::ErrorCode;
using domain::GroupState;
using domain::LegStatus;
using tests::FixedClock;
using tests::waitFor;

class TradingFlowTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.defaultStopLossPct = Decimal(20, 0);
        config_.defaultTakeProfitPct = Decimal(30, 0);
        config_.validationTimeout = std::chrono::milliseconds(500);
        config_.reconnectBaseDelay = std::chrono::milliseconds(20);
        config_.reconnectMaxDelay = std::chrono::milliseconds(40);
        config_.accountRefreshInterval = std::chrono::milliseconds(50);
        config_.eventLoopThreads = 2;

        gateway_ = std::make_shared<SimulatedTwsGateway>();
        eventBus_ = std::make_shared<InMemoryEventBus>();
        clock_ = std::make_shared<FixedClock>(FixedClock::WEDNESDAY_10_00_ET);
        terminal_ = std::make_unique<TradingTerminal>(config_, gateway_, eventBus_, clock_);
    }

    void TearDown() override {
        terminal_->shutdown();
        eventBus_->clear();
    }

    void connectAndWatchSpy() {
        ASSERT_TRUE(terminal_->connect().success);
        ASSERT_TRUE(terminal_->addTicker("SPY").success);
        ASSERT_TRUE(waitFor([this] {
            auto quote = terminal_->latestQuote("SPY");
            return quote && quote->isKnown();
        }));
    }

    PlaceOrderRequest spyCall(const std::string& expiry, const char* limit) {
        PlaceOrderRequest request;
        request.ticker = "SPY";
        request.quantity = 2;
        request.limitPrice = Decimal::fromString(limit);
        request.expiry = expiry;
        request.strike = Decimal(450, 0);
        request.right = domain::OptionRight::CALL;
        return request;
    }

    std::string nearestExpiry() {
        auto ladder = terminal_->getStrikeLadder("SPY");
        EXPECT_TRUE(ladder.success) << ladder.error;
        return ladder.ladder.expiry;
    }

    bool waitState(const std::string& groupId, GroupState state) {
        return waitFor([&] {
            auto order = terminal_->getOrder(groupId);
            return order && order->state == state;
        });
    }

    bool hasPosition(const std::string& symbol) {
        return terminal_->getSnapshot().findPosition(symbol) != nullptr;
    }

    settings::EngineConfig config_;
    std::shared_ptr<SimulatedTwsGateway> gateway_;
    std::shared_ptr<InMemoryEventBus> eventBus_;
    std::shared_ptr<FixedClock> clock_;
    std::unique_ptr<TradingTerminal> terminal_;
};

// ============================================================================
// СЕССИЯ И СПИСОК НАБЛЮДЕНИЯ
// ============================================================================

TEST_F(TradingFlowTest, Connect_PublishesStateAndSession) {
    std::vector<std::string> states;
    std::mutex statesMutex;
    eventBus_->subscribe(domain::ConnectionStateChangedEvent::TYPE, [&](const domain::DomainEvent& e) {
        std::lock_guard<std::mutex> lock(statesMutex);
        states.push_back(toString(static_cast<const domain::ConnectionStateChangedEvent&>(e).session.state));
    });

    auto result = terminal_->connect();
    eventBus_->unsubscribe(domain::ConnectionStateChangedEvent::TYPE);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.session.state, domain::ConnectionState::CONNECTED);
    EXPECT_EQ(result.session.port, 7497);
    std::lock_guard<std::mutex> lock(statesMutex);
    EXPECT_EQ(states, (std::vector<std::string>{"CONNECTING", "CONNECTED"}));
}

TEST_F(TradingFlowTest, Connect_ClientIdInUse_Failed) {
    gateway_->rejectClientId(1);

    auto result = terminal_->connect();

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.code, ErrorCode::AUTH_REJECTED);
    EXPECT_EQ(result.session.state, domain::ConnectionState::FAILED);
}

TEST_F(TradingFlowTest, AddTicker_ValidatedSubscribedAndLaddered) {
    ASSERT_TRUE(terminal_->connect().success);

    auto added = terminal_->addTicker("spy");

    ASSERT_TRUE(added.success) << added.error;
    EXPECT_EQ(added.symbol, "SPY");
    EXPECT_EQ(added.conId, 756733);
    EXPECT_EQ(added.chain.tradingClass, "SPY");
    EXPECT_EQ(terminal_->watchlist(), (std::vector<std::string>{"SPY"}));

    ASSERT_TRUE(waitFor([this] {
        auto quote = terminal_->latestQuote("SPY");
        return quote && quote->isKnown();
    }));
    EXPECT_EQ(*terminal_->latestQuote("SPY")->marketPrice(), Decimal(450, 0));

    auto ladder = terminal_->getStrikeLadder("SPY");
    ASSERT_TRUE(ladder.success) << ladder.error;
    EXPECT_EQ(ladder.ladder.strikes.size(), 12u);
    EXPECT_TRUE(std::is_sorted(ladder.ladder.strikes.rbegin(), ladder.ladder.strikes.rend()));
    EXPECT_NE(std::find(ladder.ladder.strikes.begin(), ladder.ladder.strikes.end(), Decimal(450, 0)),
              ladder.ladder.strikes.end());
    EXPECT_EQ(ladder.ladder.expiry, added.chain.expirations.front());
}

TEST_F(TradingFlowTest, AddTicker_Unknown_NotWatched) {
    ASSERT_TRUE(terminal_->connect().success);

    auto added = terminal_->addTicker("NOPE");

    EXPECT_FALSE(added.success);
    EXPECT_EQ(added.code, ErrorCode::UNKNOWN_SYMBOL);
    EXPECT_TRUE(terminal_->watchlist().empty());
    EXPECT_FALSE(terminal_->latestQuote("NOPE").has_value());
}

TEST_F(TradingFlowTest, AddTicker_NoListedOptions_NotWatched) {
    SimulatedInstrument instrument;
    instrument.symbol = "BRKA";
    instrument.conId = 1;
    instrument.price = Decimal(600000, 0);
    instrument.hasOptions = false;
    gateway_->addInstrument(instrument);
    ASSERT_TRUE(terminal_->connect().success);

    auto added = terminal_->addTicker("brka");

    EXPECT_FALSE(added.success);
    EXPECT_EQ(added.code, ErrorCode::NO_OPTIONS_AVAILABLE);
    EXPECT_TRUE(terminal_->watchlist().empty());
}

TEST_F(TradingFlowTest, RemoveTicker_StopsQuotes) {
    connectAndWatchSpy();

    EXPECT_TRUE(terminal_->removeTicker("SPY"));

    EXPECT_TRUE(terminal_->watchlist().empty());
    EXPECT_FALSE(terminal_->latestQuote("SPY").has_value());
    EXPECT_FALSE(terminal_->removeTicker("SPY"));
}

// ============================================================================
// БРЕКЕТ
// ============================================================================

TEST_F(TradingFlowTest, OptionBracket_TakeProfitHit_StopCancelledByOca) {
    connectAndWatchSpy();
    const std::string expiry = nearestExpiry();
    const std::string key = "SPY " + expiry + " 450.00C";

    // Опцион стоит 4.50, лимит 5.00 исполняется сразу по 4.50
    auto placed = terminal_->placeBracketOrder(spyCall(expiry, "5.00"));
    ASSERT_TRUE(placed.success) << placed.error;
    ASSERT_TRUE(waitState(placed.groupId, GroupState::BRACKET_ACTIVE));

    auto order = *terminal_->getOrder(placed.groupId);
    EXPECT_EQ(*order.entry.fillPrice(), Decimal::fromString("4.50"));
    EXPECT_EQ(*order.stopLoss->stopPrice, Decimal::fromString("3.60"));
    EXPECT_EQ(*order.takeProfit->limitPrice, Decimal::fromString("5.90"));
    ASSERT_TRUE(waitFor([&] {
        auto o = terminal_->getOrder(placed.groupId);
        return o->stopLoss->status == LegStatus::SUBMITTED &&
               o->takeProfit->status == LegStatus::SUBMITTED;
    }));
    ASSERT_TRUE(waitFor([&] { return hasPosition(key); }));

    gateway_->setPrice(key, Decimal(6, 0));

    ASSERT_TRUE(waitState(placed.groupId, GroupState::CLOSED));
    auto closed = *terminal_->getOrder(placed.groupId);
    EXPECT_EQ(closed.takeProfit->status, LegStatus::FILLED);
    EXPECT_EQ(closed.stopLoss->status, LegStatus::CANCELLED);
    EXPECT_EQ(gateway_->order(*closed.stopLoss->brokerOrderId)->status, LegStatus::CANCELLED);
    EXPECT_EQ(gateway_->order(*closed.takeProfit->brokerOrderId)->order.ocaGroup,
              "OCA_" + placed.groupId);

    ASSERT_TRUE(waitFor([&] { return !hasPosition(key); }));
}

TEST_F(TradingFlowTest, OptionBracket_StopHit_Closed) {
    connectAndWatchSpy();
    const std::string expiry = nearestExpiry();
    const std::string key = "SPY " + expiry + " 450.00C";

    auto placed = terminal_->placeBracketOrder(spyCall(expiry, "5.00"));
    ASSERT_TRUE(waitFor([&] {
        auto o = terminal_->getOrder(placed.groupId);
        return o && o->stopLoss && o->stopLoss->status == LegStatus::SUBMITTED &&
               o->takeProfit && o->takeProfit->status == LegStatus::SUBMITTED;
    }));

    gateway_->setPrice(key, Decimal::fromString("3.50"));

    ASSERT_TRUE(waitState(placed.groupId, GroupState::CLOSED));
    auto closed = *terminal_->getOrder(placed.groupId);
    EXPECT_EQ(closed.stopLoss->status, LegStatus::FILLED);
    EXPECT_EQ(closed.takeProfit->status, LegStatus::CANCELLED);
}

TEST_F(TradingFlowTest, CancelBeforeFill_NoRiskLegsAtBroker) {
    connectAndWatchSpy();

    // Лимит 4.00 ниже рынка: вход ждёт
    auto placed = terminal_->placeBracketOrder(spyCall(nearestExpiry(), "4.00"));
    ASSERT_TRUE(waitFor([&] {
        return terminal_->getOrder(placed.groupId)->entry.status == LegStatus::SUBMITTED;
    }));

    auto cancelled = terminal_->cancelOrder(placed.groupId);

    ASSERT_TRUE(cancelled.success) << cancelled.error;
    ASSERT_TRUE(waitState(placed.groupId, GroupState::CANCELLED));
    EXPECT_EQ(gateway_->orders().size(), 1u);
}

TEST_F(TradingFlowTest, BrokerRejectsEntry_Rejected) {
    connectAndWatchSpy();
    gateway_->rejectNextOrder(" insufficient margin");

    auto placed = terminal_->placeBracketOrder(spyCall(nearestExpiry(), "5.00"));

    ASSERT_TRUE(waitState(placed.groupId, GroupState::REJECTED));
    auto order = *terminal_->getOrder(placed.groupId);
    EXPECT_EQ(order.failure->code, ErrorCode::BROKER_REJECTED);
    EXPECT_EQ(order.failure->message, "Order rejected - reason: insufficient margin");
}

TEST_F(TradingFlowTest, OptionOrderWithoutStrike_InvalidRequest) {
    connectAndWatchSpy();
    auto request = spyCall(nearestExpiry(), "5.00");
    request.strike.reset();

    auto placed = terminal_->placeBracketOrder(request);

    EXPECT_EQ(placed.code, ErrorCode::INVALID_REQUEST);
}

TEST_F(TradingFlowTest, MarketClosed_OrderRejectedUpFront) {
    connectAndWatchSpy();
    clock_->set(FixedClock::SATURDAY_10_00_ET);

    auto placed = terminal_->placeBracketOrder(spyCall(nearestExpiry(), "5.00"));

    EXPECT_EQ(placed.code, ErrorCode::MARKET_CLOSED);
    EXPECT_TRUE(gateway_->orders().empty());
}

// ============================================================================
// ОБРЫВ СВЯЗИ
// ============================================================================

TEST_F(TradingFlowTest, FillDuringOutage_BracketPlacedAfterReconnect) {
    connectAndWatchSpy();
    auto placed = terminal_->placeBracketOrder(spyCall(nearestExpiry(), "4.00"));
    ASSERT_TRUE(waitFor([&] {
        return terminal_->getOrder(placed.groupId)->entry.status == LegStatus::SUBMITTED;
    }));
    int64_t entryId = *terminal_->getOrder(placed.groupId)->entry.brokerOrderId;

    gateway_->dropConnection("Socket reset by peer");
    ASSERT_TRUE(gateway_->fillOrder(entryId, Decimal(4, 0)));

    ASSERT_TRUE(waitState(placed.groupId, GroupState::BRACKET_ACTIVE));
    auto order = *terminal_->getOrder(placed.groupId);
    EXPECT_EQ(*order.stopLoss->stopPrice, Decimal::fromString("3.20"));
    EXPECT_EQ(terminal_->session().state, domain::ConnectionState::CONNECTED);

    // Список наблюдения подписан заново
    ASSERT_TRUE(waitFor([this] {
        auto quote = terminal_->latestQuote("SPY");
        return quote && quote->isKnown();
    }));
}

// ============================================================================
// ПОЗИЦИИ
// ============================================================================

TEST_F(TradingFlowTest, CloseAllPositions_MarketOrdersFlattenAccount) {
    ASSERT_TRUE(terminal_->connect().success);
    gateway_->setPosition(domain::Contract::stock("QQQ"), Decimal(10, 0), Decimal(380, 0));
    ASSERT_TRUE(waitFor([this] { return hasPosition("QQQ"); }));

    auto result = terminal_->closeAllPositions();

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.closed, 1);
    EXPECT_EQ(result.failed, 0);
    EXPECT_EQ(result.message, "Successfully closed 1 positions");
    ASSERT_EQ(result.groupIds.size(), 1u);

    ASSERT_TRUE(waitState(result.groupIds[0], GroupState::CLOSED));
    ASSERT_TRUE(waitFor([this] { return !hasPosition("QQQ"); }));
}

TEST_F(TradingFlowTest, ClosePosition_Unknown_NotFound) {
    ASSERT_TRUE(terminal_->connect().success);

    auto result = terminal_->closePosition("IWM");

    EXPECT_EQ(result.code, ErrorCode::NOT_FOUND);
}

TEST_F(TradingFlowTest, Snapshot_CashFromBroker) {
    ASSERT_TRUE(terminal_->connect().success);

    ASSERT_TRUE(waitFor([this] { return terminal_->getSnapshot().hasData(); }));

    auto snapshot = terminal_->getSnapshot();
    EXPECT_EQ(snapshot.cashBalance, Decimal(100000, 0));
    EXPECT_FALSE(snapshot.stale);
}
