/**
 * @file InMemoryEventBusTest.cpp
 * @brief Тесты для InMemoryEventBus и JSON-представления событий
 *
 * Проверяет:
 * - Публикацию и подписку на события
 * - Несколько подписчиков на одно событие
 * - Изоляцию ошибок обработчиков
 * - Сериализацию событий для интерфейса
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/events/AccountSnapshotUpdatedEvent.hpp"
#include "domain/events/ConnectionStateChangedEvent.hpp"
#include "domain/events/OrderStateChangedEvent.hpp"
#include "domain/events/QuoteUpdatedEvent.hpp"

using namespace ibtrader::adapters::secondary;
using namespace ibtrader::domain;

// ============================================================================
// TEST FIXTURE
// ============================================================================

class InMemoryEventBusTest : public ::testing::Test {
protected:
    void SetUp() override {
        eventBus_ = std::make_unique<InMemoryEventBus>();
    }

    void TearDown() override {
        eventBus_->clear();
        eventBus_.reset();
    }

    QuoteUpdatedEvent createQuoteEvent(const std::string& key, const char* last) {
        Quote quote;
        quote.key = key;
        quote.state = QuoteState::LIVE;
        quote.last = Decimal::fromString(last);
        return QuoteUpdatedEvent(quote);
    }

    OrderStateChangedEvent createOrderEvent(const std::string& groupId, GroupState state) {
        OrderStateChangedEvent event;
        event.order.groupId = groupId;
        event.order.contract = Contract::option("SPY", "20250117", Decimal(450, 0), OptionRight::CALL);
        event.order.state = state;
        event.order.entry.quantity = 2;
        event.order.entry.type = OrderType::LIMIT;
        event.order.entry.limitPrice = Decimal(3, 0);
        event.changedLeg = LegRole::ENTRY;
        event.message = "Order accepted";
        return event;
    }

    std::unique_ptr<InMemoryEventBus> eventBus_;
};

// ============================================================================
// ПОДПИСКА И ПУБЛИКАЦИЯ
// ============================================================================

TEST_F(InMemoryEventBusTest, Publish_SubscribedHandler_ReceivesEvent) {
    std::string receivedKey;
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent& event) {
        receivedKey = static_cast<const QuoteUpdatedEvent&>(event).quote.key;
    });

    eventBus_->publish(createQuoteEvent("SPY", "450.25"));

    EXPECT_EQ(receivedKey, "SPY");
}

TEST_F(InMemoryEventBusTest, Publish_MultipleSubscribers_AllCalledInOrder) {
    std::vector<int> calls;
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) { calls.push_back(1); });
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) { calls.push_back(2); });

    eventBus_->publish(createQuoteEvent("QQQ", "380.00"));

    EXPECT_EQ(calls, (std::vector<int>{1, 2}));
    EXPECT_EQ(eventBus_->subscriberCount(QuoteUpdatedEvent::TYPE), 2u);
}

TEST_F(InMemoryEventBusTest, Publish_OtherType_NotDelivered) {
    int quoteCalls = 0;
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) { ++quoteCalls; });

    eventBus_->publish(createOrderEvent("brk-1", GroupState::AWAITING_ENTRY));

    EXPECT_EQ(quoteCalls, 0);
}

TEST_F(InMemoryEventBusTest, Publish_NoSubscribers_NoThrow) {
    EXPECT_NO_THROW(eventBus_->publish(createQuoteEvent("SPY", "450.00")));
    EXPECT_FALSE(eventBus_->hasSubscribers(QuoteUpdatedEvent::TYPE));
}

TEST_F(InMemoryEventBusTest, Publish_ThrowingHandler_OthersStillCalled) {
    bool secondCalled = false;
    eventBus_->subscribe(OrderStateChangedEvent::TYPE, [](const DomainEvent&) {
        throw std::runtime_error("handler failure");
    });
    eventBus_->subscribe(OrderStateChangedEvent::TYPE, [&](const DomainEvent&) {
        secondCalled = true;
    });

    EXPECT_NO_THROW(eventBus_->publish(createOrderEvent("brk-1", GroupState::CLOSED)));
    EXPECT_TRUE(secondCalled);
}

TEST_F(InMemoryEventBusTest, Publish_HandlerSubscribesDuringDelivery_NoDeadlock) {
    int nested = 0;
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) {
        eventBus_->subscribe(AccountSnapshotUpdatedEvent::TYPE, [&](const DomainEvent&) { ++nested; });
    });

    eventBus_->publish(createQuoteEvent("SPY", "450.00"));
    eventBus_->publish(AccountSnapshotUpdatedEvent());

    EXPECT_EQ(nested, 1);
}

TEST_F(InMemoryEventBusTest, Unsubscribe_RemovesAllHandlersOfType) {
    int calls = 0;
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });
    eventBus_->subscribe(QuoteUpdatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });

    eventBus_->unsubscribe(QuoteUpdatedEvent::TYPE);
    eventBus_->publish(createQuoteEvent("SPY", "450.00"));

    EXPECT_EQ(calls, 0);
    EXPECT_EQ(eventBus_->subscriberCount(QuoteUpdatedEvent::TYPE), 0u);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(InMemoryEventBusTest, QuoteEvent_ToJson_PricesAsStrings) {
    auto json = nlohmann::json::parse(createQuoteEvent("SPY", "450.25").toJson());

    EXPECT_EQ(json["eventType"], "quote.updated");
    EXPECT_EQ(json["quote"]["key"], "SPY");
    EXPECT_EQ(json["quote"]["state"], "LIVE");
    EXPECT_EQ(json["quote"]["last"], "450.25");
    EXPECT_TRUE(json["quote"]["bid"].is_null());
    EXPECT_EQ(json["quote"]["marketPrice"], "450.25");
}

TEST_F(InMemoryEventBusTest, OrderEvent_ToJson_CarriesGroupAndLeg) {
    auto event = createOrderEvent("brk-42", GroupState::AWAITING_ENTRY);
    auto json = nlohmann::json::parse(event.toJson());

    EXPECT_EQ(json["eventType"], "order.state_changed");
    EXPECT_EQ(json["order"]["groupId"], "brk-42");
    EXPECT_EQ(json["order"]["state"], "AWAITING_ENTRY");
    EXPECT_EQ(json["order"]["contract"]["key"], "SPY 20250117 450.00C");
    EXPECT_EQ(json["order"]["entry"]["limitPrice"], "3.00");
    EXPECT_TRUE(json["order"]["stopLoss"].is_null());
    EXPECT_EQ(json["changedLeg"], "ENTRY");
    EXPECT_EQ(json["message"], "Order accepted");
}

TEST_F(InMemoryEventBusTest, Events_HaveUniqueIds) {
    auto first = createQuoteEvent("SPY", "1.00");
    auto second = createQuoteEvent("SPY", "1.00");

    EXPECT_FALSE(first.eventId.empty());
    EXPECT_NE(first.eventId, second.eventId);
}
