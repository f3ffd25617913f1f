#include "application/PortfolioTracker.hpp"
#include "domain/events/AccountSnapshotUpdatedEvent.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <iostream>

namespace ibtrader::application {

using domain::Decimal;
using domain::EngineException;
using namespace ports::output;

PortfolioTracker::PortfolioTracker(
    EventLoop& loop,
    const settings::EngineConfig& config,
    std::shared_ptr<ConnectionManager> connection,
    std::shared_ptr<IEventBus> eventBus,
    std::shared_ptr<IClock> clock
) : config_(config)
  , connection_(std::move(connection))
  , eventBus_(std::move(eventBus))
  , clock_(std::move(clock))
  , strand_(loop.makeStrand())
  , timer_(strand_)
{}

void PortfolioTracker::attach(BrokerMessageDispatcher& dispatcher) {
    std::weak_ptr<PortfolioTracker> weak = weak_from_this();

    dispatcher.route<AccountValueMessage>(strand_, [weak](const AccountValueMessage& m) {
        if (auto self = weak.lock()) {
            self->onAccountValue(m);
        }
    });
    dispatcher.route<PortfolioValueMessage>(strand_, [weak](const PortfolioValueMessage& m) {
        if (auto self = weak.lock()) {
            self->onPortfolioValue(m);
        }
    });
    dispatcher.route<AccountDownloadEndMessage>(strand_, [weak](const AccountDownloadEndMessage&) {
        if (auto self = weak.lock()) {
            self->onDownloadEnd();
        }
    });
}

void PortfolioTracker::start() {
    scheduleTick();
}

domain::AccountSnapshot PortfolioTracker::getSnapshot() const {
    domain::AccountSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = snapshot_;
    }
    snapshot.stale = isStale(snapshot);
    return snapshot;
}

bool PortfolioTracker::refresh() {
    try {
        connection_->send([](IBrokerSession& broker) { broker.requestAccountUpdates(true); });
        return true;
    } catch (const EngineException& e) {
        std::cerr << "[PortfolioTracker] Refresh skipped: " << e.what() << std::endl;
        return false;
    }
}

void PortfolioTracker::onConnectionStateChanged(domain::ConnectionState,
                                                domain::ConnectionState current) {
    if (current == domain::ConnectionState::CONNECTED) {
        refresh();
    }
}

void PortfolioTracker::shutdown() {
    stopped_ = true;
    std::weak_ptr<PortfolioTracker> weak = weak_from_this();
    boost::asio::post(strand_, [weak]() {
        if (auto self = weak.lock()) {
            self->timer_.cancel();
        }
    });
}

void PortfolioTracker::onAccountValue(const AccountValueMessage& message) {
    if (message.currency != "USD" && message.currency != "BASE") {
        return;
    }

    std::optional<Decimal> AccountValues::* field = nullptr;
    if (message.tag == "NetLiquidation")               field = &AccountValues::netLiquidation;
    else if (message.tag == "TotalCashValue")          field = &AccountValues::totalCash;
    else if (message.tag == "LookAheadAvailableFunds") field = &AccountValues::availableFunds;
    else if (message.tag == "DailyPnL")                field = &AccountValues::dailyPnl;
    else if (message.tag == "RealizedPnL")             field = &AccountValues::realizedPnl;
    else if (message.tag == "UnrealizedPnL")           field = &AccountValues::unrealizedPnl;
    else return;

    try {
        Decimal value = Decimal::fromString(message.value);
        std::lock_guard<std::mutex> lock(mutex_);
        values_.*field = value;
    } catch (const std::invalid_argument&) {
        std::cerr << "[PortfolioTracker] Bad value for " << message.tag << ": '"
                  << message.value << "'" << std::endl;
    }
}

void PortfolioTracker::onPortfolioValue(const PortfolioValueMessage& message) {
    std::string key = message.contract.key();
    std::lock_guard<std::mutex> lock(mutex_);

    if (message.position.isZero()) {
        positions_.erase(key);
        return;
    }

    domain::PositionPnl row;
    row.symbol = key;
    row.contract = message.contract;
    row.position = message.position;
    row.averageCost = message.averageCost;
    if (message.contract.isOption() && message.contract.multiplier > 1) {
        // Брокер даёт стоимость контракта, показываем цену за акцию
        row.averageCost = message.averageCost.dividedBy(message.contract.multiplier);
    }
    row.marketPrice = message.marketPrice;
    row.marketValue = message.marketValue;
    row.unrealizedPnl = message.unrealizedPnl;
    row.realizedPnl = message.realizedPnl;
    positions_[key] = row;
}

void PortfolioTracker::onDownloadEnd() {
    if (stopped_) {
        return;
    }

    domain::AccountSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.netLiquidation = values_.netLiquidation.value_or(Decimal());
        snapshot.cashBalance = values_.totalCash.value_or(Decimal());
        snapshot.availableFunds = values_.availableFunds.value_or(Decimal());
        snapshot.realizedPnl = values_.realizedPnl.value_or(Decimal());
        snapshot.unrealizedPnl = values_.unrealizedPnl.value_or(Decimal());
        snapshot.dailyPnl = values_.dailyPnl.value_or(Decimal());

        // Нет DailyPnL - считаем как realized + unrealized
        if (snapshot.dailyPnl.isZero()) {
            snapshot.dailyPnl = snapshot.realizedPnl + snapshot.unrealizedPnl;
        }

        for (const auto& entry : positions_) {
            snapshot.positions.push_back(entry.second);
        }
        snapshot.updatedAt = clock_->now();
        snapshot.stale = false;
        snapshot_ = snapshot;
        staleReported_ = false;
    }

    domain::AccountSnapshotUpdatedEvent event;
    event.snapshot = snapshot;
    eventBus_->publish(event);
}

void PortfolioTracker::scheduleTick() {
    std::weak_ptr<PortfolioTracker> weak = weak_from_this();
    boost::asio::post(strand_, [weak]() {
        auto self = weak.lock();
        if (!self || self->stopped_) {
            return;
        }
        self->timer_.expires_after(self->config_.accountRefreshInterval);
        self->timer_.async_wait(boost::asio::bind_executor(self->strand_,
            [weak](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (auto s = weak.lock()) {
                    s->onTick();
                }
            }));
    });
}

void PortfolioTracker::onTick() {
    if (stopped_) {
        return;
    }

    if (connection_->isConnected()) {
        refresh();
    }

    domain::AccountSnapshot staleSnapshot;
    bool publishStale = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (snapshot_.hasData() && !staleReported_ && isStale(snapshot_)) {
            staleReported_ = true;
            staleSnapshot = snapshot_;
            staleSnapshot.stale = true;
            publishStale = true;
        }
    }
    if (publishStale) {
        std::cerr << "[PortfolioTracker] Account snapshot is stale" << std::endl;
        domain::AccountSnapshotUpdatedEvent event;
        event.snapshot = staleSnapshot;
        eventBus_->publish(event);
    }

    scheduleTick();
}

bool PortfolioTracker::isStale(const domain::AccountSnapshot& snapshot) const {
    if (!snapshot.updatedAt || !connection_->isConnected()) {
        return true;
    }
    return snapshot.updatedAt->ageAt(clock_->now()) > config_.accountStaleAfter;
}

} // namespace ibtrader::application
