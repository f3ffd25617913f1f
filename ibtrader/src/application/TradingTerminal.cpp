#include "application/TradingTerminal.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>

namespace ibtrader::application {

using domain::ConnectionState;
using domain::EngineException;
using domain::ErrorCode;
using namespace ports::input;

namespace {

std::string normalize(const std::string& ticker) {
    auto begin = std::find_if_not(ticker.begin(), ticker.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(ticker.rbegin(), ticker.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    std::string result = begin < end ? std::string(begin, end) : std::string();
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

} // namespace

TradingTerminal::TradingTerminal(
    const settings::EngineConfig& config,
    std::shared_ptr<ports::output::IBrokerSession> broker,
    std::shared_ptr<ports::output::IEventBus> eventBus,
    std::shared_ptr<ports::output::IClock> clock
) : config_(config)
  , broker_(std::move(broker))
  , eventBus_(std::move(eventBus))
  , clock_(std::move(clock))
  , loop_(std::max<std::size_t>(1, config.eventLoopThreads))
  , dispatcher_(std::make_shared<BrokerMessageDispatcher>())
  , strikeSelector_(config.strikeLadderSize)
  , calendar_(config.tradingWindow)
{
    connection_ = std::make_shared<ConnectionManager>(loop_, config_, broker_, eventBus_);
    marketData_ = std::make_shared<MarketDataFeed>(loop_, connection_, eventBus_);
    validator_ = std::make_shared<WatchlistValidator>(loop_, config_, connection_);
    orderEngine_ = std::make_shared<OrderEngine>(
        loop_, config_, connection_, marketData_, eventBus_, clock_);
    portfolio_ = std::make_shared<PortfolioTracker>(
        loop_, config_, connection_, eventBus_, clock_);

    connection_->attach(*dispatcher_);
    marketData_->attach(*dispatcher_);
    validator_->attach(*dispatcher_);
    orderEngine_->attach(*dispatcher_);
    portfolio_->attach(*dispatcher_);

    // Поток адаптера брокера только публикует в strand'ы
    std::weak_ptr<BrokerMessageDispatcher> weakDispatcher = dispatcher_;
    broker_->setMessageHandler([weakDispatcher](const ports::output::BrokerMessage& message) {
        if (auto dispatcher = weakDispatcher.lock()) {
            dispatcher->dispatch(message);
        }
    });

    std::weak_ptr<MarketDataFeed> weakFeed = marketData_;
    std::weak_ptr<OrderEngine> weakEngine = orderEngine_;
    std::weak_ptr<PortfolioTracker> weakPortfolio = portfolio_;
    connection_->addStateListener([weakFeed](ConnectionState previous, ConnectionState current) {
        if (auto feed = weakFeed.lock()) {
            feed->onConnectionStateChanged(previous, current);
        }
    });
    connection_->addStateListener([weakEngine](ConnectionState previous, ConnectionState current) {
        if (auto engine = weakEngine.lock()) {
            engine->onConnectionStateChanged(previous, current);
        }
    });
    connection_->addStateListener([weakPortfolio](ConnectionState previous, ConnectionState current) {
        if (auto portfolio = weakPortfolio.lock()) {
            portfolio->onConnectionStateChanged(previous, current);
        }
    });
    connection_->addStateListener([this](ConnectionState previous, ConnectionState current) {
        onConnectionStateChanged(previous, current);
    });

    loop_.start();
    portfolio_->start();

    std::cout << "[TradingTerminal] Ready (" << config_.eventLoopThreads
              << " event loop threads)" << std::endl;
}

TradingTerminal::~TradingTerminal() {
    shutdown();
}

// ============================================================================
// Сессия
// ============================================================================

ConnectionResult TradingTerminal::connect() {
    return connect(config_.host, config_.port, config_.clientId);
}

ConnectionResult TradingTerminal::connect(const std::string& host, int port, int clientId) {
    ConnectionResult result;
    if (stopped_) {
        result.code = ErrorCode::NOT_CONNECTED;
        result.error = "Terminal is stopped";
        return result;
    }

    auto connected = connection_->connect(host, port, clientId);
    result.success = connected.success;
    result.code = connected.code;
    result.error = connected.error;
    result.session = connection_->session();
    return result;
}

void TradingTerminal::disconnect() {
    connection_->disconnect();
}

domain::Session TradingTerminal::session() const {
    return connection_->session();
}

void TradingTerminal::onConnectionStateChanged(ConnectionState, ConnectionState current) {
    if (current == ConnectionState::CONNECTED && !stopped_) {
        resubscribeWatchlist();
    }
}

void TradingTerminal::resubscribeWatchlist() {
    std::vector<std::string> symbols = watchlist();
    for (const auto& symbol : symbols) {
        auto subscribed = marketData_->subscribe(domain::Contract::stock(symbol), true);
        if (!subscribed.success) {
            std::cerr << "[TradingTerminal] Resubscribe failed for " << symbol
                      << ": " << subscribed.error << std::endl;
        }
    }
    if (!symbols.empty()) {
        std::cout << "[TradingTerminal] Resubscribed " << symbols.size()
                  << " watchlist ticker(s)" << std::endl;
    }
}

// ============================================================================
// Список наблюдения
// ============================================================================

TickerResult TradingTerminal::validateTicker(const std::string& ticker) {
    TickerResult result;
    auto validated = validator_->validate(ticker);
    result.success = validated.success;
    result.code = validated.code;
    result.error = validated.error;
    result.symbol = validated.symbol;
    result.conId = validated.conId;
    result.chain = validated.chain;
    return result;
}

TickerResult TradingTerminal::addTicker(const std::string& ticker) {
    const std::string symbol = normalize(ticker);
    {
        std::lock_guard<std::mutex> lock(watchlistMutex_);
        auto it = watchlist_.find(symbol);
        if (it != watchlist_.end() && marketData_->isSubscribed(symbol)) {
            TickerResult existing;
            existing.success = true;
            existing.symbol = symbol;
            existing.conId = it->second.underlyingConId;
            existing.chain = it->second;
            return existing;
        }
    }

    auto result = validateTicker(symbol);
    if (!result.success) {
        std::cerr << "[TradingTerminal] Ticker " << symbol << " rejected: "
                  << result.error << std::endl;
        return result;
    }

    auto subscribed = marketData_->subscribe(domain::Contract::stock(result.symbol), true);
    if (!subscribed.success) {
        result.success = false;
        result.code = subscribed.code;
        result.error = subscribed.error;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(watchlistMutex_);
        watchlist_[result.symbol] = result.chain;
    }
    std::cout << "[TradingTerminal] Added " << result.symbol << " to watchlist ("
              << result.chain.expirations.size() << " expirations, "
              << result.chain.strikes.size() << " strikes)" << std::endl;
    return result;
}

bool TradingTerminal::removeTicker(const std::string& ticker) {
    const std::string symbol = normalize(ticker);
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(watchlistMutex_);
        removed = watchlist_.erase(symbol) > 0;
    }
    bool unsubscribed = marketData_->unsubscribe(symbol);
    if (removed) {
        std::cout << "[TradingTerminal] Removed " << symbol << " from watchlist" << std::endl;
    }
    return removed || unsubscribed;
}

std::vector<std::string> TradingTerminal::watchlist() const {
    std::lock_guard<std::mutex> lock(watchlistMutex_);
    std::vector<std::string> symbols;
    symbols.reserve(watchlist_.size());
    for (const auto& entry : watchlist_) {
        symbols.push_back(entry.first);
    }
    return symbols;
}

std::optional<domain::Quote> TradingTerminal::latestQuote(const std::string& ticker) const {
    const std::string key = normalize(ticker);
    if (!marketData_->isSubscribed(key)) {
        return std::nullopt;
    }
    return marketData_->latestQuote(key);
}

LadderResult TradingTerminal::getStrikeLadder(const std::string& ticker) const {
    LadderResult result;
    const std::string symbol = normalize(ticker);

    domain::OptionChainParams chain;
    {
        std::lock_guard<std::mutex> lock(watchlistMutex_);
        auto it = watchlist_.find(symbol);
        if (it == watchlist_.end()) {
            result.code = ErrorCode::NOT_FOUND;
            result.error = symbol + " is not in the watchlist";
            return result;
        }
        chain = it->second;
    }

    auto quote = marketData_->latestQuote(symbol);
    auto price = quote.marketPrice();
    if (!quote.isKnown() || !price) {
        result.code = ErrorCode::QUOTE_UNAVAILABLE;
        result.error = "No price data available for " + symbol;
        return result;
    }

    try {
        result.ladder = strikeSelector_.buildLadder(chain, *price, calendar_.localDate(clock_->now()));
        result.success = true;
    } catch (const EngineException& e) {
        result.code = e.code();
        result.error = e.what();
    }
    return result;
}

// ============================================================================
// Ордера
// ============================================================================

OrderResult TradingTerminal::toOrderResult(const SubmitResult& submitted) {
    OrderResult result;
    result.success = submitted.success;
    result.code = submitted.code;
    result.error = submitted.error;
    result.groupId = submitted.groupId;
    result.state = submitted.state;
    result.estimatedLevels = submitted.estimatedLevels;
    return result;
}

OrderResult TradingTerminal::placeBracketOrder(const PlaceOrderRequest& request) {
    OrderResult result;
    BracketRequest order;
    const std::string symbol = normalize(request.ticker);

    bool isOption = !request.expiry.empty() || request.strike.has_value() || request.right.has_value();
    if (isOption) {
        if (request.expiry.empty() || !request.strike || !request.right) {
            result.code = ErrorCode::INVALID_REQUEST;
            result.error = "Option order requires expiry, strike and right";
            return result;
        }
        order.contract = domain::Contract::option(symbol, request.expiry, *request.strike, *request.right);
    } else {
        order.contract = domain::Contract::stock(symbol);
    }

    order.side = request.side;
    order.quantity = request.quantity;
    order.limitPrice = request.limitPrice;

    try {
        order.risk.stopLossPct = request.stopLoss
            ? domain::RiskProfile::parsePercent(*request.stopLoss)
            : config_.defaultStopLossPct;
        order.risk.takeProfitPct = request.takeProfit
            ? domain::RiskProfile::parsePercent(*request.takeProfit)
            : config_.defaultTakeProfitPct;
    } catch (const EngineException& e) {
        result.code = e.code();
        result.error = e.what();
        return result;
    }

    return toOrderResult(orderEngine_->placeBracketOrder(order));
}

OrderResult TradingTerminal::cancelOrder(const std::string& groupId) {
    OrderResult result;
    auto cancelled = orderEngine_->cancelOrder(groupId);
    result.success = cancelled.success;
    result.code = cancelled.code;
    result.error = cancelled.error;
    result.groupId = groupId;
    result.state = cancelled.state;
    return result;
}

std::optional<domain::BracketOrder> TradingTerminal::getOrder(const std::string& groupId) const {
    return orderEngine_->getOrder(groupId);
}

std::vector<domain::BracketOrder> TradingTerminal::listOrders() const {
    return orderEngine_->listOrders();
}

// ============================================================================
// Счёт и позиции
// ============================================================================

domain::AccountSnapshot TradingTerminal::getSnapshot() const {
    return portfolio_->getSnapshot();
}

OrderResult TradingTerminal::closePosition(const std::string& symbol) {
    OrderResult result;
    auto snapshot = portfolio_->getSnapshot();
    const auto* position = snapshot.findPosition(symbol);
    if (!position) {
        result.code = ErrorCode::NOT_FOUND;
        result.error = "Position not found";
        return result;
    }
    return toOrderResult(orderEngine_->closePosition(*position));
}

CloseAllResult TradingTerminal::closeAllPositions() {
    CloseAllResult result;

    auto market = calendar_.status(clock_->now());
    if (!market.open) {
        std::cout << "[TradingTerminal] Close all positions rejected: " << market.message << std::endl;
        result.code = ErrorCode::MARKET_CLOSED;
        result.message = market.message;
        return result;
    }

    auto snapshot = portfolio_->getSnapshot();
    for (const auto& position : snapshot.positions) {
        if (position.position.isZero()) {
            continue;
        }
        auto closed = orderEngine_->closePosition(position);
        if (closed.success) {
            ++result.closed;
            result.groupIds.push_back(closed.groupId);
        } else {
            ++result.failed;
            result.code = closed.code;
            std::cerr << "[TradingTerminal] Error closing position " << position.symbol
                      << ": " << closed.error << std::endl;
        }
    }

    result.success = true;
    if (result.closed == 0 && result.failed == 0) {
        result.message = "No positions to close";
    } else if (result.failed == 0) {
        result.message = "Successfully closed " + std::to_string(result.closed) + " positions";
    } else {
        result.message = "Closed " + std::to_string(result.closed) + " positions, " +
                         std::to_string(result.failed) + " failed";
    }
    return result;
}

void TradingTerminal::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    std::cout << "[TradingTerminal] Shutting down..." << std::endl;

    connection_->disconnect();
    broker_->setMessageHandler(nullptr);

    orderEngine_->shutdown();
    portfolio_->shutdown();
    validator_->shutdown();
    marketData_->shutdown();
    connection_->shutdown();
    dispatcher_->clear();

    loop_.stop();
    std::cout << "[TradingTerminal] Stopped" << std::endl;
}

} // namespace ibtrader::application
