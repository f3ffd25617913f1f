#include "adapters/secondary/broker/SimulatedTwsGateway.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>

namespace ibtrader::adapters::secondary {

using domain::Contract;
using domain::Decimal;
using domain::EngineException;
using domain::ErrorCode;
using domain::LegStatus;
using domain::OrderSide;
using domain::OrderType;
using namespace ports::output;

namespace {

const Decimal NICKEL(0, 50000000);
const Decimal PENNY(0, 10000000);

/**
 * @brief Ближайшие count пятниц начиная с сегодняшнего дня
 */
std::vector<std::string> weeklyExpirations(int count) {
    using namespace boost::gregorian;
    std::vector<std::string> result;
    date day = day_clock::local_day();
    while (day.day_of_week() != Friday) {
        day += days(1);
    }
    for (int i = 0; i < count; ++i) {
        result.push_back(to_iso_string(day));
        day += weeks(1);
    }
    return result;
}

std::vector<Decimal> strikesAround(const Decimal& price) {
    int64_t step = price < Decimal(100, 0) ? 1 : 5;
    int64_t center = price.units / step * step;
    std::vector<Decimal> result;
    for (int64_t i = -30; i <= 30; ++i) {
        int64_t strike = center + i * step;
        if (strike > 0) {
            result.emplace_back(strike, 0);
        }
    }
    return result;
}

SimulatedInstrument makeInstrument(const std::string& symbol, int64_t conId, const Decimal& price) {
    SimulatedInstrument instrument;
    instrument.symbol = symbol;
    instrument.conId = conId;
    instrument.price = price;
    instrument.expirations = weeklyExpirations(8);
    instrument.strikes = strikesAround(price);
    return instrument;
}

bool sameSign(const Decimal& a, int64_t b) {
    return (a.isPositive() && b > 0) || (a.isNegative() && b < 0);
}

} // namespace

SimulatedTwsGateway::SimulatedTwsGateway()
    : rng_(std::random_device{}())
{
    addInstrument(makeInstrument("SPY", 756733, Decimal(450, 0)));
    addInstrument(makeInstrument("QQQ", 320227571, Decimal(380, 0)));
    addInstrument(makeInstrument("AAPL", 265598, Decimal(190, 0)));
    addInstrument(makeInstrument("TSLA", 76792991, Decimal(250, 0)));
    addInstrument(makeInstrument("MSFT", 272093, Decimal(370, 0)));

    accountValues_["TotalCashValue"] = Decimal(100000, 0);

    std::cout << "[SimulatedTwsGateway] Initialized " << instruments_.size()
              << " instruments" << std::endl;
}

SimulatedTwsGateway::~SimulatedTwsGateway() {
    stopTicker();
}

// ============================================================================
// Сессия
// ============================================================================

ConnectOutcome SimulatedTwsGateway::connect(const std::string& host, int port, int clientId,
                                            std::chrono::milliseconds handshakeTimeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connectAttempts_;

    if (connected_) {
        return ConnectOutcome::ok();
    }

    if (failConnects_ > 0) {
        --failConnects_;
        switch (failConnectCode_) {
            case ErrorCode::TIMEOUT:
                return ConnectOutcome::fail(ErrorCode::TIMEOUT,
                    "No handshake from " + host + ":" + std::to_string(port) + " within " +
                    std::to_string(handshakeTimeout.count()) + "ms");
            case ErrorCode::AUTH_REJECTED:
                return ConnectOutcome::fail(ErrorCode::AUTH_REJECTED,
                    "Client id " + std::to_string(clientId) + " is already in use");
            default:
                return ConnectOutcome::fail(ErrorCode::CONNECTION_ERROR,
                    "Connection refused: " + host + ":" + std::to_string(port));
        }
    }

    if (rejectedClientIds_.count(clientId) > 0) {
        return ConnectOutcome::fail(ErrorCode::AUTH_REJECTED,
            "Client id " + std::to_string(clientId) + " is already in use (" +
            std::to_string(broker_codes::CLIENT_ID_IN_USE) + ")");
    }

    connected_ = true;
    std::cout << "[SimulatedTwsGateway] Connected " << host << ":" << port
              << " clientId=" << clientId << std::endl;
    return ConnectOutcome::ok();
}

void SimulatedTwsGateway::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return;
    }
    connected_ = false;
    streams_.clear();
    accountSubscribed_ = false;
    std::cout << "[SimulatedTwsGateway] Disconnected" << std::endl;
}

bool SimulatedTwsGateway::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

void SimulatedTwsGateway::setMessageHandler(BrokerMessageHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handler_ = std::move(handler);
}

void SimulatedTwsGateway::requestCurrentTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestCurrentTime");
    if (!heartbeatResponding_) {
        return;
    }
    auto now = std::chrono::system_clock::now().time_since_epoch();
    emit(CurrentTimeMessage{std::chrono::duration_cast<std::chrono::seconds>(now).count()});
}

// ============================================================================
// Рыночные данные и справочники
// ============================================================================

void SimulatedTwsGateway::requestMarketData(int tickerId, const Contract& contract) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestMarketData");

    if (instruments_.find(contract.symbol) == instruments_.end()) {
        emit(ErrorMessage{tickerId, broker_codes::NO_SECURITY_DEFINITION,
                          "No security definition has been found for the request"});
        return;
    }

    streams_[tickerId] = contract;
    auto price = priceLocked(contract);
    if (!price) {
        return;
    }
    Decimal spread = *price > Decimal(1, 0) ? PENNY : Decimal();
    emit(TickMessage{tickerId, TickField::CLOSE, *price});
    emit(TickMessage{tickerId, TickField::BID, *price - spread});
    emit(TickMessage{tickerId, TickField::ASK, *price + spread});
    emit(TickMessage{tickerId, TickField::LAST, *price});
}

void SimulatedTwsGateway::cancelMarketData(int tickerId) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("cancelMarketData");
    streams_.erase(tickerId);
}

void SimulatedTwsGateway::requestContractDetails(int reqId, const Contract& contract) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestContractDetails");
    if (!referenceDataResponding_) {
        return;
    }

    auto it = instruments_.find(contract.symbol);
    if (it == instruments_.end()) {
        emit(ErrorMessage{reqId, broker_codes::NO_SECURITY_DEFINITION,
                          "No security definition has been found for the request"});
        return;
    }
    emit(ContractDetailsMessage{reqId, it->second.conId, it->second.symbol});
    emit(ContractDetailsEndMessage{reqId});
}

void SimulatedTwsGateway::requestOptionParams(int reqId, const std::string& symbol, int64_t) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestOptionParams");
    if (!referenceDataResponding_) {
        return;
    }

    auto it = instruments_.find(symbol);
    if (it != instruments_.end() && it->second.hasOptions) {
        const auto& instrument = it->second;

        // Недельная серия на отдельной бирже, как у реальных цепочек
        OptionParamsMessage weekly;
        weekly.reqId = reqId;
        weekly.exchange = "CBOE";
        weekly.tradingClass = symbol + "W";
        weekly.expirations = instrument.expirations;
        emit(weekly);

        OptionParamsMessage standard;
        standard.reqId = reqId;
        standard.exchange = "SMART";
        standard.tradingClass = symbol;
        standard.expirations = instrument.expirations;
        standard.strikes = instrument.strikes;
        emit(standard);
    }
    emit(OptionParamsEndMessage{reqId});
}

// ============================================================================
// Ордера
// ============================================================================

int64_t SimulatedTwsGateway::nextOrderId() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("nextOrderId");
    return nextOrderId_++;
}

void SimulatedTwsGateway::placeOrder(int64_t orderId, const Contract& contract,
                                     const BrokerOrder& order) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("placeOrder");

    if (failPlacements_ > 0) {
        --failPlacements_;
        throw EngineException(ErrorCode::CONNECTION_ERROR, "Socket write failed");
    }

    auto existing = orders_.find(orderId);
    if (existing != orders_.end()) {
        auto& book = existing->second;
        if (domain::isFinalStatus(book.status)) {
            emit(ErrorMessage{orderId, 103, "Duplicate order id"});
            return;
        }
        // Тот же id у живого ордера - изменение параметров
        book.order = order;
        ++book.revision;
        evaluateTriggers();
        return;
    }

    SimulatedOrder book;
    book.orderId = orderId;
    book.contract = contract;
    book.order = order;

    if (rejectNext_) {
        book.status = LegStatus::REJECTED;
        orders_[orderId] = book;
        emit(ErrorMessage{orderId, broker_codes::ORDER_REJECTED,
                          "Order rejected - reason:" + *rejectNext_});
        rejectNext_.reset();
        return;
    }

    auto& placed = orders_[orderId] = book;
    std::cout << "[SimulatedTwsGateway] Order " << orderId << ": " << toString(order.side)
              << " " << order.quantity << " " << contract.key() << " " << toString(order.type)
              << (order.ocaGroup.empty() ? "" : " oca=" + order.ocaGroup) << std::endl;
    emit(OrderStatusMessage{orderId, LegStatus::SUBMITTED, 0, Decimal(), ""});

    if (order.type == OrderType::MARKET) {
        if (autoFillMarketOrders_) {
            if (auto price = priceLocked(contract)) {
                execute(placed, *price);
            }
        }
    } else {
        evaluateTriggers();
    }
}

void SimulatedTwsGateway::cancelOrder(int64_t orderId) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("cancelOrder");
    ++cancelRequests_;

    auto it = orders_.find(orderId);
    if (it == orders_.end() || domain::isFinalStatus(it->second.status)) {
        std::string state = it == orders_.end() ? "Unknown" : toString(it->second.status);
        emit(ErrorMessage{orderId, 10148, "OrderId " + std::to_string(orderId) +
                          " that needs to be cancelled cannot be cancelled, state: " + state});
        return;
    }

    auto& book = it->second;
    book.status = LegStatus::CANCELLED;
    emit(OrderStatusMessage{orderId, LegStatus::CANCELLED, book.filledQuantity, book.avgFillPrice, ""});
    emit(ErrorMessage{orderId, broker_codes::ORDER_CANCELLED, "Order Canceled - reason:"});
}

void SimulatedTwsGateway::requestAllOrders() {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestAllOrders");
    if (!orderListResponding_) {
        return;
    }
    for (const auto& entry : orders_) {
        const auto& book = entry.second;
        emit(OrderStatusMessage{book.orderId, book.status, book.filledQuantity, book.avgFillPrice, ""});
    }
    emit(OrderListEndMessage{});
}

void SimulatedTwsGateway::requestAccountUpdates(bool subscribe) {
    std::lock_guard<std::mutex> lock(mutex_);
    requireConnected("requestAccountUpdates");
    accountSubscribed_ = subscribe;
    if (subscribe) {
        publishAccount();
    }
}

// ============================================================================
// Управление симуляцией
// ============================================================================

void SimulatedTwsGateway::addInstrument(const SimulatedInstrument& instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    instruments_[instrument.symbol] = instrument;
}

void SimulatedTwsGateway::setPrice(const std::string& key, const Decimal& price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = instruments_.find(key);
    std::string symbol = key;
    if (it != instruments_.end()) {
        it->second.price = price;
    } else {
        optionPrices_[key] = price;
        symbol = key.substr(0, key.find(' '));
    }
    publishQuotes(symbol);
    evaluateTriggers();
}

std::optional<Decimal> SimulatedTwsGateway::priceOf(const Contract& contract) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return priceLocked(contract);
}

void SimulatedTwsGateway::failNextConnects(int count, ErrorCode code) {
    std::lock_guard<std::mutex> lock(mutex_);
    failConnects_ = count;
    failConnectCode_ = code;
}

void SimulatedTwsGateway::rejectClientId(int clientId) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejectedClientIds_.insert(clientId);
}

void SimulatedTwsGateway::setReferenceDataResponding(bool responding) {
    std::lock_guard<std::mutex> lock(mutex_);
    referenceDataResponding_ = responding;
}

void SimulatedTwsGateway::setHeartbeatResponding(bool responding) {
    std::lock_guard<std::mutex> lock(mutex_);
    heartbeatResponding_ = responding;
}

void SimulatedTwsGateway::setOrderListResponding(bool responding) {
    std::lock_guard<std::mutex> lock(mutex_);
    orderListResponding_ = responding;
}

void SimulatedTwsGateway::setAutoFillMarketOrders(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    autoFillMarketOrders_ = enabled;
}

void SimulatedTwsGateway::rejectNextOrder(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    rejectNext_ = reason;
}

void SimulatedTwsGateway::failNextPlacements(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failPlacements_ = count;
}

bool SimulatedTwsGateway::fillOrder(int64_t orderId, const Decimal& price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end() || domain::isFinalStatus(it->second.status)) {
        return false;
    }
    execute(it->second, price);
    return true;
}

void SimulatedTwsGateway::dropConnection(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_) {
        return;
    }
    emit(ConnectionClosedMessage{reason});
    connected_ = false;
    streams_.clear();
    accountSubscribed_ = false;
    std::cout << "[SimulatedTwsGateway] Connection dropped: " << reason << std::endl;
}

void SimulatedTwsGateway::setAccountValue(const std::string& tag, const Decimal& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    accountValues_[tag] = value;
}

void SimulatedTwsGateway::setPosition(const Contract& contract, const Decimal& position,
                                      const Decimal& averageCost) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = positions_[contract.key()];
    entry.contract = contract;
    entry.quantity = position;
    entry.averageCost = averageCost;
}

std::vector<SimulatedOrder> SimulatedTwsGateway::orders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<SimulatedOrder> result;
    for (const auto& entry : orders_) {
        result.push_back(entry.second);
    }
    return result;
}

std::optional<SimulatedOrder> SimulatedTwsGateway::order(int64_t orderId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(orderId);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int SimulatedTwsGateway::cancelRequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelRequests_;
}

int SimulatedTwsGateway::connectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connectAttempts_;
}

void SimulatedTwsGateway::startTicker(std::chrono::milliseconds interval) {
    if (tickerRunning_.exchange(true)) {
        return;
    }
    tickerThread_ = std::thread([this, interval]() {
        tickerLoop(interval);
    });
}

void SimulatedTwsGateway::stopTicker() {
    if (!tickerRunning_.exchange(false)) {
        return;
    }
    if (tickerThread_.joinable()) {
        tickerThread_.join();
    }
}

// ============================================================================
// Внутреннее (под mutex_)
// ============================================================================

void SimulatedTwsGateway::emit(const BrokerMessage& message) {
    // Пока сокета нет, сообщения теряются
    if (connected_ && handler_) {
        handler_(message);
    }
}

void SimulatedTwsGateway::requireConnected(const char* operation) const {
    if (!connected_) {
        throw EngineException(ErrorCode::CONNECTION_ERROR,
                              std::string(operation) + ": socket is not connected");
    }
}

std::optional<Decimal> SimulatedTwsGateway::priceLocked(const Contract& contract) const {
    auto instrument = instruments_.find(contract.symbol);
    if (!contract.isOption()) {
        if (instrument == instruments_.end()) {
            return std::nullopt;
        }
        return instrument->second.price;
    }

    auto fixed = optionPrices_.find(contract.key());
    if (fixed != optionPrices_.end()) {
        return fixed->second;
    }
    if (instrument == instruments_.end()) {
        return std::nullopt;
    }

    const Decimal& underlying = instrument->second.price;
    Decimal intrinsic = contract.right == domain::OptionRight::CALL
        ? underlying - contract.strike
        : contract.strike - underlying;
    if (intrinsic.isNegative()) {
        intrinsic = Decimal();
    }
    Decimal premium = (intrinsic + underlying.dividedBy(100)).ceilTo(NICKEL);
    return premium.isPositive() ? premium : NICKEL;
}

void SimulatedTwsGateway::publishQuotes(const std::string& symbol) {
    for (const auto& stream : streams_) {
        if (stream.second.symbol != symbol) {
            continue;
        }
        auto price = priceLocked(stream.second);
        if (!price) {
            continue;
        }
        Decimal spread = *price > Decimal(1, 0) ? PENNY : Decimal();
        emit(TickMessage{stream.first, TickField::BID, *price - spread});
        emit(TickMessage{stream.first, TickField::ASK, *price + spread});
        emit(TickMessage{stream.first, TickField::LAST, *price});
    }
}

void SimulatedTwsGateway::evaluateTriggers() {
    for (auto& entry : orders_) {
        auto& book = entry.second;
        if (book.status != LegStatus::SUBMITTED || book.order.type == OrderType::MARKET) {
            continue;
        }
        auto price = priceLocked(book.contract);
        if (!price) {
            continue;
        }

        bool buy = book.order.side == OrderSide::BUY;
        if (book.order.type == OrderType::LIMIT && book.order.limitPrice) {
            const Decimal& limit = *book.order.limitPrice;
            if (buy && *price <= limit) {
                execute(book, std::min(*price, limit));
            } else if (!buy && *price >= limit) {
                execute(book, std::max(*price, limit));
            }
        } else if (book.order.type == OrderType::STOP && book.order.stopPrice) {
            const Decimal& stop = *book.order.stopPrice;
            if ((buy && *price >= stop) || (!buy && *price <= stop)) {
                execute(book, *price);
            }
        }
    }
}

void SimulatedTwsGateway::execute(SimulatedOrder& book, const Decimal& price) {
    int64_t quantity = book.order.quantity - book.filledQuantity;
    book.filledQuantity = book.order.quantity;
    book.avgFillPrice = price;
    book.status = LegStatus::FILLED;

    std::cout << "[SimulatedTwsGateway] Filled " << book.orderId << ": " << quantity
              << " @ $" << price.toString() << std::endl;

    emit(ExecutionMessage{book.orderId, "sim." + std::to_string(++execCounter_), quantity, price});
    emit(OrderStatusMessage{book.orderId, LegStatus::FILLED, book.filledQuantity, price, ""});

    applyFill(book.contract, book.order.side, quantity, price);
    cancelOcaSiblings(book);

    if (accountSubscribed_) {
        publishAccount();
    }
}

void SimulatedTwsGateway::cancelOcaSiblings(const SimulatedOrder& filled) {
    if (filled.order.ocaGroup.empty()) {
        return;
    }
    for (auto& entry : orders_) {
        auto& book = entry.second;
        if (book.orderId == filled.orderId || book.order.ocaGroup != filled.order.ocaGroup ||
            domain::isFinalStatus(book.status)) {
            continue;
        }
        book.status = LegStatus::CANCELLED;
        emit(OrderStatusMessage{book.orderId, LegStatus::CANCELLED, book.filledQuantity,
                                book.avgFillPrice, "OCA group filled"});
    }
}

void SimulatedTwsGateway::applyFill(const Contract& contract, OrderSide side,
                                    int64_t quantity, const Decimal& price) {
    int64_t signedQty = side == OrderSide::BUY ? quantity : -quantity;
    Decimal cost = price * contract.multiplier;

    auto& position = positions_[contract.key()];
    position.contract = contract;

    int64_t held = position.quantity.units;
    if (held == 0 || sameSign(position.quantity, signedQty)) {
        int64_t total = std::llabs(held) + quantity;
        position.averageCost = (position.averageCost * std::llabs(held) + cost * quantity).dividedBy(total);
    } else {
        int64_t closing = std::min<int64_t>(std::llabs(held), quantity);
        Decimal perContract = held > 0 ? cost - position.averageCost : position.averageCost - cost;
        position.realizedPnl = position.realizedPnl + perContract * closing;
        if (quantity > closing) {
            position.averageCost = cost;
        }
    }
    position.quantity = Decimal(held + signedQty, 0);

    auto& cash = accountValues_["TotalCashValue"];
    cash = cash - cost * signedQty;
}

void SimulatedTwsGateway::publishAccount() {
    Decimal cash = accountValues_["TotalCashValue"];
    Decimal marketValueTotal;
    Decimal unrealizedTotal;
    Decimal realizedTotal;

    std::vector<PortfolioValueMessage> rows;
    for (const auto& entry : positions_) {
        const auto& position = entry.second;
        Decimal price = priceLocked(position.contract).value_or(Decimal());
        int64_t quantity = position.quantity.units;

        PortfolioValueMessage row;
        row.contract = position.contract;
        row.position = position.quantity;
        row.marketPrice = price;
        row.marketValue = price * position.contract.multiplier * quantity;
        row.averageCost = position.averageCost;
        row.unrealizedPnl = row.marketValue - position.averageCost * quantity;
        row.realizedPnl = position.realizedPnl;
        rows.push_back(row);

        marketValueTotal = marketValueTotal + row.marketValue;
        unrealizedTotal = unrealizedTotal + row.unrealizedPnl;
        realizedTotal = realizedTotal + row.realizedPnl;
    }

    std::map<std::string, Decimal> values;
    values["TotalCashValue"] = cash;
    values["NetLiquidation"] = cash + marketValueTotal;
    values["LookAheadAvailableFunds"] = cash;
    values["RealizedPnL"] = realizedTotal;
    values["UnrealizedPnL"] = unrealizedTotal;
    for (const auto& entry : accountValues_) {
        if (entry.first != "TotalCashValue") {
            values[entry.first] = entry.second;
        }
    }

    for (const auto& entry : values) {
        emit(AccountValueMessage{entry.first, entry.second.toString(), "USD"});
    }
    for (const auto& row : rows) {
        emit(row);
    }
    emit(AccountDownloadEndMessage{});

    // Закрытые позиции отправлены с нулём, дальше их не показываем
    for (auto it = positions_.begin(); it != positions_.end();) {
        it = it->second.quantity.isZero() ? positions_.erase(it) : std::next(it);
    }
}

void SimulatedTwsGateway::tickerLoop(std::chrono::milliseconds interval) {
    std::uniform_real_distribution<double> move(-0.002, 0.002);
    while (tickerRunning_.load()) {
        std::this_thread::sleep_for(interval);

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : instruments_) {
            auto& instrument = entry.second;
            Decimal next = Decimal::fromDouble(instrument.price.toDouble() * (1.0 + move(rng_)))
                .floorTo(PENNY);
            if (next.isPositive()) {
                instrument.price = next;
            }
            publishQuotes(instrument.symbol);
        }
        evaluateTriggers();
    }
}

} // namespace ibtrader::adapters::secondary
