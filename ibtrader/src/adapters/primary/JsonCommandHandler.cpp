#include "adapters/primary/JsonCommandHandler.hpp"
#include "domain/events/AccountSnapshotUpdatedEvent.hpp"
#include "domain/events/ConnectionStateChangedEvent.hpp"
#include "domain/events/JsonMapping.hpp"
#include "domain/events/OrderStateChangedEvent.hpp"
#include "domain/events/QuoteUpdatedEvent.hpp"
#include <iostream>
#include <stdexcept>

namespace ibtrader::adapters::primary {

using domain::Decimal;
using domain::ErrorCode;
using domain::toJsonValue;
using nlohmann::json;

namespace {

std::string requireString(const json& data, const char* field) {
    if (!data.contains(field) || !data.at(field).is_string() ||
        data.at(field).get<std::string>().empty()) {
        throw std::invalid_argument(std::string("Missing field: ") + field);
    }
    return data.at(field).get<std::string>();
}

/**
 * @brief Число или строка -> Decimal ("450", 450, 450.5)
 */
Decimal decimalField(const json& value, const char* field) {
    if (value.is_string()) {
        return Decimal::fromString(value.get<std::string>());
    }
    if (value.is_number()) {
        return Decimal::fromString(value.dump());
    }
    throw std::invalid_argument(std::string("Field must be a number: ") + field);
}

/**
 * @brief Процент защиты как текст для RiskProfile::parsePercent
 */
std::optional<std::string> percentField(const json& data, const char* field) {
    if (!data.contains(field) || data.at(field).is_null()) {
        return std::nullopt;
    }
    const json& value = data.at(field);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw std::invalid_argument(std::string("Field must be a number or \"--\": ") + field);
}

domain::OptionRight rightFrom(const std::string& text) {
    if (text == "C" || text == "CALL" || text == "Call") return domain::OptionRight::CALL;
    if (text == "P" || text == "PUT" || text == "Put") return domain::OptionRight::PUT;
    throw std::invalid_argument("Unknown option type: " + text);
}

json positionRow(const domain::PositionPnl& position) {
    return {
        {"symbol", position.symbol},
        {"position", position.position.toDouble()},
        {"avgCost", position.averageCost.toDouble()},
        {"marketPrice", position.marketPrice.toDouble()},
        {"marketValue", position.marketValue.toDouble()},
        {"unrealizedPNL", position.unrealizedPnl.toDouble()},
        {"realizedPNL", position.realizedPnl.toDouble()}
    };
}

} // namespace

JsonCommandHandler::JsonCommandHandler(
    std::shared_ptr<ports::input::ITradingTerminal> terminal,
    std::shared_ptr<ports::output::IEventBus> eventBus,
    LineWriter writer
) : terminal_(std::move(terminal))
  , eventBus_(std::move(eventBus))
  , writer_(std::move(writer))
{
    registerCommands();
}

void JsonCommandHandler::registerCommands() {
    auto bind = [this](json (JsonCommandHandler::*method)(const json&)) {
        return [this, method](const json& data) { return (this->*method)(data); };
    };

    commands_["connect"] = bind(&JsonCommandHandler::connect);
    commands_["add_ticker"] = bind(&JsonCommandHandler::addTicker);
    commands_["remove_ticker"] = bind(&JsonCommandHandler::removeTicker);
    commands_["validate_ticker"] = bind(&JsonCommandHandler::validateTicker);
    commands_["get_ticker_price"] = bind(&JsonCommandHandler::getTickerPrice);
    commands_["get_option_chain"] = bind(&JsonCommandHandler::getOptionChain);
    commands_["place_order"] = bind(&JsonCommandHandler::placeOrder);
    commands_["cancel_order"] = bind(&JsonCommandHandler::cancelOrder);
    commands_["get_order"] = bind(&JsonCommandHandler::getOrder);
    commands_["get_orders"] = bind(&JsonCommandHandler::getOrders);
    commands_["get_snapshot"] = bind(&JsonCommandHandler::getSnapshot);
    commands_["get_positions"] = bind(&JsonCommandHandler::getPositions);
    commands_["get_balance"] = bind(&JsonCommandHandler::getBalance);
    commands_["get_daily_pnl"] = bind(&JsonCommandHandler::getDailyPnl);
    commands_["close_position"] = bind(&JsonCommandHandler::closePosition);
    commands_["close_all_positions"] = bind(&JsonCommandHandler::closeAllPositions);
}

void JsonCommandHandler::forwardEvents() {
    auto forward = [this](const domain::DomainEvent& event) {
        json line;
        line["event"] = event.eventType;
        line["payload"] = json::parse(event.toJson());
        write(line);
    };
    eventBus_->subscribe(domain::QuoteUpdatedEvent::TYPE, forward);
    eventBus_->subscribe(domain::OrderStateChangedEvent::TYPE, forward);
    eventBus_->subscribe(domain::ConnectionStateChangedEvent::TYPE, forward);
    eventBus_->subscribe(domain::AccountSnapshotUpdatedEvent::TYPE, forward);
}

void JsonCommandHandler::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return;
    }

    json command;
    try {
        command = json::parse(line);
    } catch (const json::parse_error& e) {
        std::cerr << "[JsonCommandHandler] Malformed request: " << e.what() << std::endl;
        write(failure(ErrorCode::INVALID_REQUEST, std::string("Invalid JSON: ") + e.what()));
        return;
    }
    write(handle(command));
}

json JsonCommandHandler::handle(const json& command) {
    json response;
    json requestId = command.is_object() && command.contains("requestId")
        ? command.at("requestId") : json(nullptr);

    if (!command.is_object() || !command.contains("type") || !command.at("type").is_string()) {
        response = failure(ErrorCode::INVALID_REQUEST, "Missing command type");
    } else {
        const std::string type = command.at("type").get<std::string>();
        std::cout << "[JsonCommandHandler] Handling command: " << type << std::endl;

        auto it = commands_.find(type);
        if (it == commands_.end()) {
            std::cerr << "[JsonCommandHandler] Unknown command: " << type << std::endl;
            response = failure(ErrorCode::INVALID_REQUEST, "Unknown command: " + type);
        } else {
            const json data = command.contains("data") && command.at("data").is_object()
                ? command.at("data") : json::object();
            try {
                response = it->second(data);
            } catch (const json::exception& e) {
                response = failure(ErrorCode::INVALID_REQUEST, std::string("Invalid request: ") + e.what());
            } catch (const std::invalid_argument& e) {
                response = failure(ErrorCode::INVALID_REQUEST, e.what());
            } catch (const std::exception& e) {
                std::cerr << "[JsonCommandHandler] Error handling " << type << ": " << e.what() << std::endl;
                response = failure(ErrorCode::INVALID_REQUEST, std::string("Error: ") + e.what());
            }
        }
    }

    if (!requestId.is_null()) {
        response["requestId"] = requestId;
    }
    return response;
}

void JsonCommandHandler::write(const json& message) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    writer_(message.dump());
}

json JsonCommandHandler::failure(ErrorCode code, const std::string& message) {
    return {
        {"success", false},
        {"code", toString(code)},
        {"message", message}
    };
}

// ============================================================================
// Сессия и список наблюдения
// ============================================================================

json JsonCommandHandler::connect(const json& data) {
    auto result = data.contains("host")
        ? terminal_->connect(requireString(data, "host"),
                             data.value("port", 7497),
                             data.value("clientId", 1))
        : terminal_->connect();
    if (!result.success) {
        json response = failure(result.code, result.error);
        response["session"] = toJsonValue(result.session);
        return response;
    }
    return {
        {"success", true},
        {"message", "Connected to " + result.session.host + ":" + std::to_string(result.session.port)},
        {"session", toJsonValue(result.session)}
    };
}

json JsonCommandHandler::addTicker(const json& data) {
    auto result = terminal_->addTicker(requireString(data, "ticker"));
    if (!result.success) {
        return failure(result.code, result.error);
    }

    json expirations = result.chain.expirations;
    json strikes = json::array();
    for (const auto& strike : result.chain.strikes) {
        strikes.push_back(toJsonValue(strike));
    }
    return {
        {"success", true},
        {"message", result.symbol + " added to watchlist"},
        {"symbol", result.symbol},
        {"conId", result.conId},
        {"chain", {
            {"exchange", result.chain.exchange},
            {"tradingClass", result.chain.tradingClass},
            {"multiplier", result.chain.multiplier},
            {"expirations", expirations},
            {"strikes", strikes}
        }}
    };
}

json JsonCommandHandler::removeTicker(const json& data) {
    const std::string ticker = requireString(data, "ticker");
    if (!terminal_->removeTicker(ticker)) {
        return failure(ErrorCode::NOT_FOUND, ticker + " is not in the watchlist");
    }
    return {{"success", true}, {"message", ticker + " removed from watchlist"}};
}

json JsonCommandHandler::validateTicker(const json& data) {
    auto result = terminal_->validateTicker(requireString(data, "ticker"));
    if (!result.success) {
        return failure(result.code, result.error);
    }
    return {
        {"success", true},
        {"message", result.symbol + " is valid and supports options trading"},
        {"symbol", result.symbol},
        {"conId", result.conId}
    };
}

json JsonCommandHandler::getTickerPrice(const json& data) {
    const std::string ticker = requireString(data, "ticker");
    auto quote = terminal_->latestQuote(ticker);
    if (!quote) {
        json response = failure(ErrorCode::NOT_FOUND, ticker + " is not in the watchlist");
        response["price"] = 0;
        return response;
    }

    auto price = quote->marketPrice();
    if (!quote->isKnown() || !price) {
        json response = failure(ErrorCode::QUOTE_UNAVAILABLE, "No price data available for " + ticker);
        response["price"] = 0;
        return response;
    }
    return {
        {"success", true},
        {"price", price->toDouble()},
        {"quote", toJsonValue(*quote)}
    };
}

json JsonCommandHandler::getOptionChain(const json& data) {
    auto result = terminal_->getStrikeLadder(requireString(data, "ticker"));
    if (!result.success) {
        return failure(result.code, result.error);
    }
    json response = toJsonValue(result.ladder);
    response["success"] = true;
    return response;
}

// ============================================================================
// Ордера
// ============================================================================

json JsonCommandHandler::placeOrder(const json& data) {
    ports::input::PlaceOrderRequest request;
    request.ticker = requireString(data, "ticker");
    request.side = domain::orderSideFromString(data.value("action", std::string("BUY")));
    request.quantity = data.value("quantity", int64_t{0});

    if (data.contains("limitPrice") && !data.at("limitPrice").is_null()) {
        request.limitPrice = decimalField(data.at("limitPrice"), "limitPrice");
    }
    if (data.contains("expiry") && !data.at("expiry").is_null()) {
        request.expiry = data.at("expiry").get<std::string>();
    }
    if (data.contains("strike") && !data.at("strike").is_null()) {
        request.strike = decimalField(data.at("strike"), "strike");
    }
    if (data.contains("optionType") && !data.at("optionType").is_null()) {
        request.right = rightFrom(data.at("optionType").get<std::string>());
    }
    request.stopLoss = percentField(data, "stopLoss");
    request.takeProfit = percentField(data, "takeProfit");

    auto result = terminal_->placeBracketOrder(request);
    if (!result.success) {
        return failure(result.code, result.error);
    }

    json response = {
        {"success", true},
        {"message", "Order accepted"},
        {"groupId", result.groupId},
        {"state", toString(result.state)},
        {"estimatedLevels", nullptr}
    };
    if (result.estimatedLevels) {
        response["estimatedLevels"] = {
            {"stopPrice", toJsonValue(result.estimatedLevels->stopPrice)},
            {"takePrice", toJsonValue(result.estimatedLevels->takePrice)}
        };
    }
    return response;
}

json JsonCommandHandler::cancelOrder(const json& data) {
    const std::string groupId = requireString(data, "groupId");
    auto result = terminal_->cancelOrder(groupId);
    if (!result.success) {
        return failure(result.code, result.error);
    }
    return {
        {"success", true},
        {"message", "Cancel requested for " + groupId},
        {"groupId", groupId},
        {"state", toString(result.state)}
    };
}

json JsonCommandHandler::getOrder(const json& data) {
    const std::string groupId = requireString(data, "groupId");
    auto order = terminal_->getOrder(groupId);
    if (!order) {
        return failure(ErrorCode::NOT_FOUND, "Order group not found: " + groupId);
    }
    return {{"success", true}, {"order", toJsonValue(*order)}};
}

json JsonCommandHandler::getOrders(const json&) {
    json orders = json::array();
    for (const auto& order : terminal_->listOrders()) {
        orders.push_back(toJsonValue(order));
    }
    return {{"success", true}, {"orders", orders}};
}

// ============================================================================
// Счёт
// ============================================================================

json JsonCommandHandler::getSnapshot(const json&) {
    return {{"success", true}, {"snapshot", toJsonValue(terminal_->getSnapshot())}};
}

json JsonCommandHandler::getPositions(const json&) {
    auto snapshot = terminal_->getSnapshot();
    json positions = json::array();
    for (const auto& position : snapshot.positions) {
        positions.push_back(positionRow(position));
    }
    return {{"success", true}, {"positions", positions}, {"stale", snapshot.stale}};
}

json JsonCommandHandler::getBalance(const json&) {
    auto snapshot = terminal_->getSnapshot();
    return {
        {"success", true},
        {"balance", snapshot.availableFunds.toDouble()},
        {"stale", snapshot.stale}
    };
}

json JsonCommandHandler::getDailyPnl(const json&) {
    auto snapshot = terminal_->getSnapshot();
    return {
        {"success", true},
        {"dailyPnL", snapshot.dailyPnl.toDouble()},
        {"stale", snapshot.stale}
    };
}

json JsonCommandHandler::closePosition(const json& data) {
    const std::string symbol = requireString(data, "symbol");
    auto result = terminal_->closePosition(symbol);
    if (!result.success) {
        return failure(result.code, result.error);
    }
    return {
        {"success", true},
        {"message", "Closing order placed for " + symbol},
        {"groupId", result.groupId}
    };
}

json JsonCommandHandler::closeAllPositions(const json&) {
    auto result = terminal_->closeAllPositions();
    if (!result.success) {
        return failure(result.code, result.message);
    }
    return {
        {"success", true},
        {"message", result.message},
        {"closed", result.closed},
        {"failed", result.failed},
        {"groupIds", result.groupIds}
    };
}

} // namespace ibtrader::adapters::primary
