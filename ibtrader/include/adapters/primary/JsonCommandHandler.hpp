#pragma once

#include "ports/input/ITradingTerminal.hpp"
#include "ports/output/IEventBus.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ibtrader::adapters::primary {

/**
 * @brief Командный канал: одна JSON-строка на команду
 *
 * Запрос:  {"type": "place_order", "requestId": 7, "data": {...}}
 * Ответ:   {"success": true, "message": "...", ..., "requestId": 7}
 * Событие: {"event": "order.state_changed", "payload": {...}}
 *
 * Команды: connect, add_ticker, remove_ticker, validate_ticker,
 * get_ticker_price, get_option_chain, place_order, cancel_order,
 * get_order, get_orders, get_snapshot, get_positions, get_balance,
 * get_daily_pnl, close_position, close_all_positions.
 *
 * Ответы и события пишутся через writer под одним мьютексом, строки
 * не перемешиваются.
 */
class JsonCommandHandler {
public:
    using LineWriter = std::function<void(const std::string& line)>;

    JsonCommandHandler(
        std::shared_ptr<ports::input::ITradingTerminal> terminal,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        LineWriter writer
    );

    /**
     * @brief Подписаться на события движка и пересылать их в writer
     */
    void forwardEvents();

    /**
     * @brief Разобрать строку, выполнить команду, записать ответ
     */
    void handleLine(const std::string& line);

    /**
     * @brief Выполнить команду и вернуть ответ (requestId уже проставлен)
     */
    nlohmann::json handle(const nlohmann::json& command);

private:
    using Command = std::function<nlohmann::json(const nlohmann::json& data)>;

    std::shared_ptr<ports::input::ITradingTerminal> terminal_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    LineWriter writer_;
    std::mutex writeMutex_;
    std::unordered_map<std::string, Command> commands_;

    void registerCommands();
    void write(const nlohmann::json& message);

    nlohmann::json connect(const nlohmann::json& data);
    nlohmann::json addTicker(const nlohmann::json& data);
    nlohmann::json removeTicker(const nlohmann::json& data);
    nlohmann::json validateTicker(const nlohmann::json& data);
    nlohmann::json getTickerPrice(const nlohmann::json& data);
    nlohmann::json getOptionChain(const nlohmann::json& data);
    nlohmann::json placeOrder(const nlohmann::json& data);
    nlohmann::json cancelOrder(const nlohmann::json& data);
    nlohmann::json getOrder(const nlohmann::json& data);
    nlohmann::json getOrders(const nlohmann::json& data);
    nlohmann::json getSnapshot(const nlohmann::json& data);
    nlohmann::json getPositions(const nlohmann::json& data);
    nlohmann::json getBalance(const nlohmann::json& data);
    nlohmann::json getDailyPnl(const nlohmann::json& data);
    nlohmann::json closePosition(const nlohmann::json& data);
    nlohmann::json closeAllPositions(const nlohmann::json& data);

    static nlohmann::json failure(domain::ErrorCode code, const std::string& message);
};

} // namespace ibtrader::adapters::primary
