#pragma once

#include "domain/AccountSnapshot.hpp"
#include "domain/BracketOrder.hpp"
#include "domain/Contract.hpp"
#include "domain/EngineError.hpp"
#include "domain/OptionChain.hpp"
#include "domain/Quote.hpp"
#include "domain/RiskProfile.hpp"
#include "domain/Session.hpp"
#include "domain/enums/OrderSide.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ibtrader::ports::input {

/**
 * @brief Заявка из интерфейса
 *
 * Без expiry/strike/right - ордер на сам тикер (STK), иначе на опцион.
 * Проценты защиты приходят текстом: отсутствие - значение по умолчанию
 * из конфигурации, "--" или пустая строка - нога не создаётся.
 */
struct PlaceOrderRequest {
    std::string ticker;
    domain::OrderSide side = domain::OrderSide::BUY;
    int64_t quantity = 0;
    std::optional<domain::Decimal> limitPrice;

    std::string expiry;                             ///< YYYYMMDD
    std::optional<domain::Decimal> strike;
    std::optional<domain::OptionRight> right;

    std::optional<std::string> stopLoss;
    std::optional<std::string> takeProfit;
};

struct ConnectionResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    domain::Session session;
};

struct TickerResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    std::string symbol;
    int64_t conId = 0;
    domain::OptionChainParams chain;
};

struct OrderResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    std::string groupId;
    domain::GroupState state = domain::GroupState::AWAITING_ENTRY;
    std::optional<domain::BracketLevels> estimatedLevels;
};

struct LadderResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;
    domain::StrikeLadder ladder;
};

/**
 * @brief Итог закрытия всех позиций
 *
 * message в формате "Closed X positions, Y failed".
 */
struct CloseAllResult {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string message;
    int closed = 0;
    int failed = 0;
    std::vector<std::string> groupIds;
};

/**
 * @brief Граница с интерфейсом пользователя
 *
 * Все операции неблокирующие, кроме connect() и addTicker(), которые
 * ждут ответа брокера в пределах настроенных таймаутов. Ход исполнения
 * ордеров приходит событиями order.state_changed.
 */
class ITradingTerminal {
public:
    virtual ~ITradingTerminal() = default;

    virtual ConnectionResult connect() = 0;
    virtual ConnectionResult connect(const std::string& host, int port, int clientId) = 0;
    virtual void disconnect() = 0;
    virtual domain::Session session() const = 0;

    /**
     * @brief Проверить тикер и добавить в список наблюдения
     *
     * Тикер без опционной цепочки не добавляется.
     */
    virtual TickerResult addTicker(const std::string& ticker) = 0;

    /**
     * @brief Проверить тикер, не добавляя его
     */
    virtual TickerResult validateTicker(const std::string& ticker) = 0;

    virtual bool removeTicker(const std::string& ticker) = 0;
    virtual std::vector<std::string> watchlist() const = 0;

    virtual std::optional<domain::Quote> latestQuote(const std::string& ticker) const = 0;

    /**
     * @brief Ближайшая экспирация и страйки вокруг текущей цены
     */
    virtual LadderResult getStrikeLadder(const std::string& ticker) const = 0;

    virtual OrderResult placeBracketOrder(const PlaceOrderRequest& request) = 0;
    virtual OrderResult cancelOrder(const std::string& groupId) = 0;
    virtual std::optional<domain::BracketOrder> getOrder(const std::string& groupId) const = 0;
    virtual std::vector<domain::BracketOrder> listOrders() const = 0;

    virtual domain::AccountSnapshot getSnapshot() const = 0;

    /**
     * @param symbol Ключ контракта позиции ("SPY 20250117 450.00C")
     */
    virtual OrderResult closePosition(const std::string& symbol) = 0;
    virtual CloseAllResult closeAllPositions() = 0;

    virtual void shutdown() = 0;
};

} // namespace ibtrader::ports::input
