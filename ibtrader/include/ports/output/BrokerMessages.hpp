#pragma once

#include "domain/Contract.hpp"
#include "domain/Decimal.hpp"
#include "domain/enums/LegStatus.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace ibtrader::ports::output {

/**
 * @brief Поле котировки в тике (tickPrice)
 */
enum class TickField {
    BID,
    ASK,
    LAST,
    CLOSE
};

struct TickMessage {
    int tickerId = 0;
    TickField field = TickField::LAST;
    domain::Decimal price;
};

/**
 * @brief orderStatus: статус уже переведён в LegStatus
 */
struct OrderStatusMessage {
    int64_t orderId = 0;
    domain::LegStatus status = domain::LegStatus::SUBMITTED;
    int64_t filledQuantity = 0;
    domain::Decimal avgFillPrice;
    std::string reason;                 ///< Текст брокера при отклонении
};

struct ExecutionMessage {
    int64_t orderId = 0;
    std::string execId;
    int64_t shares = 0;
    domain::Decimal price;
};

/**
 * @brief Конец ответа на requestAllOrders
 */
struct OrderListEndMessage {};

struct ContractDetailsMessage {
    int reqId = 0;
    int64_t conId = 0;
    std::string symbol;
};

struct ContractDetailsEndMessage {
    int reqId = 0;
};

/**
 * @brief securityDefinitionOptionParameter (по одной строке на биржу)
 */
struct OptionParamsMessage {
    int reqId = 0;
    std::string exchange;
    std::string tradingClass;
    int multiplier = 100;
    std::vector<std::string> expirations;
    std::vector<domain::Decimal> strikes;
};

struct OptionParamsEndMessage {
    int reqId = 0;
};

/**
 * @brief updateAccountValue: тег, значение, валюта
 */
struct AccountValueMessage {
    std::string tag;
    std::string value;
    std::string currency;
};

/**
 * @brief updatePortfolio: одна позиция
 *
 * averageCost для опционов приходит на контракт (с учётом множителя).
 */
struct PortfolioValueMessage {
    domain::Contract contract;
    domain::Decimal position;
    domain::Decimal marketPrice;
    domain::Decimal marketValue;
    domain::Decimal averageCost;
    domain::Decimal unrealizedPnl;
    domain::Decimal realizedPnl;
};

struct AccountDownloadEndMessage {};

/**
 * @brief Ответ на requestCurrentTime, используется как heartbeat
 */
struct CurrentTimeMessage {
    int64_t unixSeconds = 0;
};

/**
 * @brief error(id, code, text). id = -1 для ошибок сессии.
 */
struct ErrorMessage {
    int64_t id = -1;
    int code = 0;
    std::string text;
};

/**
 * @brief Сокет закрыт брокером (connectionClosed)
 */
struct ConnectionClosedMessage {
    std::string reason;
};

/**
 * @brief Любое входящее сообщение брокера
 */
using BrokerMessage = std::variant<
    TickMessage,
    OrderStatusMessage,
    ExecutionMessage,
    OrderListEndMessage,
    ContractDetailsMessage,
    ContractDetailsEndMessage,
    OptionParamsMessage,
    OptionParamsEndMessage,
    AccountValueMessage,
    PortfolioValueMessage,
    AccountDownloadEndMessage,
    CurrentTimeMessage,
    ErrorMessage,
    ConnectionClosedMessage
>;

using BrokerMessageHandler = std::function<void(const BrokerMessage&)>;

/**
 * @brief Коды ошибок TWS, которые разбирает движок
 */
namespace broker_codes {
    constexpr int NO_SECURITY_DEFINITION = 200;     ///< Нет такого контракта
    constexpr int ORDER_REJECTED = 201;             ///< Ордер отклонён
    constexpr int ORDER_CANCELLED = 202;            ///< Ордер отменён
    constexpr int CLIENT_ID_IN_USE = 326;           ///< Client ID занят
    constexpr int NOT_CONNECTED = 504;
}

} // namespace ibtrader::ports::output
