#pragma once

#include "ports/output/BrokerMessages.hpp"
#include "domain/Contract.hpp"
#include "domain/EngineError.hpp"
#include "domain/enums/OrderSide.hpp"
#include "domain/enums/OrderType.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace ibtrader::ports::output {

/**
 * @brief Результат установки сессии
 */
struct ConnectOutcome {
    bool success = false;
    domain::ErrorCode code = domain::ErrorCode::NONE;
    std::string error;

    static ConnectOutcome ok() {
        return ConnectOutcome{true, domain::ErrorCode::NONE, ""};
    }

    static ConnectOutcome fail(domain::ErrorCode code, const std::string& error) {
        return ConnectOutcome{false, code, error};
    }
};

/**
 * @brief Ордер в терминах брокера (одна нога)
 */
struct BrokerOrder {
    domain::OrderSide side = domain::OrderSide::BUY;
    int64_t quantity = 0;
    domain::OrderType type = domain::OrderType::MARKET;
    std::optional<domain::Decimal> limitPrice;  ///< lmtPrice
    std::optional<domain::Decimal> stopPrice;   ///< auxPrice
    std::string ocaGroup;                       ///< Пусто, если нога вне OCA
    std::string orderRef;                       ///< groupId для сверки
};

/**
 * @brief Сокетная сессия с TWS / IB Gateway
 *
 * Output Port. Протокол брокера (фрейминг, id сообщений) скрыт за
 * этим интерфейсом. Все входящие сообщения приходят в единственный
 * обработчик, установленный через setMessageHandler(), из потока
 * адаптера. Обработчик не должен блокироваться.
 *
 * Реализации:
 * - SimulatedTwsGateway - брокер в памяти процесса
 *
 * Методы отправки вызываются только через ConnectionManager::send().
 */
class IBrokerSession {
public:
    virtual ~IBrokerSession() = default;

    /**
     * @brief Открыть сокет и дождаться handshake
     *
     * @return CONNECTION_ERROR если сокет не открылся,
     *         AUTH_REJECTED если clientId занят,
     *         TIMEOUT если handshake не пришёл за handshakeTimeout
     */
    virtual ConnectOutcome connect(
        const std::string& host,
        int port,
        int clientId,
        std::chrono::milliseconds handshakeTimeout
    ) = 0;

    virtual void disconnect() = 0;

    virtual bool isConnected() const = 0;

    /**
     * @brief reqCurrentTime, ответ - CurrentTimeMessage
     */
    virtual void requestCurrentTime() = 0;

    virtual void requestMarketData(int tickerId, const domain::Contract& contract) = 0;

    virtual void cancelMarketData(int tickerId) = 0;

    /**
     * @brief reqContractDetails, ответ - ContractDetailsMessage* + End
     *        или ErrorMessage с кодом 200
     */
    virtual void requestContractDetails(int reqId, const domain::Contract& contract) = 0;

    /**
     * @brief reqSecDefOptParams, ответ - OptionParamsMessage* + End
     */
    virtual void requestOptionParams(int reqId, const std::string& symbol, int64_t conId) = 0;

    /**
     * @brief Следующий свободный orderId сессии
     */
    virtual int64_t nextOrderId() = 0;

    virtual void placeOrder(int64_t orderId, const domain::Contract& contract, const BrokerOrder& order) = 0;

    virtual void cancelOrder(int64_t orderId) = 0;

    /**
     * @brief Статусы всех ордеров клиента (открытых и завершённых),
     *        ответ завершается OrderListEndMessage
     */
    virtual void requestAllOrders() = 0;

    /**
     * @brief reqAccountUpdates: поток AccountValue / PortfolioValue,
     *        каждая порция завершается AccountDownloadEndMessage
     */
    virtual void requestAccountUpdates(bool subscribe) = 0;

    virtual void setMessageHandler(BrokerMessageHandler handler) = 0;
};

} // namespace ibtrader::ports::output
