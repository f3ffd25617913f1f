#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/EventLoop.hpp"
#include "application/MarketDataFeed.hpp"
#include "application/OrderEngine.hpp"
#include "application/PortfolioTracker.hpp"
#include "application/StrikeSelector.hpp"
#include "application/TradingCalendar.hpp"
#include "application/WatchlistValidator.hpp"
#include "ports/input/ITradingTerminal.hpp"
#include "ports/output/IBrokerSession.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/EngineConfig.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <mutex>

namespace ibtrader::application {

/**
 * @brief Фасад движка для интерфейса пользователя
 *
 * Собирает компоненты вокруг одной сессии с брокером: создаёт пул
 * потоков, подключает обработчики к диспетчеру сообщений брокера,
 * раздаёт уведомления о смене состояния сессии. После
 * переподключения заново подписывает тикеры из списка наблюдения.
 */
class TradingTerminal : public ports::input::ITradingTerminal {
public:
    TradingTerminal(
        const settings::EngineConfig& config,
        std::shared_ptr<ports::output::IBrokerSession> broker,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ports::output::IClock> clock
    );

    ~TradingTerminal() override;

    ports::input::ConnectionResult connect() override;
    ports::input::ConnectionResult connect(const std::string& host, int port, int clientId) override;
    void disconnect() override;
    domain::Session session() const override;

    ports::input::TickerResult addTicker(const std::string& ticker) override;
    ports::input::TickerResult validateTicker(const std::string& ticker) override;
    bool removeTicker(const std::string& ticker) override;
    std::vector<std::string> watchlist() const override;

    std::optional<domain::Quote> latestQuote(const std::string& ticker) const override;
    ports::input::LadderResult getStrikeLadder(const std::string& ticker) const override;

    ports::input::OrderResult placeBracketOrder(const ports::input::PlaceOrderRequest& request) override;
    ports::input::OrderResult cancelOrder(const std::string& groupId) override;
    std::optional<domain::BracketOrder> getOrder(const std::string& groupId) const override;
    std::vector<domain::BracketOrder> listOrders() const override;

    domain::AccountSnapshot getSnapshot() const override;
    ports::input::OrderResult closePosition(const std::string& symbol) override;
    ports::input::CloseAllResult closeAllPositions() override;

    /**
     * @brief Остановить компоненты, затем пул потоков. Повторный вызов безопасен.
     */
    void shutdown() override;

private:
    settings::EngineConfig config_;
    std::shared_ptr<ports::output::IBrokerSession> broker_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ports::output::IClock> clock_;

    EventLoop loop_;
    std::shared_ptr<BrokerMessageDispatcher> dispatcher_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<MarketDataFeed> marketData_;
    std::shared_ptr<WatchlistValidator> validator_;
    std::shared_ptr<OrderEngine> orderEngine_;
    std::shared_ptr<PortfolioTracker> portfolio_;

    StrikeSelector strikeSelector_;
    TradingCalendar calendar_;

    // Символ -> параметры цепочки, сохранённые при проверке
    mutable std::mutex watchlistMutex_;
    std::map<std::string, domain::OptionChainParams> watchlist_;

    std::atomic<bool> stopped_{false};

    void onConnectionStateChanged(domain::ConnectionState previous,
                                  domain::ConnectionState current);
    void resubscribeWatchlist();

    static ports::input::OrderResult toOrderResult(const SubmitResult& submitted);
};

} // namespace ibtrader::application
