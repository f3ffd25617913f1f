#pragma once

#include "application/BrokerMessageDispatcher.hpp"
#include "application/ConnectionManager.hpp"
#include "application/EventLoop.hpp"
#include "domain/AccountSnapshot.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventBus.hpp"
#include "settings/EngineConfig.hpp"
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ibtrader::application {

/**
 * @brief Баланс счёта и P&L по позициям
 *
 * Собирает поток updateAccountValue / updatePortfolio и публикует
 * новый AccountSnapshot на каждый accountDownloadEnd. Таймер
 * периодически перезапрашивает данные и помечает снимок устаревшим,
 * если обновлений не было дольше accountStaleAfter. Ошибка обновления
 * не превращается в ошибку: отдаётся последний снимок с флагом stale.
 */
class PortfolioTracker : public std::enable_shared_from_this<PortfolioTracker> {
public:
    PortfolioTracker(
        EventLoop& loop,
        const settings::EngineConfig& config,
        std::shared_ptr<ConnectionManager> connection,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ports::output::IClock> clock
    );

    void attach(BrokerMessageDispatcher& dispatcher);

    /**
     * @brief Запустить периодическое обновление
     */
    void start();

    /**
     * @brief Последний снимок; stale вычисляется на момент вызова
     */
    domain::AccountSnapshot getSnapshot() const;

    /**
     * @brief Запросить обновление счёта у брокера
     * @return false если сессии нет
     */
    bool refresh();

    void onConnectionStateChanged(domain::ConnectionState previous,
                                  domain::ConnectionState current);

    void shutdown();

private:
    settings::EngineConfig config_;
    std::shared_ptr<ConnectionManager> connection_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ports::output::IClock> clock_;
    Strand strand_;
    boost::asio::steady_timer timer_;

    struct AccountValues {
        std::optional<domain::Decimal> netLiquidation;
        std::optional<domain::Decimal> totalCash;
        std::optional<domain::Decimal> availableFunds;
        std::optional<domain::Decimal> dailyPnl;
        std::optional<domain::Decimal> realizedPnl;
        std::optional<domain::Decimal> unrealizedPnl;
    };

    mutable std::mutex mutex_;
    AccountValues values_;
    std::map<std::string, domain::PositionPnl> positions_;
    domain::AccountSnapshot snapshot_;
    bool staleReported_ = false;
    std::atomic<bool> stopped_{false};

    void onAccountValue(const ports::output::AccountValueMessage& message);
    void onPortfolioValue(const ports::output::PortfolioValueMessage& message);
    void onDownloadEnd();

    void scheduleTick();
    void onTick();

    bool isStale(const domain::AccountSnapshot& snapshot) const;
};

} // namespace ibtrader::application
