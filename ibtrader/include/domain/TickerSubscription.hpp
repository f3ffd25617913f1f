#pragma once

#include "Contract.hpp"
#include "Quote.hpp"

namespace ibtrader::domain {

/**
 * @brief Подписка на поток котировок одного контракта
 *
 * Принадлежит MarketDataFeed, остальные компоненты получают копии.
 */
struct TickerSubscription {
    Contract contract;
    int tickerId = 0;               ///< reqId потока рыночных данных
    bool optionsEligible = false;   ///< Тикер прошёл проверку опционной цепочки
    Quote lastQuote;
};

} // namespace ibtrader::domain
