#pragma once

#include "Contract.hpp"
#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ibtrader::domain {

/**
 * @brief Позиция с P&L
 */
struct PositionPnl {
    std::string symbol;         ///< Ключ контракта ("SPY 20250117 450.00C")
    Contract contract;
    Decimal position;           ///< Количество (отрицательное для шорта)
    Decimal averageCost;        ///< Средняя цена за одну акцию/опцион
    Decimal marketPrice;
    Decimal marketValue;
    Decimal unrealizedPnl;
    Decimal realizedPnl;
};

/**
 * @brief Снимок счёта. Только для чтения вне PortfolioTracker.
 */
struct AccountSnapshot {
    Decimal cashBalance;        ///< TotalCashValue
    Decimal netLiquidation;     ///< NetLiquidation
    Decimal availableFunds;     ///< LookAheadAvailableFunds
    Decimal dailyPnl;
    Decimal realizedPnl;
    Decimal unrealizedPnl;
    std::vector<PositionPnl> positions;
    std::optional<Timestamp> updatedAt;     ///< Пусто, пока данных не было
    bool stale = true;

    bool hasData() const {
        return updatedAt.has_value();
    }

    const PositionPnl* findPosition(const std::string& symbol) const {
        for (const auto& p : positions) {
            if (p.symbol == symbol) {
                return &p;
            }
        }
        return nullptr;
    }
};

} // namespace ibtrader::domain
