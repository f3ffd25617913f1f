#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include "enums/LegRole.hpp"
#include "enums/LegStatus.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderType.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ibtrader::domain {

/**
 * @brief Сделка (execution) по ноге
 */
struct Execution {
    std::string execId;
    int64_t shares = 0;
    Decimal price;
    Timestamp time;
};

/**
 * @brief Одна нога брекет-группы (вход, стоп или тейк)
 */
struct BracketLeg {
    LegRole role = LegRole::ENTRY;
    OrderSide side = OrderSide::BUY;
    int64_t quantity = 0;
    OrderType type = OrderType::MARKET;
    std::optional<Decimal> limitPrice;      ///< lmtPrice для LMT
    std::optional<Decimal> stopPrice;       ///< auxPrice для STP

    std::optional<int64_t> brokerOrderId;   ///< orderId у брокера
    LegStatus status = LegStatus::PENDING;
    int64_t filledQuantity = 0;
    std::optional<Decimal> avgFillPrice;    ///< avgFillPrice из orderStatus
    std::vector<Execution> executions;
    std::string rejectReason;

    int submitAttempts = 0;                 ///< Неудачные попытки отправки
    bool cancelRequested = false;           ///< Отмена уже отправлена брокеру

    bool isFinal() const {
        return isFinalStatus(status);
    }

    /**
     * @brief Добавить сделку, дубликаты по execId игнорируются
     * @return true если сделка новая
     */
    bool addExecution(const Execution& execution) {
        for (const auto& existing : executions) {
            if (existing.execId == execution.execId) {
                return false;
            }
        }
        executions.push_back(execution);
        return true;
    }

    /**
     * @brief Фактическая цена исполнения
     *
     * VWAP по сделкам, если они есть, иначе avgFillPrice брокера.
     */
    std::optional<Decimal> fillPrice() const {
        int64_t totalShares = 0;
        Decimal totalValue;
        for (const auto& execution : executions) {
            totalShares += execution.shares;
            totalValue = totalValue + execution.price * execution.shares;
        }
        if (totalShares > 0) {
            return totalValue.dividedBy(totalShares);
        }
        if (avgFillPrice && avgFillPrice->isPositive()) {
            return avgFillPrice;
        }
        return std::nullopt;
    }
};

} // namespace ibtrader::domain
