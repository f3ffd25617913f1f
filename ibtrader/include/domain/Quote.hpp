#pragma once

#include "Decimal.hpp"
#include "Timestamp.hpp"
#include <optional>
#include <string>

namespace ibtrader::domain {

/**
 * @brief Состояние котировки
 *
 * UNKNOWN: подписка есть, но тиков ещё не было. Нулевые цены вместо
 * этого состояния не используются, чтобы не считать уровни от нуля.
 */
enum class QuoteState {
    UNKNOWN,
    LIVE
};

inline std::string toString(QuoteState state) {
    return state == QuoteState::LIVE ? "LIVE" : "UNKNOWN";
}

/**
 * @brief Последняя известная котировка инструмента
 */
struct Quote {
    std::string key;                ///< Ключ контракта
    QuoteState state = QuoteState::UNKNOWN;
    std::optional<Decimal> bid;
    std::optional<Decimal> ask;
    std::optional<Decimal> last;
    std::optional<Decimal> close;
    Timestamp updatedAt;

    bool isKnown() const {
        return state == QuoteState::LIVE;
    }

    /**
     * @brief Рыночная цена: mid, иначе last, иначе close
     */
    std::optional<Decimal> marketPrice() const {
        if (bid && ask && bid->isPositive() && ask->isPositive()) {
            return (*bid + *ask).dividedBy(2);
        }
        if (last && last->isPositive()) {
            return last;
        }
        if (close && close->isPositive()) {
            return close;
        }
        return std::nullopt;
    }
};

} // namespace ibtrader::domain
