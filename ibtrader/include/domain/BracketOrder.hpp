#pragma once

#include "BracketLeg.hpp"
#include "Contract.hpp"
#include "EngineError.hpp"
#include "RiskProfile.hpp"
#include "Timestamp.hpp"
#include "enums/GroupState.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ibtrader::domain {

/**
 * @brief Какая нога не прошла и почему
 */
struct GroupFailure {
    LegRole leg = LegRole::ENTRY;
    ErrorCode code = ErrorCode::NONE;
    std::string message;
};

/**
 * @brief Брекет-группа: вход + опциональные стоп и тейк
 *
 * Ноги стоп/тейк существуют только если соответствующий процент
 * в RiskProfile включён. Все ноги разделяют groupId, стоп и тейк
 * связаны одной OCA-группой на стороне брокера.
 */
struct BracketOrder {
    std::string groupId;
    Contract contract;
    RiskProfile risk;
    std::string ocaGroup;

    BracketLeg entry;
    std::optional<BracketLeg> stopLoss;
    std::optional<BracketLeg> takeProfit;

    GroupState state = GroupState::AWAITING_ENTRY;
    std::optional<GroupFailure> failure;
    Timestamp createdAt;
    Timestamp updatedAt;

    BracketLeg* legByRole(LegRole role) {
        switch (role) {
            case LegRole::ENTRY:       return &entry;
            case LegRole::STOP_LOSS:   return stopLoss ? &*stopLoss : nullptr;
            case LegRole::TAKE_PROFIT: return takeProfit ? &*takeProfit : nullptr;
        }
        return nullptr;
    }

    BracketLeg* legByOrderId(int64_t orderId) {
        for (auto* leg : legs()) {
            if (leg->brokerOrderId && *leg->brokerOrderId == orderId) {
                return leg;
            }
        }
        return nullptr;
    }

    /**
     * @brief Вторая нога защиты (для OCO)
     */
    BracketLeg* siblingOf(LegRole role) {
        if (role == LegRole::STOP_LOSS) return legByRole(LegRole::TAKE_PROFIT);
        if (role == LegRole::TAKE_PROFIT) return legByRole(LegRole::STOP_LOSS);
        return nullptr;
    }

    std::vector<BracketLeg*> legs() {
        std::vector<BracketLeg*> result{&entry};
        if (stopLoss) result.push_back(&*stopLoss);
        if (takeProfit) result.push_back(&*takeProfit);
        return result;
    }

    bool hasRiskLegs() const {
        return stopLoss.has_value() || takeProfit.has_value();
    }

    bool allRiskLegsFinal() const {
        return (!stopLoss || stopLoss->isFinal()) &&
               (!takeProfit || takeProfit->isFinal());
    }

    bool isTerminal() const {
        return ibtrader::domain::isTerminal(state);
    }

    void recordFailure(LegRole leg, ErrorCode code, const std::string& message) {
        failure = GroupFailure{leg, code, message};
        updatedAt = Timestamp::now();
    }
};

} // namespace ibtrader::domain
