#pragma once

#include <string>
#include <stdexcept>

namespace ibtrader::domain {

/**
 * @brief Статус отдельной ноги брекет-ордера
 *
 * PENDING -> SUBMITTED -> {FILLED, CANCELLED, REJECTED}
 */
enum class LegStatus {
    PENDING,    ///< Создана локально, брокеру ещё не передана
    SUBMITTED,  ///< Принята брокером
    FILLED,     ///< Исполнена полностью
    CANCELLED,  ///< Отменена
    REJECTED    ///< Отклонена брокером или не отправлена
};

inline std::string toString(LegStatus status) {
    switch (status) {
        case LegStatus::PENDING:   return "PENDING";
        case LegStatus::SUBMITTED: return "SUBMITTED";
        case LegStatus::FILLED:    return "FILLED";
        case LegStatus::CANCELLED: return "CANCELLED";
        case LegStatus::REJECTED:  return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline LegStatus legStatusFromString(const std::string& str) {
    if (str == "PENDING")   return LegStatus::PENDING;
    if (str == "SUBMITTED") return LegStatus::SUBMITTED;
    if (str == "FILLED")    return LegStatus::FILLED;
    if (str == "CANCELLED") return LegStatus::CANCELLED;
    if (str == "REJECTED")  return LegStatus::REJECTED;
    throw std::invalid_argument("Unknown LegStatus: " + str);
}

/**
 * @brief Является ли статус финальным (нога больше не может измениться)
 */
inline bool isFinalStatus(LegStatus status) {
    return status == LegStatus::FILLED ||
           status == LegStatus::CANCELLED ||
           status == LegStatus::REJECTED;
}

/**
 * @brief Допустим ли переход (финальные статусы не меняются, назад не ходим)
 */
inline bool isForwardTransition(LegStatus from, LegStatus to) {
    if (isFinalStatus(from) || from == to) {
        return false;
    }
    return !(from == LegStatus::SUBMITTED && to == LegStatus::PENDING);
}

} // namespace ibtrader::domain
