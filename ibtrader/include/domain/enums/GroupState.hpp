#pragma once

#include <string>
#include <stdexcept>

namespace ibtrader::domain {

/**
 * @brief Состояние группы брекет-ордера
 *
 * AWAITING_ENTRY -> ENTRY_FILLED -> BRACKET_ACTIVE -> CLOSED
 * AWAITING_ENTRY -> CANCELLED | REJECTED
 */
enum class GroupState {
    AWAITING_ENTRY,
    ENTRY_FILLED,
    BRACKET_ACTIVE,
    CLOSED,
    CANCELLED,
    REJECTED
};

inline std::string toString(GroupState state) {
    switch (state) {
        case GroupState::AWAITING_ENTRY: return "AWAITING_ENTRY";
        case GroupState::ENTRY_FILLED:   return "ENTRY_FILLED";
        case GroupState::BRACKET_ACTIVE: return "BRACKET_ACTIVE";
        case GroupState::CLOSED:         return "CLOSED";
        case GroupState::CANCELLED:      return "CANCELLED";
        case GroupState::REJECTED:       return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline GroupState groupStateFromString(const std::string& str) {
    if (str == "AWAITING_ENTRY") return GroupState::AWAITING_ENTRY;
    if (str == "ENTRY_FILLED")   return GroupState::ENTRY_FILLED;
    if (str == "BRACKET_ACTIVE") return GroupState::BRACKET_ACTIVE;
    if (str == "CLOSED")         return GroupState::CLOSED;
    if (str == "CANCELLED")      return GroupState::CANCELLED;
    if (str == "REJECTED")       return GroupState::REJECTED;
    throw std::invalid_argument("Unknown GroupState: " + str);
}

inline bool isTerminal(GroupState state) {
    return state == GroupState::CLOSED ||
           state == GroupState::CANCELLED ||
           state == GroupState::REJECTED;
}

} // namespace ibtrader::domain
