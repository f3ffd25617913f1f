#pragma once

#include <string>

namespace ibtrader::domain {

/**
 * @brief Роль ноги внутри брекет-группы
 */
enum class LegRole {
    ENTRY,
    STOP_LOSS,
    TAKE_PROFIT
};

inline std::string toString(LegRole role) {
    switch (role) {
        case LegRole::ENTRY:       return "ENTRY";
        case LegRole::STOP_LOSS:   return "STOP_LOSS";
        case LegRole::TAKE_PROFIT: return "TAKE_PROFIT";
    }
    return "UNKNOWN";
}

} // namespace ibtrader::domain
