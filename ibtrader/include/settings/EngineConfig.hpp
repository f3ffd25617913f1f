#pragma once

#include "domain/Decimal.hpp"
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace ibtrader::settings {

/**
 * @brief Правило шага цены: ниже порога один шаг, от порога другой
 *
 * По умолчанию как у опционов US: 0.05 до $3.00, 0.10 от $3.00.
 */
struct TickSizeRule {
    domain::Decimal threshold{3, 0};
    domain::Decimal belowThreshold{0, 50000000};
    domain::Decimal atOrAboveThreshold{0, 100000000};

    domain::Decimal tickFor(const domain::Decimal& price) const {
        return price < threshold ? belowThreshold : atOrAboveThreshold;
    }
};

/**
 * @brief Торговое окно в локальном времени биржи
 *
 * timeZone - POSIX-строка часового пояса (Boost.DateTime).
 */
struct TradingWindow {
    std::string timeZone = "EST-5EDT,M3.2.0,M11.1.0";
    int openMinutes = 9 * 60 + 30;      ///< 09:30
    int closeMinutes = 16 * 60;         ///< 16:00
};

/**
 * @brief Неизменяемая конфигурация движка
 *
 * Передаётся в конструктор. Ядро не читает файлы и переменные
 * окружения, этим занимается JsonEngineConfigLoader.
 */
struct EngineConfig {
    std::string host = "127.0.0.1";
    int port = 7497;
    int clientId = 1;

    std::optional<domain::Decimal> defaultStopLossPct;
    std::optional<domain::Decimal> defaultTakeProfitPct;

    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds validationTimeout{5000};

    std::chrono::milliseconds heartbeatInterval{10000};
    int heartbeatMissLimit = 3;

    int reconnectMaxRetries = 5;
    std::chrono::milliseconds reconnectBaseDelay{1000};
    std::chrono::milliseconds reconnectMaxDelay{30000};

    int submitRetryLimit = 3;
    std::chrono::milliseconds submitRetryDelay{500};
    std::size_t finishedGroupsRetained = 500;   ///< Сколько завершённых групп хранить

    std::chrono::milliseconds accountRefreshInterval{5000};
    std::chrono::milliseconds accountStaleAfter{15000};

    TradingWindow tradingWindow;
    TickSizeRule tickSize;

    std::size_t eventLoopThreads = 2;
    int strikeLadderSize = 12;
};

} // namespace ibtrader::settings
