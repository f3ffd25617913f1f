#pragma once

#include "settings/EngineConfig.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ibtrader::adapters::secondary {

/**
 * @brief Загрузка EngineConfig из config.json и переменных окружения
 *
 * Отсутствующие секции и поля берутся из значений по умолчанию
 * EngineConfig. Переменные IB_HOST, IB_PORT, IB_CLIENT_ID перекрывают
 * файл.
 *
 * @code
 * {
 *   "connection": { "host": "127.0.0.1", "port": 7497, "clientId": 1 },
 *   "risk": { "defaultStopLoss": "20", "defaultTakeProfit": "--" },
 *   "tradingWindow": { "timeZone": "EST-5EDT,M3.2.0,M11.1.0",
 *                      "open": "09:30", "close": "16:00" }
 * }
 * @endcode
 */
class JsonEngineConfigLoader {
public:
    /**
     * @throws std::runtime_error если файл не читается или содержит ошибки
     */
    static settings::EngineConfig loadFile(const std::string& path);

    /**
     * @throws std::runtime_error при некорректном JSON или значениях
     */
    static settings::EngineConfig parse(const std::string& text);

    static settings::EngineConfig fromJson(const nlohmann::json& root);

    static void applyEnvironment(settings::EngineConfig& config);
};

} // namespace ibtrader::adapters::secondary
