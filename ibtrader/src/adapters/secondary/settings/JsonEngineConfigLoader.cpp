#include "adapters/secondary/settings/JsonEngineConfigLoader.hpp"
#include "domain/RiskProfile.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ibtrader::adapters::secondary {

using domain::Decimal;
using nlohmann::json;

namespace {

Decimal decimalFrom(const json& value, const std::string& field) {
    try {
        if (value.is_string()) {
            return Decimal::fromString(value.get<std::string>());
        }
        if (value.is_number()) {
            return Decimal::fromString(value.dump());
        }
    } catch (const std::invalid_argument&) {
        // ниже общее сообщение
    }
    throw std::runtime_error("Invalid config: '" + field + "' must be a decimal number");
}

/**
 * @brief "--", "" и null выключают ногу защиты
 */
std::optional<Decimal> percentFrom(const json& value, const std::string& field) {
    if (value.is_null()) {
        return std::nullopt;
    }
    if (value.is_string()) {
        try {
            return domain::RiskProfile::parsePercent(value.get<std::string>());
        } catch (const domain::EngineException& e) {
            throw std::runtime_error("Invalid config: '" + field + "': " + e.what());
        }
    }
    return decimalFrom(value, field);
}

void readMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        auto value = section.at(key).get<int64_t>();
        if (value < 0) {
            throw std::runtime_error(std::string("Invalid config: '") + key + "' must not be negative");
        }
        target = std::chrono::milliseconds(value);
    }
}

template <typename T>
void readValue(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

/**
 * @brief "09:30" -> 570
 */
int minutesFrom(const std::string& text, const std::string& field) {
    int hours = 0;
    int minutes = 0;
    char colon = 0;
    std::istringstream in(text);
    if (!(in >> hours >> colon >> minutes) || colon != ':' ||
        hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
        throw std::runtime_error("Invalid config: '" + field + "' must be HH:MM, got '" + text + "'");
    }
    return hours * 60 + minutes;
}

} // namespace

settings::EngineConfig JsonEngineConfigLoader::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::cout << "[JsonEngineConfigLoader] Loading " << path << std::endl;
    return parse(buffer.str());
}

settings::EngineConfig JsonEngineConfigLoader::parse(const std::string& text) {
    try {
        return fromJson(json::parse(text));
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid config JSON: ") + e.what());
    }
}

settings::EngineConfig JsonEngineConfigLoader::fromJson(const json& root) {
    settings::EngineConfig config;
    const json empty = json::object();

    auto section = [&](const char* name) -> const json& {
        return root.contains(name) ? root.at(name) : empty;
    };

    const json& connection = section("connection");
    readValue(connection, "host", config.host);
    readValue(connection, "port", config.port);
    readValue(connection, "clientId", config.clientId);
    readMillis(connection, "handshakeTimeoutMs", config.handshakeTimeout);

    const json& risk = section("risk");
    if (risk.contains("defaultStopLoss")) {
        config.defaultStopLossPct = percentFrom(risk.at("defaultStopLoss"), "risk.defaultStopLoss");
    }
    if (risk.contains("defaultTakeProfit")) {
        config.defaultTakeProfitPct = percentFrom(risk.at("defaultTakeProfit"), "risk.defaultTakeProfit");
    }

    const json& heartbeat = section("heartbeat");
    readMillis(heartbeat, "intervalMs", config.heartbeatInterval);
    readValue(heartbeat, "missLimit", config.heartbeatMissLimit);

    const json& reconnect = section("reconnect");
    readValue(reconnect, "maxRetries", config.reconnectMaxRetries);
    readMillis(reconnect, "baseDelayMs", config.reconnectBaseDelay);
    readMillis(reconnect, "maxDelayMs", config.reconnectMaxDelay);

    const json& orders = section("orders");
    readValue(orders, "submitRetryLimit", config.submitRetryLimit);
    readMillis(orders, "submitRetryDelayMs", config.submitRetryDelay);
    readValue(orders, "finishedGroupsRetained", config.finishedGroupsRetained);

    const json& account = section("account");
    readMillis(account, "refreshIntervalMs", config.accountRefreshInterval);
    readMillis(account, "staleAfterMs", config.accountStaleAfter);

    const json& watchlist = section("watchlist");
    readMillis(watchlist, "validationTimeoutMs", config.validationTimeout);
    readValue(watchlist, "strikeLadderSize", config.strikeLadderSize);

    const json& window = section("tradingWindow");
    readValue(window, "timeZone", config.tradingWindow.timeZone);
    if (window.contains("open")) {
        config.tradingWindow.openMinutes = minutesFrom(window.at("open").get<std::string>(), "tradingWindow.open");
    }
    if (window.contains("close")) {
        config.tradingWindow.closeMinutes = minutesFrom(window.at("close").get<std::string>(), "tradingWindow.close");
    }

    const json& tick = section("tickSize");
    if (tick.contains("threshold")) {
        config.tickSize.threshold = decimalFrom(tick.at("threshold"), "tickSize.threshold");
    }
    if (tick.contains("below")) {
        config.tickSize.belowThreshold = decimalFrom(tick.at("below"), "tickSize.below");
    }
    if (tick.contains("atOrAbove")) {
        config.tickSize.atOrAboveThreshold = decimalFrom(tick.at("atOrAbove"), "tickSize.atOrAbove");
    }

    readValue(root, "eventLoopThreads", config.eventLoopThreads);

    if (config.port <= 0 || config.port > 65535) {
        throw std::runtime_error("Invalid config: port must be in 1..65535");
    }
    if (config.eventLoopThreads == 0) {
        throw std::runtime_error("Invalid config: eventLoopThreads must be positive");
    }
    if (config.tradingWindow.openMinutes >= config.tradingWindow.closeMinutes) {
        throw std::runtime_error("Invalid config: trading window must open before it closes");
    }
    if (!config.tickSize.belowThreshold.isPositive() || !config.tickSize.atOrAboveThreshold.isPositive()) {
        throw std::runtime_error("Invalid config: tick sizes must be positive");
    }
    return config;
}

void JsonEngineConfigLoader::applyEnvironment(settings::EngineConfig& config) {
    if (const char* host = std::getenv("IB_HOST")) {
        config.host = host;
    }
    try {
        if (const char* port = std::getenv("IB_PORT")) {
            config.port = std::stoi(port);
        }
        if (const char* clientId = std::getenv("IB_CLIENT_ID")) {
            config.clientId = std::stoi(clientId);
        }
    } catch (const std::logic_error&) {
        throw std::runtime_error("IB_PORT and IB_CLIENT_ID must be integers");
    }
}

} // namespace ibtrader::adapters::secondary
