#include "domain/events/JsonMapping.hpp"

namespace ibtrader::domain {

nlohmann::json toJsonValue(const Decimal& value) {
    return value.toString();
}

nlohmann::json toJsonValue(const std::optional<Decimal>& value) {
    if (!value) {
        return nullptr;
    }
    return value->toString();
}

nlohmann::json toJsonValue(const Contract& contract) {
    nlohmann::json j;
    j["key"] = contract.key();
    j["symbol"] = contract.symbol;
    j["secType"] = toString(contract.secType);
    j["exchange"] = contract.exchange;
    j["currency"] = contract.currency;
    if (contract.isOption()) {
        j["expiry"] = contract.expiry;
        j["strike"] = toJsonValue(contract.strike);
        j["right"] = toString(contract.right);
        j["multiplier"] = contract.multiplier;
    }
    return j;
}

nlohmann::json toJsonValue(const Quote& quote) {
    return {
        {"key", quote.key},
        {"state", toString(quote.state)},
        {"bid", toJsonValue(quote.bid)},
        {"ask", toJsonValue(quote.ask)},
        {"last", toJsonValue(quote.last)},
        {"close", toJsonValue(quote.close)},
        {"marketPrice", toJsonValue(quote.marketPrice())},
        {"updatedAt", quote.updatedAt.toString()}
    };
}

nlohmann::json toJsonValue(const BracketLeg& leg) {
    nlohmann::json j;
    j["role"] = toString(leg.role);
    j["side"] = toString(leg.side);
    j["quantity"] = leg.quantity;
    j["orderType"] = toString(leg.type);
    j["limitPrice"] = toJsonValue(leg.limitPrice);
    j["stopPrice"] = toJsonValue(leg.stopPrice);
    j["brokerOrderId"] = leg.brokerOrderId ? nlohmann::json(*leg.brokerOrderId) : nlohmann::json(nullptr);
    j["status"] = toString(leg.status);
    j["filledQuantity"] = leg.filledQuantity;
    j["fillPrice"] = toJsonValue(leg.fillPrice());
    if (!leg.rejectReason.empty()) {
        j["rejectReason"] = leg.rejectReason;
    }
    return j;
}

nlohmann::json toJsonValue(const BracketOrder& order) {
    nlohmann::json j;
    j["groupId"] = order.groupId;
    j["contract"] = toJsonValue(order.contract);
    j["state"] = toString(order.state);
    j["ocaGroup"] = order.ocaGroup;
    j["stopLossPct"] = toJsonValue(order.risk.stopLossPct);
    j["takeProfitPct"] = toJsonValue(order.risk.takeProfitPct);
    j["entry"] = toJsonValue(order.entry);
    j["stopLoss"] = order.stopLoss ? toJsonValue(*order.stopLoss) : nlohmann::json(nullptr);
    j["takeProfit"] = order.takeProfit ? toJsonValue(*order.takeProfit) : nlohmann::json(nullptr);
    if (order.failure) {
        j["failure"] = {
            {"leg", toString(order.failure->leg)},
            {"code", toString(order.failure->code)},
            {"message", order.failure->message}
        };
    }
    j["createdAt"] = order.createdAt.toString();
    j["updatedAt"] = order.updatedAt.toString();
    return j;
}

nlohmann::json toJsonValue(const AccountSnapshot& snapshot) {
    nlohmann::json positions = nlohmann::json::array();
    for (const auto& p : snapshot.positions) {
        positions.push_back({
            {"symbol", p.symbol},
            {"position", toJsonValue(p.position)},
            {"avgCost", toJsonValue(p.averageCost)},
            {"marketPrice", toJsonValue(p.marketPrice)},
            {"marketValue", toJsonValue(p.marketValue)},
            {"unrealizedPNL", toJsonValue(p.unrealizedPnl)},
            {"realizedPNL", toJsonValue(p.realizedPnl)}
        });
    }

    return {
        {"cashBalance", toJsonValue(snapshot.cashBalance)},
        {"netLiquidation", toJsonValue(snapshot.netLiquidation)},
        {"availableFunds", toJsonValue(snapshot.availableFunds)},
        {"dailyPnL", toJsonValue(snapshot.dailyPnl)},
        {"realizedPnL", toJsonValue(snapshot.realizedPnl)},
        {"unrealizedPnL", toJsonValue(snapshot.unrealizedPnl)},
        {"positions", positions},
        {"updatedAt", snapshot.updatedAt ? nlohmann::json(snapshot.updatedAt->toString()) : nlohmann::json(nullptr)},
        {"stale", snapshot.stale}
    };
}

nlohmann::json toJsonValue(const Session& session) {
    return {
        {"host", session.host},
        {"port", session.port},
        {"clientId", session.clientId},
        {"state", toString(session.state)}
    };
}

nlohmann::json toJsonValue(const StrikeLadder& ladder) {
    nlohmann::json strikes = nlohmann::json::array();
    for (const auto& strike : ladder.strikes) {
        strikes.push_back(toJsonValue(strike));
    }
    return {
        {"symbol", ladder.symbol},
        {"currentPrice", toJsonValue(ladder.underlyingPrice)},
        {"expiry", ladder.expiry},
        {"strikes", strikes}
    };
}

} // namespace ibtrader::domain
