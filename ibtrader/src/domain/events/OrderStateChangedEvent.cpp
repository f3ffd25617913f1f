#include "domain/events/OrderStateChangedEvent.hpp"
#include "domain/events/JsonMapping.hpp"
#include <nlohmann/json.hpp>

namespace ibtrader::domain {

std::string OrderStateChangedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["order"] = toJsonValue(order);
    j["changedLeg"] = changedLeg ? nlohmann::json(toString(*changedLeg)) : nlohmann::json(nullptr);
    j["message"] = message;
    return j.dump();
}

} // namespace ibtrader::domain
