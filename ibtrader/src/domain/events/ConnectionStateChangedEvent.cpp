#include "domain/events/ConnectionStateChangedEvent.hpp"
#include "domain/events/JsonMapping.hpp"
#include <nlohmann/json.hpp>

namespace ibtrader::domain {

std::string ConnectionStateChangedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["session"] = toJsonValue(session);
    j["previous"] = toString(previous);
    j["reason"] = reason;
    return j.dump();
}

} // namespace ibtrader::domain
