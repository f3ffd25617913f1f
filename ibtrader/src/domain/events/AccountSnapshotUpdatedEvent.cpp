#include "domain/events/AccountSnapshotUpdatedEvent.hpp"
#include "domain/events/JsonMapping.hpp"
#include <nlohmann/json.hpp>

namespace ibtrader::domain {

std::string AccountSnapshotUpdatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["snapshot"] = toJsonValue(snapshot);
    return j.dump();
}

} // namespace ibtrader::domain
