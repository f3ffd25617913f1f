#include "domain/events/QuoteUpdatedEvent.hpp"
#include "domain/events/JsonMapping.hpp"
#include <nlohmann/json.hpp>

namespace ibtrader::domain {

std::string QuoteUpdatedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["quote"] = toJsonValue(quote);
    return j.dump();
}

} // namespace ibtrader::domain
