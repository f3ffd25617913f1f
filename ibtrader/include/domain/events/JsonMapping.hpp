#pragma once

#include "domain/AccountSnapshot.hpp"
#include "domain/BracketOrder.hpp"
#include "domain/OptionChain.hpp"
#include "domain/Quote.hpp"
#include "domain/Session.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace ibtrader::domain {

// Цены и суммы сериализуются строками ("3.90"), чтобы не терять точность.

nlohmann::json toJsonValue(const Decimal& value);
nlohmann::json toJsonValue(const std::optional<Decimal>& value);
nlohmann::json toJsonValue(const Contract& contract);
nlohmann::json toJsonValue(const Quote& quote);
nlohmann::json toJsonValue(const BracketLeg& leg);
nlohmann::json toJsonValue(const BracketOrder& order);
nlohmann::json toJsonValue(const AccountSnapshot& snapshot);
nlohmann::json toJsonValue(const Session& session);
nlohmann::json toJsonValue(const StrikeLadder& ladder);

} // namespace ibtrader::domain
