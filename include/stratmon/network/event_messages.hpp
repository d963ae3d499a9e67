#pragma once

#include "stratmon/core/types.hpp"

#include <optional>
#include <string>

namespace stratmon::network {

// JSON text frames pushed to dashboard clients

// {"event":"price","id":"..","price":-0.95} (price null while incomplete)
std::string price_event(const StrategyId& id, std::optional<Price> price);

// {"event":"reached"|"left","id":"..","price":..}
std::string alarm_event(AlarmEvent event, const StrategyId& id, std::optional<Price> price);

// {"event":"subscription","ticker":"..","ok":true,"reason":""}
std::string subscription_event(const std::string& ticker, bool ok, const std::string& reason);

// {"event":"session","connected":true,"message":".."}
std::string session_event(bool connected, const std::string& message);

} // namespace stratmon::network
