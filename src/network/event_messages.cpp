#include "stratmon/network/event_messages.hpp"
#include "stratmon/sync/strategy_codec.hpp"

#include <fmt/format.h>

namespace stratmon::network {

namespace {

std::string price_json(std::optional<Price> price) {
    return price ? fmt::format("{}", *price) : std::string("null");
}

} // namespace

std::string price_event(const StrategyId& id, std::optional<Price> price) {
    return fmt::format("{{\"event\":\"price\",\"id\":\"{}\",\"price\":{}}}",
                       sync::json_escape(id), price_json(price));
}

std::string alarm_event(AlarmEvent event, const StrategyId& id, std::optional<Price> price) {
    return fmt::format("{{\"event\":\"{}\",\"id\":\"{}\",\"price\":{}}}",
                       alarm_event_name(event), sync::json_escape(id), price_json(price));
}

std::string subscription_event(const std::string& ticker, bool ok, const std::string& reason) {
    return fmt::format("{{\"event\":\"subscription\",\"ticker\":\"{}\",\"ok\":{},\"reason\":\"{}\"}}",
                       sync::json_escape(ticker), ok, sync::json_escape(reason));
}

std::string session_event(bool connected, const std::string& message) {
    return fmt::format("{{\"event\":\"session\",\"connected\":{},\"message\":\"{}\"}}",
                       connected, sync::json_escape(message));
}

} // namespace stratmon::network
