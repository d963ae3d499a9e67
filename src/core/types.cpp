#include "stratmon/core/types.hpp"

#include <algorithm>
#include <cctype>

namespace stratmon {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

std::optional<Side> parse_side(std::string_view text) {
    const std::string v = lower(text);
    if (v == "long" || v == "buy" || v == "+") return Side::Long;
    if (v == "short" || v == "sell" || v == "-") return Side::Short;
    return std::nullopt;
}

std::optional<TargetCondition> parse_condition(std::string_view text) {
    const std::string v = lower(text);
    if (v == "below" || v == "inferieur" || v == "<=") return TargetCondition::Below;
    if (v == "above" || v == "superieur" || v == ">=") return TargetCondition::Above;
    return std::nullopt;
}

std::optional<StrategyStatus> parse_status(std::string_view text) {
    const std::string v = lower(text);
    if (v == "active" || v == "en cours") return StrategyStatus::Active;
    if (v == "done" || v == "fait") return StrategyStatus::Done;
    if (v == "cancelled" || v == "canceled") return StrategyStatus::Cancelled;
    return std::nullopt;
}

} // namespace stratmon
