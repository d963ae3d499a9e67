#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stratmon {

// Timestamps
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using SystemTimestamp = std::chrono::time_point<std::chrono::system_clock>;

using Price = double;
using Quantity = int;

using LegId = std::string;
using StrategyId = std::string;

// Position side of a leg
enum class Side : uint8_t {
    Long = 0,
    Short = 1
};

inline constexpr const char* side_name(Side s) noexcept {
    return s == Side::Long ? "long" : "short";
}

inline constexpr int side_multiplier(Side s) noexcept {
    return s == Side::Long ? 1 : -1;
}

// Alarm trigger condition
enum class TargetCondition : uint8_t {
    Below = 0,   // price <= target
    Above = 1    // price >= target
};

inline constexpr const char* condition_name(TargetCondition c) noexcept {
    return c == TargetCondition::Below ? "below" : "above";
}

// Strategy lifecycle
enum class StrategyStatus : uint8_t {
    Active = 0,
    Done = 1,
    Cancelled = 2
};

inline constexpr const char* status_name(StrategyStatus s) noexcept {
    switch (s) {
        case StrategyStatus::Active: return "active";
        case StrategyStatus::Done: return "done";
        case StrategyStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

std::optional<Side> parse_side(std::string_view text);
std::optional<TargetCondition> parse_condition(std::string_view text);
std::optional<StrategyStatus> parse_status(std::string_view text);

// Who caused a structural change. Remote changes are never echoed back.
enum class ChangeOrigin : uint8_t {
    Local = 0,
    Remote = 1
};

/**
 * One quote as delivered by the feed.
 *
 * Absent fields are std::nullopt. Zero is a valid traded price and is kept.
 */
struct QuoteSnapshot {
    std::optional<Price> last;
    std::optional<Price> bid;
    std::optional<Price> ask;

    // Feed sentinels (negative, NaN, inf) mean "no value"
    static std::optional<Price> field(double raw) noexcept {
        if (!std::isfinite(raw) || raw < 0.0) {
            return std::nullopt;
        }
        return raw;
    }

    static QuoteSnapshot from_raw(double last, double bid, double ask) noexcept {
        return {field(last), field(bid), field(ask)};
    }

    bool empty() const noexcept { return !last && !bid && !ask; }
};

// Per-leg quote state (merged across updates)
struct LegQuote {
    std::optional<Price> last;
    std::optional<Price> bid;
    std::optional<Price> ask;
    std::optional<Price> mid;
    Timestamp updated{};

    // Mid wins whenever both sides are present
    std::optional<Price> price() const noexcept {
        return mid ? mid : last;
    }
};

// Plain-data strategy description (initial book, remote sync, snapshots)
struct LegRecord {
    LegId id;
    std::string ticker;
    Side side{Side::Long};
    Quantity quantity{1};
};

struct StrategyRecord {
    StrategyId id;
    std::string name;
    std::vector<LegRecord> legs;
    std::optional<Price> target;
    TargetCondition condition{TargetCondition::Below};
    StrategyStatus status{StrategyStatus::Active};
};

// Alarm transitions
enum class AlarmEvent : uint8_t {
    Reached = 0,
    Left = 1
};

inline constexpr const char* alarm_event_name(AlarmEvent e) noexcept {
    return e == AlarmEvent::Reached ? "reached" : "left";
}

// Callback types
using PriceCallback = std::function<void(const StrategyId&, std::optional<Price>)>;
using AlarmCallback = std::function<void(const StrategyId&, std::optional<Price>)>;
using StrategyChangedCallback = std::function<void(const StrategyId&, const StrategyRecord&)>;
using SubscriptionStatusCallback =
    std::function<void(const std::string& ticker, bool started, const std::string& reason)>;
using SessionCallback = std::function<void(bool connected, const std::string& message)>;

} // namespace stratmon
