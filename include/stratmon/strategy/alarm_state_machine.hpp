#pragma once

#include "stratmon/core/types.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace stratmon::strategy {

enum class AlarmState : uint8_t {
    NotArmed = 0,
    Armed = 1
};

inline constexpr const char* alarm_state_name(AlarmState s) noexcept {
    return s == AlarmState::Armed ? "armed" : "not_armed";
}

/**
 * Per-strategy edge detector for target crossings.
 *
 * Reached fires once when the price becomes worthy of the target, Left once
 * when it stops being worthy (including when the price goes incomplete or the
 * strategy leaves ACTIVE). Nothing fires while the state does not change.
 *
 * Not thread-safe; owned by MonitorEngine.
 */
class AlarmStateMachine {
public:
    struct Input {
        StrategyStatus status{StrategyStatus::Active};
        std::optional<Price> price;
        std::optional<Price> target;
        TargetCondition condition{TargetCondition::Below};
    };

    void add(const StrategyId& id);
    void remove(const StrategyId& id);
    bool contains(const StrategyId& id) const { return states_.count(id) > 0; }

    // Run the transition rules once
    std::optional<AlarmEvent> evaluate(const StrategyId& id, const Input& input);

    // Target or condition edited: a held alarm is released, then the new
    // target is checked against the current price (may yield Left, Reached)
    std::vector<AlarmEvent> on_target_changed(const StrategyId& id, const Input& input);

    // Manual continue: forget the alarm without emitting
    void rearm(const StrategyId& id);

    AlarmState state(const StrategyId& id) const;

    std::size_t armed_count() const;

    static bool is_worthy(const Input& input) noexcept;

private:
    std::unordered_map<StrategyId, AlarmState> states_;
};

} // namespace stratmon::strategy
