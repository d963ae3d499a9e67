#include "stratmon/strategy/alarm_state_machine.hpp"
#include "stratmon/strategy/pricing.hpp"
#include "stratmon/core/logger.hpp"

#include <algorithm>

namespace stratmon::strategy {

void AlarmStateMachine::add(const StrategyId& id) {
    states_.emplace(id, AlarmState::NotArmed);
}

void AlarmStateMachine::remove(const StrategyId& id) {
    states_.erase(id);
}

bool AlarmStateMachine::is_worthy(const Input& input) noexcept {
    if (input.status != StrategyStatus::Active || !input.price || !input.target) {
        return false;
    }
    return PricingEngine::is_target_reached(*input.price, *input.target, input.condition);
}

std::optional<AlarmEvent> AlarmStateMachine::evaluate(const StrategyId& id, const Input& input) {
    auto it = states_.find(id);
    if (it == states_.end()) {
        return std::nullopt;
    }

    const bool worthy = is_worthy(input);
    auto& state = it->second;

    if (state == AlarmState::NotArmed && worthy) {
        state = AlarmState::Armed;
        LOG_DEBUG("[Alarm] {} armed at {}", id, *input.price);
        return AlarmEvent::Reached;
    }
    if (state == AlarmState::Armed && !worthy) {
        // Price moved away, went incomplete, or the strategy is no longer active
        state = AlarmState::NotArmed;
        LOG_DEBUG("[Alarm] {} disarmed", id);
        return AlarmEvent::Left;
    }
    return std::nullopt;
}

std::vector<AlarmEvent> AlarmStateMachine::on_target_changed(const StrategyId& id, const Input& input) {
    std::vector<AlarmEvent> events;
    auto it = states_.find(id);
    if (it == states_.end()) {
        return events;
    }

    if (it->second == AlarmState::Armed) {
        it->second = AlarmState::NotArmed;
        events.push_back(AlarmEvent::Left);
    }
    if (auto event = evaluate(id, input)) {
        events.push_back(*event);
    }
    return events;
}

void AlarmStateMachine::rearm(const StrategyId& id) {
    auto it = states_.find(id);
    if (it != states_.end()) {
        it->second = AlarmState::NotArmed;
    }
}

AlarmState AlarmStateMachine::state(const StrategyId& id) const {
    auto it = states_.find(id);
    return it == states_.end() ? AlarmState::NotArmed : it->second;
}

std::size_t AlarmStateMachine::armed_count() const {
    return static_cast<std::size_t>(std::count_if(states_.begin(), states_.end(),
        [](const auto& entry) { return entry.second == AlarmState::Armed; }));
}

} // namespace stratmon::strategy
