/**
 * Alarm state machine: edge-triggered Reached / Left
 */

#include "stratmon/strategy/alarm_state_machine.hpp"

#include <fmt/format.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratmon;
using namespace stratmon::strategy;

static int g_passed = 0;
static int g_failed = 0;

#define TEST(name) \
    std::cout << "  [TEST] " << name << "... "; \
    try

#define PASS() \
    do { std::cout << "PASS" << std::endl; ++g_passed; } while(0)

#define FAIL(msg) \
    do { std::cout << "FAIL: " << msg << std::endl; ++g_failed; } while(0)

#define CATCH_ALL \
    catch (const std::exception& e) { FAIL(e.what()); }

using Input = AlarmStateMachine::Input;

static Input below(std::optional<Price> price, std::optional<Price> target = 0.0,
                   StrategyStatus status = StrategyStatus::Active) {
    return {status, price, target, TargetCondition::Below};
}

static std::string names(const std::vector<AlarmEvent>& events) {
    std::string out;
    for (auto e : events) {
        if (!out.empty()) out += ",";
        out += alarm_event_name(e);
    }
    return out.empty() ? "-" : out;
}

int main() {
    std::cout << "=== Alarm State Machine Test ===\n\n";

    TEST("BELOW 0.00: 0.10, -0.05, -0.10, 0.02, -0.01 -> Reached, Left, Reached") {
        AlarmStateMachine m;
        m.add("s");
        std::vector<AlarmEvent> events;
        for (double p : {0.10, -0.05, -0.10, 0.02, -0.01}) {
            if (auto e = m.evaluate("s", below(p))) events.push_back(*e);
        }
        std::vector<AlarmEvent> expected = {AlarmEvent::Reached, AlarmEvent::Left, AlarmEvent::Reached};
        if (events == expected) PASS();
        else FAIL(names(events));
    } CATCH_ALL

    TEST("ABOVE fires once while the price stays above") {
        AlarmStateMachine m;
        m.add("s");
        int reached = 0;
        for (double p : {1.0, 2.0, 2.5, 3.0, 2.1}) {
            auto e = m.evaluate("s", {StrategyStatus::Active, p, 2.0, TargetCondition::Above});
            if (e && *e == AlarmEvent::Reached) ++reached;
        }
        if (reached == 1 && m.state("s") == AlarmState::Armed) PASS();
        else FAIL(fmt::format("reached {}", reached));
    } CATCH_ALL

    TEST("Incomplete price while armed -> Left") {
        AlarmStateMachine m;
        m.add("s");
        m.evaluate("s", below(-1.0));
        auto e = m.evaluate("s", below(std::nullopt));
        auto again = m.evaluate("s", below(std::nullopt));
        if (e && *e == AlarmEvent::Left && !again) PASS();
        else FAIL("expected a single Left");
    } CATCH_ALL

    TEST("Absent target never arms") {
        AlarmStateMachine m;
        m.add("s");
        auto e = m.evaluate("s", below(-100.0, std::nullopt));
        if (!e && m.state("s") == AlarmState::NotArmed) PASS();
        else FAIL("armed without target");
    } CATCH_ALL

    TEST("Leaving ACTIVE while armed -> Left, inactive never arms") {
        AlarmStateMachine m;
        m.add("s");
        m.evaluate("s", below(-1.0));
        auto left = m.evaluate("s", below(-1.0, 0.0, StrategyStatus::Done));
        auto quiet = m.evaluate("s", below(-2.0, 0.0, StrategyStatus::Cancelled));
        auto back = m.evaluate("s", below(-2.0));
        if (left && *left == AlarmEvent::Left && !quiet && back && *back == AlarmEvent::Reached) PASS();
        else FAIL("unexpected status transitions");
    } CATCH_ALL

    TEST("Rearm resets silently; next worthy price fires again") {
        AlarmStateMachine m;
        m.add("s");
        m.evaluate("s", below(-1.0));
        m.rearm("s");
        bool reset = m.state("s") == AlarmState::NotArmed;
        auto e = m.evaluate("s", below(-1.0));
        if (reset && e && *e == AlarmEvent::Reached) PASS();
        else FAIL("rearm did not reset");
    } CATCH_ALL

    TEST("Target change while armed -> Left then re-evaluation") {
        AlarmStateMachine m;
        m.add("s");
        m.evaluate("s", below(-1.0));
        auto still = m.on_target_changed("s", below(-1.0, -0.5));
        auto gone = m.on_target_changed("s", below(-1.0, -2.0));
        std::vector<AlarmEvent> expect_still = {AlarmEvent::Left, AlarmEvent::Reached};
        std::vector<AlarmEvent> expect_gone = {AlarmEvent::Left};
        if (still == expect_still && gone == expect_gone) PASS();
        else FAIL(fmt::format("still={} gone={}", names(still), names(gone)));
    } CATCH_ALL

    TEST("Target change while not armed only evaluates") {
        AlarmStateMachine m;
        m.add("s");
        auto none = m.on_target_changed("s", below(1.0, 0.0));
        auto hit = m.on_target_changed("s", below(1.0, 1.5));
        if (none.empty() && hit.size() == 1 && hit[0] == AlarmEvent::Reached) PASS();
        else FAIL(fmt::format("none={} hit={}", names(none), names(hit)));
    } CATCH_ALL

    TEST("Unknown and removed strategies are ignored") {
        AlarmStateMachine m;
        m.add("s");
        m.evaluate("s", below(-1.0));
        m.remove("s");
        auto e = m.evaluate("s", below(-1.0));
        auto u = m.evaluate("nope", below(-1.0));
        if (!e && !u && m.armed_count() == 0 && !m.contains("s")) PASS();
        else FAIL("state survived removal");
    } CATCH_ALL

    std::cout << fmt::format("\n=== Result: {}/{} passed ===\n", g_passed, g_passed + g_failed);
    return g_failed > 0 ? 1 : 0;
}
