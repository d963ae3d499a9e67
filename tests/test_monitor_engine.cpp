/**
 * Monitor engine end-to-end (recording session, manual io_context pumping)
 *
 * 1. Fly: legs created before start go out in one batch, aggregate from mids
 * 2. Alarm sequence across leg quotes: Reached, Left, Reached
 * 3. Status transitions: leaving ACTIVE releases, returning waits for a quote
 * 4. Shared ticker across strategies: one subscribe, unsubscribe after the last
 * 5. Debounced sync: burst -> one notification with final state, remote silent
 * 6. Ticker change resets the leg price
 * 7. Rejected quantities
 * 8. Whole-record upsert: leg diff and reorder
 * 9. Removal notifications and stop()
 */

#include "stratmon/engine/monitor_engine.hpp"
#include "recording_session.hpp"

#include <boost/asio/io_context.hpp>
#include <fmt/format.h>

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace stratmon;
using namespace stratmon::engine;
namespace net = boost::asio;
using namespace std::chrono_literals;

static int g_pass = 0, g_fail = 0;

static void check(bool cond, const std::string& name, const std::string& detail = "") {
    if (cond) {
        std::cout << fmt::format("  [PASS] {}", name);
        ++g_pass;
    } else {
        std::cout << fmt::format("  [FAIL] {}", name);
        ++g_fail;
    }
    if (!detail.empty()) std::cout << " - " << detail;
    std::cout << "\n";
}

static void pump(net::io_context& ioc) {
    ioc.run();
    ioc.restart();
}

static bool near(std::optional<Price> v, double expected) {
    return v && std::fabs(*v - expected) < 1e-9;
}

static std::string show(std::optional<Price> v) {
    return v ? fmt::format("{:.6f}", *v) : "incomplete";
}

struct Harness {
    net::io_context ioc;
    std::shared_ptr<RecordingSession> session = std::make_shared<RecordingSession>();
    std::shared_ptr<market::InstrumentRegistry> registry = std::make_shared<market::InstrumentRegistry>();
    MonitorEngine engine{ioc, session, registry, 10ms};

    std::vector<std::pair<StrategyId, std::optional<Price>>> prices;
    std::vector<std::string> alarms;       // "reached:<id>" / "left:<id>"
    std::vector<StrategyRecord> changed;
    std::vector<StrategyId> removed;
    std::vector<std::pair<bool, std::string>> session_events;

    Harness() {
        engine.set_price_callback([this](const StrategyId& id, std::optional<Price> p) {
            prices.emplace_back(id, p);
        });
        engine.set_reached_callback([this](const StrategyId& id, std::optional<Price>) {
            alarms.push_back("reached:" + id);
        });
        engine.set_left_callback([this](const StrategyId& id, std::optional<Price>) {
            alarms.push_back("left:" + id);
        });
        engine.set_strategy_changed_callback([this](const StrategyId&, const StrategyRecord& r) {
            changed.push_back(r);
        });
        engine.set_strategy_removed_callback([this](const StrategyId& id) { removed.push_back(id); });
        engine.set_session_callback([this](bool ok, const std::string& msg) {
            session_events.emplace_back(ok, msg);
        });
    }

    std::string canon(const std::string& text) { return registry->normalize(text).str(); }

    std::string joined_alarms() const {
        std::string out;
        for (const auto& a : alarms) {
            if (!out.empty()) out += ",";
            out += a;
        }
        return out.empty() ? "-" : out;
    }
};

static void test_fly() {
    std::cout << "\n[1] Fly end-to-end\n";
    Harness h;
    auto id = h.engine.create_strategy("SFRH6 fly", std::string("fly"));
    check(id && *id == "fly", "strategy created with caller id");

    auto a = h.engine.create_leg("fly", "SFRH6C 96.00 Comdty", Side::Long, 1);
    auto b = h.engine.create_leg("fly", "SFRH6C 96.25 Comdty", Side::Short, 2);
    auto c = h.engine.create_leg("fly", "SFRH6C 96.50 Comdty", Side::Long, 1);
    check(a && b && c, "three legs created");
    pump(h.ioc);
    check(h.session->subscribe_batches.empty(), "nothing sent before start");

    check(h.engine.start(), "engine started");
    pump(h.ioc);
    check(h.session->subscribe_batches.size() == 1 && h.session->subscribe_batches[0].size() == 3,
          "one batch with three tickers");
    check(!h.session_events.empty() && h.session_events.back().first, "session reported connected");

    h.session->mid("SFRH6C 96.00 Comdty", 1.15, 1.25);
    h.session->mid("SFRH6C 96.25 Comdty", 0.95, 1.05);
    check(!h.engine.price("fly"), "incomplete until every leg priced");
    check(h.prices.empty(), "incomplete -> incomplete not published");

    h.session->mid("sfrh6c 96.50 comdty", 0.80, 0.90);
    check(near(h.engine.price("fly"), 0.05), "fly = 1.20 - 2x1.00 + 0.85", show(h.engine.price("fly")));
    check(h.prices.size() == 1 && near(h.prices[0].second, 0.05), "one price event");

    auto snap = h.engine.snapshot("fly");
    check(snap && snap->legs.size() == 3, "snapshot lists legs");
    if (snap && snap->legs.size() == 3) {
        check(near(snap->legs[1].contribution, -2.0), "short x2 contribution",
              show(snap->legs[1].contribution));
        check(snap->legs[0].ticker == h.canon("SFRH6C 96.00 Comdty"), "canonical ticker in snapshot");
    }

    auto stats = h.engine.stats();
    check(stats.strategies == 1 && stats.legs == 3 && stats.quotes_applied == 3, "stats counted");
}

static void test_alarm_sequence() {
    std::cout << "\n[2] Alarm sequence\n";
    Harness h;
    h.engine.start();
    auto id = h.engine.create_strategy("spread", std::string("sp"));
    h.engine.create_leg("sp", "AAA Comdty", Side::Long, 1);
    h.engine.create_leg("sp", "BBB Comdty", Side::Short, 1);
    h.engine.update_target("sp", 0.0, TargetCondition::Below);
    pump(h.ioc);
    check(id.has_value(), "strategy created");

    h.session->quote("AAA Comdty", 1.0);
    for (double p : {0.90, 1.05, 1.10, 0.98, 1.01}) {
        h.session->quote("BBB Comdty", p);
    }
    check(h.joined_alarms() == "reached:sp,left:sp,reached:sp", "Reached, Left, Reached", h.joined_alarms());
    check(near(h.engine.price("sp"), -0.01), "last price", show(h.engine.price("sp")));

    auto stats = h.engine.stats();
    check(stats.reached_events == 2 && stats.left_events == 1 && stats.armed == 1, "alarm counters");
}

static void test_status_transitions() {
    std::cout << "\n[3] Status transitions\n";
    Harness h;
    h.engine.start();
    h.engine.create_strategy("s", std::string("s"));
    h.engine.create_leg("s", "AAA Comdty", Side::Long, 1);
    h.engine.update_target("s", 1.0, TargetCondition::Above);
    pump(h.ioc);

    h.session->quote("AAA Comdty", 1.5);
    check(h.joined_alarms() == "reached:s", "armed on first worthy quote");

    h.alarms.clear();
    h.engine.update_status("s", StrategyStatus::Done);
    check(h.joined_alarms() == "left:s", "leaving ACTIVE releases the alarm");

    h.alarms.clear();
    h.session->quote("AAA Comdty", 1.6);
    check(h.alarms.empty(), "inactive strategy never arms");

    h.engine.update_status("s", StrategyStatus::Active);
    check(h.alarms.empty(), "returning to ACTIVE waits for a price");

    h.session->quote("AAA Comdty", 1.7);
    check(h.joined_alarms() == "reached:s", "next quote re-arms");

    h.alarms.clear();
    h.engine.rearm("s");
    h.session->quote("AAA Comdty", 1.8);
    check(h.joined_alarms() == "reached:s", "rearm lets the alarm fire again");

    h.alarms.clear();
    h.engine.update_target("s", 2.0, TargetCondition::Above);
    check(h.joined_alarms() == "left:s", "target moved out of reach releases");
}

static void test_shared_ticker() {
    std::cout << "\n[4] Shared ticker across strategies\n";
    Harness h;
    h.engine.start();
    const std::string text = "SFRZ5P 95.75 Comdty";
    const std::string t = h.canon(text);

    h.engine.create_strategy("one", std::string("s1"));
    h.engine.create_strategy("two", std::string("s2"));
    h.engine.create_leg("s1", text, Side::Long, 1);
    h.engine.create_leg("s2", "sfrz5p 95.75 cmdty", Side::Short, 3);
    pump(h.ioc);
    check(h.session->count_subscribes(t) == 1, "subscribed once for two legs");

    h.session->quote(text, 0.50);
    check(near(h.engine.price("s1"), 0.50) && near(h.engine.price("s2"), -1.50), "both strategies priced");

    h.engine.remove_strategy("s1");
    pump(h.ioc);
    check(h.session->count_unsubscribes(t) == 0, "still held by s2");

    h.engine.remove_strategy("s2");
    pump(h.ioc);
    check(h.session->count_unsubscribes(t) == 1, "unsubscribed after last strategy removed");
    check(h.session->outstanding.empty(), "no outstanding subscriptions");
}

static void test_debounced_sync() {
    std::cout << "\n[5] Debounced sync\n";
    Harness h;
    h.engine.start();
    h.engine.create_strategy("draft", std::string("d"));
    h.engine.rename_strategy("d", "renamed");
    h.engine.update_target("d", -0.25, TargetCondition::Below);
    h.engine.create_leg("d", "ERZ5 Comdty", Side::Long, 2);
    h.engine.update_status("d", StrategyStatus::Done);
    pump(h.ioc);

    check(h.changed.size() == 1, "one notification for the burst", fmt::format("{}", h.changed.size()));
    if (!h.changed.empty()) {
        const auto& r = h.changed.front();
        check(r.id == "d" && r.name == "renamed", "final name carried");
        check(r.target && *r.target == -0.25 && r.status == StrategyStatus::Done, "final target and status");
        check(r.legs.size() == 1 && r.legs[0].quantity == 2, "final legs carried");
    }

    h.changed.clear();
    StrategyRecord remote;
    remote.id = "r";
    remote.name = "from server";
    remote.legs.push_back({"rl", "ERZ5 Comdty", Side::Short, 1});
    h.engine.upsert_strategy(remote, ChangeOrigin::Remote);
    remote.name = "renamed by server";
    h.engine.upsert_strategy(remote, ChangeOrigin::Remote);
    pump(h.ioc);
    check(h.changed.empty(), "remote changes are not echoed");
    check(h.engine.snapshot("r") && h.engine.snapshot("r")->record.name == "renamed by server", "remote applied");

    h.engine.rename_strategy("d", "again");
    h.engine.remove_strategy("d");
    pump(h.ioc);
    check(h.changed.empty(), "removal cancels the pending sync");
}

static void test_ticker_change() {
    std::cout << "\n[6] Ticker change\n";
    Harness h;
    h.engine.start();
    h.engine.create_strategy("s", std::string("s"));
    auto leg = h.engine.create_leg("s", "AAA Comdty", Side::Long, 1);
    pump(h.ioc);
    h.session->quote("AAA Comdty", 2.0);
    check(near(h.engine.price("s"), 2.0), "priced on old ticker");

    h.prices.clear();
    check(leg && h.engine.update_leg_ticker(*leg, "CCC Comdty"), "ticker updated");
    pump(h.ioc);
    check(!h.engine.price("s"), "price reset to incomplete");
    check(h.prices.size() == 1 && !h.prices[0].second, "incomplete published");
    check(h.session->count_unsubscribes(h.canon("AAA")) == 1, "old ticker released");
    check(h.session->count_subscribes(h.canon("CCC")) == 1, "new ticker subscribed");

    h.session->quote("AAA Comdty", 9.0);
    check(!h.engine.price("s"), "old ticker quotes ignored");
    h.session->quote("CCC Comdty", 3.0);
    check(near(h.engine.price("s"), 3.0), "priced on new ticker");

    check(h.engine.update_leg_position(*leg, Side::Short, 2), "position updated");
    check(near(h.engine.price("s"), -6.0), "contribution follows side and quantity", show(h.engine.price("s")));

    check(h.engine.update_leg_ticker(*leg, ""), "ticker cleared");
    check(!h.engine.price("s"), "leg without ticker is incomplete");
}

static void test_rejected_quantity() {
    std::cout << "\n[7] Rejected quantities\n";
    Harness h;
    h.engine.create_strategy("s", std::string("s"));
    check(!h.engine.create_leg("s", "AAA Comdty", Side::Long, 0), "zero quantity rejected");
    check(!h.engine.create_leg("s", "AAA Comdty", Side::Long, -3), "negative quantity rejected");
    check(!h.engine.create_leg("missing", "AAA Comdty", Side::Long, 1), "unknown strategy rejected");
    auto leg = h.engine.create_leg("s", "AAA Comdty", Side::Long, 1);
    check(leg && !h.engine.update_leg_position(*leg, Side::Long, 0), "position update to zero rejected");
    check(!h.engine.create_strategy("dup", std::string("s")), "duplicate strategy id rejected");
    check(h.engine.stats().legs == 1, "only the valid leg exists");
}

static void test_upsert_diff() {
    std::cout << "\n[8] Upsert diff and reorder\n";
    Harness h;
    h.engine.start();

    StrategyRecord r;
    r.id = "u";
    r.name = "book";
    r.legs = {{"L1", "AAA Comdty", Side::Long, 1},
              {"L2", "BBB Comdty", Side::Short, 1},
              {"L3", "CCC Comdty", Side::Long, 1}};
    h.engine.upsert_strategy(r, ChangeOrigin::Remote);
    pump(h.ioc);
    check(h.engine.stats().legs == 3, "three legs loaded");

    r.legs = {{"L3", "CCC Comdty", Side::Long, 1},
              {"L1", "AAA Comdty", Side::Long, 4},
              {"", "DDD Comdty", Side::Short, 1}};
    h.engine.upsert_strategy(r, ChangeOrigin::Remote);
    pump(h.ioc);

    auto snap = h.engine.snapshot("u");
    check(snap && snap->legs.size() == 3, "three legs after diff");
    if (snap && snap->legs.size() == 3) {
        check(snap->legs[0].id == "L3" && snap->legs[1].id == "L1", "record order applied");
        check(snap->legs[1].quantity == 4, "existing leg updated in place");
        check(!snap->legs[2].id.empty() && snap->legs[2].id != "L2", "new leg got an id");
    }
    check(h.session->count_unsubscribes(h.canon("BBB")) == 1, "dropped leg released its ticker");
    check(h.session->count_subscribes(h.canon("DDD")) == 1, "added leg subscribed");

    // A kept leg coming back with a non-positive quantity is removed outright
    StrategyRecord z;
    z.id = "z";
    z.legs = {{"Z1", "EEE Comdty", Side::Long, 1}};
    h.engine.upsert_strategy(z, ChangeOrigin::Remote);
    pump(h.ioc);
    z.legs[0].quantity = 0;
    h.engine.upsert_strategy(z, ChangeOrigin::Remote);
    pump(h.ioc);
    auto zsnap = h.engine.snapshot("z");
    auto eee = h.registry->normalize("EEE");
    check(zsnap && zsnap->legs.empty(), "zero-quantity leg left the strategy");
    check(h.engine.stats().legs == 3, "zero-quantity leg left the store",
          fmt::format("{} legs", h.engine.stats().legs));
    check(h.engine.multiplexer()->refcount(eee) == 0 && h.session->outstanding.count(eee.str()) == 0,
          "zero-quantity leg released its ticker");

    // The same leg id twice counts once
    StrategyRecord dup;
    dup.id = "dup";
    dup.legs = {{"X", "FFF Comdty", Side::Long, 1}, {"X", "FFF Comdty", Side::Long, 1}};
    h.engine.upsert_strategy(dup, ChangeOrigin::Remote);
    pump(h.ioc);
    h.session->quote("FFF Comdty", 1.0);
    auto dsnap = h.engine.snapshot("dup");
    check(dsnap && dsnap->legs.size() == 1, "duplicate leg id kept once");
    check(near(h.engine.price("dup"), 1.0), "duplicate leg priced once", show(h.engine.price("dup")));

    h.engine.upsert_strategy(dup, ChangeOrigin::Remote);
    dsnap = h.engine.snapshot("dup");
    check(dsnap && dsnap->legs.size() == 1 && near(h.engine.price("dup"), 1.0), "re-upsert keeps one leg");
}

static void test_remove_and_stop() {
    std::cout << "\n[9] Removal notifications and stop\n";
    Harness h;
    h.engine.start();
    h.engine.create_strategy("a", std::string("a"));
    h.engine.create_strategy("b", std::string("b"));
    h.engine.create_leg("a", "AAA Comdty", Side::Long, 1);

    check(h.engine.remove_strategy("a"), "local removal");
    check(h.removed.size() == 1 && h.removed[0] == "a", "local removal notified");
    check(h.engine.remove_strategy("b", ChangeOrigin::Remote), "remote removal");
    check(h.removed.size() == 1, "remote removal not notified");
    check(!h.engine.remove_strategy("b"), "second removal is a no-op");
    check(h.engine.strategy_ids().empty(), "no strategies left");

    h.engine.create_strategy("c", std::string("c"));
    h.session_events.clear();
    h.engine.stop();
    pump(h.ioc);

    check(h.session->stop_calls == 1, "session stopped");
    check(!h.session_events.empty() && !h.session_events.back().first, "disconnect reported");
    check(h.changed.empty(), "pending sync discarded on stop");
    check(!h.engine.is_running(), "not running");

    bool threw = false;
    try {
        h.engine.create_strategy("late");
    } catch (const std::logic_error&) {
        threw = true;
    }
    check(threw, "edits after stop throw");

    h.engine.stop();
    check(h.session->stop_calls == 1, "stop is idempotent");
}

int main() {
    std::cout << "=== Monitor Engine Test ===\n";

    test_fly();
    test_alarm_sequence();
    test_status_transitions();
    test_shared_ticker();
    test_debounced_sync();
    test_ticker_change();
    test_rejected_quantity();
    test_upsert_diff();
    test_remove_and_stop();

    std::cout << fmt::format("\n=== Result: {}/{} passed ===\n", g_pass, g_pass + g_fail);
    return g_fail > 0 ? 1 : 0;
}
