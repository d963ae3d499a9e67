/**
 * Monitor engine under concurrent feed and edit threads
 *
 * 1. Re-pointed leg never keeps a quote from its old ticker
 * 2. Edit threads: subscriptions match refcounts once flushes settle
 * 3. Alarm notifications arrive in state order across threads
 */

#include "stratmon/engine/monitor_engine.hpp"
#include "recording_session.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <fmt/format.h>

#include <atomic>
#include <iostream>
#include <mutex>
#include <random>
#include <string>
#include <thread>
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

static void test_repointed_leg() {
    std::cout << "\n[1] Re-pointed leg under a live feed\n";
    net::io_context ioc;
    auto guard = net::make_work_guard(ioc);
    std::thread io([&]() { ioc.run(); });

    auto session = std::make_shared<RecordingSession>();
    auto registry = std::make_shared<market::InstrumentRegistry>();
    {
        MonitorEngine engine(ioc, session, registry, 10ms);
        engine.start();
        engine.create_strategy("toggle", std::string("t"));
        auto leg = engine.create_leg("t", "AAA Comdty", Side::Long, 1);
        check(leg.has_value(), "leg created");

        std::atomic<bool> feeding{true};
        std::thread feed([&]() {
            while (feeding.load(std::memory_order_acquire)) {
                session->quote("AAA Comdty", 100.0);
            }
        });

        const std::string bbb = registry->normalize("BBB").str();
        int leaked = 0;
        for (int i = 0; i < 2000 && leg; ++i) {
            engine.update_leg_ticker(*leg, "AAA Comdty");
            engine.update_leg_ticker(*leg, "BBB Comdty");
            auto snap = engine.snapshot("t");
            if (snap && snap->legs.size() == 1 && snap->legs[0].ticker == bbb && snap->legs[0].quote.price()) {
                ++leaked;
            }
        }

        // Keep feeding the old ticker for a moment after the last switch
        std::this_thread::sleep_for(20ms);
        feeding.store(false, std::memory_order_release);
        feed.join();

        check(leaked == 0, "BBB leg never carried an AAA quote", fmt::format("{} leaks", leaked));
        check(!engine.price("t"), "price stays incomplete without a BBB quote");

        auto stats = engine.stats();
        check(stats.quotes_applied + stats.quotes_stale > 0, "feed reached the engine",
              fmt::format("applied {}, stale {}", stats.quotes_applied, stats.quotes_stale));

        guard.reset();
        io.join();
    }
}

static void test_refcount_settles() {
    std::cout << "\n[2] Concurrent edits keep subscriptions in step\n";
    net::io_context ioc;
    auto guard = net::make_work_guard(ioc);
    std::thread io([&]() { ioc.run(); });

    auto session = std::make_shared<RecordingSession>();
    auto registry = std::make_shared<market::InstrumentRegistry>();
    const std::vector<std::string> pool = {"AAA Comdty", "BBB Comdty", "CCC Comdty",
                                           "DDD Comdty", "EEE Comdty", "FFF Comdty"};

    MonitorEngine engine(ioc, session, registry, 5ms);
    engine.start();

    constexpr int kEditors = 4;
    for (int t = 0; t < kEditors; ++t) {
        engine.create_strategy(fmt::format("book {}", t), fmt::format("s{}", t));
    }

    std::atomic<bool> feeding{true};
    std::thread feed([&]() {
        std::size_t n = 0;
        while (feeding.load(std::memory_order_acquire)) {
            session->quote(pool[n++ % pool.size()], 1.0 + static_cast<double>(n % 7));
        }
    });

    std::vector<std::thread> editors;
    for (int t = 0; t < kEditors; ++t) {
        editors.emplace_back([&, t]() {
            std::mt19937 rng(static_cast<unsigned>(t + 1));
            std::uniform_int_distribution<std::size_t> pick(0, pool.size() - 1);
            std::uniform_int_distribution<int> action(0, 2);
            const StrategyId id = fmt::format("s{}", t);
            std::vector<LegId> legs;

            for (int i = 0; i < 500; ++i) {
                int a = legs.empty() ? 0 : action(rng);
                if (a == 0) {
                    if (auto leg = engine.create_leg(id, pool[pick(rng)], Side::Long, 1)) legs.push_back(*leg);
                } else if (a == 1) {
                    engine.update_leg_ticker(legs[pick(rng) % legs.size()], pool[pick(rng)]);
                } else {
                    std::size_t k = pick(rng) % legs.size();
                    engine.remove_leg(legs[k]);
                    legs.erase(legs.begin() + static_cast<std::ptrdiff_t>(k));
                }
            }
        });
    }
    for (auto& e : editors) e.join();
    feeding.store(false, std::memory_order_release);
    feed.join();

    // Let the pending flushes and sync timers run out
    guard.reset();
    io.join();

    int mismatched = 0;
    for (const auto& text : pool) {
        auto ticker = registry->normalize(text);
        bool wanted = engine.multiplexer()->refcount(ticker) > 0;
        bool subscribed = session->outstanding.count(ticker.str()) > 0;
        if (wanted != subscribed) ++mismatched;
    }
    check(mismatched == 0, "subscribed exactly where refcount > 0", fmt::format("{} mismatched", mismatched));
    check(session->duplicate_subscribes == 0, "no duplicate subscribes",
          fmt::format("{}", session->duplicate_subscribes));
    check(session->spurious_unsubscribes == 0, "no unsubscribe without a subscribe",
          fmt::format("{}", session->spurious_unsubscribes));

    for (int t = 0; t < kEditors; ++t) {
        engine.remove_strategy(fmt::format("s{}", t));
    }
    ioc.restart();
    ioc.run();
    check(session->outstanding.empty(), "everything released after removal",
          fmt::format("{} left", session->outstanding.size()));
    check(engine.stats().legs == 0, "store empty");
}

static void test_alarm_order() {
    std::cout << "\n[3] Alarm order across threads\n";
    net::io_context ioc;
    auto guard = net::make_work_guard(ioc);
    std::thread io([&]() { ioc.run(); });

    auto session = std::make_shared<RecordingSession>();
    MonitorEngine engine(ioc, session, std::make_shared<market::InstrumentRegistry>(), 10ms);

    std::mutex seen_mutex;
    std::vector<char> seen;     // 'R' reached, 'L' left
    engine.set_reached_callback([&](const StrategyId&, std::optional<Price>) {
        std::lock_guard lock(seen_mutex);
        seen.push_back('R');
    });
    engine.set_left_callback([&](const StrategyId&, std::optional<Price>) {
        std::lock_guard lock(seen_mutex);
        seen.push_back('L');
    });

    engine.start();
    engine.create_strategy("edge", std::string("e"));
    engine.create_leg("e", "AAA Comdty", Side::Long, 1);
    engine.update_target("e", 100.0, TargetCondition::Above);

    std::thread feed([&]() {
        for (int i = 0; i < 20000; ++i) {
            session->quote("AAA Comdty", i % 2 == 0 ? 101.0 : 99.0);
        }
    });
    std::thread editor([&]() {
        for (int i = 0; i < 2000; ++i) {
            engine.update_status("e", StrategyStatus::Done);
            engine.update_status("e", StrategyStatus::Active);
        }
    });
    feed.join();
    editor.join();

    std::vector<char> events;
    {
        std::lock_guard lock(seen_mutex);
        events = seen;
    }
    int out_of_order = 0;
    for (std::size_t i = 0; i < events.size(); ++i) {
        char expected = i % 2 == 0 ? 'R' : 'L';
        if (events[i] != expected) ++out_of_order;
    }
    check(!events.empty(), "alarm fired", fmt::format("{} events", events.size()));
    check(out_of_order == 0, "Reached and Left strictly alternate",
          fmt::format("{} out of order", out_of_order));

    auto snap = engine.snapshot("e");
    bool listener_armed = !events.empty() && events.back() == 'R';
    check(snap && (snap->alarm == strategy::AlarmState::Armed) == listener_armed,
          "last notification matches the alarm state");

    guard.reset();
    io.join();
}

int main() {
    std::cout << "=== Engine Concurrency Test ===\n";

    test_repointed_leg();
    test_refcount_settles();
    test_alarm_order();

    std::cout << fmt::format("\n=== Result: {}/{} passed ===\n", g_pass, g_pass + g_fail);
    return g_fail > 0 ? 1 : 0;
}
