#pragma once

#include "stratmon/core/types.hpp"
#include "stratmon/market/instrument_registry.hpp"
#include "stratmon/market/market_data_session.hpp"
#include "stratmon/market/subscription_multiplexer.hpp"
#include "stratmon/strategy/alarm_state_machine.hpp"
#include "stratmon/strategy/change_debouncer.hpp"
#include "stratmon/strategy/strategy_store.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/uuid/random_generator.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stratmon::engine {

namespace net = boost::asio;

struct LegSnapshot {
    LegId id;
    std::string ticker;             // Canonical, empty when unset
    Side side{Side::Long};
    Quantity quantity{1};
    LegQuote quote;
    std::optional<Price> contribution;
};

struct StrategySnapshot {
    StrategyRecord record;
    std::optional<Price> price;
    strategy::AlarmState alarm{strategy::AlarmState::NotArmed};
    std::vector<LegSnapshot> legs;
};

struct EngineStats {
    std::size_t strategies{0};
    std::size_t legs{0};
    std::size_t armed{0};
    uint64_t quotes_applied{0};
    uint64_t quotes_stale{0};       // leg gone before its quote arrived
    uint64_t price_events{0};
    uint64_t reached_events{0};
    uint64_t left_events{0};
    uint64_t sync_scheduled{0};
    uint64_t sync_emitted{0};
    std::size_t sync_pending{0};
    market::SubscriptionMultiplexer::Stats multiplexer;
};

/**
 * Strategy pricing and alarm engine.
 *
 * Owns the multiplexer, the strategy store, the alarm state machine and the
 * sync debouncer. Every public method is thread-safe; the session may deliver
 * quotes on any thread. Callbacks run after the engine lock is released, so a
 * callback may call back into the engine.
 *
 * Notifications are queued under the engine lock and delivered one at a time
 * in that order, so listeners see transitions in the order the state changed.
 * Delivery happens on whichever calling thread is draining the queue.
 *
 * Install callbacks before start(). Edits after stop() throw std::logic_error.
 */
class MonitorEngine {
public:
    using StrategyRemovedCallback = std::function<void(const StrategyId&)>;

    MonitorEngine(net::io_context& ioc,
                  std::shared_ptr<market::IMarketDataSession> session,
                  std::shared_ptr<market::InstrumentRegistry> registry,
                  std::chrono::milliseconds sync_debounce = std::chrono::milliseconds(500));
    ~MonitorEngine();

    MonitorEngine(const MonitorEngine&) = delete;
    MonitorEngine& operator=(const MonitorEngine&) = delete;

    // Lifecycle
    bool start();
    void stop();
    bool is_running() const noexcept {
        return started_.load(std::memory_order_acquire) && !stopped_.load(std::memory_order_acquire);
    }

    // Strategy edits
    std::optional<StrategyId> create_strategy(const std::string& name,
                                              std::optional<StrategyId> id = std::nullopt);
    bool rename_strategy(const StrategyId& id, const std::string& name);
    bool update_target(const StrategyId& id, std::optional<Price> target, TargetCondition condition);
    bool update_status(const StrategyId& id, StrategyStatus status);
    bool remove_strategy(const StrategyId& id, ChangeOrigin origin = ChangeOrigin::Local);
    bool rearm(const StrategyId& id);

    // Leg edits
    std::optional<LegId> create_leg(const StrategyId& strategy_id,
                                    const std::string& ticker_text,
                                    Side side,
                                    Quantity quantity,
                                    std::optional<LegId> leg_id = std::nullopt);
    bool update_leg_ticker(const LegId& leg_id, const std::string& ticker_text);
    bool update_leg_position(const LegId& leg_id, Side side, Quantity quantity);
    bool remove_leg(const LegId& leg_id);

    // Apply a whole strategy (initial book, remote sync); returns its id
    std::optional<StrategyId> upsert_strategy(const StrategyRecord& record,
                                              ChangeOrigin origin = ChangeOrigin::Local);

    // Queries
    std::optional<StrategySnapshot> snapshot(const StrategyId& id) const;
    std::optional<Price> price(const StrategyId& id) const;
    std::vector<StrategyId> strategy_ids() const;
    EngineStats stats() const;

    const std::shared_ptr<market::InstrumentRegistry>& registry() const noexcept { return registry_; }
    const std::shared_ptr<market::SubscriptionMultiplexer>& multiplexer() const noexcept { return mux_; }

    // Callbacks
    void set_price_callback(PriceCallback cb) { on_price_ = std::move(cb); }
    void set_reached_callback(AlarmCallback cb) { on_reached_ = std::move(cb); }
    void set_left_callback(AlarmCallback cb) { on_left_ = std::move(cb); }
    void set_strategy_changed_callback(StrategyChangedCallback cb) { on_changed_ = std::move(cb); }
    void set_strategy_removed_callback(StrategyRemovedCallback cb) { on_removed_ = std::move(cb); }
    void set_subscription_status_callback(SubscriptionStatusCallback cb) { on_subscription_ = std::move(cb); }
    void set_session_callback(SessionCallback cb) { on_session_ = std::move(cb); }

private:
    struct Notification {
        enum class Kind : uint8_t { Price, Reached, Left, Changed, Removed };
        Kind kind;
        StrategyId id;
        std::optional<Price> price;
        StrategyRecord record;          // Changed only
    };
    using Notifications = std::vector<Notification>;

    enum class AlarmUpdate : uint8_t {
        Evaluate,       // plain transition check
        TargetChanged,  // release a held alarm, then check the new target
        Suppress        // back to ACTIVE: wait for the next price
    };

    void ensure_running() const;
    StrategyId new_id();

    void on_leg_quote(const LegId& leg, const market::Ticker& ticker, const QuoteSnapshot& snapshot);

    // Helpers below expect mutex_ held
    bool add_leg_locked(const StrategyId& strategy_id, const LegRecord& record, LegId& out_id);
    void set_leg_ticker_locked(strategy::Leg& leg, const std::string& ticker_text);
    void drop_leg_interest_locked(const strategy::Leg& leg);
    void refresh_locked(const StrategyId& id, Notifications& out, AlarmUpdate mode);
    void push_alarm(std::optional<AlarmEvent> event, const StrategyId& id,
                    std::optional<Price> price, Notifications& out);
    strategy::AlarmStateMachine::Input alarm_input_locked(const strategy::Strategy& s) const;
    void schedule_sync_locked(const StrategyId& id, ChangeOrigin origin);

    void emit_sync(const StrategyId& id);

    // Append to the outbox; expects mutex_ held
    void publish_locked(Notifications& events);
    // Deliver the outbox unless another caller already is
    void drain();
    void deliver(const Notification& event);

    std::shared_ptr<market::IMarketDataSession> session_;
    std::shared_ptr<market::InstrumentRegistry> registry_;
    std::shared_ptr<market::SubscriptionMultiplexer> mux_;
    std::shared_ptr<strategy::ChangeDebouncer> debouncer_;

    mutable std::mutex mutex_;
    strategy::StrategyStore store_;
    strategy::AlarmStateMachine alarms_;
    boost::uuids::random_generator uuid_gen_;

    std::mutex outbox_mutex_;           // Taken inside mutex_, never the other way
    std::deque<Notification> outbox_;
    bool draining_{false};

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};

    PriceCallback on_price_;
    AlarmCallback on_reached_;
    AlarmCallback on_left_;
    StrategyChangedCallback on_changed_;
    StrategyRemovedCallback on_removed_;
    SubscriptionStatusCallback on_subscription_;
    SessionCallback on_session_;

    std::atomic<uint64_t> quotes_applied_{0};
    std::atomic<uint64_t> quotes_stale_{0};
    std::atomic<uint64_t> price_events_{0};
    std::atomic<uint64_t> reached_events_{0};
    std::atomic<uint64_t> left_events_{0};
    std::atomic<uint64_t> sync_scheduled_{0};
    std::atomic<uint64_t> sync_emitted_{0};
};

} // namespace stratmon::engine
