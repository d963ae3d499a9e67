#include "stratmon/engine/monitor_engine.hpp"
#include "stratmon/core/logger.hpp"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace stratmon::engine {

MonitorEngine::MonitorEngine(net::io_context& ioc,
                             std::shared_ptr<market::IMarketDataSession> session,
                             std::shared_ptr<market::InstrumentRegistry> registry,
                             std::chrono::milliseconds sync_debounce)
    : session_(std::move(session))
    , registry_(registry ? std::move(registry) : std::make_shared<market::InstrumentRegistry>())
    , mux_(std::make_shared<market::SubscriptionMultiplexer>(ioc, registry_))
    , debouncer_(std::make_shared<strategy::ChangeDebouncer>(ioc, sync_debounce)) {

    mux_->set_quote_route([this](const LegId& leg, const market::Ticker& ticker, const QuoteSnapshot& snapshot) {
        on_leg_quote(leg, ticker, snapshot);
    });
    mux_->set_status_callback([this](const std::string& ticker, bool started, const std::string& reason) {
        if (on_subscription_) {
            on_subscription_(ticker, started, reason);
        }
    });
    mux_->set_terminated_callback([this]() {
        if (on_session_) {
            on_session_(false, "market-data session terminated");
        }
    });
}

MonitorEngine::~MonitorEngine() {
    stop();
}

bool MonitorEngine::start() {
    if (stopped_.load(std::memory_order_acquire)) {
        throw std::logic_error("MonitorEngine::start called after stop");
    }
    if (started_.exchange(true, std::memory_order_acq_rel)) {
        return true;
    }
    if (!session_) {
        Logger::error("[Engine] No market-data session configured");
        if (on_session_) on_session_(false, "no market-data session");
        return false;
    }

    // Registrations made before start are still pending and go out on attach
    mux_->attach(session_);
    const bool ok = session_->start();
    if (ok) {
        Logger::info("[Engine] Started on session '{}'", session_->get_name());
    } else {
        Logger::error("[Engine] Session '{}' failed to start", session_->get_name());
    }
    if (on_session_) {
        on_session_(ok, ok ? "connected to " + session_->get_name()
                           : "failed to start " + session_->get_name());
    }
    return ok;
}

void MonitorEngine::stop() {
    if (stopped_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Order matters: no quotes, no subscribes, no sync, then the session goes
    mux_->shutdown();
    debouncer_->cancel_all();
    if (auto session = mux_->release_session()) {
        session->stop();
    }
    Logger::info("[Engine] Stopped");
}

void MonitorEngine::ensure_running() const {
    if (stopped_.load(std::memory_order_acquire)) {
        throw std::logic_error("MonitorEngine edited after stop");
    }
}

StrategyId MonitorEngine::new_id() {
    return boost::uuids::to_string(uuid_gen_());
}

// ---------------------------------------------------------------------------
// Quote path
// ---------------------------------------------------------------------------

void MonitorEngine::on_leg_quote(const LegId& leg, const market::Ticker& ticker, const QuoteSnapshot& snapshot) {
    if (stopped_.load(std::memory_order_acquire)) {
        return;
    }

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto applied = store_.apply_quote(leg, ticker, snapshot, std::chrono::steady_clock::now());
        if (!applied) {
            auto stale = quotes_stale_.fetch_add(1, std::memory_order_relaxed) + 1;
            LOG_DEBUG("[Engine] {} quote for leg {} dropped, leg removed or re-pointed (total stale: {})",
                      ticker.str(), leg, stale);
            return;
        }
        quotes_applied_.fetch_add(1, std::memory_order_relaxed);

        if (applied->changed()) {
            events.push_back({Notification::Kind::Price, applied->strategy, applied->aggregate});
        }
        if (const auto* s = store_.find_strategy(applied->strategy)) {
            push_alarm(alarms_.evaluate(s->id, alarm_input_locked(*s)), s->id, applied->aggregate, events);
        }
        publish_locked(events);
    }
    drain();
}

// ---------------------------------------------------------------------------
// Strategy edits
// ---------------------------------------------------------------------------

std::optional<StrategyId> MonitorEngine::create_strategy(const std::string& name,
                                                         std::optional<StrategyId> id) {
    ensure_running();

    std::lock_guard lock(mutex_);
    strategy::Strategy s;
    s.id = id ? *id : new_id();
    s.name = name;
    if (!store_.add_strategy(s)) {
        Logger::warn("[Engine] Strategy id '{}' already exists", s.id);
        return std::nullopt;
    }
    alarms_.add(s.id);
    schedule_sync_locked(s.id, ChangeOrigin::Local);
    Logger::debug("[Engine] Created strategy {} '{}'", s.id, name);
    return s.id;
}

bool MonitorEngine::rename_strategy(const StrategyId& id, const std::string& name) {
    ensure_running();

    std::lock_guard lock(mutex_);
    auto* s = store_.find_strategy(id);
    if (!s) {
        return false;
    }
    s->name = name;
    store_.touch(id);
    schedule_sync_locked(id, ChangeOrigin::Local);
    return true;
}

bool MonitorEngine::update_target(const StrategyId& id, std::optional<Price> target,
                                  TargetCondition condition) {
    ensure_running();

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto* s = store_.find_strategy(id);
        if (!s) {
            return false;
        }
        const bool changed = s->target != target || s->condition != condition;
        s->target = target;
        s->condition = condition;
        store_.touch(id);
        refresh_locked(id, events, changed ? AlarmUpdate::TargetChanged : AlarmUpdate::Evaluate);
        schedule_sync_locked(id, ChangeOrigin::Local);
        publish_locked(events);
    }
    drain();
    return true;
}

bool MonitorEngine::update_status(const StrategyId& id, StrategyStatus status) {
    ensure_running();

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto* s = store_.find_strategy(id);
        if (!s) {
            return false;
        }
        if (s->status == status) {
            return true;
        }
        s->status = status;
        store_.touch(id);
        refresh_locked(id, events,
                       status == StrategyStatus::Active ? AlarmUpdate::Suppress : AlarmUpdate::Evaluate);
        schedule_sync_locked(id, ChangeOrigin::Local);
        Logger::info("[Engine] Strategy {} is now {}", id, status_name(status));
        publish_locked(events);
    }
    drain();
    return true;
}

bool MonitorEngine::remove_strategy(const StrategyId& id, ChangeOrigin origin) {
    ensure_running();

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        std::vector<strategy::Leg> legs;
        if (!store_.remove_strategy(id, &legs)) {
            return false;
        }
        for (const auto& leg : legs) {
            drop_leg_interest_locked(leg);
        }
        alarms_.remove(id);
        debouncer_->cancel(id);
        if (origin == ChangeOrigin::Local) {
            events.push_back({Notification::Kind::Removed, id, std::nullopt});
        }
        Logger::debug("[Engine] Removed strategy {} ({} legs)", id, legs.size());
        publish_locked(events);
    }
    drain();
    return true;
}

bool MonitorEngine::rearm(const StrategyId& id) {
    ensure_running();

    std::lock_guard lock(mutex_);
    if (!alarms_.contains(id)) {
        return false;
    }
    alarms_.rearm(id);
    return true;
}

// ---------------------------------------------------------------------------
// Leg edits
// ---------------------------------------------------------------------------

std::optional<LegId> MonitorEngine::create_leg(const StrategyId& strategy_id,
                                               const std::string& ticker_text,
                                               Side side,
                                               Quantity quantity,
                                               std::optional<LegId> leg_id) {
    ensure_running();
    if (quantity <= 0) {
        Logger::warn("[Engine] Rejected leg with quantity {} on {}", quantity, strategy_id);
        return std::nullopt;
    }

    Notifications events;
    LegId created;
    {
        std::lock_guard lock(mutex_);
        if (!store_.find_strategy(strategy_id)) {
            return std::nullopt;
        }
        LegRecord record{leg_id ? *leg_id : LegId{}, ticker_text, side, quantity};
        if (!add_leg_locked(strategy_id, record, created)) {
            return std::nullopt;
        }
        store_.touch(strategy_id);
        refresh_locked(strategy_id, events, AlarmUpdate::Evaluate);
        schedule_sync_locked(strategy_id, ChangeOrigin::Local);
        publish_locked(events);
    }
    drain();
    return created;
}

bool MonitorEngine::update_leg_ticker(const LegId& leg_id, const std::string& ticker_text) {
    ensure_running();

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto* leg = store_.find_leg(leg_id);
        if (!leg) {
            return false;
        }
        const StrategyId owner = leg->strategy;
        set_leg_ticker_locked(*leg, ticker_text);
        store_.touch(owner);
        refresh_locked(owner, events, AlarmUpdate::Evaluate);
        schedule_sync_locked(owner, ChangeOrigin::Local);
        publish_locked(events);
    }
    drain();
    return true;
}

bool MonitorEngine::update_leg_position(const LegId& leg_id, Side side, Quantity quantity) {
    ensure_running();
    if (quantity <= 0) {
        Logger::warn("[Engine] Rejected quantity {} for leg {}", quantity, leg_id);
        return false;
    }

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto* leg = store_.find_leg(leg_id);
        if (!leg) {
            return false;
        }
        leg->side = side;
        leg->quantity = quantity;
        const StrategyId owner = leg->strategy;
        store_.touch(owner);
        refresh_locked(owner, events, AlarmUpdate::Evaluate);
        schedule_sync_locked(owner, ChangeOrigin::Local);
        publish_locked(events);
    }
    drain();
    return true;
}

bool MonitorEngine::remove_leg(const LegId& leg_id) {
    ensure_running();

    Notifications events;
    {
        std::lock_guard lock(mutex_);
        auto removed = store_.remove_leg(leg_id);
        if (!removed) {
            return false;
        }
        drop_leg_interest_locked(*removed);
        store_.touch(removed->strategy);
        refresh_locked(removed->strategy, events, AlarmUpdate::Evaluate);
        schedule_sync_locked(removed->strategy, ChangeOrigin::Local);
        publish_locked(events);
    }
    drain();
    return true;
}

// ---------------------------------------------------------------------------
// Whole-record apply
// ---------------------------------------------------------------------------

std::optional<StrategyId> MonitorEngine::upsert_strategy(const StrategyRecord& record, ChangeOrigin origin) {
    ensure_running();

    Notifications events;
    StrategyId id;
    {
        std::lock_guard lock(mutex_);
        id = record.id.empty() ? new_id() : record.id;

        AlarmUpdate mode = AlarmUpdate::Evaluate;
        auto* s = store_.find_strategy(id);
        if (!s) {
            strategy::Strategy fresh;
            fresh.id = id;
            fresh.name = record.name;
            fresh.target = record.target;
            fresh.condition = record.condition;
            fresh.status = record.status;
            store_.add_strategy(std::move(fresh));
            alarms_.add(id);
            s = store_.find_strategy(id);
        } else {
            if (s->target != record.target || s->condition != record.condition) {
                mode = AlarmUpdate::TargetChanged;
            } else if (s->status != StrategyStatus::Active && record.status == StrategyStatus::Active) {
                mode = AlarmUpdate::Suppress;
            }
            s->name = record.name;
            s->target = record.target;
            s->condition = record.condition;
            s->status = record.status;
        }

        // Rebuild the leg list in record order; every leg not kept goes away
        const std::vector<LegId> existing = s->legs;
        std::unordered_set<LegId> kept;
        std::vector<LegId> order;
        for (const auto& leg_record : record.legs) {
            if (leg_record.quantity <= 0) {
                Logger::warn("[Engine] Skipping leg with quantity {} in {}", leg_record.quantity, id);
                continue;
            }
            if (!leg_record.id.empty()) {
                if (kept.count(leg_record.id)) {
                    Logger::warn("[Engine] Leg {} listed twice in {}", leg_record.id, id);
                    continue;
                }
                if (auto* leg = store_.find_leg(leg_record.id)) {
                    if (leg->strategy != id) {
                        Logger::warn("[Engine] Leg {} belongs to {}, not {}", leg_record.id, leg->strategy, id);
                        continue;
                    }
                    set_leg_ticker_locked(*leg, leg_record.ticker);
                    leg->side = leg_record.side;
                    leg->quantity = leg_record.quantity;
                    kept.insert(leg_record.id);
                    order.push_back(leg_record.id);
                    continue;
                }
            }
            LegId created;
            if (add_leg_locked(id, leg_record, created)) {
                kept.insert(created);
                order.push_back(created);
            }
        }
        for (const auto& leg_id : existing) {
            if (kept.count(leg_id)) continue;
            if (auto removed = store_.remove_leg(leg_id)) {
                drop_leg_interest_locked(*removed);
            }
        }
        s->legs = std::move(order);

        store_.touch(id);
        refresh_locked(id, events, mode);
        schedule_sync_locked(id, origin);
        publish_locked(events);
    }
    drain();
    return id;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<StrategySnapshot> MonitorEngine::snapshot(const StrategyId& id) const {
    std::lock_guard lock(mutex_);
    const auto* s = store_.find_strategy(id);
    if (!s) {
        return std::nullopt;
    }

    StrategySnapshot out;
    out.record = store_.record(id);
    out.price = s->aggregate;
    out.alarm = alarms_.state(id);
    for (const auto* leg : store_.legs_of(id)) {
        out.legs.push_back({leg->id, leg->ticker.str(), leg->side, leg->quantity,
                            leg->quote, leg->contribution()});
    }
    return out;
}

std::optional<Price> MonitorEngine::price(const StrategyId& id) const {
    std::lock_guard lock(mutex_);
    const auto* s = store_.find_strategy(id);
    return s ? s->aggregate : std::nullopt;
}

std::vector<StrategyId> MonitorEngine::strategy_ids() const {
    std::lock_guard lock(mutex_);
    return store_.strategy_ids();
}

EngineStats MonitorEngine::stats() const {
    EngineStats s;
    {
        std::lock_guard lock(mutex_);
        s.strategies = store_.strategy_count();
        s.legs = store_.leg_count();
        s.armed = alarms_.armed_count();
    }
    s.quotes_applied = quotes_applied_.load(std::memory_order_relaxed);
    s.quotes_stale = quotes_stale_.load(std::memory_order_relaxed);
    s.price_events = price_events_.load(std::memory_order_relaxed);
    s.reached_events = reached_events_.load(std::memory_order_relaxed);
    s.left_events = left_events_.load(std::memory_order_relaxed);
    s.sync_scheduled = sync_scheduled_.load(std::memory_order_relaxed);
    s.sync_emitted = sync_emitted_.load(std::memory_order_relaxed);
    s.sync_pending = debouncer_->pending_count();
    s.multiplexer = mux_->stats();
    return s;
}

// ---------------------------------------------------------------------------
// Internals
// ---------------------------------------------------------------------------

bool MonitorEngine::add_leg_locked(const StrategyId& strategy_id, const LegRecord& record, LegId& out_id) {
    if (record.quantity <= 0) {
        return false;
    }

    strategy::Leg leg;
    leg.id = record.id.empty() ? new_id() : record.id;
    leg.strategy = strategy_id;
    leg.ticker_text = record.ticker;
    leg.ticker = registry_->intern(record.ticker);
    leg.side = record.side;
    leg.quantity = record.quantity;

    const LegId id = leg.id;
    const market::Ticker ticker = leg.ticker;
    if (!store_.add_leg(std::move(leg))) {
        Logger::warn("[Engine] Leg id '{}' already exists", id);
        return false;
    }
    if (!ticker.empty()) {
        mux_->register_leg(id, ticker);
    }
    out_id = id;
    return true;
}

void MonitorEngine::set_leg_ticker_locked(strategy::Leg& leg, const std::string& ticker_text) {
    leg.ticker_text = ticker_text;
    const market::Ticker ticker = registry_->intern(ticker_text);
    if (ticker == leg.ticker) {
        return;
    }

    drop_leg_interest_locked(leg);
    leg.ticker = ticker;
    leg.quote = LegQuote{};     // Old instrument's prices no longer apply
    if (!ticker.empty()) {
        mux_->register_leg(leg.id, ticker);
    }
}

void MonitorEngine::drop_leg_interest_locked(const strategy::Leg& leg) {
    if (!leg.ticker.empty()) {
        mux_->unregister_leg(leg.id, leg.ticker);
    }
}

void MonitorEngine::refresh_locked(const StrategyId& id, Notifications& out, AlarmUpdate mode) {
    auto* s = store_.find_strategy(id);
    if (!s) {
        return;
    }

    const auto previous = s->aggregate;
    const auto current = store_.recompute(id);
    if (current != previous) {
        out.push_back({Notification::Kind::Price, id, current});
    }

    const auto input = alarm_input_locked(*s);
    switch (mode) {
        case AlarmUpdate::Evaluate:
            push_alarm(alarms_.evaluate(id, input), id, current, out);
            break;
        case AlarmUpdate::TargetChanged:
            for (auto event : alarms_.on_target_changed(id, input)) {
                push_alarm(event, id, current, out);
            }
            break;
        case AlarmUpdate::Suppress:
            break;
    }
}

void MonitorEngine::push_alarm(std::optional<AlarmEvent> event, const StrategyId& id,
                               std::optional<Price> price, Notifications& out) {
    if (!event) {
        return;
    }
    out.push_back({*event == AlarmEvent::Reached ? Notification::Kind::Reached : Notification::Kind::Left,
                   id, price});
}

strategy::AlarmStateMachine::Input MonitorEngine::alarm_input_locked(const strategy::Strategy& s) const {
    return {s.status, s.aggregate, s.target, s.condition};
}

void MonitorEngine::schedule_sync_locked(const StrategyId& id, ChangeOrigin origin) {
    // Remote changes are already known to the server
    if (origin == ChangeOrigin::Remote) {
        return;
    }
    if (debouncer_->schedule(id, [this, id]() { emit_sync(id); })) {
        sync_scheduled_.fetch_add(1, std::memory_order_relaxed);
    }
}

void MonitorEngine::emit_sync(const StrategyId& id) {
    if (stopped_.load(std::memory_order_acquire)) {
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (!store_.find_strategy(id)) {
            return;
        }
        Notifications events;
        events.push_back({Notification::Kind::Changed, id, std::nullopt, store_.record(id)});
        publish_locked(events);
    }
    sync_emitted_.fetch_add(1, std::memory_order_relaxed);
    Logger::debug("[Engine] StrategyChanged {}", id);
    drain();
}

void MonitorEngine::publish_locked(Notifications& events) {
    if (events.empty()) {
        return;
    }
    std::lock_guard lock(outbox_mutex_);
    for (auto& e : events) {
        outbox_.push_back(std::move(e));
    }
}

void MonitorEngine::drain() {
    std::unique_lock lock(outbox_mutex_);
    if (draining_) {
        return;  // The active drainer delivers ours after its own
    }
    draining_ = true;
    while (!outbox_.empty()) {
        Notification event = std::move(outbox_.front());
        outbox_.pop_front();
        lock.unlock();
        try {
            deliver(event);
        } catch (const std::exception& e) {
            Logger::error("[Engine] Listener failed on {}: {}", event.id, e.what());
        }
        lock.lock();
    }
    draining_ = false;
}

void MonitorEngine::deliver(const Notification& e) {
    switch (e.kind) {
        case Notification::Kind::Price:
            price_events_.fetch_add(1, std::memory_order_relaxed);
            if (on_price_) on_price_(e.id, e.price);
            break;
        case Notification::Kind::Reached:
            reached_events_.fetch_add(1, std::memory_order_relaxed);
            if (on_reached_) on_reached_(e.id, e.price);
            break;
        case Notification::Kind::Left:
            left_events_.fetch_add(1, std::memory_order_relaxed);
            if (on_left_) on_left_(e.id, e.price);
            break;
        case Notification::Kind::Changed:
            if (on_changed_) on_changed_(e.id, e.record);
            break;
        case Notification::Kind::Removed:
            if (on_removed_) on_removed_(e.id);
            break;
    }
}

} // namespace stratmon::engine
