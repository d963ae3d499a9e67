#include "stratmon/market/subscription_multiplexer.hpp"
#include "stratmon/core/logger.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <utility>

namespace stratmon::market {

SubscriptionMultiplexer::SubscriptionMultiplexer(net::io_context& ioc,
                                                 std::shared_ptr<InstrumentRegistry> registry)
    : registry_(std::move(registry))
    , strand_(net::make_strand(ioc)) {
}

void SubscriptionMultiplexer::attach(std::shared_ptr<IMarketDataSession> session) {
    std::weak_ptr<SubscriptionMultiplexer> weak = weak_from_this();

    SessionListener listener;
    listener.on_quote = [weak](const std::string& ticker, double last, double bid, double ask) {
        if (auto self = weak.lock()) {
            self->on_quote(ticker, QuoteSnapshot::from_raw(last, bid, ask));
        }
    };
    listener.on_subscription_started = [weak](const std::string& ticker) {
        if (auto self = weak.lock()) self->on_subscription_started(ticker);
    };
    listener.on_subscription_failed = [weak](const std::string& ticker, const std::string& reason) {
        if (auto self = weak.lock()) self->on_subscription_failed(ticker, reason);
    };
    listener.on_session_terminated = [weak]() {
        if (auto self = weak.lock()) self->on_session_terminated();
    };
    session->set_listener(std::move(listener));

    {
        std::unique_lock lock(mutex_);
        session_ = std::move(session);
        Logger::info("[Mux] Attached to session '{}' ({} tickers pending)",
                     session_->get_name(), pending_add_.size());
    }
    request_flush();
}

bool SubscriptionMultiplexer::register_leg(const LegId& leg, const Ticker& ticker) {
    if (ticker.empty() || leg.empty()) {
        return false;
    }

    {
        std::unique_lock lock(mutex_);
        auto& legs = interest_[ticker];
        if (!legs.insert(leg).second) {
            return false;  // Already registered
        }
        if (legs.size() == 1) {
            // First consumer: cancel a pending removal or queue a subscribe
            if (pending_remove_.erase(ticker) == 0) {
                pending_add_.insert(ticker);
            }
        }
        LOG_DEBUG("[Mux] {} -> {} (refcount {})", leg, ticker.str(), legs.size());
    }

    request_flush();
    return true;
}

bool SubscriptionMultiplexer::unregister_leg(const LegId& leg, const Ticker& ticker) {
    {
        std::unique_lock lock(mutex_);
        auto it = interest_.find(ticker);
        if (it == interest_.end() || it->second.erase(leg) == 0) {
            // Edits can race in-flight callbacks; unknown pairs are fine
            LOG_DEBUG("[Mux] Ignoring unregister of {} from {}", leg, ticker.str());
            return false;
        }
        if (it->second.empty()) {
            interest_.erase(it);
            // Last consumer: cancel a pending subscribe or queue an unsubscribe
            if (pending_add_.erase(ticker) == 0) {
                pending_remove_.insert(ticker);
            }
        }
    }

    request_flush();
    return true;
}

void SubscriptionMultiplexer::on_quote(const std::string& ticker, const QuoteSnapshot& snapshot) {
    if (!accepting_.load(std::memory_order_acquire)) {
        quotes_dropped_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    const Ticker key = registry_->normalize(ticker);

    // Copy under the lock so a concurrent edit of this ticker is seen whole or not at all
    std::vector<LegId> legs;
    {
        std::shared_lock lock(mutex_);
        auto it = interest_.find(key);
        if (it != interest_.end()) {
            legs.assign(it->second.begin(), it->second.end());
        }
    }

    if (legs.empty()) {
        // In-flight delivery after the last consumer left
        auto dropped = quotes_dropped_.fetch_add(1, std::memory_order_relaxed) + 1;
        LOG_DEBUG("[Mux] Dropped quote for {} with no interest (total dropped: {})", key.str(), dropped);
        return;
    }

    if (route_) {
        for (const auto& leg : legs) {
            route_(leg, key, snapshot);
        }
    }
    quotes_routed_.fetch_add(legs.size(), std::memory_order_relaxed);
}

void SubscriptionMultiplexer::on_subscription_started(const std::string& ticker) {
    Logger::info("[Mux] Subscription active: {}", ticker);
    if (on_status_) {
        on_status_(ticker, true, "");
    }
}

void SubscriptionMultiplexer::on_subscription_failed(const std::string& ticker, const std::string& reason) {
    subscription_failures_.fetch_add(1, std::memory_order_relaxed);
    Logger::warn("[Mux] Subscription failed for {}: {}", ticker, reason);
    if (on_status_) {
        on_status_(ticker, false, reason);
    }
}

void SubscriptionMultiplexer::on_session_terminated() {
    Logger::warn("[Mux] Market-data session terminated");
    if (on_terminated_) {
        on_terminated_();
    }
}

void SubscriptionMultiplexer::request_flush() {
    if (!accepting_.load(std::memory_order_acquire)) {
        return;
    }
    if (flush_posted_.exchange(true, std::memory_order_acq_rel)) {
        return;  // A flush is already queued and will see this change
    }
    net::post(strand_, [weak = weak_from_this()]() {
        if (auto self = weak.lock()) {
            self->flush();
        }
    });
}

void SubscriptionMultiplexer::flush() {
    std::vector<Ticker> adds;
    std::vector<Ticker> removes;
    std::shared_ptr<IMarketDataSession> session;

    {
        std::unique_lock lock(mutex_);
        flush_posted_.store(false, std::memory_order_release);

        if (!accepting_.load(std::memory_order_acquire) || !session_) {
            return;  // Keep batches until a session is attached
        }
        if (pending_add_.empty() && pending_remove_.empty()) {
            return;
        }

        removes.assign(pending_remove_.begin(), pending_remove_.end());
        adds.assign(pending_add_.begin(), pending_add_.end());
        pending_remove_.clear();
        pending_add_.clear();

        for (const auto& t : removes) subscribed_.erase(t);
        for (const auto& t : adds) subscribed_.insert(t);
        session = session_;
    }

    flushes_.fetch_add(1, std::memory_order_relaxed);

    // Session round-trips happen outside the lock; the strand keeps flushes ordered
    if (!removes.empty()) {
        Logger::debug("[Mux] Unsubscribing {} ticker(s)", removes.size());
        session->unsubscribe(removes);
        unsubscribe_calls_.fetch_add(1, std::memory_order_relaxed);
    }
    if (!adds.empty()) {
        Logger::debug("[Mux] Subscribing {} ticker(s)", adds.size());
        session->subscribe(adds);
        subscribe_calls_.fetch_add(1, std::memory_order_relaxed);
    }
}

void SubscriptionMultiplexer::shutdown() {
    if (!accepting_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    std::unique_lock lock(mutex_);
    if (!pending_add_.empty() || !pending_remove_.empty()) {
        Logger::info("[Mux] Discarding {} pending subscribe(s), {} pending unsubscribe(s)",
                     pending_add_.size(), pending_remove_.size());
    }
    pending_add_.clear();
    pending_remove_.clear();
    interest_.clear();
}

std::shared_ptr<IMarketDataSession> SubscriptionMultiplexer::release_session() {
    std::unique_lock lock(mutex_);
    subscribed_.clear();
    return std::exchange(session_, nullptr);
}

std::size_t SubscriptionMultiplexer::refcount(const Ticker& ticker) const {
    std::shared_lock lock(mutex_);
    auto it = interest_.find(ticker);
    return it == interest_.end() ? 0 : it->second.size();
}

bool SubscriptionMultiplexer::is_subscribed(const Ticker& ticker) const {
    std::shared_lock lock(mutex_);
    return subscribed_.count(ticker) > 0;
}

std::vector<Ticker> SubscriptionMultiplexer::active_tickers() const {
    std::shared_lock lock(mutex_);
    std::vector<Ticker> out;
    out.reserve(interest_.size());
    for (const auto& [ticker, legs] : interest_) {
        out.push_back(ticker);
    }
    std::sort(out.begin(), out.end());
    return out;
}

SubscriptionMultiplexer::Stats SubscriptionMultiplexer::stats() const {
    Stats s;
    {
        std::shared_lock lock(mutex_);
        s.tickers = interest_.size();
        for (const auto& [ticker, legs] : interest_) {
            s.registrations += legs.size();
        }
        s.outstanding = subscribed_.size();
    }
    s.quotes_routed = quotes_routed_.load(std::memory_order_relaxed);
    s.quotes_dropped = quotes_dropped_.load(std::memory_order_relaxed);
    s.subscribe_calls = subscribe_calls_.load(std::memory_order_relaxed);
    s.unsubscribe_calls = unsubscribe_calls_.load(std::memory_order_relaxed);
    s.flushes = flushes_.load(std::memory_order_relaxed);
    s.subscription_failures = subscription_failures_.load(std::memory_order_relaxed);
    return s;
}

} // namespace stratmon::market
