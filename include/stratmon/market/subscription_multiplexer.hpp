#pragma once

#include "stratmon/core/types.hpp"
#include "stratmon/market/instrument_registry.hpp"
#include "stratmon/market/market_data_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stratmon::market {

namespace net = boost::asio;

/**
 * Reference-counted fan-in of leg interests onto one market-data session.
 *
 * Every canonical ticker with at least one interested leg has exactly one
 * outstanding subscription. Registration changes are batched and flushed on a
 * strand, so callers never wait on the session; a ticker added and removed
 * before the flush runs produces no session call at all.
 *
 * Create with std::make_shared, flush handlers hold a weak reference.
 */
class SubscriptionMultiplexer : public std::enable_shared_from_this<SubscriptionMultiplexer> {
public:
    // The ticker is the canonical one the leg was registered under
    using QuoteRoute = std::function<void(const LegId&, const Ticker&, const QuoteSnapshot&)>;
    using TerminatedCallback = std::function<void()>;

    struct Stats {
        std::size_t tickers{0};             // tickers with refcount > 0
        std::size_t registrations{0};       // (leg, ticker) pairs
        std::size_t outstanding{0};         // subscriptions the session holds
        uint64_t quotes_routed{0};          // leg deliveries
        uint64_t quotes_dropped{0};         // no interested leg / after shutdown
        uint64_t subscribe_calls{0};
        uint64_t unsubscribe_calls{0};
        uint64_t flushes{0};
        uint64_t subscription_failures{0};
    };

    SubscriptionMultiplexer(net::io_context& ioc, std::shared_ptr<InstrumentRegistry> registry);

    SubscriptionMultiplexer(const SubscriptionMultiplexer&) = delete;
    SubscriptionMultiplexer& operator=(const SubscriptionMultiplexer&) = delete;

    // Wire the session's callbacks to this multiplexer and flush pending work
    void attach(std::shared_ptr<IMarketDataSession> session);

    void set_quote_route(QuoteRoute route) { route_ = std::move(route); }
    void set_status_callback(SubscriptionStatusCallback cb) { on_status_ = std::move(cb); }
    void set_terminated_callback(TerminatedCallback cb) { on_terminated_ = std::move(cb); }

    // Returns true if the interest set changed
    bool register_leg(const LegId& leg, const Ticker& ticker);
    bool unregister_leg(const LegId& leg, const Ticker& ticker);

    // Session callbacks
    void on_quote(const std::string& ticker, const QuoteSnapshot& snapshot);
    void on_subscription_started(const std::string& ticker);
    void on_subscription_failed(const std::string& ticker, const std::string& reason);
    void on_session_terminated();

    // Post a flush onto the dispatch strand; redundant calls coalesce
    void request_flush();

    // Stop routing quotes and drop batches that were never sent
    void shutdown();

    // Hand the session back to its owner and forget it
    std::shared_ptr<IMarketDataSession> release_session();

    bool accepting() const noexcept { return accepting_.load(std::memory_order_acquire); }

    // Introspection
    std::size_t refcount(const Ticker& ticker) const;
    bool is_subscribed(const Ticker& ticker) const;
    std::vector<Ticker> active_tickers() const;
    Stats stats() const;

private:
    void flush();

    std::shared_ptr<InstrumentRegistry> registry_;
    net::strand<net::io_context::executor_type> strand_;

    // Guards interest_, subscribed_, pending_* and session_
    mutable std::shared_mutex mutex_;
    std::unordered_map<Ticker, std::unordered_set<LegId>, TickerHash> interest_;
    std::unordered_set<Ticker, TickerHash> subscribed_;
    std::set<Ticker> pending_add_;
    std::set<Ticker> pending_remove_;
    std::shared_ptr<IMarketDataSession> session_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> flush_posted_{false};

    QuoteRoute route_;
    SubscriptionStatusCallback on_status_;
    TerminatedCallback on_terminated_;

    std::atomic<uint64_t> quotes_routed_{0};
    std::atomic<uint64_t> quotes_dropped_{0};
    std::atomic<uint64_t> subscribe_calls_{0};
    std::atomic<uint64_t> unsubscribe_calls_{0};
    std::atomic<uint64_t> flushes_{0};
    std::atomic<uint64_t> subscription_failures_{0};
};

} // namespace stratmon::market
