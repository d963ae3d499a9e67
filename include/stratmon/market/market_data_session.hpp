#pragma once

#include "stratmon/market/instrument_registry.hpp"

#include <functional>
#include <string>
#include <vector>

namespace stratmon::market {

/**
 * Callbacks a market-data session delivers on its own execution context.
 * No ordering is guaranteed between on_subscription_started and the first
 * on_quote for the same ticker.
 */
struct SessionListener {
    // Raw feed values; negative or NaN fields mean "no value"
    std::function<void(const std::string& ticker, double last, double bid, double ask)> on_quote;
    std::function<void(const std::string& ticker)> on_subscription_started;
    std::function<void(const std::string& ticker, const std::string& reason)> on_subscription_failed;
    std::function<void()> on_session_terminated;
};

/**
 * External market-data session (terminal API, simulator, test double)
 */
class IMarketDataSession {
public:
    virtual ~IMarketDataSession() = default;

    virtual const std::string& get_name() const = 0;

    // Connection
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_connected() const = 0;

    // Subscriptions, one call per flushed batch
    virtual void subscribe(const std::vector<Ticker>& tickers) = 0;
    virtual void unsubscribe(const std::vector<Ticker>& tickers) = 0;

    virtual void set_listener(SessionListener listener) = 0;
};

} // namespace stratmon::market
