#pragma once

#include "stratmon/core/config.hpp"
#include "stratmon/market/market_data_session.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace stratmon::market {

namespace net = boost::asio;

/**
 * Market-data session without a terminal.
 *
 * Each subscribed ticker starts at a random base price and random-walks every
 * interval; bid and ask straddle the last price by a small random spread.
 */
class SimulatedSession : public IMarketDataSession,
                         public std::enable_shared_from_this<SimulatedSession> {
public:
    SimulatedSession(net::io_context& ioc, const SessionConfig& config);
    ~SimulatedSession() override = default;

    const std::string& get_name() const override { return name_; }

    bool start() override;
    void stop() override;
    bool is_connected() const override { return connected_.load(std::memory_order_acquire); }

    void subscribe(const std::vector<Ticker>& tickers) override;
    void unsubscribe(const std::vector<Ticker>& tickers) override;

    void set_listener(SessionListener listener) override;

    // Emit one round of quotes immediately (tests, manual stepping)
    void tick();

    std::size_t subscription_count() const;

private:
    void schedule_tick();
    void on_tick_timer(const boost::system::error_code& ec);

    std::string name_{"simulation"};
    net::strand<net::io_context::executor_type> strand_;
    net::steady_timer timer_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    SessionListener listener_;
    std::map<std::string, double> prices_;   // canonical ticker -> last
    std::mt19937 rng_;

    std::atomic<bool> connected_{false};
};

} // namespace stratmon::market
