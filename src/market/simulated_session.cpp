#include "stratmon/market/simulated_session.hpp"
#include "stratmon/core/logger.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <vector>

namespace stratmon::market {

namespace {

constexpr double BASE_PRICE_MIN = 90.0;
constexpr double BASE_PRICE_MAX = 110.0;
constexpr double STEP = 0.5;
constexpr double SPREAD_MIN = 0.01;
constexpr double SPREAD_MAX = 0.05;
constexpr double PRICE_FLOOR = 0.01;

unsigned int make_seed(unsigned int configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

} // namespace

SimulatedSession::SimulatedSession(net::io_context& ioc, const SessionConfig& config)
    : strand_(net::make_strand(ioc))
    , timer_(strand_)
    , interval_(std::max(config.simulation_interval_ms, 10))
    , rng_(make_seed(config.simulation_seed)) {
}

void SimulatedSession::set_listener(SessionListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

bool SimulatedSession::start() {
    if (connected_.exchange(true, std::memory_order_acq_rel)) {
        return true;
    }
    Logger::info("[SimSession] Started (interval {}ms)", interval_.count());
    net::post(strand_, [self = shared_from_this()]() { self->schedule_tick(); });
    return true;
}

void SimulatedSession::stop() {
    if (!connected_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    // The timer belongs to the strand
    net::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });

    std::function<void()> terminated;
    {
        std::lock_guard lock(mutex_);
        prices_.clear();
        terminated = listener_.on_session_terminated;
    }
    Logger::info("[SimSession] Stopped");
    if (terminated) {
        terminated();
    }
}

void SimulatedSession::subscribe(const std::vector<Ticker>& tickers) {
    std::vector<std::string> started;
    std::function<void(const std::string&)> on_started;
    {
        std::lock_guard lock(mutex_);
        std::uniform_real_distribution<double> base(BASE_PRICE_MIN, BASE_PRICE_MAX);
        for (const auto& ticker : tickers) {
            if (prices_.emplace(ticker.str(), base(rng_)).second) {
                started.push_back(ticker.str());
            }
        }
        on_started = listener_.on_subscription_started;
    }

    Logger::debug("[SimSession] Subscribed {} ticker(s)", started.size());
    if (on_started) {
        for (const auto& t : started) {
            on_started(t);
        }
    }
}

void SimulatedSession::unsubscribe(const std::vector<Ticker>& tickers) {
    std::lock_guard lock(mutex_);
    for (const auto& ticker : tickers) {
        prices_.erase(ticker.str());
    }
    Logger::debug("[SimSession] Unsubscribed {} ticker(s)", tickers.size());
}

std::size_t SimulatedSession::subscription_count() const {
    std::lock_guard lock(mutex_);
    return prices_.size();
}

void SimulatedSession::tick() {
    struct Quote {
        std::string ticker;
        double last, bid, ask;
    };
    std::vector<Quote> quotes;
    std::function<void(const std::string&, double, double, double)> on_quote;
    {
        std::lock_guard lock(mutex_);
        std::uniform_real_distribution<double> step(-STEP, STEP);
        std::uniform_real_distribution<double> spread(SPREAD_MIN, SPREAD_MAX);
        quotes.reserve(prices_.size());
        for (auto& [ticker, price] : prices_) {
            price = std::max(PRICE_FLOOR, price + step(rng_));
            double bid = price - spread(rng_);
            double ask = price + spread(rng_);
            quotes.push_back({ticker, price, bid, ask});
        }
        on_quote = listener_.on_quote;
    }

    if (!on_quote) {
        return;
    }
    for (const auto& q : quotes) {
        on_quote(q.ticker, q.last, q.bid, q.ask);
    }
}

void SimulatedSession::schedule_tick() {
    if (!connected_.load(std::memory_order_acquire)) {
        return;
    }
    timer_.expires_after(interval_);
    timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        self->on_tick_timer(ec);
    });
}

void SimulatedSession::on_tick_timer(const boost::system::error_code& ec) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        Logger::error("[SimSession] Tick timer error: {}", ec.message());
        return;
    }
    if (!connected_.load(std::memory_order_acquire)) {
        return;
    }
    tick();
    schedule_tick();
}

} // namespace stratmon::market
