#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace stratmon::strategy {

namespace net = boost::asio;

/**
 * Per-entity trailing debounce.
 *
 * schedule() replaces the entity's pending action and restarts its quiet
 * timer; when the timer expires the latest action runs exactly once.
 * Rescheduling and cancelling are atomic with respect to expiry: a handler
 * whose generation is stale does nothing.
 *
 * Create with std::make_shared, timer handlers hold a weak reference.
 */
class ChangeDebouncer : public std::enable_shared_from_this<ChangeDebouncer> {
public:
    using Action = std::function<void()>;

    ChangeDebouncer(net::io_context& ioc, std::chrono::milliseconds quiet_period);
    ~ChangeDebouncer();

    ChangeDebouncer(const ChangeDebouncer&) = delete;
    ChangeDebouncer& operator=(const ChangeDebouncer&) = delete;

    // False once cancel_all() has run
    bool schedule(const std::string& id, Action action);

    // Drop the pending action without running it
    bool cancel(const std::string& id);

    // Drop everything and refuse further schedules
    void cancel_all();

    std::size_t pending_count() const;
    bool is_pending(const std::string& id) const;

    std::chrono::milliseconds quiet_period() const noexcept { return quiet_; }
    uint64_t executions() const noexcept { return executions_.load(std::memory_order_relaxed); }

private:
    struct Entry {
        std::unique_ptr<net::steady_timer> timer;
        Action action;
        uint64_t generation{0};
    };

    void on_expired(const std::string& id, uint64_t generation);

    net::io_context& ioc_;
    const std::chrono::milliseconds quiet_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    uint64_t next_generation_{0};
    bool stopped_{false};

    std::atomic<uint64_t> executions_{0};
};

} // namespace stratmon::strategy
