#include "stratmon/strategy/change_debouncer.hpp"
#include "stratmon/core/logger.hpp"

#include <exception>
#include <utility>

namespace stratmon::strategy {

ChangeDebouncer::ChangeDebouncer(net::io_context& ioc, std::chrono::milliseconds quiet_period)
    : ioc_(ioc)
    , quiet_(quiet_period.count() < 0 ? std::chrono::milliseconds(0) : quiet_period) {
}

ChangeDebouncer::~ChangeDebouncer() {
    std::lock_guard lock(mutex_);
    entries_.clear();
}

bool ChangeDebouncer::schedule(const std::string& id, Action action) {
    std::lock_guard lock(mutex_);
    if (stopped_) {
        return false;
    }

    auto& entry = entries_[id];
    if (!entry.timer) {
        entry.timer = std::make_unique<net::steady_timer>(ioc_);
    }
    entry.action = std::move(action);
    entry.generation = ++next_generation_;

    // expires_after aborts the previous wait; its handler sees operation_aborted
    entry.timer->expires_after(quiet_);
    entry.timer->async_wait(
        [weak = weak_from_this(), id, generation = entry.generation](const boost::system::error_code& ec) {
            if (ec == net::error::operation_aborted) {
                return;
            }
            if (ec) {
                Logger::error("[Debounce] Timer error for {}: {}", id, ec.message());
                return;
            }
            if (auto self = weak.lock()) {
                self->on_expired(id, generation);
            }
        });
    return true;
}

void ChangeDebouncer::on_expired(const std::string& id, uint64_t generation) {
    Action action;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        // Rescheduled or cancelled after the timer had already fired
        if (it == entries_.end() || it->second.generation != generation) {
            return;
        }
        action = std::move(it->second.action);
        entries_.erase(it);
    }

    executions_.fetch_add(1, std::memory_order_relaxed);
    if (!action) {
        return;
    }
    try {
        action();
    } catch (const std::exception& e) {
        Logger::error("[Debounce] Action for {} threw: {}", id, e.what());
    }
}

bool ChangeDebouncer::cancel(const std::string& id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.timer->cancel();
    entries_.erase(it);
    return true;
}

void ChangeDebouncer::cancel_all() {
    std::lock_guard lock(mutex_);
    stopped_ = true;
    if (!entries_.empty()) {
        Logger::info("[Debounce] Cancelling {} pending action(s)", entries_.size());
    }
    for (auto& [id, entry] : entries_) {
        entry.timer->cancel();
    }
    entries_.clear();
}

std::size_t ChangeDebouncer::pending_count() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

bool ChangeDebouncer::is_pending(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return entries_.count(id) > 0;
}

} // namespace stratmon::strategy
