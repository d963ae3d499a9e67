#include "stratmon/strategy/strategy_store.hpp"
#include "stratmon/strategy/pricing.hpp"

#include <algorithm>

namespace stratmon::strategy {

std::optional<Price> Leg::contribution() const {
    return PricingEngine::contribution(quote, side, quantity);
}

bool StrategyStore::add_strategy(Strategy strategy) {
    if (strategy.id.empty() || strategies_.count(strategy.id)) {
        return false;
    }
    // Legs are attached through add_leg only
    strategy.legs.clear();
    strategy.aggregate.reset();
    if (strategy.created_at == SystemTimestamp{}) {
        strategy.created_at = std::chrono::system_clock::now();
    }
    order_.push_back(strategy.id);
    auto id = strategy.id;
    strategies_.emplace(std::move(id), std::move(strategy));
    return true;
}

std::optional<Strategy> StrategyStore::remove_strategy(const StrategyId& id, std::vector<Leg>* removed_legs) {
    auto it = strategies_.find(id);
    if (it == strategies_.end()) {
        return std::nullopt;
    }

    for (const auto& leg_id : it->second.legs) {
        auto leg_it = legs_.find(leg_id);
        if (leg_it == legs_.end()) continue;
        if (removed_legs) {
            removed_legs->push_back(std::move(leg_it->second));
        }
        legs_.erase(leg_it);
    }

    Strategy removed = std::move(it->second);
    strategies_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return removed;
}

bool StrategyStore::add_leg(Leg leg) {
    if (leg.id.empty() || legs_.count(leg.id)) {
        return false;
    }
    auto* strategy = find_strategy(leg.strategy);
    if (!strategy) {
        return false;
    }
    strategy->legs.push_back(leg.id);
    auto id = leg.id;
    legs_.emplace(std::move(id), std::move(leg));
    return true;
}

std::optional<Leg> StrategyStore::remove_leg(const LegId& id) {
    auto it = legs_.find(id);
    if (it == legs_.end()) {
        return std::nullopt;
    }
    Leg removed = std::move(it->second);
    legs_.erase(it);

    if (auto* strategy = find_strategy(removed.strategy)) {
        auto& ids = strategy->legs;
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    }
    return removed;
}

Strategy* StrategyStore::find_strategy(const StrategyId& id) {
    auto it = strategies_.find(id);
    return it == strategies_.end() ? nullptr : &it->second;
}

const Strategy* StrategyStore::find_strategy(const StrategyId& id) const {
    auto it = strategies_.find(id);
    return it == strategies_.end() ? nullptr : &it->second;
}

Leg* StrategyStore::find_leg(const LegId& id) {
    auto it = legs_.find(id);
    return it == legs_.end() ? nullptr : &it->second;
}

const Leg* StrategyStore::find_leg(const LegId& id) const {
    auto it = legs_.find(id);
    return it == legs_.end() ? nullptr : &it->second;
}

std::vector<const Leg*> StrategyStore::legs_of(const StrategyId& id) const {
    std::vector<const Leg*> out;
    const auto* strategy = find_strategy(id);
    if (!strategy) {
        return out;
    }
    out.reserve(strategy->legs.size());
    for (const auto& leg_id : strategy->legs) {
        if (const auto* leg = find_leg(leg_id)) {
            out.push_back(leg);
        }
    }
    return out;
}

std::optional<QuoteApplication> StrategyStore::apply_quote(const LegId& leg_id,
                                                           const market::Ticker& ticker,
                                                           const QuoteSnapshot& snapshot,
                                                           Timestamp now) {
    auto* leg = find_leg(leg_id);
    if (!leg || leg->ticker.empty() || leg->ticker != ticker) {
        return std::nullopt;  // Removed or re-pointed while the quote was in flight
    }

    PricingEngine::merge(leg->quote, snapshot, now);

    QuoteApplication result;
    result.strategy = leg->strategy;
    if (const auto* strategy = find_strategy(leg->strategy)) {
        result.previous = strategy->aggregate;
    }
    result.aggregate = recompute(leg->strategy);
    return result;
}

std::optional<Price> StrategyStore::recompute(const StrategyId& id) {
    auto* strategy = find_strategy(id);
    if (!strategy) {
        return std::nullopt;
    }

    // No legs means nothing to price
    std::optional<Price> total;
    if (!strategy->legs.empty()) {
        double sum = 0.0;
        bool complete = true;
        for (const auto& leg_id : strategy->legs) {
            const auto* leg = find_leg(leg_id);
            auto contribution = leg ? leg->contribution() : std::nullopt;
            if (!contribution) {
                complete = false;
                break;
            }
            sum += *contribution;
        }
        if (complete) {
            total = sum;
        }
    }

    strategy->aggregate = total;
    return total;
}

void StrategyStore::touch(const StrategyId& id) {
    if (auto* strategy = find_strategy(id)) {
        strategy->updated_at = std::chrono::system_clock::now();
    }
}

StrategyRecord StrategyStore::record(const StrategyId& id) const {
    StrategyRecord out;
    const auto* strategy = find_strategy(id);
    if (!strategy) {
        return out;
    }
    out.id = strategy->id;
    out.name = strategy->name;
    out.target = strategy->target;
    out.condition = strategy->condition;
    out.status = strategy->status;
    for (const auto* leg : legs_of(id)) {
        out.legs.push_back({leg->id,
                            leg->ticker.empty() ? leg->ticker_text : leg->ticker.str(),
                            leg->side, leg->quantity});
    }
    return out;
}

std::vector<StrategyId> StrategyStore::strategy_ids() const {
    return order_;
}

} // namespace stratmon::strategy
