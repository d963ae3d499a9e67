#pragma once

#include "stratmon/core/types.hpp"
#include "stratmon/market/instrument_registry.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stratmon::strategy {

// One option position inside a strategy
struct Leg {
    LegId id;
    StrategyId strategy;
    std::string ticker_text;        // As entered
    market::Ticker ticker;          // Canonical, empty when no instrument is set
    Side side{Side::Long};
    Quantity quantity{1};
    LegQuote quote;

    std::optional<Price> contribution() const;
};

struct Strategy {
    StrategyId id;
    std::string name;
    std::vector<LegId> legs;        // Display order
    std::optional<Price> target;
    TargetCondition condition{TargetCondition::Below};
    StrategyStatus status{StrategyStatus::Active};
    std::optional<Price> aggregate; // Cache of the last full recompute
    SystemTimestamp created_at{};
    SystemTimestamp updated_at{};
};

// Result of routing one quote into one leg
struct QuoteApplication {
    StrategyId strategy;
    std::optional<Price> aggregate;
    std::optional<Price> previous;

    bool changed() const noexcept { return aggregate != previous; }
};

/**
 * Legs, strategies and their prices.
 *
 * Not thread-safe; MonitorEngine serializes every call under its own lock.
 * Aggregates are always recomputed from every leg, never adjusted by deltas.
 */
class StrategyStore {
public:
    bool add_strategy(Strategy strategy);
    std::optional<Strategy> remove_strategy(const StrategyId& id, std::vector<Leg>* removed_legs = nullptr);

    bool add_leg(Leg leg);
    std::optional<Leg> remove_leg(const LegId& id);

    Strategy* find_strategy(const StrategyId& id);
    const Strategy* find_strategy(const StrategyId& id) const;
    Leg* find_leg(const LegId& id);
    const Leg* find_leg(const LegId& id) const;

    std::vector<const Leg*> legs_of(const StrategyId& id) const;

    // Update the leg's quote, recompute its strategy. Nothing happens when the
    // leg is gone or no longer references `ticker`.
    std::optional<QuoteApplication> apply_quote(const LegId& leg, const market::Ticker& ticker,
                                                const QuoteSnapshot& snapshot, Timestamp now);

    // Full recompute; stores and returns the aggregate
    std::optional<Price> recompute(const StrategyId& id);

    // Mark a structural edit
    void touch(const StrategyId& id);

    StrategyRecord record(const StrategyId& id) const;
    std::vector<StrategyId> strategy_ids() const;

    std::size_t strategy_count() const noexcept { return strategies_.size(); }
    std::size_t leg_count() const noexcept { return legs_.size(); }

private:
    std::unordered_map<StrategyId, Strategy> strategies_;
    std::unordered_map<LegId, Leg> legs_;
    std::vector<StrategyId> order_;     // Creation order for listings
};

} // namespace stratmon::strategy
