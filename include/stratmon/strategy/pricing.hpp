#pragma once

#include "stratmon/core/types.hpp"

#include <optional>

namespace stratmon::strategy {

/**
 * Strategy price arithmetic
 */
class PricingEngine {
public:
    // Merge present fields into the leg's quote; absent fields keep their last value
    static void merge(LegQuote& quote, const QuoteSnapshot& snapshot, Timestamp now) {
        if (snapshot.last) quote.last = snapshot.last;
        if (snapshot.bid) quote.bid = snapshot.bid;
        if (snapshot.ask) quote.ask = snapshot.ask;
        if (quote.bid && quote.ask) {
            quote.mid = (*quote.bid + *quote.ask) / 2.0;
        }
        quote.updated = now;
    }

    // sign(side) * quantity * price, absent until the leg has a price
    static std::optional<Price> contribution(const LegQuote& quote, Side side, Quantity quantity) {
        auto price = quote.price();
        if (!price) {
            return std::nullopt;
        }
        return static_cast<double>(side_multiplier(side)) * static_cast<double>(quantity) * *price;
    }

    static bool is_target_reached(Price price, Price target, TargetCondition condition) noexcept {
        return condition == TargetCondition::Below ? price <= target : price >= target;
    }
};

} // namespace stratmon::strategy
