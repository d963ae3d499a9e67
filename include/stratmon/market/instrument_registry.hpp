#pragma once

#include "stratmon/core/config.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stratmon::market {

/**
 * Canonical instrument identifier.
 *
 * Only InstrumentRegistry builds non-empty tickers, so two Ticker values are
 * equal exactly when their canonical strings are.
 */
class Ticker {
public:
    Ticker() = default;

    const std::string& str() const noexcept { return canonical_; }
    bool empty() const noexcept { return canonical_.empty(); }

    bool operator==(const Ticker& other) const noexcept { return canonical_ == other.canonical_; }
    bool operator!=(const Ticker& other) const noexcept { return canonical_ != other.canonical_; }
    bool operator<(const Ticker& other) const noexcept { return canonical_ < other.canonical_; }

    std::size_t hash() const noexcept { return std::hash<std::string>{}(canonical_); }

private:
    friend class InstrumentRegistry;
    explicit Ticker(std::string canonical) : canonical_(std::move(canonical)) {}

    std::string canonical_;
};

struct TickerHash {
    std::size_t operator()(const Ticker& t) const noexcept { return t.hash(); }
};

/**
 * Ticker normalization and interning.
 *
 * "sfrh6c 96.00 comdty", " SFRH6C  96.00 Cmdty " and "SFRH6C 96.00" (with the
 * default suffix Comdty) all collapse to "SFRH6C 96.00 COMDTY".
 */
class InstrumentRegistry {
public:
    InstrumentRegistry();
    explicit InstrumentRegistry(const InstrumentConfig& config);

    // Pure normalization, no bookkeeping
    Ticker normalize(std::string_view text) const;

    // Normalize and remember the ticker and its raw spelling
    Ticker intern(std::string_view text);

    bool contains(const Ticker& ticker) const;
    std::size_t known_count() const;
    std::vector<std::string> spellings(const Ticker& ticker) const;

    // Register an extra spelling for a canonical suffix token
    void add_suffix_synonym(std::string_view canonical, std::string_view synonym);

    bool is_suffix(std::string_view token) const;

private:
    static std::string upper(std::string_view text);

    std::string default_suffix_;
    std::unordered_map<std::string, std::string> suffix_map_;   // spelling -> canonical

    mutable std::shared_mutex mutex_;
    std::unordered_map<Ticker, std::unordered_set<std::string>, TickerHash> known_;
};

} // namespace stratmon::market

namespace std {
template<>
struct hash<stratmon::market::Ticker> {
    std::size_t operator()(const stratmon::market::Ticker& t) const noexcept {
        return t.hash();
    }
};
} // namespace std
