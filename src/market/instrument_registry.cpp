#include "stratmon/market/instrument_registry.hpp"
#include "stratmon/core/logger.hpp"

#include <algorithm>
#include <cctype>

namespace stratmon::market {

namespace {

// Bloomberg yellow keys and their common shorthands
const std::vector<std::pair<const char*, std::vector<const char*>>>& builtin_suffixes() {
    static const std::vector<std::pair<const char*, std::vector<const char*>>> table = {
        {"COMDTY", {"CMDTY"}},
        {"INDEX",  {"IDX"}},
        {"EQUITY", {"EQ", "EQTY"}},
        {"CURNCY", {"CRNCY", "CCY"}},
        {"GOVT",   {}},
        {"CORP",   {}},
        {"MUNI",   {}},
        {"MTGE",   {}},
        {"PFD",    {}},
        {"M-MKT",  {}},
    };
    return table;
}

std::vector<std::string> split_ws(std::string_view text) {
    std::vector<std::string> tokens;
    std::size_t i = 0;
    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        std::size_t start = i;
        while (i < text.size() && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i > start) tokens.emplace_back(text.substr(start, i - start));
    }
    return tokens;
}

} // namespace

InstrumentRegistry::InstrumentRegistry() : InstrumentRegistry(InstrumentConfig{}) {}

InstrumentRegistry::InstrumentRegistry(const InstrumentConfig& config)
    : default_suffix_(upper(config.default_suffix)) {
    for (const auto& [canonical, synonyms] : builtin_suffixes()) {
        suffix_map_[canonical] = canonical;
        for (const char* s : synonyms) {
            suffix_map_[s] = canonical;
        }
    }
    for (const auto& [canonical, synonyms] : config.suffix_synonyms) {
        const std::string c = upper(canonical);
        suffix_map_[c] = c;
        for (const auto& s : synonyms) {
            suffix_map_[upper(s)] = c;
        }
    }
    // A default suffix nobody declared still has to be recognized as one
    if (!default_suffix_.empty()) {
        suffix_map_.emplace(default_suffix_, default_suffix_);
    }
}

std::string InstrumentRegistry::upper(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

Ticker InstrumentRegistry::normalize(std::string_view text) const {
    auto tokens = split_ws(text);
    if (tokens.empty()) {
        return Ticker{};
    }

    for (auto& token : tokens) {
        token = upper(token);
    }

    {
        std::shared_lock lock(mutex_);
        auto it = suffix_map_.find(tokens.back());
        if (it != suffix_map_.end()) {
            tokens.back() = it->second;
        } else if (!default_suffix_.empty()) {
            tokens.push_back(default_suffix_);
        }
    }

    std::string canonical;
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) canonical += ' ';
        canonical += tokens[i];
    }
    return Ticker(std::move(canonical));
}

Ticker InstrumentRegistry::intern(std::string_view text) {
    Ticker ticker = normalize(text);
    if (ticker.empty()) {
        return ticker;
    }

    std::unique_lock lock(mutex_);
    auto& seen = known_[ticker];
    if (seen.emplace(text).second && seen.size() > 1) {
        LOG_DEBUG("[Registry] '{}' is another spelling of {}", text, ticker.str());
    }
    return ticker;
}

bool InstrumentRegistry::contains(const Ticker& ticker) const {
    std::shared_lock lock(mutex_);
    return known_.count(ticker) > 0;
}

std::size_t InstrumentRegistry::known_count() const {
    std::shared_lock lock(mutex_);
    return known_.size();
}

std::vector<std::string> InstrumentRegistry::spellings(const Ticker& ticker) const {
    std::shared_lock lock(mutex_);
    auto it = known_.find(ticker);
    if (it == known_.end()) {
        return {};
    }
    std::vector<std::string> out(it->second.begin(), it->second.end());
    std::sort(out.begin(), out.end());
    return out;
}

void InstrumentRegistry::add_suffix_synonym(std::string_view canonical, std::string_view synonym) {
    const std::string c = upper(canonical);
    std::unique_lock lock(mutex_);
    suffix_map_[c] = c;
    suffix_map_[upper(synonym)] = c;
}

bool InstrumentRegistry::is_suffix(std::string_view token) const {
    std::shared_lock lock(mutex_);
    return suffix_map_.count(upper(token)) > 0;
}

} // namespace stratmon::market
