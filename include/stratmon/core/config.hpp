#pragma once

#include "types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace stratmon {

// Market-data session settings
struct SessionConfig {
    std::string mode{"simulation"};
    std::string host{"localhost"};
    int port{8194};
    int simulation_interval_ms{1000};
    unsigned int simulation_seed{0};   // 0 = seed from random_device
};

// Ticker normalization settings
struct InstrumentConfig {
    std::string default_suffix{"Comdty"};
    // canonical suffix -> extra spellings
    std::unordered_map<std::string, std::vector<std::string>> suffix_synonyms;
};

// Log sinks and levels
struct LogSettings {
    std::string level{"info"};
    std::string file{"logs/stratmon.log"};  // empty = console only
    std::string alarm_file;                 // empty = no separate alarm trail
    int max_size_mb{50};
    int max_files{5};
    int queue_size{8192};
    bool console{true};
};

// Runtime configuration (loaded from YAML)
struct RuntimeConfig {
    SessionConfig session;
    InstrumentConfig instruments;

    // Engine
    int sync_debounce_ms{500};
    int io_threads{2};

    // Event broadcast
    bool broadcast_enabled{true};
    unsigned short broadcast_port{8765};

    LogSettings logging;

    // Initial strategy book
    std::vector<StrategyRecord> strategies;
};

// Configuration loader
class ConfigLoader {
public:
    // Load from YAML file
    static RuntimeConfig load(const std::string& path);

    // Load from an in-memory YAML document
    static RuntimeConfig load_from_string(const std::string& yaml_text);

    // Get default configuration
    static RuntimeConfig get_default();

    static std::string expand_env_vars(const std::string& value);

private:
    static std::string get_env(const std::string& name, const std::string& default_value = "");
};

} // namespace stratmon
