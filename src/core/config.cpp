#include "stratmon/core/config.hpp"
#include "stratmon/core/logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <regex>

namespace stratmon {

namespace {

void load_session(const YAML::Node& s, SessionConfig& session) {
    if (s["mode"]) session.mode = ConfigLoader::expand_env_vars(s["mode"].as<std::string>());
    if (s["host"]) session.host = ConfigLoader::expand_env_vars(s["host"].as<std::string>());
    if (s["port"]) session.port = s["port"].as<int>();
    if (s["simulation_interval_ms"]) session.simulation_interval_ms = s["simulation_interval_ms"].as<int>();
    if (s["simulation_seed"]) session.simulation_seed = s["simulation_seed"].as<unsigned int>();
}

void load_instruments(const YAML::Node& i, InstrumentConfig& instruments) {
    if (i["default_suffix"]) instruments.default_suffix = i["default_suffix"].as<std::string>();
    if (i["suffix_synonyms"] && i["suffix_synonyms"].IsMap()) {
        for (const auto& entry : i["suffix_synonyms"]) {
            auto canonical = entry.first.as<std::string>();
            auto& spellings = instruments.suffix_synonyms[canonical];
            if (entry.second.IsSequence()) {
                for (const auto& alias : entry.second) {
                    spellings.push_back(alias.as<std::string>());
                }
            } else if (entry.second.IsScalar()) {
                spellings.push_back(entry.second.as<std::string>());
            }
        }
    }
}

LegRecord load_leg(const YAML::Node& l) {
    LegRecord leg;
    if (l["id"]) leg.id = l["id"].as<std::string>();
    if (l["ticker"]) leg.ticker = l["ticker"].as<std::string>();
    if (l["side"]) {
        auto side = parse_side(l["side"].as<std::string>());
        if (side) {
            leg.side = *side;
        } else {
            Logger::warn("[Config] Unknown leg side '{}', using long", l["side"].as<std::string>());
        }
    }
    if (l["quantity"]) leg.quantity = l["quantity"].as<int>();
    return leg;
}

StrategyRecord load_strategy(const YAML::Node& s) {
    StrategyRecord record;
    if (s["id"]) record.id = s["id"].as<std::string>();
    if (s["name"]) record.name = s["name"].as<std::string>();
    if (s["target"] && !s["target"].IsNull()) record.target = s["target"].as<double>();
    if (s["condition"]) {
        auto condition = parse_condition(s["condition"].as<std::string>());
        if (condition) {
            record.condition = *condition;
        } else {
            Logger::warn("[Config] Unknown target condition '{}' in '{}', using below",
                         s["condition"].as<std::string>(), record.name);
        }
    }
    if (s["status"]) {
        auto status = parse_status(s["status"].as<std::string>());
        if (status) {
            record.status = *status;
        } else {
            Logger::warn("[Config] Unknown status '{}' in '{}', using active",
                         s["status"].as<std::string>(), record.name);
        }
    }
    if (s["legs"] && s["legs"].IsSequence()) {
        for (const auto& l : s["legs"]) {
            record.legs.push_back(load_leg(l));
        }
    }
    return record;
}

RuntimeConfig load_node(const YAML::Node& yaml) {
    RuntimeConfig config = ConfigLoader::get_default();

    if (yaml["session"]) {
        load_session(yaml["session"], config.session);
    }

    if (yaml["instruments"]) {
        load_instruments(yaml["instruments"], config.instruments);
    }

    if (yaml["engine"]) {
        auto e = yaml["engine"];
        if (e["sync_debounce_ms"]) config.sync_debounce_ms = e["sync_debounce_ms"].as<int>();
        if (e["io_threads"]) config.io_threads = e["io_threads"].as<int>();
    }

    if (yaml["broadcast"]) {
        auto b = yaml["broadcast"];
        if (b["enabled"]) config.broadcast_enabled = b["enabled"].as<bool>();
        if (b["port"]) config.broadcast_port = b["port"].as<unsigned short>();
    }

    if (yaml["logging"]) {
        auto log = yaml["logging"];
        auto& out = config.logging;
        if (log["level"]) out.level = log["level"].as<std::string>();
        if (log["file"]) out.file = ConfigLoader::expand_env_vars(log["file"].as<std::string>());
        if (log["alarm_file"]) out.alarm_file = ConfigLoader::expand_env_vars(log["alarm_file"].as<std::string>());
        if (log["max_size_mb"]) out.max_size_mb = log["max_size_mb"].as<int>();
        if (log["max_files"]) out.max_files = log["max_files"].as<int>();
        if (log["queue_size"]) out.queue_size = log["queue_size"].as<int>();
        if (log["console"]) out.console = log["console"].as<bool>();
    }

    if (yaml["strategies"] && yaml["strategies"].IsSequence()) {
        for (const auto& s : yaml["strategies"]) {
            config.strategies.push_back(load_strategy(s));
        }
    }

    if (config.io_threads < 1) config.io_threads = 1;
    if (config.sync_debounce_ms < 0) config.sync_debounce_ms = 0;
    if (config.session.simulation_interval_ms < 10) config.session.simulation_interval_ms = 10;

    return config;
}

} // namespace

std::string ConfigLoader::get_env(const std::string& name, const std::string& default_value) {
    const char* value = std::getenv(name.c_str());
    return value ? value : default_value;
}

std::string ConfigLoader::expand_env_vars(const std::string& value) {
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::string result = value;
    std::smatch match;

    while (std::regex_search(result, match, env_regex)) {
        std::string env_name = match[1].str();
        std::string env_value = get_env(env_name);
        result = match.prefix().str() + env_value + match.suffix().str();
    }

    return result;
}

RuntimeConfig ConfigLoader::load(const std::string& path) {
    try {
        return load_node(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        Logger::error("[Config] Failed to load {}: {} - using defaults", path, e.what());
    }
    return get_default();
}

RuntimeConfig ConfigLoader::load_from_string(const std::string& yaml_text) {
    try {
        return load_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        Logger::error("[Config] Failed to parse configuration: {} - using defaults", e.what());
    }
    return get_default();
}

RuntimeConfig ConfigLoader::get_default() {
    RuntimeConfig config;
    config.instruments.suffix_synonyms["COMDTY"] = {"CMDTY"};
    return config;
}

} // namespace stratmon
