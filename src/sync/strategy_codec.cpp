#include "stratmon/sync/strategy_codec.hpp"
#include "stratmon/engine/monitor_engine.hpp"
#include "stratmon/core/logger.hpp"

#include <simdjson.h>
#include <fmt/format.h>

#include <cmath>
#include <cstdint>
#include <limits>

namespace stratmon::sync {

namespace dom = simdjson::dom;

namespace {

bool field(const dom::object& obj, std::string_view key, dom::element& out) {
    return obj[key].get(out) == simdjson::SUCCESS;
}

std::optional<std::string> string_field(const dom::object& obj, std::string_view key) {
    dom::element el;
    std::string_view sv;
    if (!field(obj, key, el) || el.get_string().get(sv) != simdjson::SUCCESS) {
        return std::nullopt;
    }
    return std::string(sv);
}

std::optional<double> number_field(const dom::object& obj, std::string_view key) {
    dom::element el;
    double value = 0.0;
    if (!field(obj, key, el) || el.get_double().get(value) != simdjson::SUCCESS) {
        return std::nullopt;
    }
    return value;
}

// Whole numbers in int range only; 2 and 2.0 are accepted, 1.9 and 1e20 are not
std::optional<Quantity> quantity_field(const dom::element& el) {
    constexpr auto lo = std::numeric_limits<Quantity>::min();
    constexpr auto hi = std::numeric_limits<Quantity>::max();

    int64_t whole = 0;
    if (el.get_int64().get(whole) == simdjson::SUCCESS) {
        if (whole < lo || whole > hi) return std::nullopt;
        return static_cast<Quantity>(whole);
    }
    double value = 0.0;
    if (el.get_double().get(value) != simdjson::SUCCESS) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || std::trunc(value) != value || value < lo || value > hi) {
        return std::nullopt;
    }
    return static_cast<Quantity>(value);
}

std::optional<LegRecord> read_leg(const dom::object& obj) {
    LegRecord leg;
    if (auto id = string_field(obj, "id")) leg.id = *id;
    if (auto ticker = string_field(obj, "ticker")) leg.ticker = *ticker;
    if (auto position = string_field(obj, "position")) {
        auto side = parse_side(*position);
        if (!side) {
            Logger::warn("[Sync] Unknown leg position '{}'", *position);
            return std::nullopt;
        }
        leg.side = *side;
    }
    dom::element quantity_el;
    if (field(obj, "quantity", quantity_el)) {
        auto quantity = quantity_field(quantity_el);
        if (!quantity) {
            Logger::warn("[Sync] Leg {} has an invalid quantity", leg.id);
            return std::nullopt;
        }
        leg.quantity = *quantity;
    }
    return leg;
}

std::optional<StrategyRecord> read_strategy(const dom::object& obj) {
    StrategyRecord record;
    auto id = string_field(obj, "id");
    if (!id || id->empty()) {
        Logger::warn("[Sync] Strategy without id");
        return std::nullopt;
    }
    record.id = *id;
    if (auto name = string_field(obj, "name")) record.name = *name;
    record.target = number_field(obj, "target_price");   // null or absent: no target

    if (auto condition = string_field(obj, "target_condition")) {
        auto parsed = parse_condition(*condition);
        if (!parsed) {
            Logger::warn("[Sync] Unknown target condition '{}' for {}", *condition, record.id);
            return std::nullopt;
        }
        record.condition = *parsed;
    }
    if (auto status = string_field(obj, "status")) {
        auto parsed = parse_status(*status);
        if (!parsed) {
            Logger::warn("[Sync] Unknown status '{}' for {}", *status, record.id);
            return std::nullopt;
        }
        record.status = *parsed;
    }

    dom::element legs_el;
    if (field(obj, "legs", legs_el)) {
        dom::array legs;
        if (legs_el.get_array().get(legs) != simdjson::SUCCESS) {
            Logger::warn("[Sync] 'legs' of {} is not an array", record.id);
            return std::nullopt;
        }
        // One bad leg rejects the record; applying the rest would drop the leg
        for (dom::element leg_el : legs) {
            dom::object leg_obj;
            if (leg_el.get_object().get(leg_obj) != simdjson::SUCCESS) {
                Logger::warn("[Sync] Leg entry of {} is not an object", record.id);
                return std::nullopt;
            }
            auto leg = read_leg(leg_obj);
            if (!leg) {
                return std::nullopt;
            }
            record.legs.push_back(std::move(*leg));
        }
    }
    return record;
}

} // namespace

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<int>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::string encode_strategy(const StrategyRecord& record) {
    std::string json;
    json.reserve(128 + record.legs.size() * 96);
    json += fmt::format(
        "{{\"id\":\"{}\",\"name\":\"{}\",\"target_price\":{},"
        "\"target_condition\":\"{}\",\"status\":\"{}\",\"legs\":[",
        json_escape(record.id), json_escape(record.name),
        record.target ? fmt::format("{}", *record.target) : std::string("null"),
        condition_name(record.condition), status_name(record.status));

    bool first = true;
    for (const auto& leg : record.legs) {
        if (!first) json += ",";
        first = false;
        json += fmt::format(
            "{{\"id\":\"{}\",\"ticker\":\"{}\",\"position\":\"{}\",\"quantity\":{}}}",
            json_escape(leg.id), json_escape(leg.ticker), side_name(leg.side), leg.quantity);
    }
    json += "]}";
    return json;
}

std::string encode_sync_message(const SyncMessage& message) {
    if (message.type == SyncType::Deleted) {
        return fmt::format("{{\"type\":\"{}\",\"data\":{{\"id\":\"{}\"}}}}",
                           sync_type_name(message.type), json_escape(message.record.id));
    }
    return fmt::format("{{\"type\":\"{}\",\"data\":{}}}",
                       sync_type_name(message.type), encode_strategy(message.record));
}

std::optional<StrategyRecord> decode_strategy(std::string_view json) {
    try {
        dom::parser parser;
        simdjson::padded_string padded(json);
        dom::object root;
        if (auto err = parser.parse(padded).get_object().get(root)) {
            Logger::warn("[Sync] Malformed strategy document: {}", simdjson::error_message(err));
            return std::nullopt;
        }
        return read_strategy(root);
    } catch (const simdjson::simdjson_error& e) {
        Logger::warn("[Sync] Failed to parse strategy: {}", e.what());
        return std::nullopt;
    }
}

std::optional<SyncMessage> decode_sync_message(std::string_view json) {
    try {
        dom::parser parser;
        simdjson::padded_string padded(json);
        dom::object root;
        if (auto err = parser.parse(padded).get_object().get(root)) {
            Logger::warn("[Sync] Malformed sync message: {}", simdjson::error_message(err));
            return std::nullopt;
        }

        auto type = string_field(root, "type");
        if (!type) {
            Logger::warn("[Sync] Sync message without type");
            return std::nullopt;
        }

        SyncMessage message;
        if (*type == sync_type_name(SyncType::Created)) {
            message.type = SyncType::Created;
        } else if (*type == sync_type_name(SyncType::Updated)) {
            message.type = SyncType::Updated;
        } else if (*type == sync_type_name(SyncType::Deleted)) {
            message.type = SyncType::Deleted;
        } else {
            Logger::debug("[Sync] Ignoring message type '{}'", *type);
            return std::nullopt;
        }

        dom::element data_el;
        dom::object data;
        if (!field(root, "data", data_el) || data_el.get_object().get(data) != simdjson::SUCCESS) {
            Logger::warn("[Sync] {} without data object", *type);
            return std::nullopt;
        }

        if (message.type == SyncType::Deleted) {
            auto id = string_field(data, "id");
            if (!id || id->empty()) {
                Logger::warn("[Sync] strategy_deleted without id");
                return std::nullopt;
            }
            message.record.id = *id;
            return message;
        }

        auto record = read_strategy(data);
        if (!record) {
            return std::nullopt;
        }
        message.record = std::move(*record);
        return message;
    } catch (const simdjson::simdjson_error& e) {
        Logger::warn("[Sync] Failed to parse sync message: {}", e.what());
        return std::nullopt;
    }
}

bool apply_sync_message(engine::MonitorEngine& engine, const SyncMessage& message) {
    switch (message.type) {
        case SyncType::Created:
        case SyncType::Updated: {
            auto id = engine.upsert_strategy(message.record, ChangeOrigin::Remote);
            Logger::debug("[Sync] Applied {} for {}", sync_type_name(message.type), message.record.id);
            return id.has_value();
        }
        case SyncType::Deleted: {
            bool removed = engine.remove_strategy(message.record.id, ChangeOrigin::Remote);
            if (!removed) {
                Logger::debug("[Sync] Delete of unknown strategy {}", message.record.id);
            }
            return removed;
        }
    }
    return false;
}

} // namespace stratmon::sync
