#pragma once

#include "stratmon/core/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace stratmon::engine {
class MonitorEngine;
}

namespace stratmon::sync {

enum class SyncType : uint8_t {
    Created = 0,
    Updated = 1,
    Deleted = 2
};

inline constexpr const char* sync_type_name(SyncType t) noexcept {
    switch (t) {
        case SyncType::Created: return "strategy_created";
        case SyncType::Updated: return "strategy_updated";
        case SyncType::Deleted: return "strategy_deleted";
        default: return "unknown";
    }
}

// One message exchanged with the sync server; Deleted carries only record.id
struct SyncMessage {
    SyncType type{SyncType::Updated};
    StrategyRecord record;
};

std::string json_escape(std::string_view text);

// {"id","name","target_price","target_condition","status","legs":[...]}
std::string encode_strategy(const StrategyRecord& record);

// {"type":"strategy_updated","data":{...}}
std::string encode_sync_message(const SyncMessage& message);

// Malformed or unknown messages yield std::nullopt and a warning
std::optional<StrategyRecord> decode_strategy(std::string_view json);
std::optional<SyncMessage> decode_sync_message(std::string_view json);

// Apply without echoing the change back to the server
bool apply_sync_message(engine::MonitorEngine& engine, const SyncMessage& message);

} // namespace stratmon::sync
