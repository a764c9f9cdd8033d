#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace phoenix {
namespace core {

// Row categories persisted by the event journal. Engine lifecycle events
// are folded into these (see engine::toJournalEvent).
enum class JournalEventType {
    ENGAGEMENT_DECLINED,
    ORDER_SUBMITTED,
    ORDER_UPDATED,
    POSITION_OPENED,
    POSITION_REDUCED,
    STOP_UPDATED,
    POSITION_CLOSED
};

struct JournalEvent {
    std::uint64_t seq = 0;          // assigned by the journal on append
    Timestamp ts = 0;
    JournalEventType type = JournalEventType::ORDER_UPDATED;
    std::string symbol;
    std::string position_id;        // empty for declined engagements
    nlohmann::json payload = nlohmann::json::object();
};

} // namespace core
} // namespace phoenix
