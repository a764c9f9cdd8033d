#pragma once

#include <string>

#include "common/Types.h"
#include "core/model/JournalTypes.h"

namespace phoenix {
namespace engine {

enum class LifecycleEventType {
    ENGAGEMENT_INVALID,
    ENGAGEMENT_SKIPPED,     // Risk Brain triage
    ENGAGEMENT_REJECTED,    // safety law
    POSITION_OPENED,
    TAKE_PROFIT_FILLED,
    STOP_MOVED,
    AMENDMENT_REFUSED,
    POSITION_CLOSED
};

const char* lifecycleEventTypeToString(LifecycleEventType type);

struct LifecycleEvent {
    LifecycleEventType type = LifecycleEventType::POSITION_OPENED;
    Timestamp ts = 0;
    std::string symbol;
    std::string position_id;
    std::string law;        // TOURNIQUET / WINNER / ZOMBIE / TRAILING / STRATEGY
    std::string reason;
    double price = 0.0;
    double size = 0.0;
    double pnl = 0.0;
};

// Journal row for a lifecycle event
core::JournalEvent toJournalEvent(const LifecycleEvent& event);

} // namespace engine
} // namespace phoenix
