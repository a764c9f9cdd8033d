#include "engine/LifecycleEvent.h"

namespace phoenix {
namespace engine {

const char* lifecycleEventTypeToString(LifecycleEventType type) {
    switch (type) {
        case LifecycleEventType::ENGAGEMENT_INVALID: return "ENGAGEMENT_INVALID";
        case LifecycleEventType::ENGAGEMENT_SKIPPED: return "ENGAGEMENT_SKIPPED";
        case LifecycleEventType::ENGAGEMENT_REJECTED: return "ENGAGEMENT_REJECTED";
        case LifecycleEventType::POSITION_OPENED: return "POSITION_OPENED";
        case LifecycleEventType::TAKE_PROFIT_FILLED: return "TAKE_PROFIT_FILLED";
        case LifecycleEventType::STOP_MOVED: return "STOP_MOVED";
        case LifecycleEventType::AMENDMENT_REFUSED: return "AMENDMENT_REFUSED";
        case LifecycleEventType::POSITION_CLOSED: return "POSITION_CLOSED";
    }
    return "UNKNOWN";
}

core::JournalEvent toJournalEvent(const LifecycleEvent& event) {
    core::JournalEvent row;
    row.ts = event.ts;
    row.symbol = event.symbol;
    row.position_id = event.position_id;

    switch (event.type) {
        case LifecycleEventType::ENGAGEMENT_INVALID:
        case LifecycleEventType::ENGAGEMENT_SKIPPED:
        case LifecycleEventType::ENGAGEMENT_REJECTED:
            row.type = core::JournalEventType::ENGAGEMENT_DECLINED;
            break;
        case LifecycleEventType::POSITION_OPENED:
            row.type = core::JournalEventType::POSITION_OPENED;
            break;
        case LifecycleEventType::TAKE_PROFIT_FILLED:
            row.type = core::JournalEventType::POSITION_REDUCED;
            break;
        case LifecycleEventType::STOP_MOVED:
        case LifecycleEventType::AMENDMENT_REFUSED:
            row.type = core::JournalEventType::STOP_UPDATED;
            break;
        case LifecycleEventType::POSITION_CLOSED:
            row.type = core::JournalEventType::POSITION_CLOSED;
            break;
    }

    row.payload["event"] = lifecycleEventTypeToString(event.type);
    row.payload["price"] = event.price;
    row.payload["size"] = event.size;
    row.payload["pnl"] = event.pnl;
    if (!event.law.empty()) {
        row.payload["law"] = event.law;
    }
    if (!event.reason.empty()) {
        row.payload["reason"] = event.reason;
    }
    return row;
}

} // namespace engine
} // namespace phoenix
