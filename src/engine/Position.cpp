#include "engine/Position.h"

namespace phoenix {
namespace engine {

const char* positionStateToString(PositionState state) {
    switch (state) {
        case PositionState::PENDING: return "PENDING";
        case PositionState::OPEN: return "OPEN";
        case PositionState::PARTIAL: return "PARTIAL";
        case PositionState::CLOSED: return "CLOSED";
    }
    return "UNKNOWN";
}

const char* closeReasonToString(CloseReason reason) {
    switch (reason) {
        case CloseReason::STOP_LOSS: return "STOP_LOSS";
        case CloseReason::TAKE_PROFIT: return "TAKE_PROFIT";
        case CloseReason::SAFETY_LAW: return "SAFETY_LAW";
        case CloseReason::END_OF_DATA: return "END_OF_DATA";
        case CloseReason::BROKER_REJECT: return "BROKER_REJECT";
    }
    return "UNKNOWN";
}

} // namespace engine
} // namespace phoenix
