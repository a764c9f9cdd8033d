#pragma once

#include "engine/Position.h"

namespace phoenix {
namespace core {
namespace execution {

enum class PositionEvent {
    ACCEPT,             // engagement passed triage and Tourniquet
    TAKE_PROFIT_FILL,   // partial exit, size remains
    CLOSE               // remaining size exits
};

const char* positionEventToString(PositionEvent event);

class PositionLifecycleStateMachine {
public:
    // Throws std::logic_error on a transition the lifecycle does not allow
    static engine::PositionState transition(engine::PositionState state, PositionEvent event);

    static bool isTerminal(engine::PositionState state) {
        return state == engine::PositionState::CLOSED;
    }
};

} // namespace execution
} // namespace core
} // namespace phoenix
