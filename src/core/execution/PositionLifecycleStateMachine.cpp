#include "core/execution/PositionLifecycleStateMachine.h"

#include <stdexcept>
#include <string>

namespace phoenix {
namespace core {
namespace execution {

using engine::PositionState;

const char* positionEventToString(PositionEvent event) {
    switch (event) {
        case PositionEvent::ACCEPT: return "ACCEPT";
        case PositionEvent::TAKE_PROFIT_FILL: return "TAKE_PROFIT_FILL";
        case PositionEvent::CLOSE: return "CLOSE";
    }
    return "UNKNOWN";
}

PositionState PositionLifecycleStateMachine::transition(PositionState state, PositionEvent event) {
    switch (event) {
        case PositionEvent::ACCEPT:
            if (state == PositionState::PENDING) {
                return PositionState::OPEN;
            }
            break;
        case PositionEvent::TAKE_PROFIT_FILL:
            if (state == PositionState::OPEN || state == PositionState::PARTIAL) {
                return PositionState::PARTIAL;
            }
            break;
        case PositionEvent::CLOSE:
            if (state == PositionState::OPEN || state == PositionState::PARTIAL) {
                return PositionState::CLOSED;
            }
            break;
    }

    throw std::logic_error(std::string("illegal position transition: ") +
                           engine::positionStateToString(state) + " on " +
                           positionEventToString(event));
}

} // namespace execution
} // namespace core
} // namespace phoenix
