#include "core/execution/OrderLifecycleStateMachine.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace phoenix {
namespace core {
namespace execution {

namespace {
constexpr double SIZE_EPSILON = 1e-9;

const std::pair<const char*, BrokerEventKind> EVENT_NAMES[] = {
    {"accepted", BrokerEventKind::ACKNOWLEDGED},
    {"submitted", BrokerEventKind::ACKNOWLEDGED},
    {"new", BrokerEventKind::ACKNOWLEDGED},
    {"partial_fill", BrokerEventKind::PARTIAL_FILL},
    {"partially_filled", BrokerEventKind::PARTIAL_FILL},
    {"fill", BrokerEventKind::FILL},
    {"filled", BrokerEventKind::FILL},
    {"cancelled", BrokerEventKind::CANCEL},
    {"canceled", BrokerEventKind::CANCEL},
    {"expired", BrokerEventKind::CANCEL},
    {"reject", BrokerEventKind::REJECT},
    {"rejected", BrokerEventKind::REJECT},
};

OrderStatus workingStatus(double filled_size, OrderStatus idle) {
    return filled_size > 0.0 ? OrderStatus::PARTIALLY_FILLED : idle;
}
}

BrokerEventKind OrderLifecycleStateMachine::classify(const std::string& event) {
    std::string lowered(event.size(), '\0');
    std::transform(event.begin(), event.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& entry : EVENT_NAMES) {
        if (lowered == entry.first) {
            return entry.second;
        }
    }
    return BrokerEventKind::UNRECOGNISED;
}

OrderProgress OrderLifecycleStateMachine::advance(const OrderProgress& current,
                                                  const std::string& event,
                                                  double order_size,
                                                  double executed_size) {
    if (current.terminal) {
        return current;
    }

    OrderProgress next;
    next.filled_size = std::max(current.filled_size, executed_size);

    switch (classify(event)) {
        case BrokerEventKind::FILL:
            if (next.filled_size <= 0.0) {
                next.filled_size = order_size;
            }
            next.status = OrderStatus::FILLED;
            next.terminal = true;
            break;
        case BrokerEventKind::PARTIAL_FILL:
            if (next.filled_size >= order_size - SIZE_EPSILON) {
                next.status = OrderStatus::FILLED;
                next.terminal = true;
            } else {
                next.status = workingStatus(next.filled_size, OrderStatus::SUBMITTED);
            }
            break;
        case BrokerEventKind::CANCEL:
            next.status = OrderStatus::CANCELLED;
            next.terminal = true;
            break;
        case BrokerEventKind::REJECT:
            next.status = OrderStatus::REJECTED;
            next.terminal = true;
            break;
        case BrokerEventKind::ACKNOWLEDGED:
            next.status = workingStatus(next.filled_size, OrderStatus::SUBMITTED);
            break;
        case BrokerEventKind::UNRECOGNISED:
            next.status = workingStatus(next.filled_size, current.status);
            break;
    }
    return next;
}

} // namespace execution
} // namespace core
} // namespace phoenix
