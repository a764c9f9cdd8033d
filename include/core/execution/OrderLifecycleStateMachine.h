#pragma once

#include <string>

#include "common/Types.h"

namespace phoenix {
namespace core {
namespace execution {

// Broker vocabulary collapsed to the few events the engine reacts to
enum class BrokerEventKind {
    ACKNOWLEDGED,
    PARTIAL_FILL,
    FILL,
    CANCEL,
    REJECT,
    UNRECOGNISED
};

struct OrderProgress {
    OrderStatus status = OrderStatus::PENDING;
    double filled_size = 0.0;
    bool terminal = false;
};

class OrderLifecycleStateMachine {
public:
    // Case-insensitive; "canceled"/"expired" count as CANCEL
    static BrokerEventKind classify(const std::string& event);

    // Folds one broker event into the order's progress. Once terminal,
    // progress is returned unchanged.
    static OrderProgress advance(const OrderProgress& current,
                                 const std::string& event,
                                 double order_size,
                                 double executed_size = 0.0);
};

} // namespace execution
} // namespace core
} // namespace phoenix
