#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/model/ExecutionTypes.h"
#include "core/model/JournalTypes.h"

namespace phoenix {
namespace core {
namespace execution {

const char* toString(OrderStatus status);
const char* toString(OrderSide side);
const char* toString(ExecutionIntent intent);

// Broker update for `request` after the state machine produced `progress`.
// fill_price is reported only for FILLED orders.
ExecutionUpdate reportFor(const ExecutionRequest& request,
                          const std::string& order_id,
                          const OrderProgress& progress,
                          const std::string& source,
                          const std::string& event,
                          double fill_price = 0.0);

// One line of the broker audit trail
nlohmann::json toJson(const ExecutionUpdate& update);

// ORDER_SUBMITTED for the acknowledgement, ORDER_UPDATED afterwards
JournalEvent toJournalEvent(const ExecutionUpdate& update);

} // namespace execution
} // namespace core
} // namespace phoenix
