#pragma once

#include <string>

#include "common/Types.h"

namespace phoenix {
namespace core {

enum class ExecutionIntent {
    ENTRY,
    EXIT,
    STOP_UPDATE
};

// Order handed to a broker on behalf of one engine position
struct ExecutionRequest {
    std::string symbol;
    std::string position_id;
    ExecutionIntent intent = ExecutionIntent::ENTRY;
    OrderSide side = OrderSide::BUY;
    double price = 0.0;
    double size = 0.0;
    double stop_price = 0.0;     // only meaningful for ENTRY and STOP_UPDATE
    std::string strategy_name;
    Timestamp ts = 0;
};

// Broker-side progress of one order. A terminal update is the last one
// the broker emits for its order_id.
struct ExecutionUpdate {
    std::string order_id;
    std::string symbol;
    std::string position_id;
    ExecutionIntent intent = ExecutionIntent::ENTRY;
    OrderSide side = OrderSide::BUY;
    OrderStatus status = OrderStatus::PENDING;
    double order_size = 0.0;
    double filled_size = 0.0;
    double fill_price = 0.0;
    std::string source;
    std::string event;
    bool terminal = false;
    Timestamp ts = 0;

    bool isFill() const { return status == OrderStatus::FILLED && filled_size > 0.0; }
};

} // namespace core
} // namespace phoenix
