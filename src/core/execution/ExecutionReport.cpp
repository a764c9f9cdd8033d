#include "core/execution/ExecutionReport.h"

namespace phoenix {
namespace core {
namespace execution {

const char* toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING: return "PENDING";
        case OrderStatus::SUBMITTED: return "SUBMITTED";
        case OrderStatus::PARTIALLY_FILLED: return "PARTIALLY_FILLED";
        case OrderStatus::FILLED: return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED: return "REJECTED";
    }
    return "UNKNOWN";
}

const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "BUY" : "SELL";
}

const char* toString(ExecutionIntent intent) {
    switch (intent) {
        case ExecutionIntent::ENTRY: return "ENTRY";
        case ExecutionIntent::EXIT: return "EXIT";
        case ExecutionIntent::STOP_UPDATE: return "STOP_UPDATE";
    }
    return "UNKNOWN";
}

ExecutionUpdate reportFor(const ExecutionRequest& request,
                          const std::string& order_id,
                          const OrderProgress& progress,
                          const std::string& source,
                          const std::string& event,
                          double fill_price) {
    ExecutionUpdate update;
    update.order_id = order_id;
    update.symbol = request.symbol;
    update.position_id = request.position_id;
    update.intent = request.intent;
    update.side = request.side;
    update.ts = request.ts;
    update.order_size = request.size;

    update.status = progress.status;
    update.filled_size = progress.filled_size;
    update.terminal = progress.terminal;
    if (progress.status == OrderStatus::FILLED) {
        update.fill_price = fill_price;
    }

    update.source = source;
    update.event = event;
    return update;
}

nlohmann::json toJson(const ExecutionUpdate& update) {
    nlohmann::json fill = {
        {"order_size", update.order_size},
        {"filled_size", update.filled_size},
        {"price", update.fill_price},
    };
    return {
        {"ts", update.ts},
        {"order_id", update.order_id},
        {"symbol", update.symbol},
        {"position_id", update.position_id},
        {"intent", toString(update.intent)},
        {"side", toString(update.side)},
        {"status", toString(update.status)},
        {"terminal", update.terminal},
        {"source", update.source},
        {"event", update.event},
        {"fill", fill},
    };
}

JournalEvent toJournalEvent(const ExecutionUpdate& update) {
    JournalEvent row;
    row.ts = update.ts;
    row.type = update.status == OrderStatus::SUBMITTED && update.filled_size <= 0.0
        ? JournalEventType::ORDER_SUBMITTED
        : JournalEventType::ORDER_UPDATED;
    row.symbol = update.symbol;
    row.position_id = update.position_id;
    row.payload = toJson(update);
    return row;
}

} // namespace execution
} // namespace core
} // namespace phoenix
