#include "execution/BrokerExecutionSink.h"
#include "common/Logger.h"
#include "core/execution/ExecutionReport.h"

namespace phoenix {
namespace execution {

namespace {
// Side of the order that opens (ENTRY) or flattens (EXIT, STOP_UPDATE)
OrderSide sideFor(Direction direction, core::ExecutionIntent intent) {
    const bool buying = (direction == Direction::LONG) == (intent == core::ExecutionIntent::ENTRY);
    return buying ? OrderSide::BUY : OrderSide::SELL;
}

core::ExecutionRequest makeRequest(const std::string& symbol,
                                   const std::string& position_id,
                                   Direction direction,
                                   core::ExecutionIntent intent,
                                   double price,
                                   double size,
                                   const std::string& strategy_name,
                                   Timestamp ts) {
    core::ExecutionRequest request;
    request.symbol = symbol;
    request.position_id = position_id;
    request.intent = intent;
    request.side = sideFor(direction, intent);
    request.price = price;
    request.size = size;
    request.strategy_name = strategy_name;
    request.ts = ts;
    return request;
}
}

BrokerExecutionSink::BrokerExecutionSink(core::IBrokerAdapter& broker, std::string symbol)
    : broker_(broker)
    , symbol_(std::move(symbol)) {}

void BrokerExecutionSink::onPositionOpened(const engine::Position& position, Timestamp ts) {
    auto request = makeRequest(symbol_, position.id, position.direction, core::ExecutionIntent::ENTRY,
                               position.entry_price, position.initial_size, position.strategy_name, ts);
    request.stop_price = position.stop_price;

    if (!send(request)) {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_entries_.push_back(position.id);
    }
}

void BrokerExecutionSink::onPositionReduced(const engine::Position& position, double price,
                                            double size, Timestamp ts) {
    send(makeRequest(symbol_, position.id, position.direction, core::ExecutionIntent::EXIT,
                     price, size, position.strategy_name, ts));
}

void BrokerExecutionSink::onStopMoved(const engine::Position& position, Timestamp ts) {
    auto request = makeRequest(symbol_, position.id, position.direction, core::ExecutionIntent::STOP_UPDATE,
                               position.stop_price, position.remaining_size, position.strategy_name, ts);
    request.stop_price = position.stop_price;
    send(request);
}

void BrokerExecutionSink::onPositionClosed(const engine::ClosedTrade& trade, double last_fill_price,
                                           double last_fill_size) {
    // The broker never held a rejected entry
    if (trade.reason == engine::CloseReason::BROKER_REJECT || last_fill_size <= 0.0) {
        return;
    }
    send(makeRequest(symbol_, trade.position_id, trade.direction, core::ExecutionIntent::EXIT,
                     last_fill_price, last_fill_size, trade.strategy_name, trade.closed_at));
}

std::vector<std::string> BrokerExecutionSink::drainFailedEntries() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.swap(failed_entries_);
    return out;
}

bool BrokerExecutionSink::send(const core::ExecutionRequest& request) {
    const std::string order_id = broker_.submit(request);
    if (order_id.empty()) {
        LOG_WARN("Broker did not accept {} for {}",
                 core::execution::toString(request.intent), request.position_id);
        return false;
    }
    return true;
}

} // namespace execution
} // namespace phoenix
