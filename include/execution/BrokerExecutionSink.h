#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IBrokerAdapter.h"
#include "engine/IExecutionSink.h"

namespace phoenix {
namespace execution {

// Turns lifecycle actions of one instrument into broker requests
class BrokerExecutionSink : public engine::IExecutionSink {
public:
    BrokerExecutionSink(core::IBrokerAdapter& broker, std::string symbol);

    void onPositionOpened(const engine::Position& position, Timestamp ts) override;
    void onPositionReduced(const engine::Position& position, double price, double size, Timestamp ts) override;
    void onStopMoved(const engine::Position& position, Timestamp ts) override;
    void onPositionClosed(const engine::ClosedTrade& trade, double last_fill_price, double last_fill_size) override;

    // Entries the broker refused to queue; the router force-closes them
    std::vector<std::string> drainFailedEntries();

private:
    bool send(const core::ExecutionRequest& request);

    core::IBrokerAdapter& broker_;
    std::string symbol_;
    std::mutex mutex_;
    std::vector<std::string> failed_entries_;
};

} // namespace execution
} // namespace phoenix
