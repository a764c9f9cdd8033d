#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "core/contracts/IBrokerAdapter.h"
#include "core/execution/OrderLifecycleStateMachine.h"

namespace phoenix {
namespace execution {

// Simulated venue: every queued order fills at its requested price on the
// next poll. Orders above max_order_size (when > 0) are rejected.
class PaperBrokerAdapter : public core::IBrokerAdapter {
public:
    explicit PaperBrokerAdapter(double max_order_size = 0.0);

    std::string submit(const core::ExecutionRequest& request) override;
    bool cancel(const std::string& order_id) override;
    void poll() override;
    std::vector<core::ExecutionUpdate> drainUpdates() override;

    size_t submittedCount() const;

private:
    struct PendingOrder {
        std::string order_id;
        core::ExecutionRequest request;
        core::execution::OrderProgress progress;
    };

    // Advances the order and queues the resulting update
    void report(PendingOrder& order, const std::string& event, double executed_size, double fill_price);

    double max_order_size_;
    mutable std::mutex mutex_;
    std::deque<PendingOrder> pending_;
    std::vector<core::ExecutionUpdate> updates_;
    std::uint64_t next_order_seq_ = 1;
    size_t submitted_count_ = 0;
};

} // namespace execution
} // namespace phoenix
