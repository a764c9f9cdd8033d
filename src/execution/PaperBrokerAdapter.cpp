#include "execution/PaperBrokerAdapter.h"
#include "common/Logger.h"
#include "core/execution/ExecutionReport.h"

#include <algorithm>

namespace phoenix {
namespace execution {

namespace {
constexpr const char* SOURCE = "paper";
}

PaperBrokerAdapter::PaperBrokerAdapter(double max_order_size)
    : max_order_size_(max_order_size) {}

std::string PaperBrokerAdapter::submit(const core::ExecutionRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    PendingOrder order;
    order.order_id = "paper-" + std::to_string(next_order_seq_++);
    order.request = request;
    report(order, "accepted", 0.0, 0.0);

    pending_.push_back(std::move(order));
    submitted_count_++;
    return pending_.back().order_id;
}

bool PaperBrokerAdapter::cancel(const std::string& order_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&order_id](const PendingOrder& o) { return o.order_id == order_id; });
    if (it == pending_.end()) {
        return false;
    }
    report(*it, "cancelled", 0.0, 0.0);
    pending_.erase(it);
    return true;
}

void PaperBrokerAdapter::poll() {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& order : pending_) {
        const auto& request = order.request;
        const bool oversized = max_order_size_ > 0.0 &&
                               request.intent != core::ExecutionIntent::STOP_UPDATE &&
                               request.size > max_order_size_;
        if (oversized) {
            LOG_WARN("Paper broker rejected {} {} size={:.4f} > max {:.4f}",
                     core::execution::toString(request.intent),
                     request.position_id, request.size, max_order_size_);
            report(order, "rejected", 0.0, 0.0);
        } else {
            report(order, "filled", request.size, request.price);
        }
    }
    pending_.clear();
}

std::vector<core::ExecutionUpdate> PaperBrokerAdapter::drainUpdates() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<core::ExecutionUpdate> out;
    out.swap(updates_);
    return out;
}

size_t PaperBrokerAdapter::submittedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submitted_count_;
}

void PaperBrokerAdapter::report(PendingOrder& order, const std::string& event,
                                double executed_size, double fill_price) {
    order.progress = core::execution::OrderLifecycleStateMachine::advance(
        order.progress, event, order.request.size, executed_size);
    updates_.push_back(core::execution::reportFor(
        order.request, order.order_id, order.progress, SOURCE, event, fill_price));
}

} // namespace execution
} // namespace phoenix
