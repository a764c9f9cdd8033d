#pragma once

#include <string>
#include <vector>

#include "core/model/ExecutionTypes.h"

namespace phoenix {
namespace core {

// Execution venue behind the runtime router. Fills and rejections arrive
// asynchronously through poll()/drainUpdates().
class IBrokerAdapter {
public:
    virtual ~IBrokerAdapter() = default;

    // Returns the broker order id, empty when the request could not be queued
    virtual std::string submit(const ExecutionRequest& request) = 0;
    virtual bool cancel(const std::string& order_id) = 0;
    virtual void poll() = 0;
    virtual std::vector<ExecutionUpdate> drainUpdates() = 0;
};

} // namespace core
} // namespace phoenix
