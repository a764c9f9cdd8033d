#pragma once

#include "engine/Position.h"

namespace phoenix {
namespace engine {

// Receives every accepted lifecycle action. Backtests run without a sink;
// the runtime router forwards these to a broker adapter.
class IExecutionSink {
public:
    virtual ~IExecutionSink() = default;

    virtual void onPositionOpened(const Position& position, Timestamp ts) = 0;
    virtual void onPositionReduced(const Position& position, double price, double size, Timestamp ts) = 0;
    virtual void onStopMoved(const Position& position, Timestamp ts) = 0;
    virtual void onPositionClosed(const ClosedTrade& trade, double last_fill_price, double last_fill_size) = 0;
};

} // namespace engine
} // namespace phoenix
