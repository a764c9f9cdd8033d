#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

#include "common/Types.h"

namespace phoenix {
namespace backtest {

enum class FeedStatus {
    BAR,            // `bar` holds the next sample
    STALL,          // nothing yet, stream still open
    END_OF_STREAM   // no more bars will ever arrive
};

// Pull-based bar source. One consumer.
class IBarFeed {
public:
    virtual ~IBarFeed() = default;
    virtual FeedStatus next(Bar& bar) = 0;
};

// Finite in-memory history for backtests
class VectorBarFeed : public IBarFeed {
public:
    explicit VectorBarFeed(std::vector<Bar> bars)
        : bars_(std::move(bars)) {}

    FeedStatus next(Bar& bar) override;

    size_t size() const { return bars_.size(); }

private:
    std::vector<Bar> bars_;
    size_t cursor_ = 0;
};

// Producer/consumer feed for live routing. next() waits up to the poll
// timeout and reports STALL when nothing arrived.
class LiveBarFeed : public IBarFeed {
public:
    explicit LiveBarFeed(std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(200))
        : poll_timeout_(poll_timeout) {}

    LiveBarFeed(const LiveBarFeed&) = delete;
    LiveBarFeed& operator=(const LiveBarFeed&) = delete;

    void push(const Bar& bar);

    // Bars already queued are still delivered before END_OF_STREAM
    void close();

    FeedStatus next(Bar& bar) override;

    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<Bar> queue_;
    bool closed_ = false;
    std::chrono::milliseconds poll_timeout_;
};

} // namespace backtest
} // namespace phoenix
