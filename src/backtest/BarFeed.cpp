#include "backtest/BarFeed.h"

namespace phoenix {
namespace backtest {

FeedStatus VectorBarFeed::next(Bar& bar) {
    if (cursor_ >= bars_.size()) {
        return FeedStatus::END_OF_STREAM;
    }
    bar = bars_[cursor_++];
    return FeedStatus::BAR;
}

void LiveBarFeed::push(const Bar& bar) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queue_.push_back(bar);
    }
    condition_.notify_one();
}

void LiveBarFeed::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

FeedStatus LiveBarFeed::next(Bar& bar) {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait_for(lock, poll_timeout_, [this] { return !queue_.empty() || closed_; });

    if (!queue_.empty()) {
        bar = queue_.front();
        queue_.pop_front();
        return FeedStatus::BAR;
    }
    return closed_ ? FeedStatus::END_OF_STREAM : FeedStatus::STALL;
}

bool LiveBarFeed::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace backtest
} // namespace phoenix
