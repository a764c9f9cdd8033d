#pragma once

#include "common/Types.h"

namespace phoenix {
namespace backtest {

// Rejects malformed or unordered bars with FeedIntegrityError
class FeedValidator {
public:
    void validate(const Bar& bar);
    void reset();

    bool hasLast() const { return has_last_; }
    Timestamp lastTimestamp() const { return last_timestamp_; }

private:
    bool has_last_ = false;
    Timestamp last_timestamp_ = 0;
};

} // namespace backtest
} // namespace phoenix
