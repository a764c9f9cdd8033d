#include "backtest/FeedValidator.h"
#include "common/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace phoenix {
namespace backtest {

void FeedValidator::validate(const Bar& bar) {
    const std::string at = " at ts=" + std::to_string(bar.timestamp);

    for (double price : {bar.open, bar.high, bar.low, bar.close}) {
        if (!std::isfinite(price) || price <= 0.0) {
            throw FeedIntegrityError("malformed bar: non-positive price" + at, bar.timestamp);
        }
    }
    if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
        throw FeedIntegrityError("malformed bar: negative volume" + at, bar.timestamp);
    }
    if (bar.high < std::max(bar.open, bar.close) || bar.low > std::min(bar.open, bar.close)) {
        throw FeedIntegrityError("malformed bar: high/low do not bound open/close" + at, bar.timestamp);
    }

    if (has_last_) {
        if (bar.timestamp == last_timestamp_) {
            throw FeedIntegrityError("duplicate timestamp" + at, bar.timestamp);
        }
        if (bar.timestamp < last_timestamp_) {
            throw FeedIntegrityError("out-of-order timestamp" + at + " after " +
                                     std::to_string(last_timestamp_), bar.timestamp);
        }
    }

    has_last_ = true;
    last_timestamp_ = bar.timestamp;
}

void FeedValidator::reset() {
    has_last_ = false;
    last_timestamp_ = 0;
}

} // namespace backtest
} // namespace phoenix
