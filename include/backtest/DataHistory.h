#pragma once

#include <string>
#include <vector>

#include "common/Types.h"

namespace phoenix {
namespace backtest {

// Historical bar files. Rows come back in file order; ordering and shape
// are checked by FeedValidator when the bars are replayed.
class DataHistory {
public:
    // Expected format: timestamp,open,high,low,close,volume
    // Header lines are skipped; any other unparsable row throws FeedIntegrityError.
    static std::vector<Bar> loadCSV(const std::string& file_path);

    // Array of objects with timestamp/open/high/low/close/volume (or t/o/h/l/c/v)
    static std::vector<Bar> loadJSON(const std::string& file_path);

    // Picks the loader by extension
    static std::vector<Bar> load(const std::string& file_path);

    // Second-resolution timestamps (< 1e12) become milliseconds
    static Timestamp toMsTimestamp(Timestamp ts);
};

} // namespace backtest
} // namespace phoenix
