#include "backtest/BarFeed.h"
#include "backtest/DataHistory.h"
#include "backtest/FeedValidator.h"
#include "common/Errors.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

using namespace phoenix;
using phoenix::backtest::DataHistory;
using phoenix::backtest::FeedStatus;
using phoenix::backtest::FeedValidator;
using phoenix::backtest::LiveBarFeed;
using phoenix::backtest::VectorBarFeed;

namespace {
constexpr Timestamp T0 = 1700000000000LL;

bool rejects(FeedValidator& validator, const Bar& bar) {
    try {
        validator.validate(bar);
    } catch (const FeedIntegrityError& e) {
        assert(e.timestamp() == bar.timestamp);
        return true;
    }
    return false;
}

std::filesystem::path writeTemp(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path, std::ios::trunc);
    out << content;
    return path;
}

template <typename Fn>
bool throwsFeedError(Fn fn) {
    try {
        fn();
    } catch (const FeedIntegrityError&) {
        return true;
    }
    return false;
}
}

int main() {
    // Shape checks
    {
        FeedValidator v;
        assert(rejects(v, Bar(1.1, 1.2, 1.0, 0.0, 10.0, T0)));
        assert(rejects(v, Bar(1.1, 1.2, 1.0, -1.1, 10.0, T0)));
        assert(rejects(v, Bar(1.1, 1.2, 1.0, std::numeric_limits<double>::quiet_NaN(), 10.0, T0)));
        assert(rejects(v, Bar(1.1, 1.2, 1.0, 1.1, -1.0, T0)));
        assert(rejects(v, Bar(1.1, 1.05, 1.0, 1.1, 10.0, T0)));     // high below open
        assert(rejects(v, Bar(1.1, 1.2, 1.15, 1.18, 10.0, T0)));    // low above open
        assert(!v.hasLast());

        assert(!rejects(v, Bar(1.1, 1.2, 1.0, 1.15, 0.0, T0)));
        assert(v.hasLast());
        assert(v.lastTimestamp() == T0);
    }

    // Ordering checks
    {
        FeedValidator v;
        assert(!rejects(v, Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0)));
        assert(rejects(v, Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0)));
        assert(rejects(v, Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 - 1)));
        assert(!rejects(v, Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 + 1)));

        v.reset();
        assert(!v.hasLast());
        assert(!rejects(v, Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 - 1)));
    }

    // CSV with header, second timestamps, quoted cells
    {
        const auto path = writeTemp("phoenix_bars_test.csv",
            "timestamp,open,high,low,close,volume\n"
            "1700000000,1.1000,1.1010,1.0990,1.1005,100\n"
            "\n"
            "\"1700000060\",1.1005,1.1015,1.1000,1.1010,120\n");
        auto bars = DataHistory::load(path.string());
        assert(bars.size() == 2);
        assert(bars[0].timestamp == 1700000000000LL);
        assert(bars[1].timestamp == 1700000060000LL);
        assert(std::abs(bars[1].close - 1.1010) < 1e-12);
        assert(std::abs(bars[1].volume - 120.0) < 1e-12);
        std::filesystem::remove(path);
    }

    // Malformed CSV rows abort the load
    {
        const auto short_row = writeTemp("phoenix_bars_short.csv",
            "1700000000000,1.1,1.2,1.0,1.1,1\n"
            "1700000060000,1.1,1.2\n");
        assert(throwsFeedError([&] { DataHistory::loadCSV(short_row.string()); }));
        std::filesystem::remove(short_row);

        const auto bad_number = writeTemp("phoenix_bars_bad.csv",
            "1700000000000,1.1,1.2,1.0,1.1,1\n"
            "1700000060000,1.1,abc,1.0,1.1,1\n");
        assert(throwsFeedError([&] { DataHistory::loadCSV(bad_number.string()); }));
        std::filesystem::remove(bad_number);

        // A header-like row is only tolerated first
        const auto late_header = writeTemp("phoenix_bars_late.csv",
            "1700000000000,1.1,1.2,1.0,1.1,1\n"
            "timestamp,open,high,low,close,volume\n");
        assert(throwsFeedError([&] { DataHistory::loadCSV(late_header.string()); }));
        std::filesystem::remove(late_header);

        assert(throwsFeedError([] { DataHistory::loadCSV("/nonexistent/phoenix_bars.csv"); }));
    }

    // Timestamps that do not fit an integer millisecond clock abort the load
    {
        const char* rows[] = {
            "1700000000000,1.1,1.2,1.0,1.1,1\n1e30,1.1,1.2,1.0,1.1,1\n",
            "1700000000000,1.1,1.2,1.0,1.1,1\n-1e30,1.1,1.2,1.0,1.1,1\n",
            "1700000000000,1.1,1.2,1.0,1.1,1\nnan,1.1,1.2,1.0,1.1,1\n",
            "1700000000000,1.1,1.2,1.0,1.1,1\ninf,1.1,1.2,1.0,1.1,1\n",
            "1700000000000,1.1,1.2,1.0,1.1,1\n1700000060.5,1.1,1.2,1.0,1.1,1\n",
            // Not mistaken for a header
            "nan,1.1,1.2,1.0,1.1,1\n1700000060000,1.1,1.2,1.0,1.1,1\n",
        };
        for (const char* content : rows) {
            const auto path = writeTemp("phoenix_bars_bad_ts.csv", content);
            assert(throwsFeedError([&] { DataHistory::loadCSV(path.string()); }));
            std::filesystem::remove(path);
        }

        const auto json_huge = writeTemp("phoenix_bars_huge_ts.json",
            R"([{"t": 1e30, "o": 1.1, "h": 1.2, "l": 1.0, "c": 1.1}])");
        assert(throwsFeedError([&] { DataHistory::loadJSON(json_huge.string()); }));
        std::filesystem::remove(json_huge);

        const auto json_fraction = writeTemp("phoenix_bars_fraction_ts.json",
            R"([{"t": 1700000000.25, "o": 1.1, "h": 1.2, "l": 1.0, "c": 1.1}])");
        assert(throwsFeedError([&] { DataHistory::loadJSON(json_fraction.string()); }));
        std::filesystem::remove(json_fraction);

        const auto json_unsigned = writeTemp("phoenix_bars_unsigned_ts.json",
            R"([{"t": 18446744073709551615, "o": 1.1, "h": 1.2, "l": 1.0, "c": 1.1}])");
        assert(throwsFeedError([&] { DataHistory::loadJSON(json_unsigned.string()); }));
        std::filesystem::remove(json_unsigned);

        // Integral values written in float notation are accepted
        const auto exponent = writeTemp("phoenix_bars_exponent_ts.csv",
            "1.7e12,1.1,1.2,1.0,1.1,1\n");
        auto bars = DataHistory::loadCSV(exponent.string());
        assert(bars.size() == 1);
        assert(bars[0].timestamp == 1700000000000LL);
        std::filesystem::remove(exponent);
    }

    // JSON bars, long and short keys
    {
        const auto path = writeTemp("phoenix_bars_test.json",
            R"([{"timestamp": 1700000000000, "open": 1.1, "high": 1.2, "low": 1.0, "close": 1.15, "volume": 5},
                {"t": 1700000060, "o": 1.15, "h": 1.2, "l": 1.1, "c": 1.12}])");
        auto bars = DataHistory::load(path.string());
        assert(bars.size() == 2);
        assert(bars[1].timestamp == 1700000060000LL);
        assert(bars[1].volume == 0.0);
        std::filesystem::remove(path);

        const auto missing = writeTemp("phoenix_bars_missing.json",
            R"([{"timestamp": 1700000000000, "open": 1.1, "high": 1.2, "close": 1.15}])");
        assert(throwsFeedError([&] { DataHistory::loadJSON(missing.string()); }));
        std::filesystem::remove(missing);

        const auto not_array = writeTemp("phoenix_bars_object.json", R"({"bars": []})");
        assert(throwsFeedError([&] { DataHistory::loadJSON(not_array.string()); }));
        std::filesystem::remove(not_array);
    }

    // Vector feed drains in order then ends
    {
        VectorBarFeed feed({Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0), Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 + 1)});
        assert(feed.size() == 2);
        Bar bar;
        assert(feed.next(bar) == FeedStatus::BAR && bar.timestamp == T0);
        assert(feed.next(bar) == FeedStatus::BAR && bar.timestamp == T0 + 1);
        assert(feed.next(bar) == FeedStatus::END_OF_STREAM);
        assert(feed.next(bar) == FeedStatus::END_OF_STREAM);
    }

    // Live feed: stall while empty, deliver queued bars after close, then end
    {
        LiveBarFeed feed(std::chrono::milliseconds(10));
        Bar bar;
        assert(feed.next(bar) == FeedStatus::STALL);

        std::thread producer([&feed]() {
            for (int i = 0; i < 5; ++i) {
                feed.push(Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 + i));
            }
            feed.close();
        });

        int received = 0;
        Timestamp expected = T0;
        while (true) {
            const auto status = feed.next(bar);
            if (status == FeedStatus::END_OF_STREAM) {
                break;
            }
            if (status == FeedStatus::STALL) {
                continue;
            }
            assert(bar.timestamp == expected);
            ++expected;
            ++received;
        }
        producer.join();

        assert(received == 5);
        assert(feed.closed());
        feed.push(Bar(1.1, 1.2, 1.0, 1.1, 1.0, T0 + 10));
        assert(feed.next(bar) == FeedStatus::END_OF_STREAM);
    }

    std::cout << "[TEST] FeedValidator PASSED\n";
    return 0;
}
