#pragma once

#include <string>
#include <vector>

namespace phoenix {

using Timestamp = long long;   // epoch milliseconds

enum class Direction { LONG = 1, SHORT = -1 };
enum class OrderSide { BUY, SELL };
enum class OrderStatus { PENDING, SUBMITTED, FILLED, PARTIALLY_FILLED, CANCELLED, REJECTED };

inline double directionSign(Direction d) {
    return d == Direction::LONG ? 1.0 : -1.0;
}

inline const char* directionToString(Direction d) {
    return d == Direction::LONG ? "LONG" : "SHORT";
}

// OHLCV sample, immutable once produced by a feed
struct Bar {
    double open;
    double high;
    double low;
    double close;
    double volume;
    Timestamp timestamp;

    Bar() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Bar(double o, double h, double l, double c, double v, Timestamp t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}

    double range() const { return high - low; }
};

// Take-profit level: distance from entry (pips) and the fraction of the
// original size closed when it fills
struct TakeProfitLevel {
    double distance_pips = 0.0;
    double fraction = 0.0;
};

// A strategy's proposal to open a position
struct Engagement {
    std::string symbol;
    Direction direction = Direction::LONG;
    double entry_price = 0.0;
    double stop_distance_pips = 0.0;
    std::vector<TakeProfitLevel> take_profits;
    double requested_size = 0.0;
    std::string strategy_name;
    std::string tag;
};

// Strategy request to move the stop of an open position
struct StopAmendment {
    std::string position_id;
    double new_stop_distance_pips = 0.0;
};

} // namespace phoenix
