#pragma once

#include <stdexcept>
#include <string>

#include "common/Types.h"

namespace phoenix {

// Bar stream violated ordering or shape; the run cannot continue
class FeedIntegrityError : public std::runtime_error {
public:
    FeedIntegrityError(const std::string& what, Timestamp timestamp)
        : std::runtime_error(what), timestamp_(timestamp) {}

    Timestamp timestamp() const { return timestamp_; }

private:
    Timestamp timestamp_;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace phoenix
