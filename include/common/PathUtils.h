#pragma once

#include <filesystem>
#include <string>

namespace phoenix {
namespace utils {

class PathUtils {
public:
    // Directory of the running binary; falls back to the working directory
    static std::filesystem::path executableDir();

    // Absolute paths and paths that exist relative to the working directory
    // are returned as given. Anything else is taken relative to
    // executableDir(), so a binary started from elsewhere still finds
    // config/ and logs/ beside itself.
    static std::filesystem::path resolve(const std::string& path);
};

} // namespace utils
} // namespace phoenix
