#include "common/PathUtils.h"

#include <system_error>

namespace phoenix {
namespace utils {

std::filesystem::path PathUtils::executableDir() {
    std::error_code ec;
    auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (!ec && exe.has_parent_path()) {
        return exe.parent_path();
    }
    return std::filesystem::current_path(ec);
}

std::filesystem::path PathUtils::resolve(const std::string& path) {
    const std::filesystem::path given(path);
    std::error_code ec;
    if (given.is_absolute() || std::filesystem::exists(given, ec)) {
        return given;
    }
    return executableDir() / given;
}

} // namespace utils
} // namespace phoenix
