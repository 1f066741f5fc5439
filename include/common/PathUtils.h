#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace stratvault {
namespace utils {

class PathUtils {
public:
    // Directory of the running binary, or the working directory when /proc is unavailable.
    static std::filesystem::path executableDir();

    // Absolute paths pass through; relative ones are anchored at executableDir().
    static std::filesystem::path anchored(const std::string& path);

    // Looks for the path relative to the working directory first, then next to the binary.
    // Empty when neither exists.
    static std::filesystem::path locateExisting(const std::string& path);

    static bool ensureParentDirectory(const std::filesystem::path& file, std::error_code& ec);
};

} // namespace utils
} // namespace stratvault
