#include "common/PathUtils.h"

namespace stratvault {
namespace utils {

std::filesystem::path PathUtils::executableDir() {
    std::error_code ec;
    const auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec || exe.empty()) {
        return std::filesystem::current_path(ec);
    }
    return exe.parent_path();
}

std::filesystem::path PathUtils::anchored(const std::string& path) {
    const std::filesystem::path p(path);
    if (p.is_absolute()) {
        return p;
    }
    return executableDir() / p;
}

std::filesystem::path PathUtils::locateExisting(const std::string& path) {
    std::error_code ec;
    const std::filesystem::path direct(path);
    if (std::filesystem::exists(direct, ec)) {
        return direct;
    }
    if (direct.is_absolute()) {
        return {};
    }
    const auto beside_binary = executableDir() / direct;
    if (std::filesystem::exists(beside_binary, ec)) {
        return beside_binary;
    }
    return {};
}

bool PathUtils::ensureParentDirectory(const std::filesystem::path& file, std::error_code& ec) {
    ec.clear();
    if (!file.has_parent_path()) {
        return true;
    }
    std::filesystem::create_directories(file.parent_path(), ec);
    return !ec;
}

} // namespace utils
} // namespace stratvault
