#include "common/PathUtils.h"

#include <system_error>

namespace cryptogate {
namespace utils {

std::filesystem::path PathUtils::getExecutableDir() {
    std::error_code ec;
    const auto exe_path = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        // procfs 가 없으면 작업 디렉토리 기준
        return std::filesystem::current_path();
    }
    return exe_path.parent_path();
}

std::filesystem::path PathUtils::resolveRelativePath(const std::string& relative_path) {
    // 작업 디렉토리에 이미 있으면 그쪽 우선 (테스트/개발 실행)
    std::filesystem::path local(relative_path);
    std::error_code ec;
    if (std::filesystem::exists(local, ec)) {
        return std::filesystem::absolute(local, ec);
    }
    return getExecutableDir() / relative_path;
}

} // namespace utils
} // namespace cryptogate
