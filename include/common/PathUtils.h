#pragma once

#include <string>
#include <filesystem>

namespace confluence {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable; falls back to the working directory
    static std::filesystem::path getExecutableDir();

    // Working directory first, then the executable directory
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace confluence
