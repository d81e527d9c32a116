#pragma once

#include <string>
#include <filesystem>

namespace stratbench {
namespace utils {

class PathUtils {
public:
    // Directory holding the running executable (falls back to the working directory)
    static std::filesystem::path getExecutableDir();

    // Relative paths resolve against the executable directory when the target
    // exists there, otherwise against the working directory.
    static std::filesystem::path resolveRelativePath(const std::string& relative_path);
};

} // namespace utils
} // namespace stratbench
