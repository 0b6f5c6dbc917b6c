#pragma once

#include <filesystem>
#include <string>

namespace BlockSync {

class PathUtils {
public:
    static std::filesystem::path getHome();
    static std::filesystem::path getConfigDir();
    static void ensureDirectory(const std::filesystem::path& dir);

    /// Replace a leading '~' with the home directory
    static std::string expandHome(const std::string& path);
};

} // namespace BlockSync
