// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace ideasorter::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief GetDataHome()/IdeaSorter, created on demand. */
    static std::filesystem::path GetAppDataDir();
};

} // namespace ideasorter::infrastructure
