#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace ideasorter::infrastructure {

namespace fs = std::filesystem;

namespace {

// $<variable> when set, otherwise $HOME/<homeRelative>, otherwise the CWD.
fs::path XdgDirectory(const char* variable, const fs::path& homeRelative) {
    if (const char* value = std::getenv(variable); value && *value) {
        return fs::path(value);
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path();
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return XdgDirectory("XDG_DATA_HOME", fs::path(".local") / "share");
}

fs::path PathUtils::GetConfigHome() {
    return XdgDirectory("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetAppDataDir() {
    fs::path base = GetDataHome() / "IdeaSorter";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

} // namespace ideasorter::infrastructure
