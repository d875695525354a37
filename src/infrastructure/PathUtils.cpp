#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

#ifndef GLYCEMICGUARD_INSTALL_DATADIR
#define GLYCEMICGUARD_INSTALL_DATADIR "/usr/local/share/GlycemicGuard"
#endif

namespace glycemicguard::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetInstalledDataDir() {
    return fs::path(GLYCEMICGUARD_INSTALL_DATADIR);
}

std::vector<fs::path> PathUtils::DataSearchDirs() {
    return {GetDataHome() / "GlycemicGuard", GetInstalledDataDir()};
}

fs::path PathUtils::ResolveDataFile(const fs::path& path) {
    std::error_code ec;
    if (path.is_absolute() || fs::exists(path, ec)) {
        return path;
    }
    for (const auto& dir : DataSearchDirs()) {
        fs::path candidate = dir / path.filename();
        if (fs::exists(candidate, ec)) {
            return candidate;
        }
    }
    return path;
}

} // namespace glycemicguard::infrastructure
