// PathUtils Header
#pragma once
#include <string>
#include <filesystem>
#include <vector>

namespace glycemicguard::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief Data directory of an installed build (share/GlycemicGuard under the prefix). */
    static std::filesystem::path GetInstalledDataDir();

    /** @brief Directories searched for data files, in order: XDG data home, then the install dir. */
    static std::vector<std::filesystem::path> DataSearchDirs();

    /**
     * @brief Finds a relative data file: as given, then in each of DataSearchDirs().
     * @return The first existing candidate, or the path unchanged.
     */
    static std::filesystem::path ResolveDataFile(const std::filesystem::path& path);
};

} // namespace glycemicguard::infrastructure
