// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace treeshaper::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();

    /** @brief <data home>/TreeShaper, created on demand. */
    static std::filesystem::path GetDefaultProjectRoot();

    /** @brief Resolves @p file against @p projectRoot unless it is already absolute. */
    static std::filesystem::path ResolveInProject(const std::string& projectRoot, const std::string& file);
};

} // namespace treeshaper::infrastructure
