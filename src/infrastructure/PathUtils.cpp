#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace treeshaper::infrastructure {

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

fs::path PathUtils::GetDefaultProjectRoot() {
    fs::path base = GetDataHome() / "TreeShaper";
    std::error_code ec;
    if (!fs::exists(base, ec)) {
        fs::create_directories(base, ec);
        if (ec) {
            std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
        }
    }
    return base;
}

fs::path PathUtils::ResolveInProject(const std::string& projectRoot, const std::string& file) {
    fs::path filePath(file);
    if (filePath.is_absolute()) {
        return filePath;
    }
    return fs::path(projectRoot) / filePath;
}

} // namespace treeshaper::infrastructure
