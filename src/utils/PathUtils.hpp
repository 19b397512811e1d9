#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace craftkit::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getAppDataPath() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" : fs::current_path();
#else
        const char* xdgData = std::getenv("XDG_DATA_HOME");
        if (xdgData && *xdgData) return fs::path(xdgData);
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".local" / "share" : fs::current_path();
#endif
    }

    static fs::path getDataPath() {
        return getAppDataPath() / "Craftkit";
    }

    // Relative paths from the config file are anchored at the data directory
    static fs::path resolve(const fs::path& path) {
        return path.is_absolute() ? path : getDataPath() / path;
    }
};

} // namespace craftkit::utils
