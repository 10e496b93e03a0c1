#pragma once

#include <filesystem>
#include <string>
#include <cstdlib>

namespace ftpget::utils {

namespace fs = std::filesystem;

class PathUtils {
public:
    static fs::path getConfigDirectory() {
#ifdef _WIN32
        const char* appData = std::getenv("APPDATA");
        return appData ? fs::path(appData) / "ftpget" : fs::current_path();
#elif defined(__APPLE__)
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / "Library" / "Application Support" / "ftpget" : fs::current_path();
#else
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg) {
            return fs::path(xdg) / "ftpget";
        }
        const char* home = std::getenv("HOME");
        return home ? fs::path(home) / ".config" / "ftpget" : fs::current_path();
#endif
    }

    static fs::path getConfigPath() {
        return getConfigDirectory() / "config.json";
    }
};

} // namespace ftpget::utils
