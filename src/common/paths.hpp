#pragma once

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace camper::paths {

inline constexpr const char* app_dir_name = "camper";

namespace detail {

// $XDG_<kind>_HOME/camper, else $HOME/<home_suffix>/camper, else ./<fallback>
inline std::string xdg_dir(const char* xdg_var, const char* home_suffix,
                           const char* fallback) {
    const char* xdg = getenv(xdg_var);
    if (xdg && *xdg) {
        return (std::filesystem::path(xdg) / app_dir_name).string();
    }

    const char* home = getenv("HOME");
    if (home && *home) {
        return (std::filesystem::path(home) / home_suffix / app_dir_name).string();
    }
    return std::string("./") + fallback;
}

} // namespace detail

inline std::string get_config_dir() {
#if defined(__APPLE__)
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Application Support/camper";
    }
    return "./config";
#else
    return detail::xdg_dir("XDG_CONFIG_HOME", ".config", "config");
#endif
}

inline std::string get_cache_dir() {
#if defined(__APPLE__)
    const char* home = getenv("HOME");
    if (home) {
        return std::string(home) + "/Library/Caches/camper";
    }
    return "./cache";
#else
    return detail::xdg_dir("XDG_CACHE_HOME", ".cache", "cache");
#endif
}

// Returns false when the directory could not be created; callers decide
// whether that is fatal.
inline bool ensure_directory_exists(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    return !ec;
}

} // namespace camper::paths
