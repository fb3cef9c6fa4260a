#pragma once

#include <cstdlib>
#include <spdlog/spdlog.h>
#include <string>
#include "../core/config/config.hpp"

namespace camper::notifications {

// Global config pointer - set once by main()
inline const Config* g_config = nullptr;

inline void init(const Config* cfg) {
    g_config = cfg;
}

inline std::string quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

inline void send(const std::string& message) {
    if (g_config && !g_config->get_notifications_enabled()) {
        return;
    }

    std::string command = "notify-send camper " + quote(message) + " >/dev/null 2>&1";
    if (system(command.c_str()) != 0) {
        spdlog::debug("notify-send unavailable for: {}", message);
    }
}

inline void send_network_error(const std::string& detail) {
    send("Network problem: " + detail);
}

inline void send_login_required() {
    send("Your Bandcamp session expired, please log in again");
}

inline void send_now_playing(const std::string& track) {
    send("Now playing: " + track);
}

} // namespace camper::notifications
