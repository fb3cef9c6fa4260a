#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>
#include <vector>
#include "../../common/paths.hpp"

namespace camper {

class Config {
private:
  rapidjson::Document config;
  std::string config_path;
  mutable std::mutex config_mutex;

  void create_default_config() {
    config.SetObject();
    auto &allocator = config.GetAllocator();

    rapidjson::Value network(rapidjson::kObjectType);
    network.AddMember("base_url", "https://bandcamp.com", allocator);
    network.AddMember("user_agent",
                      "Mozilla/5.0 (X11; Linux x86_64; rv:120.0) Gecko/20100101 Firefox/120.0",
                      allocator);
    network.AddMember("timeout_seconds", 15, allocator);
    network.AddMember("page_size", 50, allocator);
    config.AddMember("network", network, allocator);

    rapidjson::Value player(rapidjson::kObjectType);
    player.AddMember("volume", 100, allocator);
    player.AddMember("load_timeout_seconds", 20, allocator);

    rapidjson::Value mpv_options(rapidjson::kObjectType);
    mpv_options.AddMember("video", "no", allocator);
    mpv_options.AddMember("audio-display", "no", allocator);
    mpv_options.AddMember("terminal", "no", allocator);
    mpv_options.AddMember("quiet", "yes", allocator);
    mpv_options.AddMember("cache", "yes", allocator);
#if defined(__APPLE__)
    mpv_options.AddMember("ao", "coreaudio", allocator);
#else
    mpv_options.AddMember("ao", "pulse", allocator);
#endif
    player.AddMember("mpv_options", mpv_options, allocator);
    config.AddMember("player", player, allocator);

    rapidjson::Value ui(rapidjson::kObjectType);
    ui.AddMember("show_notifications", true, allocator);
    config.AddMember("ui", ui, allocator);

    rapidjson::Value logging(rapidjson::kObjectType);
    logging.AddMember("level", "info", allocator);
    config.AddMember("logging", logging, allocator);

    rapidjson::Value session(rapidjson::kObjectType);
    std::string credential_file = paths::get_config_dir() + "/cookies";
    session.AddMember("credential_file",
                      rapidjson::Value(credential_file.c_str(), allocator), allocator);
    config.AddMember("session", session, allocator);

    save_config();
  }

  void save_config() {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    config.Accept(writer);

    std::ofstream file(config_path);
    if (!file) {
      spdlog::warn("Could not write config file {}", config_path);
      return;
    }
    file << buffer.GetString() << std::endl;
  }

  std::string get_string_value(const char *section, const char *key,
                               const std::string &default_value = "") const {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (config.HasMember(section) && config[section].IsObject() &&
        config[section].HasMember(key) && config[section][key].IsString()) {
      return config[section][key].GetString();
    }
    return default_value;
  }

  bool get_bool_value(const char *section, const char *key,
                      bool default_value = false) const {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (config.HasMember(section) && config[section].IsObject() &&
        config[section].HasMember(key) && config[section][key].IsBool()) {
      return config[section][key].GetBool();
    }
    return default_value;
  }

  int get_int_value(const char *section, const char *key,
                    int default_value = 0) const {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (config.HasMember(section) && config[section].IsObject() &&
        config[section].HasMember(key) && config[section][key].IsInt()) {
      return config[section][key].GetInt();
    }
    return default_value;
  }

public:
  explicit Config(const std::string &path = "")
      : config_path(path.empty() ? (paths::get_config_dir() + "/config.json") : path) {
    try {
      paths::ensure_directory_exists(std::filesystem::path(config_path).parent_path().string());

      std::ifstream file(config_path);
      if (file.good()) {
        std::string json_str((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());

        if (config.Parse(json_str.c_str()).HasParseError() ||
            !config.IsObject()) {
          throw std::runtime_error("Invalid config file format");
        }
      } else {
        create_default_config();
      }
    } catch (const std::exception &e) {
      spdlog::warn("Config error in {}: {}, using defaults", config_path, e.what());
      create_default_config();
    }
  }

  const std::string &path() const { return config_path; }

  std::string get_base_url() const {
    return get_string_value("network", "base_url", "https://bandcamp.com");
  }

  std::string get_user_agent() const {
    return get_string_value("network", "user_agent", "camper/0.1");
  }

  int get_timeout_seconds() const {
    return get_int_value("network", "timeout_seconds", 15);
  }

  int get_page_size() const { return get_int_value("network", "page_size", 50); }

  int get_volume() const { return get_int_value("player", "volume", 100); }

  int get_load_timeout_seconds() const {
    return get_int_value("player", "load_timeout_seconds", 20);
  }

  bool get_notifications_enabled() const {
    return get_bool_value("ui", "show_notifications", true);
  }

  std::string get_log_level() const {
    return get_string_value("logging", "level", "info");
  }

  std::string get_credential_file() const {
    return get_string_value("session", "credential_file",
                            paths::get_config_dir() + "/cookies");
  }

  // All string-valued entries of player.mpv_options, in file order.
  std::vector<std::pair<std::string, std::string>> get_mpv_options() const {
    std::lock_guard<std::mutex> lock(config_mutex);
    std::vector<std::pair<std::string, std::string>> options;
    if (config.HasMember("player") && config["player"].IsObject() &&
        config["player"].HasMember("mpv_options") &&
        config["player"]["mpv_options"].IsObject()) {
      for (const auto &member : config["player"]["mpv_options"].GetObject()) {
        if (member.value.IsString()) {
          options.emplace_back(member.name.GetString(), member.value.GetString());
        }
      }
    }
    return options;
  }

  void set_volume(int volume) {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (config.HasMember("player") && config["player"].IsObject()) {
      auto &player = config["player"];
      if (player.HasMember("volume")) {
        player["volume"].SetInt(volume);
      } else {
        player.AddMember("volume", volume, config.GetAllocator());
      }
      save_config();
    }
  }
};

} // namespace camper
