#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <unistd.h>

#include "audio/mpris_adapter.hpp"
#include "audio/mpris_handler.hpp"
#include "audio/mpv_backend.hpp"
#include "audio/playback_engine.hpp"
#include "common/notification.hpp"
#include "control/command_handler.hpp"
#include "control/player_notifier.hpp"
#include "core/background_worker.hpp"
#include "core/config/config.hpp"
#include "core/logging.hpp"
#include "player/state_machine.hpp"
#include "services/bandcamp/content_client.hpp"
#include "services/bandcamp/http.hpp"
#include "storage/session_store.hpp"

namespace {

std::atomic_bool interrupted{false};

void on_signal(int) { interrupted = true; }

void print_usage() {
  std::cout << "usage: camper [--headless] [--config <file>]\n"
               "  --headless   no console, control through MPRIS only\n"
               "  --config     config file (default ~/.config/camper/config.json)\n";
}

void open_in_browser(const std::string &url) {
  std::string command = "xdg-open " + camper::notifications::quote(url) + " >/dev/null 2>&1 &";
  if (system(command.c_str()) != 0) {
    spdlog::warn("Could not launch a browser for {}", url);
  }
}

// Waits for console input without blocking shutdown requests.
bool wait_for_input(const std::atomic_bool &running) {
  while (running && !interrupted) {
    if (std::cin.rdbuf()->in_avail() > 0) {
      return true;
    }
    pollfd fd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&fd, 1, 200);
    if (ready > 0) {
      return true;
    }
    if (ready < 0 && errno != EINTR) {
      return false;
    }
  }
  return false;
}

void report_failure(camper::ErrorKind kind, const std::string &message) {
  if (kind == camper::ErrorKind::AuthExpired) {
    camper::notifications::send_login_required();
  } else {
    camper::notifications::send_network_error(message);
  }
}

} // namespace

int main(int argc, char *argv[]) {
  bool headless = false;
  std::string config_path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--headless") {
      headless = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << std::endl;
      print_usage();
      return 2;
    }
  }

  camper::Config config(config_path);
  camper::logging::init(config);
  camper::notifications::init(&config);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  camper::FileCredentialStorage credentials(config.get_credential_file());
  camper::SessionStore session(credentials);
  session.load();

  camper::bandcamp::CurlTransport transport(config.get_user_agent(), config.get_timeout_seconds());
  camper::bandcamp::ContentClient client(
      transport, session, camper::bandcamp::ClientOptions{config.get_base_url(), config.get_page_size()});

  std::unique_ptr<camper::MpvBackend> backend;
  try {
    backend = std::make_unique<camper::MpvBackend>(config.get_mpv_options(), config.get_volume());
  } catch (const std::exception &e) {
    spdlog::critical("Audio backend unavailable: {}", e.what());
    std::cerr << "Audio backend unavailable: " << e.what() << std::endl;
    return 1;
  }
  camper::PlaybackEngine engine(*backend);

  auto worker = std::make_unique<camper::BackgroundWorker>("stream-resolver");
  camper::PlayerOptions options;
  options.load_timeout = std::chrono::seconds(config.get_load_timeout_seconds());
  options.volume = config.get_volume() / 100.0;
  camper::PlayerStateMachine player(
      engine, client, [&worker](std::function<void()> job) { worker->post(std::move(job)); }, options);

  backend->set_event_sink([&player](const camper::BackendEvent &event) { player.post_backend_event(event); });

  camper::MprisAdapter adapter([&player](camper::Command cmd) { player.post(std::move(cmd)); });
  player.subscribe([&adapter](const camper::PlayerSnapshot &snapshot) { adapter.update(snapshot); });
  // Banners and config writes stay off the owner thread.
  auto desktop = std::make_unique<camper::BackgroundWorker>("notifier");
  auto post_desktop = [&desktop](std::function<void()> job) { desktop->post(std::move(job)); };
  auto notifier = std::make_shared<camper::control::PlayerNotifier>(
      post_desktop,
      camper::control::PlayerNotifier::Actions{
          camper::notifications::send_now_playing, report_failure,
          [&config](int percent) { config.set_volume(percent); }},
      config.get_volume());
  player.subscribe([notifier](const camper::PlayerSnapshot &snapshot) { (*notifier)(snapshot); });

  std::atomic_bool running{true};
  std::unique_ptr<camper::MPRISHandler> mpris;
  try {
    mpris = std::make_unique<camper::MPRISHandler>(adapter, [&running] { running = false; });
    mpris->initialize();
    mpris->startEventLoop();
  } catch (const sdbus::Error &e) {
    spdlog::warn("MPRIS disabled: {}", e.getMessage());
    mpris.reset();
  }

  std::thread owner([&player] { player.run(); });

  if (!session.is_valid()) {
    spdlog::info("No valid session, library commands need \"login <cookie>\"");
  }

  if (headless) {
    while (running && !interrupted) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  } else {
    camper::control::CommandHandler handler(client, player, session);
    handler.set_url_opener(open_in_browser);
    handler.set_notifier([&post_desktop](camper::ErrorKind kind, const std::string &message) {
      post_desktop([kind, message] { report_failure(kind, message); });
    });

    std::string line;
    while (wait_for_input(running) && std::getline(std::cin, line)) {
      if (line.empty()) continue;

      std::cout << handler.execute(line) << std::endl;
      std::cout.flush();
      if (handler.quit_requested()) {
        break;
      }
    }
  }

  spdlog::info("Shutting down");
  mpris.reset();
  player.shutdown();
  owner.join();
  worker.reset();
  desktop.reset();
  backend->set_event_sink(nullptr);
  return 0;
}
