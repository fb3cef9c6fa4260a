#include "mpv_backend.hpp"

#include <algorithm>
#include <cstring>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace camper {

MpvBackend::MpvBackend(const std::vector<std::pair<std::string, std::string>> &options,
                       int volume) {
  mpv.reset(mpv_create());
  if (!mpv) {
    throw std::runtime_error("MPV initialization failed");
  }

  for (const auto &[option, value] : options) {
    if (mpv_set_option_string(mpv.get(), option.c_str(), value.c_str()) < 0) {
      spdlog::warn("mpv: failed to set option {}={}", option, value);
    }
  }

  // Every load starts paused; the engine decides when to unpause.
  mpv_set_option_string(mpv.get(), "pause", "yes");
  mpv_set_option_string(mpv.get(), "volume", std::to_string(std::clamp(volume, 0, 100)).c_str());

  mpv_observe_property(mpv.get(), 0, "time-pos", MPV_FORMAT_DOUBLE);
  mpv_observe_property(mpv.get(), 0, "duration", MPV_FORMAT_DOUBLE);
  mpv_observe_property(mpv.get(), 0, "cache-buffering-state", MPV_FORMAT_INT64);

  if (mpv_initialize(mpv.get()) < 0) {
    throw std::runtime_error("MPV initialization failed");
  }

  event_thread = std::make_unique<std::thread>([this] { event_loop(); });
  spdlog::info("mpv {} ready", mpv_client_api_version() >> 16);
}

MpvBackend::~MpvBackend() {
  running = false;
  if (event_thread && event_thread->joinable()) {
    mpv_wakeup(mpv.get());
    event_thread->join();
  }
}

void MpvBackend::set_event_sink(EventSink next) {
  std::lock_guard<std::mutex> lock(sink_mutex);
  sink = std::move(next);
}

void MpvBackend::command(const std::vector<std::string> &args) {
  std::vector<const char *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &arg : args) {
    argv.push_back(arg.c_str());
  }
  argv.push_back(nullptr);

  int result = mpv_command_async(mpv.get(), 0, argv.data());
  if (result < 0) {
    spdlog::error("mpv: {} failed: {}", args.front(), mpv_error_string(result));
  }
}

void MpvBackend::load(const std::string &uri, std::uint64_t next_token) {
  token = next_token;
  int paused = 1;
  mpv_set_property(mpv.get(), "pause", MPV_FORMAT_FLAG, &paused);
  command({"loadfile", uri, "replace"});
}

void MpvBackend::set_paused(bool paused) {
  int flag = paused ? 1 : 0;
  int result = mpv_set_property_async(mpv.get(), 0, "pause", MPV_FORMAT_FLAG, &flag);
  if (result < 0) {
    spdlog::error("mpv: pause={} failed: {}", paused, mpv_error_string(result));
  }
}

void MpvBackend::seek(double position) {
  command({"seek", fmt::format("{:.3f}", position), "absolute"});
}

void MpvBackend::stop() {
  token = 0;
  command({"stop"});
}

void MpvBackend::set_volume(int percent) {
  int64_t mpv_volume = std::clamp(percent, 0, 100);
  mpv_set_property_async(mpv.get(), 0, "volume", MPV_FORMAT_INT64, &mpv_volume);
}

void MpvBackend::emit(BackendEventType type, double value, std::string message) {
  BackendEvent event{type, token.load(), value, std::move(message)};
  if (event.token == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(sink_mutex);
  if (sink) {
    sink(event);
  }
}

void MpvBackend::event_loop() {
  while (running) {
    mpv_event *event = mpv_wait_event(mpv.get(), 0.1);
    switch (event->event_id) {
    case MPV_EVENT_NONE:
      break;
    case MPV_EVENT_SHUTDOWN:
      running = false;
      break;
    case MPV_EVENT_PROPERTY_CHANGE:
      handle_property_change(static_cast<mpv_event_property *>(event->data));
      break;
    case MPV_EVENT_FILE_LOADED:
      emit(BackendEventType::Loaded);
      break;
    case MPV_EVENT_END_FILE:
      handle_end_file(static_cast<mpv_event_end_file *>(event->data));
      break;
    case MPV_EVENT_COMMAND_REPLY:
      if (event->error < 0) {
        spdlog::warn("mpv: async command failed: {}", mpv_error_string(event->error));
      }
      break;
    default:
      break;
    }
  }
}

void MpvBackend::handle_property_change(const mpv_event_property *prop) {
  if (!prop->data) {
    return;
  }
  if (strcmp(prop->name, "time-pos") == 0 && prop->format == MPV_FORMAT_DOUBLE) {
    emit(BackendEventType::Position, *static_cast<double *>(prop->data));
  } else if (strcmp(prop->name, "duration") == 0 && prop->format == MPV_FORMAT_DOUBLE) {
    emit(BackendEventType::Duration, *static_cast<double *>(prop->data));
  } else if (strcmp(prop->name, "cache-buffering-state") == 0 &&
             prop->format == MPV_FORMAT_INT64) {
    emit(BackendEventType::Buffering, static_cast<double>(*static_cast<int64_t *>(prop->data)));
  }
}

void MpvBackend::handle_end_file(const mpv_event_end_file *end) {
  switch (end->reason) {
  case MPV_END_FILE_REASON_EOF:
    emit(BackendEventType::EndOfFile);
    break;
  case MPV_END_FILE_REASON_ERROR:
    emit(BackendEventType::Failed, 0.0, mpv_error_string(end->error));
    break;
  default:
    // stop, replace by a newer loadfile, quit
    break;
  }
}

} // namespace camper
