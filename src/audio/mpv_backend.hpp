#pragma once

#include <atomic>
#include <memory>
#include <mpv/client.h>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "audio_backend.hpp"

namespace camper {

// libmpv-backed output. mpv runs its own decoder threads; this class only
// forwards commands and turns mpv events into BackendEvents on a private
// event thread.
class MpvBackend : public AudioBackend {
public:
  explicit MpvBackend(const std::vector<std::pair<std::string, std::string>> &options,
                      int volume = 100);
  ~MpvBackend() override;

  MpvBackend(const MpvBackend &) = delete;
  MpvBackend &operator=(const MpvBackend &) = delete;

  void set_event_sink(EventSink sink) override;
  void load(const std::string &uri, std::uint64_t token) override;
  void set_paused(bool paused) override;
  void seek(double position) override;
  void stop() override;
  void set_volume(int percent) override;

private:
  void event_loop();
  void handle_property_change(const mpv_event_property *prop);
  void handle_end_file(const mpv_event_end_file *end);
  void emit(BackendEventType type, double value = 0.0, std::string message = {});
  void command(const std::vector<std::string> &args);

  std::unique_ptr<mpv_handle, decltype(&mpv_terminate_destroy)> mpv{nullptr, mpv_terminate_destroy};
  std::unique_ptr<std::thread> event_thread;
  std::atomic_bool running{true};
  std::atomic<std::uint64_t> token{0};

  std::mutex sink_mutex;
  EventSink sink;
};

} // namespace camper
