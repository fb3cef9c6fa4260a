#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "../common/errors.hpp"
#include "audio_backend.hpp"

namespace camper {

enum class EngineEventType { Ready, DurationChanged, BufferingProgress, PositionTick, EndOfStream, Error };

struct EngineEvent {
    EngineEventType type = EngineEventType::Ready;
    std::uint64_t load_id = 0;
    // Seconds for PositionTick/DurationChanged, percent for BufferingProgress.
    double value = 0.0;
    ErrorCause cause;
    bool paused = true;
};

const char* to_string(EngineEventType type);

// Transport over one track URI at a time. Not thread-safe: every call,
// including handle_backend_event, is made from the player's owner thread.
class PlaybackEngine {
public:
    explicit PlaybackEngine(AudioBackend& backend);

    // Returns immediately; readiness arrives as a Ready event.
    std::uint64_t load(const std::string& uri);
    // Before readiness these only record the wish, last call wins.
    void play();
    void pause();
    // Throws NotReady until the current load is ready.
    void seek(double position);
    void stop();
    void set_volume(double volume);

    // Translates a raw backend event; nullopt for events of replaced or
    // stopped loads and for ones with no engine-level meaning.
    std::optional<EngineEvent> handle_backend_event(const BackendEvent& event);

    bool is_ready() const { return ready; }
    bool is_paused() const { return paused; }
    std::uint64_t active_load() const { return active; }
    std::optional<double> duration() const { return known_duration; }

private:
    void reset();

    AudioBackend& backend;
    std::uint64_t last_token = 0;
    std::uint64_t active = 0;
    bool ready = false;
    bool paused = true;
    std::optional<bool> pending_play;
    std::optional<double> known_duration;
};

} // namespace camper
