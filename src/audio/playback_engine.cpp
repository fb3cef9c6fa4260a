#include "playback_engine.hpp"

#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>

namespace camper {

const char* to_string(EngineEventType type) {
    switch (type) {
    case EngineEventType::Ready: return "ready";
    case EngineEventType::DurationChanged: return "duration";
    case EngineEventType::BufferingProgress: return "buffering";
    case EngineEventType::PositionTick: return "position";
    case EngineEventType::EndOfStream: return "end_of_stream";
    case EngineEventType::Error: return "error";
    }
    return "unknown";
}

PlaybackEngine::PlaybackEngine(AudioBackend& backend) : backend(backend) {}

std::uint64_t PlaybackEngine::load(const std::string& uri) {
    reset();
    active = ++last_token;
    spdlog::debug("engine: load #{} {}", active, uri);
    backend.load(uri, active);
    return active;
}

void PlaybackEngine::play() {
    if (!active) {
        return;
    }
    if (!ready) {
        pending_play = true;
        return;
    }
    backend.set_paused(false);
    paused = false;
}

void PlaybackEngine::pause() {
    if (!active) {
        return;
    }
    if (!ready) {
        pending_play = false;
        return;
    }
    backend.set_paused(true);
    paused = true;
}

void PlaybackEngine::seek(double position) {
    if (!ready) {
        throw NotReady("seek before the stream is ready");
    }
    backend.seek(std::max(0.0, position));
}

void PlaybackEngine::stop() {
    if (active) {
        spdlog::debug("engine: stop #{}", active);
        backend.stop();
    }
    reset();
}

void PlaybackEngine::set_volume(double volume) {
    backend.set_volume(static_cast<int>(std::lround(std::clamp(volume, 0.0, 1.0) * 100.0)));
}

void PlaybackEngine::reset() {
    active = 0;
    ready = false;
    paused = true;
    pending_play.reset();
    known_duration.reset();
}

std::optional<EngineEvent> PlaybackEngine::handle_backend_event(const BackendEvent& event) {
    if (!active || event.token != active) {
        spdlog::debug("engine: dropping stale event for load #{}", event.token);
        return std::nullopt;
    }

    EngineEvent out;
    out.load_id = active;

    switch (event.type) {
    case BackendEventType::Loaded:
        ready = true;
        if (pending_play) {
            paused = !*pending_play;
            backend.set_paused(paused);
            pending_play.reset();
        }
        out.type = EngineEventType::Ready;
        if (known_duration) {
            out.value = *known_duration;
        }
        break;
    case BackendEventType::Duration:
        if (event.value <= 0.0) {
            return std::nullopt;
        }
        known_duration = event.value;
        out.type = EngineEventType::DurationChanged;
        out.value = event.value;
        break;
    case BackendEventType::Position:
        if (!ready) {
            return std::nullopt;
        }
        out.type = EngineEventType::PositionTick;
        out.value = event.value;
        break;
    case BackendEventType::Buffering:
        out.type = EngineEventType::BufferingProgress;
        out.value = std::clamp(event.value, 0.0, 100.0);
        break;
    case BackendEventType::EndOfFile:
        out.type = EngineEventType::EndOfStream;
        reset();
        break;
    case BackendEventType::Failed:
        spdlog::error("engine: load #{} failed: {}", event.token, event.message);
        out.type = EngineEventType::Error;
        out.cause = ErrorCause{ErrorKind::Decode, event.message};
        reset();
        break;
    }

    out.paused = paused;
    return out;
}

} // namespace camper
