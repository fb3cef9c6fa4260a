#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace camper {

enum class BackendEventType { Loaded, Position, Duration, Buffering, EndOfFile, Failed };

// Raw event from the audio backend. `token` echoes the token passed to the
// load() that produced it, so consumers can drop events of replaced loads.
struct BackendEvent {
    BackendEventType type = BackendEventType::Loaded;
    std::uint64_t token = 0;
    double value = 0.0;
    std::string message;
};

// Streaming audio output. Events may be raised from any thread.
class AudioBackend {
public:
    using EventSink = std::function<void(const BackendEvent&)>;

    virtual ~AudioBackend() = default;

    virtual void set_event_sink(EventSink sink) = 0;
    // Starts fetching `uri` paused; Loaded follows once it can play.
    virtual void load(const std::string& uri, std::uint64_t token) = 0;
    virtual void set_paused(bool paused) = 0;
    virtual void seek(double position) = 0;
    virtual void stop() = 0;
    virtual void set_volume(int percent) = 0;
};

} // namespace camper
