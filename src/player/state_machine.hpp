#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "../audio/playback_engine.hpp"
#include "../core/message_queue.hpp"
#include "../services/bandcamp/content_client.hpp"
#include "player_state.hpp"
#include "queue.hpp"

namespace camper {

namespace command {

// Replace the queue and start at `start` (play album from track N).
struct ReplaceQueue {
    std::vector<QueueEntry> entries;
    std::size_t start = 0;
};
struct Enqueue {
    QueueEntry entry;
};
struct EnqueueNext {
    QueueEntry entry;
};
struct RemoveAt {
    std::size_t index = 0;
};
struct ClearQueue {};
struct PlayRequested {
    std::size_t index = 0;
};
struct Play {};
struct Pause {};
struct TogglePlayPause {};
struct Next {};
struct Previous {};
// Absolute position in seconds.
struct Seek {
    double position = 0.0;
};
struct Retry {};
struct Stop {};
// 0.0 - 1.0
struct SetVolume {
    double volume = 1.0;
};

} // namespace command

using Command = std::variant<command::ReplaceQueue, command::Enqueue, command::EnqueueNext,
                             command::RemoveAt, command::ClearQueue, command::PlayRequested,
                             command::Play, command::Pause, command::TogglePlayPause,
                             command::Next, command::Previous, command::Seek, command::Retry,
                             command::Stop, command::SetVolume>;

const char* command_name(const Command& cmd);

struct PlayerOptions {
    std::chrono::milliseconds load_timeout{20000};
    double volume = 1.0;
};

// Single owner of the player state. UI, MPRIS and the audio backend only
// post messages; run() (or process_pending() in tests) applies them one at
// a time on the owner thread, so the state itself needs no locking.
class PlayerStateMachine {
public:
    using Executor = std::function<void(std::function<void()>)>;
    using Clock = std::chrono::steady_clock;
    using Now = std::function<Clock::time_point()>;
    using Listener = std::function<void(const PlayerSnapshot&)>;

    // Stream URLs are resolved through `executor`, never on the owner thread.
    PlayerStateMachine(PlaybackEngine& engine, StreamResolver& resolver, Executor executor,
                       PlayerOptions options = {}, Now now = Clock::now);

    PlayerStateMachine(const PlayerStateMachine&) = delete;
    PlayerStateMachine& operator=(const PlayerStateMachine&) = delete;

    // Thread-safe.
    void post(Command cmd);
    void post_backend_event(BackendEvent event);

    // Owner loop; returns after shutdown().
    void run();
    void shutdown();

    // Drains the inbox on the calling thread. Returns the number of messages handled.
    std::size_t process_pending();
    void check_timeout();

    // Thread-safe copies of the last published state.
    PlayerSnapshot snapshot() const;
    std::vector<QueueEntry> queue_entries() const;

    // Listeners run on the owner thread after every change.
    void subscribe(Listener listener);

private:
    struct StreamResolved {
        std::uint64_t generation;
        std::string uri;
    };
    struct StreamFailed {
        std::uint64_t generation;
        ErrorCause cause;
    };
    using Message = std::variant<Command, BackendEvent, StreamResolved, StreamFailed>;

    void dispatch(Message& message);

    void handle(command::ReplaceQueue& cmd);
    void handle(command::Enqueue& cmd);
    void handle(command::EnqueueNext& cmd);
    void handle(const command::RemoveAt& cmd);
    void handle(const command::ClearQueue& cmd);
    void handle(const command::PlayRequested& cmd);
    void handle(const command::Play& cmd);
    void handle(const command::Pause& cmd);
    void handle(const command::TogglePlayPause& cmd);
    void handle(const command::Next& cmd);
    void handle(const command::Previous& cmd);
    void handle(const command::Seek& cmd);
    void handle(const command::Retry& cmd);
    void handle(const command::Stop& cmd);
    void handle(const command::SetVolume& cmd);
    void handle(const BackendEvent& event);
    void handle(StreamResolved& resolved);
    void handle(StreamFailed& failed);

    void on_engine_event(const EngineEvent& event);

    void start_loading(const QueueEntry& entry);
    void go_idle();
    void fail(const QueueEntry& entry, ErrorCause cause);
    void play_or_idle(const std::optional<QueueEntry>& entry);
    void transition(PlayerState next);
    void publish();

    PlaybackEngine& engine;
    StreamResolver& resolver;
    Executor executor;
    PlayerOptions options;
    Now now;

    MessageQueue<Message> inbox;
    std::atomic_bool stopping{false};

    // Owner-thread state.
    PlayerState current = state::Idle{};
    Queue queue;
    std::uint64_t generation = 0;
    std::optional<Clock::time_point> deadline;
    bool start_paused = false;
    std::optional<double> duration;
    double buffering = 0.0;
    double volume;
    bool dirty = false;

    mutable std::mutex published_mutex;
    PlayerSnapshot published;
    std::vector<QueueEntry> published_entries;
    std::vector<Listener> listeners;
};

} // namespace camper
