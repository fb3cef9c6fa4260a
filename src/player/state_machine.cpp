#include "state_machine.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace camper {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

const char* command_name(const Command& cmd) {
    return std::visit(
        overloaded{
            [](const command::ReplaceQueue&) { return "replace_queue"; },
            [](const command::Enqueue&) { return "enqueue"; },
            [](const command::EnqueueNext&) { return "enqueue_next"; },
            [](const command::RemoveAt&) { return "remove_at"; },
            [](const command::ClearQueue&) { return "clear_queue"; },
            [](const command::PlayRequested&) { return "play_requested"; },
            [](const command::Play&) { return "play"; },
            [](const command::Pause&) { return "pause"; },
            [](const command::TogglePlayPause&) { return "toggle_play_pause"; },
            [](const command::Next&) { return "next"; },
            [](const command::Previous&) { return "previous"; },
            [](const command::Seek&) { return "seek"; },
            [](const command::Retry&) { return "retry"; },
            [](const command::Stop&) { return "stop"; },
            [](const command::SetVolume&) { return "set_volume"; },
        },
        cmd);
}

PlayerStateMachine::PlayerStateMachine(PlaybackEngine& engine, StreamResolver& resolver,
                                       Executor executor, PlayerOptions options, Now now)
    : engine(engine),
      resolver(resolver),
      executor(std::move(executor)),
      options(options),
      now(std::move(now)),
      volume(std::clamp(options.volume, 0.0, 1.0)) {
    published.volume = volume;
}

void PlayerStateMachine::post(Command cmd) {
    if (!inbox.push(Message{std::move(cmd)})) {
        spdlog::debug("player: command after shutdown dropped");
    }
}

void PlayerStateMachine::post_backend_event(BackendEvent event) {
    inbox.push(Message{std::move(event)});
}

void PlayerStateMachine::run() {
    spdlog::debug("player: owner loop started");
    while (!stopping) {
        auto message = inbox.pop_for(std::chrono::milliseconds(100));
        if (message) {
            dispatch(*message);
        }
        check_timeout();
    }
    engine.stop();
    spdlog::debug("player: owner loop finished");
}

void PlayerStateMachine::shutdown() {
    stopping = true;
    inbox.close();
}

std::size_t PlayerStateMachine::process_pending() {
    std::size_t handled = 0;
    while (auto message = inbox.try_pop()) {
        dispatch(*message);
        ++handled;
    }
    return handled;
}

void PlayerStateMachine::check_timeout() {
    auto* loading = std::get_if<state::Loading>(&current);
    if (!loading || !deadline || now() < *deadline) {
        return;
    }
    spdlog::warn("player: \"{}\" did not become ready in {} ms", loading->entry.track.title,
                 options.load_timeout.count());
    QueueEntry entry = loading->entry;
    ++generation;
    engine.stop();
    fail(entry, ErrorCause{ErrorKind::Timeout, "stream did not start in time"});
    publish();
}

PlayerSnapshot PlayerStateMachine::snapshot() const {
    std::lock_guard<std::mutex> lock(published_mutex);
    return published;
}

std::vector<QueueEntry> PlayerStateMachine::queue_entries() const {
    std::lock_guard<std::mutex> lock(published_mutex);
    return published_entries;
}

void PlayerStateMachine::subscribe(Listener listener) {
    std::lock_guard<std::mutex> lock(published_mutex);
    listeners.push_back(std::move(listener));
}

void PlayerStateMachine::dispatch(Message& message) {
    if (auto* cmd = std::get_if<Command>(&message)) {
        spdlog::debug("player: {} in {}", command_name(*cmd), to_string(status_of(current)));
        std::visit([this](auto& c) { handle(c); }, *cmd);
    } else if (auto* event = std::get_if<BackendEvent>(&message)) {
        handle(*event);
    } else if (auto* resolved = std::get_if<StreamResolved>(&message)) {
        handle(*resolved);
    } else if (auto* failed = std::get_if<StreamFailed>(&message)) {
        handle(*failed);
    }
    publish();
}

// Queue mutation

void PlayerStateMachine::handle(command::ReplaceQueue& cmd) {
    queue.clear();
    for (auto& entry : cmd.entries) {
        queue.append(std::move(entry));
    }
    dirty = true;
    if (queue.empty()) {
        go_idle();
        return;
    }
    std::size_t start = cmd.start;
    if (start >= queue.size()) {
        spdlog::warn("player: start index {} beyond queue of {}, starting at 0", start, queue.size());
        start = 0;
    }
    queue.move_cursor_to(start);
    start_loading(*queue.current());
}

void PlayerStateMachine::handle(command::Enqueue& cmd) {
    queue.append(std::move(cmd.entry));
    dirty = true;
}

void PlayerStateMachine::handle(command::EnqueueNext& cmd) {
    queue.insert_next(std::move(cmd.entry));
    dirty = true;
}

void PlayerStateMachine::handle(const command::RemoveAt& cmd) {
    bool was_current = false;
    try {
        was_current = queue.remove_at(cmd.index);
    } catch (const std::out_of_range& e) {
        spdlog::warn("player: remove ignored: {}", e.what());
        return;
    }
    dirty = true;
    if (was_current && !std::holds_alternative<state::Idle>(current)) {
        play_or_idle(queue.current());
    }
}

void PlayerStateMachine::handle(const command::ClearQueue&) {
    queue.clear();
    dirty = true;
    if (!std::holds_alternative<state::Idle>(current)) {
        go_idle();
    }
}

void PlayerStateMachine::handle(const command::PlayRequested& cmd) {
    try {
        queue.move_cursor_to(cmd.index);
    } catch (const std::out_of_range& e) {
        spdlog::warn("player: play ignored: {}", e.what());
        return;
    }
    start_loading(*queue.current());
}

// Transport

void PlayerStateMachine::handle(const command::Play&) {
    if (auto* paused = std::get_if<state::Paused>(&current)) {
        engine.play();
        transition(state::Playing{paused->entry, paused->position});
    } else if (std::holds_alternative<state::Loading>(current)) {
        start_paused = false;
        engine.play();
    } else if (std::holds_alternative<state::Error>(current)) {
        handle(command::Retry{});
    } else if (std::holds_alternative<state::Idle>(current)) {
        if (auto entry = queue.resume()) {
            start_loading(*entry);
        }
    }
}

void PlayerStateMachine::handle(const command::Pause&) {
    if (auto* playing = std::get_if<state::Playing>(&current)) {
        engine.pause();
        transition(state::Paused{playing->entry, playing->position});
    } else if (std::holds_alternative<state::Loading>(current)) {
        start_paused = true;
        engine.pause();
    }
}

void PlayerStateMachine::handle(const command::TogglePlayPause&) {
    if (std::holds_alternative<state::Playing>(current)) {
        handle(command::Pause{});
    } else if (std::holds_alternative<state::Loading>(current)) {
        if (start_paused) {
            handle(command::Play{});
        } else {
            handle(command::Pause{});
        }
    } else {
        handle(command::Play{});
    }
}

void PlayerStateMachine::handle(const command::Next&) {
    if (std::holds_alternative<state::Idle>(current)) {
        // Nothing current: start where the queue picks up again.
        if (!queue.current()) {
            if (auto entry = queue.resume()) {
                start_loading(*entry);
            }
        }
        return;
    }
    play_or_idle(queue.advance());
}

void PlayerStateMachine::handle(const command::Previous&) {
    if (std::holds_alternative<state::Idle>(current)) {
        return;
    }
    play_or_idle(queue.previous());
}

void PlayerStateMachine::handle(const command::Seek& cmd) {
    if (!std::holds_alternative<state::Playing>(current) &&
        !std::holds_alternative<state::Paused>(current)) {
        spdlog::debug("player: seek ignored while {}", to_string(status_of(current)));
        return;
    }
    try {
        engine.seek(cmd.position);
    } catch (const NotReady& e) {
        spdlog::debug("player: seek ignored: {}", e.what());
    }
}

void PlayerStateMachine::handle(const command::Retry&) {
    if (auto* error = std::get_if<state::Error>(&current)) {
        QueueEntry entry = error->entry;
        start_loading(entry);
    }
}

void PlayerStateMachine::handle(const command::Stop&) {
    if (!std::holds_alternative<state::Idle>(current)) {
        go_idle();
    }
}

void PlayerStateMachine::handle(const command::SetVolume& cmd) {
    volume = std::clamp(cmd.volume, 0.0, 1.0);
    engine.set_volume(volume);
    dirty = true;
}

// Asynchronous results

void PlayerStateMachine::handle(StreamResolved& resolved) {
    if (resolved.generation != generation || !std::holds_alternative<state::Loading>(current)) {
        spdlog::debug("player: discarding stale stream URL (generation {})", resolved.generation);
        return;
    }
    engine.load(resolved.uri);
    if (start_paused) {
        engine.pause();
    } else {
        engine.play();
    }
}

void PlayerStateMachine::handle(StreamFailed& failed) {
    auto* loading = std::get_if<state::Loading>(&current);
    if (failed.generation != generation || !loading) {
        spdlog::debug("player: discarding stale resolve failure (generation {})", failed.generation);
        return;
    }
    QueueEntry entry = loading->entry;
    fail(entry, std::move(failed.cause));
}

void PlayerStateMachine::handle(const BackendEvent& event) {
    if (auto translated = engine.handle_backend_event(event)) {
        on_engine_event(*translated);
    }
}

void PlayerStateMachine::on_engine_event(const EngineEvent& event) {
    switch (event.type) {
    case EngineEventType::Ready:
        if (auto* loading = std::get_if<state::Loading>(&current)) {
            QueueEntry entry = loading->entry;
            if (event.value > 0.0) {
                duration = event.value;
            }
            if (start_paused) {
                transition(state::Paused{entry, 0.0});
            } else {
                engine.play();
                transition(state::Playing{entry, 0.0});
            }
        }
        break;
    case EngineEventType::DurationChanged:
        duration = event.value;
        dirty = true;
        break;
    case EngineEventType::BufferingProgress:
        buffering = event.value;
        dirty = true;
        break;
    case EngineEventType::PositionTick: {
        double position = std::max(0.0, event.value);
        if (duration) {
            position = std::min(position, *duration);
        }
        if (auto* playing = std::get_if<state::Playing>(&current)) {
            playing->position = position;
            dirty = true;
        } else if (auto* paused = std::get_if<state::Paused>(&current)) {
            paused->position = position;
            dirty = true;
        }
        break;
    }
    case EngineEventType::EndOfStream:
        if (std::holds_alternative<state::Playing>(current) ||
            std::holds_alternative<state::Paused>(current)) {
            play_or_idle(queue.advance());
        }
        break;
    case EngineEventType::Error:
        if (const QueueEntry* entry = entry_of(current)) {
            QueueEntry failed = *entry;
            ++generation;
            engine.stop();
            fail(failed, event.cause);
        }
        break;
    }
}

// Transitions

void PlayerStateMachine::start_loading(const QueueEntry& entry) {
    std::uint64_t target = ++generation;
    engine.stop();
    start_paused = false;
    duration = entry.track.duration;
    buffering = 0.0;
    transition(state::Loading{entry});
    deadline = now() + options.load_timeout;

    spdlog::info("player: loading \"{}\"", entry.track.to_string());
    Track track = entry.track;
    executor([this, target, track]() {
        Message result;
        try {
            result = StreamResolved{target, resolver.resolve_stream_uri(track)};
        } catch (const AuthExpired& e) {
            result = StreamFailed{target, {ErrorKind::AuthExpired, e.what()}};
        } catch (const NetworkError& e) {
            result = StreamFailed{target, {ErrorKind::Network, e.what()}};
        } catch (const ParseError& e) {
            result = StreamFailed{target, {ErrorKind::Parse, e.what()}};
        } catch (const StreamUnavailable& e) {
            result = StreamFailed{target, {ErrorKind::NoStream, e.what()}};
        } catch (const std::exception& e) {
            result = StreamFailed{target, {ErrorKind::Network, e.what()}};
        }
        inbox.push(std::move(result));
    });
}

void PlayerStateMachine::go_idle() {
    ++generation;
    engine.stop();
    duration.reset();
    buffering = 0.0;
    transition(state::Idle{});
}

void PlayerStateMachine::fail(const QueueEntry& entry, ErrorCause cause) {
    spdlog::warn("player: \"{}\" failed ({}): {}", entry.track.title, to_string(cause.kind),
                 cause.message);
    transition(state::Error{entry, std::move(cause)});
}

void PlayerStateMachine::play_or_idle(const std::optional<QueueEntry>& entry) {
    if (entry) {
        start_loading(*entry);
    } else {
        go_idle();
    }
}

void PlayerStateMachine::transition(PlayerState next) {
    PlayerStatus from = status_of(current);
    PlayerStatus to = status_of(next);
    current = std::move(next);
    if (to != PlayerStatus::Loading) {
        deadline.reset();
    }
    spdlog::debug("player: {} -> {}", to_string(from), to_string(to));
    dirty = true;
}

void PlayerStateMachine::publish() {
    if (!dirty) {
        return;
    }
    dirty = false;

    PlayerSnapshot snap;
    snap.state = current;
    snap.duration = duration;
    snap.has_next = queue.has_next();
    snap.has_previous = queue.has_previous();
    snap.queue_length = queue.size();
    snap.cursor = queue.cursor();
    snap.can_resume = queue.can_resume();
    snap.volume = volume;
    snap.buffering = buffering;

    std::vector<Listener> targets;
    {
        std::lock_guard<std::mutex> lock(published_mutex);
        published = snap;
        published_entries = queue.entries();
        targets = listeners;
    }

    for (const auto& listener : targets) {
        try {
            listener(snap);
        } catch (const std::exception& e) {
            spdlog::error("player: state listener failed: {}", e.what());
        }
    }
}

} // namespace camper
