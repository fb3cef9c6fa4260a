#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include "../common/errors.hpp"
#include "../common/models.hpp"

namespace camper {

namespace state {

struct Idle {};

struct Loading {
    QueueEntry entry;
};

struct Playing {
    QueueEntry entry;
    double position = 0.0;
};

struct Paused {
    QueueEntry entry;
    double position = 0.0;
};

struct Error {
    QueueEntry entry;
    ErrorCause cause;
};

} // namespace state

using PlayerState = std::variant<state::Idle, state::Loading, state::Playing, state::Paused, state::Error>;

enum class PlayerStatus { Idle, Loading, Playing, Paused, Error };

const char* to_string(PlayerStatus status);

PlayerStatus status_of(const PlayerState& state);
// None for Idle.
const QueueEntry* entry_of(const PlayerState& state);
// Zero unless Playing or Paused.
double position_of(const PlayerState& state);

// What subscribers observe: the authoritative state plus queue bounds.
struct PlayerSnapshot {
    PlayerState state = state::Idle{};
    std::optional<double> duration;
    bool has_next = false;
    bool has_previous = false;
    std::size_t queue_length = 0;
    long cursor = -1;
    // Play from Idle would start something.
    bool can_resume = false;
    double volume = 1.0;
    double buffering = 0.0;

    PlayerStatus status() const { return status_of(state); }
};

} // namespace camper
