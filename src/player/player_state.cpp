#include "player_state.hpp"

namespace camper {

const char* to_string(PlayerStatus status) {
    switch (status) {
    case PlayerStatus::Idle: return "idle";
    case PlayerStatus::Loading: return "loading";
    case PlayerStatus::Playing: return "playing";
    case PlayerStatus::Paused: return "paused";
    case PlayerStatus::Error: return "error";
    }
    return "unknown";
}

PlayerStatus status_of(const PlayerState& state) {
    return static_cast<PlayerStatus>(state.index());
}

const QueueEntry* entry_of(const PlayerState& state) {
    if (auto* s = std::get_if<state::Loading>(&state)) return &s->entry;
    if (auto* s = std::get_if<state::Playing>(&state)) return &s->entry;
    if (auto* s = std::get_if<state::Paused>(&state)) return &s->entry;
    if (auto* s = std::get_if<state::Error>(&state)) return &s->entry;
    return nullptr;
}

double position_of(const PlayerState& state) {
    if (auto* s = std::get_if<state::Playing>(&state)) return s->position;
    if (auto* s = std::get_if<state::Paused>(&state)) return s->position;
    return 0.0;
}

} // namespace camper
