#pragma once

#include <functional>
#include <string>
#include "../player/state_machine.hpp"

namespace camper::control {

// Watches player snapshots for the moments the user should notice without
// looking (track change, playback failure, volume change). Runs as a player
// listener on the owner thread; the actions themselves shell out or write
// files, so they are handed to `executor`.
class PlayerNotifier {
public:
    struct Actions {
        std::function<void(const std::string& track)> now_playing;
        std::function<void(ErrorKind kind, const std::string& message)> failed;
        std::function<void(int percent)> volume_changed;
    };

    PlayerNotifier(PlayerStateMachine::Executor executor, Actions actions, int volume_percent);

    void operator()(const PlayerSnapshot& snapshot);

private:
    PlayerStateMachine::Executor executor;
    Actions actions;
    std::string announced;
    PlayerStatus last_status = PlayerStatus::Idle;
    int volume;
};

} // namespace camper::control
