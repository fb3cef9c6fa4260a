#include "player_notifier.hpp"

#include <utility>
#include <variant>

namespace camper::control {

PlayerNotifier::PlayerNotifier(PlayerStateMachine::Executor executor, Actions actions,
                               int volume_percent)
    : executor(std::move(executor)), actions(std::move(actions)), volume(volume_percent) {}

void PlayerNotifier::operator()(const PlayerSnapshot& snapshot) {
    if (const auto* playing = std::get_if<state::Playing>(&snapshot.state)) {
        if (playing->entry.track.id != announced) {
            announced = playing->entry.track.id;
            if (actions.now_playing) {
                executor([action = actions.now_playing, track = playing->entry.track.to_string()] {
                    action(track);
                });
            }
        }
    } else if (const auto* error = std::get_if<state::Error>(&snapshot.state)) {
        ErrorKind kind = error->cause.kind;
        bool worth_a_banner = kind == ErrorKind::AuthExpired || kind == ErrorKind::Network;
        if (last_status != PlayerStatus::Error && worth_a_banner && actions.failed) {
            executor([action = actions.failed, kind, message = error->cause.message] {
                action(kind, message);
            });
        }
        announced.clear();
    }
    last_status = snapshot.status();

    int percent = static_cast<int>(snapshot.volume * 100.0 + 0.5);
    if (percent != volume) {
        volume = percent;
        if (actions.volume_changed) {
            executor([action = actions.volume_changed, percent] { action(percent); });
        }
    }
}

} // namespace camper::control
