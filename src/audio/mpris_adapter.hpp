#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "../player/state_machine.hpp"

namespace camper {

struct MprisMetadata {
    std::string track_id;
    std::string title;
    std::vector<std::string> artists;
    std::string album;
    std::string art_url;
    std::string url;
    std::int64_t length_us = 0;
};

// org.mpris.MediaPlayer2.Player properties derived from one snapshot.
struct MprisProperties {
    std::string playback_status = "Stopped";
    MprisMetadata metadata;
    std::int64_t position_us = 0;
    double volume = 1.0;
    bool can_play = false;
    bool can_pause = false;
    bool can_seek = false;
    bool can_go_next = false;
    bool can_go_previous = false;
};

// Translation layer between the player and the desktop media surface. It
// holds no playback logic: outbound it maps snapshots to MPRIS fields,
// inbound it turns MPRIS calls into player commands.
class MprisAdapter {
public:
    using CommandSink = std::function<void(Command)>;
    using ChangedCallback = std::function<void(const MprisProperties&, bool seeked)>;

    static constexpr const char* no_track_path = "/org/mpris/MediaPlayer2/TrackList/NoTrack";

    explicit MprisAdapter(CommandSink sink);

    static std::string track_object_path(const std::string& track_id);
    static MprisProperties map(const PlayerSnapshot& snapshot);

    // Player listener. Fires the changed callback when anything visible moved.
    void update(const PlayerSnapshot& snapshot);
    MprisProperties properties() const;
    void set_changed_callback(ChangedCallback callback);

    void play_pause();
    void play();
    void pause();
    void next();
    void previous();
    void stop();
    // Relative, microseconds. Past the end of the track behaves like next().
    void seek(std::int64_t offset_us);
    // Ignored unless `track_id` is the current track and the position fits it.
    void set_position(const std::string& track_id, std::int64_t position_us);
    void set_volume(double volume);

private:
    CommandSink sink;
    ChangedCallback changed;

    mutable std::mutex mutex;
    MprisProperties last;
    bool has_duration = false;
};

} // namespace camper
