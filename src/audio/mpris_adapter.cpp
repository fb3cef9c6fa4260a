#include "mpris_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>
#include "../services/bandcamp/urls.hpp"

namespace camper {

namespace {

constexpr std::int64_t seek_jump_us = 3'000'000;

std::int64_t to_us(double seconds) {
    return static_cast<std::int64_t>(seconds * 1'000'000.0);
}

bool same_visible_state(const MprisProperties& a, const MprisProperties& b) {
    return a.playback_status == b.playback_status && a.metadata.track_id == b.metadata.track_id &&
           a.metadata.length_us == b.metadata.length_us && a.volume == b.volume &&
           a.can_play == b.can_play && a.can_pause == b.can_pause && a.can_seek == b.can_seek &&
           a.can_go_next == b.can_go_next && a.can_go_previous == b.can_go_previous;
}

} // namespace

MprisAdapter::MprisAdapter(CommandSink sink) : sink(std::move(sink)) {}

std::string MprisAdapter::track_object_path(const std::string& track_id) {
    if (track_id.empty()) {
        return no_track_path;
    }
    std::string path = "/org/camper/track/";
    for (char c : track_id) {
        path += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
    }
    return path;
}

MprisProperties MprisAdapter::map(const PlayerSnapshot& snapshot) {
    MprisProperties props;
    PlayerStatus status = snapshot.status();

    switch (status) {
    case PlayerStatus::Playing:
    case PlayerStatus::Loading:
        props.playback_status = "Playing";
        break;
    case PlayerStatus::Paused:
        props.playback_status = "Paused";
        break;
    case PlayerStatus::Idle:
    case PlayerStatus::Error:
        props.playback_status = "Stopped";
        break;
    }

    if (const QueueEntry* entry = entry_of(snapshot.state)) {
        const Track& track = entry->track;
        props.metadata.track_id = track_object_path(track.id);
        props.metadata.title = track.title;
        if (!track.artist.empty()) {
            props.metadata.artists.push_back(track.artist);
        }
        props.metadata.album = track.album_title;
        props.metadata.art_url = track.art_url;
        props.metadata.url = bandcamp::browser_url(*entry);
        if (snapshot.duration) {
            props.metadata.length_us = to_us(*snapshot.duration);
        }
    } else {
        props.metadata.track_id = no_track_path;
    }

    props.position_us = to_us(position_of(snapshot.state));
    props.volume = snapshot.volume;

    bool active = status != PlayerStatus::Idle;
    props.can_play = active || snapshot.can_resume;
    props.can_pause = status == PlayerStatus::Playing || status == PlayerStatus::Loading;
    props.can_seek = status == PlayerStatus::Playing || status == PlayerStatus::Paused;
    props.can_go_next = active && snapshot.has_next;
    props.can_go_previous = active && snapshot.has_previous;
    return props;
}

void MprisAdapter::update(const PlayerSnapshot& snapshot) {
    MprisProperties next = map(snapshot);
    bool seeked = false;
    bool visible_change = false;
    ChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (next.can_seek && last.can_seek && next.metadata.track_id == last.metadata.track_id) {
            std::int64_t delta = next.position_us - last.position_us;
            seeked = delta < 0 || delta > seek_jump_us;
        }
        visible_change = !same_visible_state(last, next);
        last = next;
        has_duration = snapshot.duration.has_value();
        callback = changed;
    }
    if (callback && (visible_change || seeked)) {
        callback(next, seeked);
    }
}

MprisProperties MprisAdapter::properties() const {
    std::lock_guard<std::mutex> lock(mutex);
    return last;
}

void MprisAdapter::set_changed_callback(ChangedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex);
    changed = std::move(callback);
}

void MprisAdapter::play_pause() { sink(command::TogglePlayPause{}); }
void MprisAdapter::play() { sink(command::Play{}); }
void MprisAdapter::pause() { sink(command::Pause{}); }
void MprisAdapter::next() { sink(command::Next{}); }
void MprisAdapter::previous() { sink(command::Previous{}); }
void MprisAdapter::stop() { sink(command::Stop{}); }

void MprisAdapter::seek(std::int64_t offset_us) {
    MprisProperties props = properties();
    if (!props.can_seek) {
        return;
    }
    std::int64_t target = std::max<std::int64_t>(0, props.position_us + offset_us);
    bool known_length;
    {
        std::lock_guard<std::mutex> lock(mutex);
        known_length = has_duration;
    }
    if (known_length && target > props.metadata.length_us) {
        sink(command::Next{});
        return;
    }
    sink(command::Seek{static_cast<double>(target) / 1'000'000.0});
}

void MprisAdapter::set_position(const std::string& track_id, std::int64_t position_us) {
    MprisProperties props = properties();
    if (!props.can_seek || track_id != props.metadata.track_id) {
        spdlog::debug("mpris: SetPosition for stale track {} ignored", track_id);
        return;
    }
    if (position_us < 0 || (props.metadata.length_us > 0 && position_us > props.metadata.length_us)) {
        return;
    }
    sink(command::Seek{static_cast<double>(position_us) / 1'000'000.0});
}

void MprisAdapter::set_volume(double volume) {
    sink(command::SetVolume{std::clamp(volume, 0.0, 1.0)});
}

} // namespace camper
