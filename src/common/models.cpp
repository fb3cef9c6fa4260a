#include "common/models.hpp"

namespace camper {

const char* to_string(EntityKind kind) {
    switch (kind) {
    case EntityKind::Album: return "album";
    case EntityKind::Track: return "track";
    case EntityKind::Artist: return "artist";
    }
    return "unknown";
}

const char* to_string(AcquisitionKind kind) {
    return kind == AcquisitionKind::Purchased ? "purchased" : "wishlist";
}

const char* to_string(OriginKind kind) {
    switch (kind) {
    case OriginKind::Album: return "album";
    case OriginKind::Search: return "search";
    case OriginKind::Discover: return "discover";
    case OriginKind::Library: return "library";
    }
    return "unknown";
}

const std::string& LibraryEntry::id() const {
    if (const auto* album = std::get_if<Album>(&item)) {
        return album->id;
    }
    return std::get<Track>(item).id;
}

const std::string& LibraryEntry::title() const {
    if (const auto* album = std::get_if<Album>(&item)) {
        return album->title;
    }
    return std::get<Track>(item).title;
}

const std::string& LibraryEntry::artist() const {
    if (const auto* album = std::get_if<Album>(&item)) {
        return album->artist_name;
    }
    return std::get<Track>(item).artist;
}

EntityKind LibraryEntry::kind() const {
    return std::holds_alternative<Album>(item) ? EntityKind::Album : EntityKind::Track;
}

std::vector<QueueEntry> make_queue_entries(const Album& album, OriginKind origin_kind) {
    std::vector<QueueEntry> entries;
    entries.reserve(album.tracks.size());
    for (const auto& track : album.tracks) {
        QueueEntry entry;
        entry.track = track;
        entry.origin.kind = origin_kind;
        entry.origin.album_id = album.id;
        entry.origin.label = album.title;
        entries.push_back(std::move(entry));
    }
    return entries;
}

const std::string& origin_album_id(const QueueEntry& entry) {
    if (!entry.origin.album_id.empty()) {
        return entry.origin.album_id;
    }
    return entry.track.album_id;
}

} // namespace camper
