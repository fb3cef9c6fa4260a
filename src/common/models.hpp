#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace camper {

enum class EntityKind { Album, Track, Artist };

const char* to_string(EntityKind kind);

struct Artist {
    std::string id;
    std::string name;
    std::string profile_url;
};

struct Track {
    std::string id;
    std::string title;
    std::string artist;
    // Identifier (page URL) of the release this track was fetched from.
    std::string album_id;
    std::string album_title;
    std::string art_url;
    std::optional<double> duration;
    // Tokenized stream URL; expires, so it is re-resolved on every (re)start.
    std::optional<std::string> stream_url;
    int track_number = 0;

    // Convert to display string for menus and notifications
    std::string to_string() const {
        return title + " - " + artist;
    }
};

struct Album {
    std::string id;
    std::optional<std::uint64_t> catalog_id;
    std::string title;
    std::string artist_id;
    std::string artist_name;
    std::string art_url;
    std::string genre;
    std::vector<std::string> tags;
    std::string format;
    std::string release_date;
    std::vector<Track> tracks;
};

// Thin projection of a search hit or discovery feed entry. Resolved to a full
// Album only when the user selects it.
struct CatalogItem {
    std::string id;
    std::string title;
    std::string artist;
    std::string art_url;
    std::string genre;
    EntityKind kind = EntityKind::Album;
};

using SearchResult = CatalogItem;
using DiscoveryItem = CatalogItem;

enum class AcquisitionKind { Purchased, Wishlisted };

const char* to_string(AcquisitionKind kind);

struct LibraryEntry {
    AcquisitionKind acquisition = AcquisitionKind::Purchased;
    std::optional<std::chrono::system_clock::time_point> acquired_at;
    std::variant<Album, Track> item;

    const std::string& id() const;
    const std::string& title() const;
    const std::string& artist() const;
    EntityKind kind() const;
};

enum class OriginKind { Album, Search, Discover, Library };

const char* to_string(OriginKind kind);

// Where a queued track came from. Only used for display and "open in
// browser", never for playback decisions.
struct QueueOrigin {
    OriginKind kind = OriginKind::Album;
    std::string album_id;
    std::string label;
};

struct QueueEntry {
    Track track;
    QueueOrigin origin;
};

std::vector<QueueEntry> make_queue_entries(const Album& album, OriginKind origin_kind);

const std::string& origin_album_id(const QueueEntry& entry);

struct FanInfo {
    std::uint64_t fan_id = 0;
    std::string username;
};

} // namespace camper
