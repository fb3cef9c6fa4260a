#include "urls.hpp"

#include <fmt/format.h>

namespace camper::bandcamp {

const std::vector<Option>& genres() {
    static const std::vector<Option> table = {
        {"all", "All"},
        {"electronic", "Electronic"},
        {"rock", "Rock"},
        {"metal", "Metal"},
        {"alternative", "Alternative"},
        {"hip-hop-rap", "Hip-Hop/Rap"},
        {"experimental", "Experimental"},
        {"punk", "Punk"},
        {"folk", "Folk"},
        {"pop", "Pop"},
        {"ambient", "Ambient"},
        {"soundtrack", "Soundtrack"},
        {"world", "World"},
        {"jazz", "Jazz"},
        {"acoustic", "Acoustic"},
        {"funk", "Funk"},
        {"r-b-soul", "R&B/Soul"},
        {"devotional", "Devotional"},
        {"classical", "Classical"},
        {"reggae", "Reggae"},
        {"podcasts", "Podcasts"},
        {"country", "Country"},
        {"spoken-word", "Spoken Word"},
        {"comedy", "Comedy"},
        {"blues", "Blues"},
        {"kids", "Kids"},
        {"audiobooks", "Audiobooks"},
        {"latin", "Latin"},
    };
    return table;
}

const std::vector<Option>& sort_options() {
    static const std::vector<Option> table = {
        {"new", "New Arrivals"},
        {"rec", "Recommended"},
        {"top", "Best Sellers"},
    };
    return table;
}

const std::vector<Option>& format_options() {
    static const std::vector<Option> table = {
        {"all", "All Formats"},
        {"digital", "Digital"},
        {"vinyl", "Vinyl"},
        {"cd", "CD"},
        {"cassette", "Cassette"},
    };
    return table;
}

std::string art_url(std::uint64_t art_id, int format_id) {
    return fmt::format("https://f4.bcbits.com/img/a{:010}_{}.jpg", art_id, format_id);
}

std::string art_url_thumb(std::uint64_t art_id) {
    return art_url(art_id, 10);
}

std::string art_url_large(std::uint64_t art_id) {
    return art_url(art_id, 5);
}

std::string item_page_url(const std::string& subdomain, const std::string& item_type,
                          const std::string& slug) {
    const char* type_path = (item_type == "t" || item_type == "track") ? "track" : "album";
    return fmt::format("https://{}.bandcamp.com/{}/{}", subdomain, type_path, slug);
}

std::string browser_url(const Album& album) {
    return album.id;
}

// Tracks fetched from an album page only know their album; that is the
// closest page the catalog has for them.
std::string browser_url(const Track& track) {
    return track.album_id;
}

std::string browser_url(const Artist& artist) {
    return artist.profile_url;
}

std::string browser_url(const CatalogItem& item) {
    return item.id;
}

std::string browser_url(const LibraryEntry& entry) {
    if (const auto* track = std::get_if<Track>(&entry.item)) {
        return browser_url(*track);
    }
    return entry.id();
}

std::string browser_url(const QueueEntry& entry) {
    return origin_album_id(entry);
}

} // namespace camper::bandcamp
