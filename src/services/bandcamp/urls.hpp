#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "../../common/models.hpp"

namespace camper::bandcamp {

struct Option {
    const char* slug;
    const char* label;
};

const std::vector<Option>& genres();
const std::vector<Option>& sort_options();
const std::vector<Option>& format_options();

// Image URL for an art id. Format 10 = 350px (grid thumbnails),
// format 5 = 700px (player art).
std::string art_url(std::uint64_t art_id, int format_id);
std::string art_url_thumb(std::uint64_t art_id);
std::string art_url_large(std::uint64_t art_id);

// https://<subdomain>.bandcamp.com/<album|track>/<slug>
std::string item_page_url(const std::string& subdomain, const std::string& item_type,
                          const std::string& slug);

// Page to open for an entity in the user's browser.
std::string browser_url(const Album& album);
std::string browser_url(const Track& track);
std::string browser_url(const Artist& artist);
std::string browser_url(const CatalogItem& item);
std::string browser_url(const LibraryEntry& entry);
std::string browser_url(const QueueEntry& entry);

} // namespace camper::bandcamp
