#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "../../common/models.hpp"
#include "../../storage/session_store.hpp"
#include "http.hpp"
#include "paged_query.hpp"

namespace camper {

// Looks up a fresh stream URL for a track. Stream URLs are tokenized and
// short-lived, so callers ask again every time a track (re)starts.
class StreamResolver {
public:
    virtual ~StreamResolver() = default;
    virtual std::string resolve_stream_uri(const Track& track) = 0;
};

namespace bandcamp {

enum class SearchFilter { All, Albums, Tracks, Artists };

const char* search_filter_code(SearchFilter filter);

struct DiscoverQuery {
    std::string genre = "all";
    std::string tag;
    std::string sort = "new";
    std::string format = "all";
};

enum class LibraryKind { Purchased, Wishlist };

struct ClientOptions {
    std::string base_url = "https://bandcamp.com";
    int page_size = 50;
};

// Authenticated access to the catalog. Every call attaches the current
// session cookie; a rejected cookie surfaces as AuthExpired (and clears the
// session), transport trouble as NetworkError, an unreadable envelope as
// ParseError. Single malformed records never fail a page.
class ContentClient : public StreamResolver {
public:
    ContentClient(HttpTransport& transport, SessionStore& session, ClientOptions options = {});

    FanInfo fan();

    // The catalog answers a search with one page; page > 0 is empty.
    Page<SearchResult> search(const std::string& query, SearchFilter filter, int page = 0);
    Page<DiscoveryItem> discover(const DiscoverQuery& query, int page = 0);
    // Empty cursor starts from the most recent acquisition.
    Page<LibraryEntry> library(LibraryKind kind, const std::string& cursor = "");

    Album resolve_album(const std::string& album_id);
    std::string resolve_stream_uri(const Track& track) override;

    PagedQuery<SearchResult> search_pages(const std::string& query, SearchFilter filter);
    PagedQuery<DiscoveryItem> discover_pages(const DiscoverQuery& query);
    PagedQuery<LibraryEntry> library_pages(LibraryKind kind);

private:
    HttpResponse send(HttpRequest request);
    // Attaches `credential` (when valid); a 401/403 expires exactly that one.
    HttpResponse send(HttpRequest request, const std::shared_ptr<const SessionCredential>& credential);
    std::string api_url(const std::string& path) const;
    std::optional<std::uint64_t> cached_fan_id();

    HttpTransport& transport;
    SessionStore& session;
    ClientOptions options;

    std::mutex fan_mutex;
    std::optional<FanInfo> cached_fan;
    std::uint64_t fan_revision = 0;
};

} // namespace bandcamp
} // namespace camper
