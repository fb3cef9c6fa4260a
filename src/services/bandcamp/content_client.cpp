#include "content_client.hpp"

#include <chrono>
#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <spdlog/spdlog.h>
#include "../../common/errors.hpp"
#include "parsers.hpp"

namespace camper::bandcamp {

namespace {

std::string to_json(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return buffer.GetString();
}

HttpRequest json_post(std::string url, const rapidjson::Document& body) {
    HttpRequest request;
    request.method = "POST";
    request.url = std::move(url);
    request.body = to_json(body);
    request.headers.push_back("Content-Type: application/json");
    return request;
}

} // namespace

const char* search_filter_code(SearchFilter filter) {
    switch (filter) {
    case SearchFilter::All: return "";
    case SearchFilter::Albums: return "a";
    case SearchFilter::Tracks: return "t";
    case SearchFilter::Artists: return "b";
    }
    return "";
}

ContentClient::ContentClient(HttpTransport& transport, SessionStore& session, ClientOptions options)
    : transport(transport), session(session), options(std::move(options)) {}

std::string ContentClient::api_url(const std::string& path) const {
    return options.base_url + path;
}

HttpResponse ContentClient::send(HttpRequest request) {
    return send(std::move(request), session.snapshot());
}

HttpResponse ContentClient::send(HttpRequest request,
                                 const std::shared_ptr<const SessionCredential>& credential) {
    if (credential && credential->is_valid()) {
        request.headers.push_back("Cookie: " + credential->blob);
    }

    HttpResponse response = transport.perform(request);

    if (response.status == 401 || response.status == 403) {
        spdlog::warn("{} rejected the session (HTTP {})", request.url, response.status);
        session.mark_expired(credential);
        throw AuthExpired(fmt::format("session rejected (HTTP {})", response.status));
    }
    if (response.status < 200 || response.status >= 300) {
        spdlog::warn("{} answered HTTP {}", request.url, response.status);
        throw NetworkError(fmt::format("HTTP {} from {}", response.status, request.url),
                           response.status);
    }
    return response;
}

FanInfo ContentClient::fan() {
    std::lock_guard<std::mutex> lock(fan_mutex);
    std::uint64_t revision = session.revision();
    if (cached_fan && fan_revision == revision) {
        return *cached_fan;
    }
    auto credential = session.snapshot();
    if (!credential || !credential->is_valid()) {
        throw AuthExpired("not logged in");
    }

    HttpRequest request;
    request.url = api_url("/api/fan/2/collection_summary");
    HttpResponse response = send(request, credential);

    rapidjson::Document doc = parse_json(response.body, "collection_summary");
    try {
        cached_fan = parse_collection_summary(doc);
    } catch (const AuthExpired&) {
        session.mark_expired(credential);
        throw;
    }
    fan_revision = revision;
    spdlog::info("Logged in as {} (fan {})", cached_fan->username, cached_fan->fan_id);
    return *cached_fan;
}

std::optional<std::uint64_t> ContentClient::cached_fan_id() {
    std::lock_guard<std::mutex> lock(fan_mutex);
    if (cached_fan && fan_revision == session.revision()) {
        return cached_fan->fan_id;
    }
    return std::nullopt;
}

Page<SearchResult> ContentClient::search(const std::string& query, SearchFilter filter, int page) {
    if (page > 0 || query.empty()) {
        return {};
    }

    rapidjson::Document body;
    body.SetObject();
    auto& allocator = body.GetAllocator();
    body.AddMember("search_text", rapidjson::Value(query.c_str(), allocator), allocator);
    body.AddMember("search_filter", rapidjson::Value(search_filter_code(filter), allocator), allocator);
    body.AddMember("full_page", true, allocator);
    if (auto fan_id = cached_fan_id()) {
        body.AddMember("fan_id", *fan_id, allocator);
    }

    HttpResponse response =
        send(json_post(api_url("/api/bcsearch_public_api/1/autocomplete_elastic"), body));
    rapidjson::Document doc = parse_json(response.body, "search");

    auto auto_it = doc.FindMember("auto");
    if (auto_it == doc.MemberEnd() || !auto_it->value.IsObject() ||
        !auto_it->value.HasMember("results")) {
        throw ParseError("search: response without auto.results");
    }

    Page<SearchResult> result =
        parse_records<SearchResult>(auto_it->value["results"], "search", parse_search_result);
    spdlog::debug("search \"{}\": {} results, {} skipped", query, result.items.size(), result.skipped);
    return result;
}

Page<DiscoveryItem> ContentClient::discover(const DiscoverQuery& query, int page) {
    HttpRequest request;
    request.url = api_url(fmt::format("/api/discover/3/get_web?g={}&t={}&s={}&f={}&p={}&w=0&lo=0",
                                      CurlTransport::url_encode(query.genre),
                                      CurlTransport::url_encode(query.tag),
                                      CurlTransport::url_encode(query.sort),
                                      CurlTransport::url_encode(query.format), page));
    HttpResponse response = send(request);
    rapidjson::Document doc = parse_json(response.body, "discover");

    if (!doc.HasMember("items")) {
        throw ParseError("discover: response without items");
    }
    Page<DiscoveryItem> result = parse_records<DiscoveryItem>(doc["items"], "discover", parse_discover_item);
    if (!doc["items"].Empty()) {
        result.next_cursor = std::to_string(page + 1);
    }
    spdlog::debug("discover {}/{}/{} page {}: {} items, {} skipped", query.genre, query.sort,
                  query.format, page, result.items.size(), result.skipped);
    return result;
}

Page<LibraryEntry> ContentClient::library(LibraryKind kind, const std::string& cursor) {
    FanInfo info = fan();

    std::string token = cursor;
    if (token.empty()) {
        auto now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch());
        token = fmt::format("{}::a::", now.count());
    }

    rapidjson::Document body;
    body.SetObject();
    auto& allocator = body.GetAllocator();
    body.AddMember("fan_id", info.fan_id, allocator);
    body.AddMember("older_than_token", rapidjson::Value(token.c_str(), allocator), allocator);
    body.AddMember("count", options.page_size, allocator);

    const char* path = kind == LibraryKind::Purchased ? "/api/fancollection/1/collection_items"
                                                      : "/api/fancollection/1/wishlist_items";
    HttpResponse response = send(json_post(api_url(path), body));
    rapidjson::Document doc = parse_json(response.body, "library");

    if (!doc.HasMember("items")) {
        throw ParseError("library: response without items");
    }
    AcquisitionKind acquisition =
        kind == LibraryKind::Purchased ? AcquisitionKind::Purchased : AcquisitionKind::Wishlisted;
    Page<LibraryEntry> result = parse_records<LibraryEntry>(
        doc["items"], "library", [acquisition](const rapidjson::Value& record) {
            return parse_collection_item(record, acquisition);
        });

    bool more = doc.HasMember("more_available") && doc["more_available"].IsBool() &&
                doc["more_available"].GetBool();
    if (more && doc.HasMember("last_token") && doc["last_token"].IsString()) {
        result.next_cursor = doc["last_token"].GetString();
    }
    return result;
}

Album ContentClient::resolve_album(const std::string& album_id) {
    if (album_id.rfind("http", 0) != 0) {
        throw ParseError("not a release page: \"" + album_id + "\"");
    }

    HttpRequest request;
    request.url = album_id;
    request.headers.push_back("Accept: text/html");
    HttpResponse response = send(request);

    Album album = parse_album_page(response.body, album_id);
    spdlog::debug("Resolved {} ({} tracks)", album_id, album.tracks.size());
    return album;
}

std::string ContentClient::resolve_stream_uri(const Track& track) {
    Album album = resolve_album(track.album_id);

    const Track* match = nullptr;
    for (const auto& candidate : album.tracks) {
        if (candidate.id == track.id) {
            match = &candidate;
            break;
        }
    }
    if (!match && track.track_number > 0) {
        for (const auto& candidate : album.tracks) {
            if (candidate.track_number == track.track_number) {
                match = &candidate;
                break;
            }
        }
    }

    if (!match) {
        throw StreamUnavailable("track " + track.id + " is no longer on " + track.album_id);
    }
    if (!match->stream_url) {
        throw StreamUnavailable("no stream offered for \"" + track.title + "\"");
    }
    return *match->stream_url;
}

PagedQuery<SearchResult> ContentClient::search_pages(const std::string& query, SearchFilter filter) {
    return PagedQuery<SearchResult>(
        [this, query, filter](const std::string& cursor) {
            return search(query, filter, std::stoi(cursor));
        },
        "0");
}

PagedQuery<DiscoveryItem> ContentClient::discover_pages(const DiscoverQuery& query) {
    return PagedQuery<DiscoveryItem>(
        [this, query](const std::string& cursor) {
            return discover(query, std::stoi(cursor));
        },
        "0");
}

PagedQuery<LibraryEntry> ContentClient::library_pages(LibraryKind kind) {
    return PagedQuery<LibraryEntry>(
        [this, kind](const std::string& cursor) { return library(kind, cursor); });
}

} // namespace camper::bandcamp
