#include <gtest/gtest.h>

#include <rapidjson/document.h>
#include "fakes.hpp"
#include "services/bandcamp/content_client.hpp"

using namespace camper;
using namespace camper::bandcamp;
using namespace camper::testing;

namespace {

const char* summary_path = "/api/fan/2/collection_summary";
const char* search_path = "/api/bcsearch_public_api/1/autocomplete_elastic";
const char* discover_path = "/api/discover/3/get_web";
const char* collection_path = "/api/fancollection/1/collection_items";
const char* wishlist_path = "/api/fancollection/1/wishlist_items";
const char* release_url = "https://band.bandcamp.com/album/night-drive";

std::string release_page(const std::string& stream_token) {
    return "<div data-tralbum=\"{&quot;id&quot;:1,&quot;current&quot;:{&quot;title&quot;:&quot;Night Drive&quot;,"
           "&quot;artist&quot;:&quot;Band&quot;},&quot;trackinfo&quot;:["
           "{&quot;track_id&quot;:11,&quot;title&quot;:&quot;One&quot;,&quot;track_num&quot;:1,"
           "&quot;file&quot;:{&quot;mp3-128&quot;:&quot;https://t4.bcbits.com/stream/11?" + stream_token +
           "&quot;}},"
           "{&quot;track_id&quot;:12,&quot;title&quot;:&quot;Two&quot;,&quot;track_num&quot;:2}"
           "]}\"></div>";
}

class ContentClientTest : public ::testing::Test {
protected:
    ContentClientTest() : session(storage), client(transport, session) {}

    void log_in() {
        storage.stored = "identity=abc; js_logged_in=1";
        session.load();
        transport.respond(summary_path, 200, R"({"collection_summary":{"fan_id":4242,"username":"fan"}})");
    }

    rapidjson::Document request_body(std::size_t index) const {
        rapidjson::Document doc;
        doc.Parse(transport.requests.at(index).body.c_str());
        return doc;
    }

    FakeTransport transport;
    MemoryCredentialStorage storage;
    SessionStore session;
    ContentClient client;
};

} // namespace

TEST_F(ContentClientTest, AttachesSessionCookieWhenLoggedIn) {
    log_in();
    transport.respond(discover_path, 200, R"({"items":[]})");

    client.discover(DiscoverQuery{});

    ASSERT_EQ(transport.requests.size(), 1u);
    auto cookie = transport.header(0, "Cookie");
    ASSERT_TRUE(cookie);
    EXPECT_EQ(*cookie, "identity=abc; js_logged_in=1");
}

TEST_F(ContentClientTest, AnonymousRequestsCarryNoCookie) {
    transport.respond(discover_path, 200, R"({"items":[]})");
    client.discover(DiscoverQuery{});
    EXPECT_FALSE(transport.header(0, "Cookie"));
}

TEST_F(ContentClientTest, RejectedCookieExpiresSession) {
    log_in();
    transport.respond(discover_path, 401, "unauthorized");

    EXPECT_THROW(client.discover(DiscoverQuery{}), AuthExpired);
    EXPECT_FALSE(session.is_valid());
    EXPECT_EQ(storage.removes, 1);
    EXPECT_FALSE(storage.stored);
}

TEST_F(ContentClientTest, LateRejectionKeepsNewerLogin) {
    log_in();
    transport.respond(discover_path, 401, "unauthorized");
    transport.on_request = [this](const HttpRequest&) { session.update("identity=fresh"); };

    EXPECT_THROW(client.discover(DiscoverQuery{}), AuthExpired);

    ASSERT_TRUE(session.is_valid());
    EXPECT_EQ(session.current()->blob, "identity=fresh");
    EXPECT_EQ(storage.removes, 0);
    ASSERT_TRUE(storage.stored);
    EXPECT_EQ(*storage.stored, "identity=fresh");
}

TEST_F(ContentClientTest, ForbiddenIsTreatedAsExpiredToo) {
    log_in();
    transport.respond(wishlist_path, 403, "");
    EXPECT_THROW(client.library(LibraryKind::Wishlist), AuthExpired);
    EXPECT_FALSE(session.is_valid());
}

TEST_F(ContentClientTest, ServerErrorIsNetworkErrorWithStatus) {
    transport.respond(discover_path, 503, "busy");
    try {
        client.discover(DiscoverQuery{});
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_EQ(e.status(), 503);
    }
}

TEST_F(ContentClientTest, TransportFailurePropagates) {
    transport.unreachable = true;
    EXPECT_THROW(client.search("drone", SearchFilter::All), NetworkError);
}

TEST_F(ContentClientTest, UnreadableEnvelopeIsParseError) {
    transport.respond(search_path, 200, "<html>oops</html>");
    EXPECT_THROW(client.search("drone", SearchFilter::All), ParseError);

    transport.routes.clear();
    transport.respond(search_path, 200, R"({"auto":{}})");
    EXPECT_THROW(client.search("drone", SearchFilter::All), ParseError);
}

TEST_F(ContentClientTest, SearchPostsQueryAndSkipsBadRecords) {
    transport.respond(search_path, 200, R"({"auto":{"results":[
        {"type":"a","name":"First","band_name":"A","item_url_path":"https://a.bandcamp.com/album/first"},
        {"type":"a"},
        {"type":"b","name":"Second","item_url_root":"https://b.bandcamp.com"}
    ]}})");

    auto page = client.search("night drive", SearchFilter::Albums);

    ASSERT_EQ(page.items.size(), 2u);
    EXPECT_EQ(page.skipped, 1u);
    EXPECT_EQ(page.items[0].title, "First");
    EXPECT_EQ(page.items[1].title, "Second");
    EXPECT_FALSE(page.next_cursor);

    ASSERT_EQ(transport.requests.size(), 1u);
    EXPECT_EQ(transport.requests[0].method, "POST");
    auto body = request_body(0);
    EXPECT_STREQ(body["search_text"].GetString(), "night drive");
    EXPECT_STREQ(body["search_filter"].GetString(), "a");
    EXPECT_FALSE(body.HasMember("fan_id"));
}

TEST_F(ContentClientTest, SearchBeyondFirstPageIsEmptyWithoutRequest) {
    auto page = client.search("drone", SearchFilter::All, 1);
    EXPECT_TRUE(page.items.empty());
    EXPECT_TRUE(client.search("", SearchFilter::All).items.empty());
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(ContentClientTest, DiscoverPagesArriveInRequestOrder) {
    transport.respond("&p=0&", 200, R"({"items":[
        {"primary_text":"A","url_hints":{"subdomain":"a","slug":"x"}},
        {"primary_text":"B","url_hints":{"subdomain":"b","slug":"y"}}]})");
    transport.respond("&p=1&", 200, R"({"items":[
        {"primary_text":"C","url_hints":{"subdomain":"c","slug":"z","item_type":"t"}}]})");
    transport.respond("&p=2&", 200, R"({"items":[]})");

    DiscoverQuery query;
    query.genre = "electronic";
    query.sort = "top";
    auto pages = client.discover_pages(query);

    std::vector<std::string> titles;
    while (pages.has_more()) {
        for (const auto& item : pages.next_page().items) {
            titles.push_back(item.title);
        }
    }

    EXPECT_EQ(titles, (std::vector<std::string>{"A", "B", "C"}));
    EXPECT_EQ(pages.pages_fetched(), 3u);
    EXPECT_NE(transport.requests[0].url.find("g=electronic"), std::string::npos);
    EXPECT_NE(transport.requests[0].url.find("s=top"), std::string::npos);
}

TEST_F(ContentClientTest, FailedPageCanBeRequestedAgain) {
    transport.respond(discover_path, 500, "");
    auto pages = client.discover_pages(DiscoverQuery{});
    EXPECT_THROW(pages.next_page(), NetworkError);
    EXPECT_TRUE(pages.has_more());

    transport.routes.clear();
    transport.respond(discover_path, 200, R"({"items":[]})");
    EXPECT_TRUE(pages.next_page().items.empty());
    EXPECT_FALSE(pages.has_more());
}

TEST_F(ContentClientTest, LibraryRequiresLogin) {
    EXPECT_THROW(client.library(LibraryKind::Purchased), AuthExpired);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(ContentClientTest, LibraryFollowsOlderThanTokens) {
    log_in();
    transport.respond(collection_path, 200, R"({"more_available":true,"last_token":"1600000000:11:a::",
        "items":[{"item_type":"album","item_id":11,"item_title":"LP","band_name":"Band",
                  "item_url":"https://band.bandcamp.com/album/lp","purchased":"29 Oct 2021 18:13:27 GMT"}]})");

    auto page = client.library(LibraryKind::Purchased);

    ASSERT_EQ(page.items.size(), 1u);
    EXPECT_EQ(page.items[0].acquisition, AcquisitionKind::Purchased);
    ASSERT_TRUE(page.next_cursor);
    EXPECT_EQ(*page.next_cursor, "1600000000:11:a::");

    // Request 0 is the collection summary.
    ASSERT_EQ(transport.requests.size(), 2u);
    auto body = request_body(1);
    EXPECT_EQ(body["fan_id"].GetUint64(), 4242u);
    std::string first_token = body["older_than_token"].GetString();
    EXPECT_NE(first_token.find("::a::"), std::string::npos);

    client.library(LibraryKind::Purchased, *page.next_cursor);
    ASSERT_EQ(transport.requests.size(), 3u);
    EXPECT_STREQ(request_body(2)["older_than_token"].GetString(), "1600000000:11:a::");
}

TEST_F(ContentClientTest, LibraryEndsWhenNothingMoreIsAvailable) {
    log_in();
    transport.respond(wishlist_path, 200, R"({"more_available":false,"last_token":"x","items":[]})");

    auto pages = client.library_pages(LibraryKind::Wishlist);
    auto page = pages.next_page();
    EXPECT_TRUE(page.items.empty());
    EXPECT_FALSE(pages.has_more());
}

TEST_F(ContentClientTest, FanIsCachedPerSession) {
    log_in();
    EXPECT_EQ(client.fan().fan_id, 4242u);
    EXPECT_EQ(client.fan().fan_id, 4242u);
    EXPECT_EQ(transport.requests.size(), 1u);

    session.update("identity=other");
    client.fan();
    EXPECT_EQ(transport.requests.size(), 2u);
}

TEST_F(ContentClientTest, SearchIncludesKnownFanId) {
    log_in();
    client.fan();
    transport.respond(search_path, 200, R"({"auto":{"results":[]}})");

    client.search("drone", SearchFilter::All);
    auto body = request_body(1);
    ASSERT_TRUE(body.HasMember("fan_id"));
    EXPECT_EQ(body["fan_id"].GetUint64(), 4242u);
}

TEST_F(ContentClientTest, SummaryWithoutFanExpiresSession) {
    storage.stored = "identity=stale";
    session.load();
    transport.respond(summary_path, 200, R"({"error":"not logged in"})");

    EXPECT_THROW(client.fan(), AuthExpired);
    EXPECT_FALSE(session.is_valid());
}

TEST_F(ContentClientTest, ResolvedAlbumTracksPointBackToAlbum) {
    transport.respond(release_url, 200, release_page("token=a"));

    Album album = client.resolve_album(release_url);
    ASSERT_EQ(album.tracks.size(), 2u);
    EXPECT_EQ(album.title, "Night Drive");

    auto entries = make_queue_entries(album, OriginKind::Search);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(origin_album_id(entries[1]), release_url);
    EXPECT_EQ(entries[1].track.album_id, release_url);
    EXPECT_EQ(entries[1].origin.label, "Night Drive");
}

TEST_F(ContentClientTest, ResolveAlbumRejectsNonPageIds) {
    EXPECT_THROW(client.resolve_album("12345"), ParseError);
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(ContentClientTest, StreamUriIsFetchedFreshEachTime) {
    transport.respond(release_url, 200, release_page("token=first"));
    Track track = make_track("11", release_url, 1);

    EXPECT_EQ(client.resolve_stream_uri(track), "https://t4.bcbits.com/stream/11?token=first");

    transport.routes.clear();
    transport.respond(release_url, 200, release_page("token=second"));
    EXPECT_EQ(client.resolve_stream_uri(track), "https://t4.bcbits.com/stream/11?token=second");
    EXPECT_EQ(transport.requests.size(), 2u);
}

TEST_F(ContentClientTest, TrackWithoutStreamIsUnavailable) {
    transport.respond(release_url, 200, release_page("token=a"));

    EXPECT_THROW(client.resolve_stream_uri(make_track("12", release_url, 2)), StreamUnavailable);
    EXPECT_THROW(client.resolve_stream_uri(make_track("99", release_url, 0)), StreamUnavailable);
}

TEST_F(ContentClientTest, TrackIsMatchedByNumberWhenIdChanged) {
    transport.respond(release_url, 200, release_page("token=a"));
    EXPECT_EQ(client.resolve_stream_uri(make_track("https://band.bandcamp.com/track/one", release_url, 1)),
              "https://t4.bcbits.com/stream/11?token=a");
}
