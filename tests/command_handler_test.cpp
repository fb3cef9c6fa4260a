#include <gtest/gtest.h>

#include <rapidjson/document.h>
#include <string>
#include <vector>
#include "control/command_handler.hpp"
#include "fakes.hpp"

using namespace camper;
using namespace camper::testing;
using camper::control::CommandHandler;

namespace {

const char* search_path = "/api/bcsearch_public_api/1/autocomplete_elastic";
const char* discover_path = "/api/discover/3/get_web";
const char* summary_path = "/api/fan/2/collection_summary";
const char* release_url = "https://band.bandcamp.com/album/night-drive";

const char* search_body = R"({"auto":{"results":[
    {"type":"a","name":"Night Drive","band_name":"Band","item_url_path":"https://band.bandcamp.com/album/night-drive"},
    {"type":"b","name":"Band","item_url_root":"https://band.bandcamp.com"}
]}})";

const char* release_page =
    "<div data-tralbum=\"{&quot;current&quot;:{&quot;title&quot;:&quot;Night Drive&quot;,&quot;artist&quot;:&quot;Band&quot;},"
    "&quot;trackinfo&quot;:["
    "{&quot;track_id&quot;:11,&quot;title&quot;:&quot;One&quot;,&quot;file&quot;:{&quot;mp3-128&quot;:&quot;https://t4/11&quot;}},"
    "{&quot;track_id&quot;:12,&quot;title&quot;:&quot;Two&quot;,&quot;file&quot;:{&quot;mp3-128&quot;:&quot;https://t4/12&quot;}},"
    "{&quot;track_id&quot;:13,&quot;title&quot;:&quot;Three&quot;,&quot;file&quot;:{&quot;mp3-128&quot;:&quot;https://t4/13&quot;}}"
    "]}\"></div>";

class CommandHandlerTest : public ::testing::Test {
protected:
    CommandHandlerTest()
        : session(storage),
          client(transport, session),
          engine(backend),
          player(engine, resolver, inline_executor()),
          handler(client, player, session) {
        backend.set_event_sink([this](const BackendEvent& event) { player.post_backend_event(event); });
        handler.set_notifier([this](ErrorKind kind, const std::string&) { notified.push_back(kind); });
        handler.set_url_opener([this](const std::string& url) { opened.push_back(url); });
        transport.respond(search_path, 200, search_body);
        transport.respond(release_url, 200, release_page);
    }

    // Runs a command, applies whatever it posted, and returns the parsed reply.
    rapidjson::Document run(const std::string& line) {
        std::string out = handler.execute(line);
        player.process_pending();
        rapidjson::Document doc;
        doc.Parse(out.c_str());
        EXPECT_FALSE(doc.HasParseError()) << out;
        return doc;
    }

    // Listings carry no "success" member; only errors set it to false.
    static bool ok(const rapidjson::Document& doc) {
        return doc.IsObject() && (!doc.HasMember("success") || doc["success"].GetBool());
    }

    static std::string kind(const rapidjson::Document& doc) {
        return doc.HasMember("kind") ? doc["kind"].GetString() : "";
    }

    void open_album() {
        ASSERT_TRUE(ok(run("search night drive")));
        ASSERT_TRUE(ok(run("album 0")));
    }

    FakeTransport transport;
    MemoryCredentialStorage storage;
    SessionStore session;
    bandcamp::ContentClient client;
    FakeBackend backend;
    FakeResolver resolver;
    PlaybackEngine engine;
    PlayerStateMachine player;
    CommandHandler handler;
    std::vector<ErrorKind> notified;
    std::vector<std::string> opened;
};

} // namespace

TEST_F(CommandHandlerTest, UnknownCommandIsAUsageError) {
    auto reply = run("dance");
    EXPECT_FALSE(ok(reply));
    EXPECT_EQ(kind(reply), "usage");
}

TEST_F(CommandHandlerTest, SearchListsIndexedResults) {
    auto reply = run("search --albums night drive");
    ASSERT_TRUE(ok(reply));
    ASSERT_EQ(reply["count"].GetUint64(), 2u);
    EXPECT_EQ(reply["results"][1]["index"].GetUint64(), 1u);
    EXPECT_STREQ(reply["results"][1]["kind"].GetString(), "artist");
    EXPECT_FALSE(reply["more"].GetBool());
    EXPECT_NE(transport.requests[0].body.find("\"search_filter\":\"a\""), std::string::npos);
}

TEST_F(CommandHandlerTest, SearchNeedsAQuery) {
    EXPECT_EQ(kind(run("search")), "usage");
    EXPECT_EQ(kind(run("search --albums")), "usage");
    EXPECT_EQ(kind(run("search --labels x")), "usage");
    EXPECT_TRUE(transport.requests.empty());
}

TEST_F(CommandHandlerTest, MoreWithoutListingIsAUsageError) {
    EXPECT_EQ(kind(run("more")), "usage");
}

TEST_F(CommandHandlerTest, MoreAfterLastPageIsEmpty) {
    run("search night drive");
    auto reply = run("more");
    ASSERT_TRUE(ok(reply));
    EXPECT_EQ(reply["count"].GetUint64(), 0u);
    EXPECT_EQ(transport.requests.size(), 1u);
}

TEST_F(CommandHandlerTest, AlbumResolvesListedRelease) {
    run("search night drive");
    auto reply = run("album 0");
    ASSERT_TRUE(ok(reply));
    EXPECT_STREQ(reply["title"].GetString(), "Night Drive");
    ASSERT_EQ(reply["tracks"].Size(), 3u);
    EXPECT_TRUE(reply["tracks"][0]["streamable"].GetBool());
}

TEST_F(CommandHandlerTest, AlbumRejectsArtistsAndBadIndexes) {
    run("search night drive");
    EXPECT_EQ(kind(run("album 1")), "usage");
    EXPECT_EQ(kind(run("album 7")), "usage");
    EXPECT_EQ(kind(run("album one")), "usage");
}

TEST_F(CommandHandlerTest, PlayStartsAlbumAtTrack) {
    open_album();
    ASSERT_TRUE(ok(run("play 1")));

    auto snapshot = player.snapshot();
    EXPECT_EQ(snapshot.status(), PlayerStatus::Loading);
    EXPECT_EQ(snapshot.queue_length, 3u);
    const QueueEntry* entry = entry_of(snapshot.state);
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->track.id, "12");
    EXPECT_EQ(entry->origin.kind, OriginKind::Search);
    EXPECT_EQ(origin_album_id(*entry), release_url);
    EXPECT_EQ(resolver.calls_for("12"), 1u);
}

TEST_F(CommandHandlerTest, PlayWithoutAlbumIsAUsageError) {
    EXPECT_EQ(kind(run("play 0")), "usage");
    // Bare play resumes instead.
    EXPECT_TRUE(ok(run("play")));
}

TEST_F(CommandHandlerTest, EnqueueNextLandsAfterCurrent) {
    open_album();
    run("play 0");
    ASSERT_TRUE(ok(run("enqueue next 2")));
    ASSERT_TRUE(ok(run("enqueue 0")));

    auto entries = player.queue_entries();
    ASSERT_EQ(entries.size(), 5u);
    EXPECT_EQ(entries[1].track.id, "13");
    EXPECT_EQ(entries[4].track.id, "11");
}

TEST_F(CommandHandlerTest, QueueCommandsValidateIndexes) {
    open_album();
    run("play 0");
    EXPECT_EQ(kind(run("jump 3")), "usage");
    EXPECT_EQ(kind(run("remove 9")), "usage");

    ASSERT_TRUE(ok(run("jump 2")));
    EXPECT_EQ(player.snapshot().cursor, 2);

    auto queue = run("queue");
    EXPECT_EQ(queue["count"].GetUint64(), 3u);
    EXPECT_TRUE(queue["queue"][2]["current"].GetBool());
}

TEST_F(CommandHandlerTest, VolumeMustBeAPercentage) {
    EXPECT_EQ(kind(run("volume 150")), "usage");
    EXPECT_EQ(kind(run("volume loud")), "usage");

    ASSERT_TRUE(ok(run("volume 40")));
    EXPECT_DOUBLE_EQ(player.snapshot().volume, 0.4);
    EXPECT_EQ(backend.volume, 40);
}

TEST_F(CommandHandlerTest, SeekNeedsAPosition) {
    EXPECT_EQ(kind(run("seek")), "usage");
    EXPECT_EQ(kind(run("seek -4")), "usage");
}

TEST_F(CommandHandlerTest, StatusReportsPlayerState) {
    auto idle = run("status");
    EXPECT_STREQ(idle["status"].GetString(), "idle");
    EXPECT_EQ(idle["cursor"].GetInt64(), -1);

    open_album();
    run("play 0");
    backend.emit(BackendEventType::Loaded);
    player.process_pending();

    auto playing = run("status");
    EXPECT_STREQ(playing["status"].GetString(), "playing");
    EXPECT_STREQ(playing["track"]["title"].GetString(), "One");
}

TEST_F(CommandHandlerTest, LibraryWhileLoggedOutAsksForLogin) {
    auto reply = run("library");
    EXPECT_FALSE(ok(reply));
    EXPECT_EQ(kind(reply), "auth_expired");
    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0], ErrorKind::AuthExpired);
}

TEST_F(CommandHandlerTest, NetworkFailuresAreReportedAndNotified) {
    transport.respond(discover_path, 502, "bad gateway");
    auto reply = run("discover electronic");
    EXPECT_EQ(kind(reply), "network");
    ASSERT_EQ(notified.size(), 1u);
    EXPECT_EQ(notified[0], ErrorKind::Network);
}

TEST_F(CommandHandlerTest, ParseFailuresAreReportedQuietly) {
    transport.respond(discover_path, 200, "not json");
    EXPECT_EQ(kind(run("discover")), "parse");
    EXPECT_TRUE(notified.empty());
}

TEST_F(CommandHandlerTest, DiscoverPassesFilters) {
    transport.respond(discover_path, 200, R"({"items":[]})");
    ASSERT_TRUE(ok(run("discover rock top vinyl tag=shoegaze")));
    const std::string& url = transport.requests.back().url;
    EXPECT_NE(url.find("g=rock"), std::string::npos);
    EXPECT_NE(url.find("s=top"), std::string::npos);
    EXPECT_NE(url.find("f=vinyl"), std::string::npos);
    EXPECT_NE(url.find("t=shoegaze"), std::string::npos);
}

TEST_F(CommandHandlerTest, OpenUsesListingThenCurrentTrack) {
    EXPECT_EQ(kind(run("open")), "usage");

    run("search night drive");
    auto listed = run("open 1");
    EXPECT_STREQ(listed["url"].GetString(), "https://band.bandcamp.com");

    run("album 0");
    run("play 2");
    auto current = run("open");
    EXPECT_STREQ(current["url"].GetString(), release_url);
    EXPECT_EQ(opened, (std::vector<std::string>{"https://band.bandcamp.com", release_url}));
}

TEST_F(CommandHandlerTest, LoginStoresCredentialAndIdentifiesFan) {
    transport.respond(summary_path, 200, R"({"collection_summary":{"fan_id":7,"username":"listener"}})");
    auto reply = run("login identity=abc; js_logged_in=1");
    ASSERT_TRUE(ok(reply));
    EXPECT_STREQ(reply["message"].GetString(), "Logged in as listener");
    ASSERT_TRUE(storage.stored);
    EXPECT_EQ(*storage.stored, "identity=abc; js_logged_in=1");

    ASSERT_TRUE(ok(run("logout")));
    EXPECT_FALSE(session.is_valid());
}

TEST_F(CommandHandlerTest, GenresListsBrowseOptions) {
    auto reply = run("genres");
    ASSERT_TRUE(reply["genres"].IsArray());
    EXPECT_GT(reply["genres"].Size(), 0u);
    EXPECT_GT(reply["sorts"].Size(), 0u);
    EXPECT_GT(reply["formats"].Size(), 0u);
}

TEST_F(CommandHandlerTest, QuitIsRemembered) {
    EXPECT_FALSE(handler.quit_requested());
    EXPECT_TRUE(ok(run("quit")));
    EXPECT_TRUE(handler.quit_requested());
}
