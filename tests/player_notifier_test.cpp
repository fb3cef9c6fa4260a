#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "control/player_notifier.hpp"
#include "fakes.hpp"

using namespace camper;
using namespace camper::testing;
using camper::control::PlayerNotifier;

namespace {

PlayerSnapshot snapshot_of(PlayerState state, double volume = 1.0) {
    PlayerSnapshot snapshot;
    snapshot.state = std::move(state);
    snapshot.volume = volume;
    return snapshot;
}

class PlayerNotifierTest : public ::testing::Test {
protected:
    PlayerNotifierTest()
        : notifier(desktop.executor(),
                   PlayerNotifier::Actions{
                       [this](const std::string& track) { banners.push_back(track); },
                       [this](ErrorKind kind, const std::string&) { failures.push_back(kind); },
                       [this](int percent) { volumes.push_back(percent); }},
                   100) {}

    ManualExecutor desktop;
    PlayerNotifier notifier;
    std::vector<std::string> banners;
    std::vector<ErrorKind> failures;
    std::vector<int> volumes;
};

} // namespace

TEST_F(PlayerNotifierTest, ActionsWaitForTheExecutor) {
    notifier(snapshot_of(state::Playing{make_entry("1"), 0.0}, 0.5));

    EXPECT_TRUE(banners.empty());
    EXPECT_TRUE(volumes.empty());
    EXPECT_EQ(desktop.jobs.size(), 2u);

    desktop.run_all();
    ASSERT_EQ(banners.size(), 1u);
    EXPECT_EQ(banners[0], make_entry("1").track.to_string());
    EXPECT_EQ(volumes, std::vector<int>{50});
}

TEST_F(PlayerNotifierTest, EachTrackIsAnnouncedOnce) {
    auto entry = make_entry("1");
    notifier(snapshot_of(state::Playing{entry, 1.0}));
    notifier(snapshot_of(state::Playing{entry, 2.0}));
    notifier(snapshot_of(state::Paused{entry, 2.0}));
    notifier(snapshot_of(state::Playing{entry, 2.0}));
    notifier(snapshot_of(state::Playing{make_entry("2"), 0.0}));
    desktop.run_all();

    EXPECT_EQ(banners.size(), 2u);
    EXPECT_TRUE(volumes.empty());
}

TEST_F(PlayerNotifierTest, OnlyNetworkAndAuthFailuresRaiseBanners) {
    auto entry = make_entry("1");
    notifier(snapshot_of(state::Error{entry, {ErrorKind::Network, "down"}}));
    notifier(snapshot_of(state::Error{entry, {ErrorKind::Network, "down"}}));
    notifier(snapshot_of(state::Loading{entry}));
    notifier(snapshot_of(state::Error{entry, {ErrorKind::Decode, "bad frame"}}));
    notifier(snapshot_of(state::Loading{entry}));
    notifier(snapshot_of(state::Error{entry, {ErrorKind::AuthExpired, "401"}}));
    desktop.run_all();

    EXPECT_EQ(failures, (std::vector<ErrorKind>{ErrorKind::Network, ErrorKind::AuthExpired}));
}

TEST(PlayerNotifierListenerTest, PositionTicksDoNotRepeatTheBanner) {
    FakeBackend backend;
    FakeResolver resolver;
    PlaybackEngine engine(backend);
    PlayerStateMachine player(engine, resolver, inline_executor());
    backend.set_event_sink([&player](const BackendEvent& event) { player.post_backend_event(event); });

    ManualExecutor desktop;
    std::vector<std::string> banners;
    auto notifier = std::make_shared<PlayerNotifier>(
        desktop.executor(),
        PlayerNotifier::Actions{[&banners](const std::string& track) { banners.push_back(track); }, nullptr,
                                nullptr},
        100);
    player.subscribe([notifier](const PlayerSnapshot& snapshot) { (*notifier)(snapshot); });

    player.post(command::ReplaceQueue{make_entries(1), 0});
    player.process_pending();
    backend.emit(BackendEventType::Loaded);
    backend.emit(BackendEventType::Position, 1.0);
    backend.emit(BackendEventType::Position, 2.0);
    player.process_pending();
    ASSERT_EQ(player.snapshot().status(), PlayerStatus::Playing);

    desktop.run_all();
    EXPECT_EQ(banners.size(), 1u);
}
