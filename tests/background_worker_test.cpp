#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "core/background_worker.hpp"
#include "core/message_queue.hpp"
#include "fakes.hpp"

using namespace camper;
using namespace camper::testing;
using namespace std::chrono_literals;

namespace {

template <typename Predicate>
bool wait_until(Predicate done, std::chrono::milliseconds limit = 2000ms) {
    auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return done();
}

} // namespace

TEST(MessageQueueTest, DeliversInPushOrder) {
    MessageQueue<int> queue;
    queue.push(1);
    queue.push(2);
    queue.push(3);

    EXPECT_EQ(queue.try_pop(), 1);
    EXPECT_EQ(queue.pop_for(10ms), 2);
    EXPECT_EQ(queue.try_pop(), 3);
    EXPECT_FALSE(queue.try_pop());
}

TEST(MessageQueueTest, ClosedQueueRejectsPushesAndWakesWaiters) {
    MessageQueue<int> queue;
    std::thread closer([&queue] {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(queue.pop_for(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
    closer.join();

    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(7));
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BackgroundWorkerTest, RunsJobsInSubmissionOrder) {
    std::vector<int> seen;
    {
        BackgroundWorker worker("test");
        for (int i = 0; i < 50; ++i) {
            worker.post([&seen, i] { seen.push_back(i); });
        }
    }
    ASSERT_EQ(seen.size(), 50u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(seen[i], i);
    }
}

TEST(BackgroundWorkerTest, FailingJobDoesNotStopTheWorker) {
    std::atomic_int done{0};
    BackgroundWorker worker("test");
    worker.post([] { throw std::runtime_error("boom"); });
    worker.post([&done] { ++done; });
    EXPECT_TRUE(wait_until([&done] { return done.load() == 1; }));
}

TEST(BackgroundWorkerTest, OwnerLoopAppliesCommandsFromOtherThreads) {
    FakeBackend backend;
    FakeResolver resolver;
    PlaybackEngine engine(backend);
    auto worker = std::make_unique<BackgroundWorker>("resolver");
    PlayerStateMachine player(engine, resolver,
                              [&worker](std::function<void()> job) { worker->post(std::move(job)); });
    backend.set_event_sink([&player](const BackendEvent& event) { player.post_backend_event(event); });

    std::thread owner([&player] { player.run(); });

    player.post(command::ReplaceQueue{make_entries(2), 0});
    EXPECT_TRUE(wait_until([&player] { return player.snapshot().status() == PlayerStatus::Loading; }));

    player.shutdown();
    owner.join();
    // Draining the worker guarantees the resolution job ran.
    worker.reset();

    EXPECT_EQ(resolver.calls.size(), 1u);
    EXPECT_EQ(player.snapshot().queue_length, 2u);
}
