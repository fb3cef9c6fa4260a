#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <set>
#include <thread>
#include <unistd.h>
#include "fakes.hpp"
#include "storage/session_store.hpp"

using namespace camper;
using camper::testing::MemoryCredentialStorage;

namespace fs = std::filesystem;

namespace {

class FileCredentialStorageTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() /
              ("camper-session-" + std::to_string(::getpid()) + "-" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    std::string path() const { return (dir / "nested" / "session").string(); }

    fs::path dir;
};

} // namespace

TEST(SessionStoreTest, StartsLoggedOutWithoutStoredCredential) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    session.load();

    EXPECT_FALSE(session.is_valid());
    EXPECT_FALSE(session.current());
    EXPECT_EQ(session.snapshot(), nullptr);
}

TEST(SessionStoreTest, LoadsPersistedCredential) {
    MemoryCredentialStorage storage;
    storage.stored = "identity=abc";
    SessionStore session(storage);
    session.load();

    ASSERT_TRUE(session.is_valid());
    EXPECT_EQ(session.current()->blob, "identity=abc");
}

TEST(SessionStoreTest, UpdatePersistsAndBumpsRevision) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    session.load();
    auto before = session.revision();

    session.update("identity=new");

    EXPECT_TRUE(session.is_valid());
    EXPECT_GT(session.revision(), before);
    EXPECT_EQ(storage.saves, 1);
    ASSERT_TRUE(storage.stored);
    EXPECT_EQ(*storage.stored, "identity=new");
}

TEST(SessionStoreTest, EmptyCredentialIsRejected) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    EXPECT_THROW(session.update(""), std::invalid_argument);
    EXPECT_EQ(storage.saves, 0);
}

TEST(SessionStoreTest, LogoutRemovesCredential) {
    MemoryCredentialStorage storage;
    storage.stored = "identity=abc";
    SessionStore session(storage);
    session.load();

    session.logout();
    EXPECT_FALSE(session.is_valid());
    EXPECT_FALSE(storage.stored);
}

TEST(SessionStoreTest, MarkExpiredFlagsCredentialOnce) {
    MemoryCredentialStorage storage;
    storage.stored = "identity=abc";
    SessionStore session(storage);
    session.load();
    auto before = session.revision();
    auto used = session.snapshot();

    session.mark_expired(used);
    session.mark_expired(used);
    session.mark_expired(session.snapshot());

    EXPECT_FALSE(session.is_valid());
    EXPECT_EQ(storage.removes, 1);
    EXPECT_FALSE(storage.stored);
    EXPECT_EQ(session.revision(), before + 1);

    auto expired = session.current();
    ASSERT_TRUE(expired);
    EXPECT_TRUE(expired->expired);
    EXPECT_EQ(expired->blob, "identity=abc");
}

TEST(SessionStoreTest, ExpiringAReplacedCredentialKeepsTheNewOne) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    session.update("identity=old");
    auto used = session.snapshot();
    session.update("identity=fresh");

    session.mark_expired(used);

    ASSERT_TRUE(session.is_valid());
    EXPECT_EQ(session.current()->blob, "identity=fresh");
    EXPECT_EQ(storage.removes, 0);
    ASSERT_TRUE(storage.stored);
    EXPECT_EQ(*storage.stored, "identity=fresh");
}

TEST(SessionStoreTest, LoginAfterExpiryIsValidAgain) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    session.update("identity=old");
    session.mark_expired(session.snapshot());

    session.update("identity=new");
    EXPECT_TRUE(session.is_valid());
    EXPECT_FALSE(session.current()->expired);
}

TEST(SessionStoreTest, SnapshotSurvivesLaterUpdates) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    session.update("identity=first");

    auto held = session.snapshot();
    session.update("identity=second");
    session.logout();

    ASSERT_NE(held, nullptr);
    EXPECT_EQ(held->blob, "identity=first");
}

TEST(SessionStoreTest, ReadersNeverSeeAPartialCredential) {
    MemoryCredentialStorage storage;
    SessionStore session(storage);
    const std::string first(4096, 'a');
    const std::string second(4096, 'b');
    session.update(first);

    std::atomic_bool done{false};
    std::atomic_int torn{0};
    std::thread reader([&] {
        while (!done) {
            auto cred = session.snapshot();
            if (cred && cred->blob != first && cred->blob != second) {
                ++torn;
            }
        }
    });

    for (int i = 0; i < 2000; ++i) {
        session.update(i % 2 ? first : second);
    }
    done = true;
    reader.join();

    EXPECT_EQ(torn.load(), 0);
}

TEST_F(FileCredentialStorageTest, MissingFileMeansNoCredential) {
    FileCredentialStorage storage(path());
    EXPECT_FALSE(storage.load());
}

TEST_F(FileCredentialStorageTest, SavedCredentialIsOwnerOnly) {
    FileCredentialStorage storage(path());
    storage.save("identity=abc");

    ASSERT_TRUE(fs::exists(path()));
    auto perms = fs::status(path()).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);

    auto loaded = storage.load();
    ASSERT_TRUE(loaded);
    EXPECT_EQ(*loaded, "identity=abc");
}

TEST_F(FileCredentialStorageTest, TrailingNewlinesAreIgnored) {
    fs::create_directories(fs::path(path()).parent_path());
    std::ofstream(path()) << "identity=abc\r\n";

    FileCredentialStorage storage(path());
    ASSERT_TRUE(storage.load());
    EXPECT_EQ(*storage.load(), "identity=abc");
}

TEST_F(FileCredentialStorageTest, RemoveDeletesFile) {
    FileCredentialStorage storage(path());
    storage.save("identity=abc");
    storage.remove();
    EXPECT_FALSE(fs::exists(path()));
    EXPECT_FALSE(storage.load());

    // Removing twice is harmless.
    storage.remove();
}
