// =============================================================================
// pdf-shrink - Session Janitor Tests
// =============================================================================

#include "pds/session/session_janitor.h"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>

#include "test_support.h"

namespace pds::session {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;
using test::makeBytes;

class SessionJanitorTest : public test::TempDirTest {
protected:
    void SetUp() override {
        test::TempDirTest::SetUp();
        store_ = std::make_unique<ChunkStore>(uploadRoot());
        janitor_ = std::make_unique<SessionJanitor>(*store_, locks_);
    }

    void TearDown() override {
        janitor_.reset();
        store_.reset();
        test::TempDirTest::TearDown();
    }

    /// @brief A session directory no ChunkStore knows about.
    fs::path makeOrphan(std::string_view fileName) {
        const fs::path dir = uploadRoot() / makeSessionId(fileName);
        fs::create_directories(dir);
        std::ofstream(dir / chunkFileName(0)) << "left over";
        return dir;
    }

    std::unique_ptr<ChunkStore> store_;
    SessionLocks locks_;
    std::unique_ptr<SessionJanitor> janitor_;
};

TEST_F(SessionJanitorTest, CleanupRemovesDirectoryAndRegistration) {
    (void)store_->storeChunk("a.pdf", 0, 2, makeBytes(10));
    (void)store_->storeChunk("a.pdf", 1, 2, makeBytes(10));
    const fs::path dir = store_->sessionDirectory(makeSessionId("a.pdf"));
    ASSERT_TRUE(fs::exists(dir));

    auto report = janitor_->cleanup("a.pdf");
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.wasRegistered);
    EXPECT_EQ(report.removedEntries, 3u);
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_FALSE(store_->session("a.pdf").has_value());
}

TEST_F(SessionJanitorTest, CleanupIsIdempotent) {
    (void)store_->storeChunk("a.pdf", 0, 1, makeBytes(10));
    EXPECT_TRUE(janitor_->cleanup("a.pdf").ok());

    auto second = janitor_->cleanup("a.pdf");
    EXPECT_TRUE(second.ok());
    EXPECT_FALSE(second.wasRegistered);
    EXPECT_EQ(second.removedEntries, 0u);

    EXPECT_TRUE(janitor_->cleanup("never-uploaded.pdf").ok());
}

TEST_F(SessionJanitorTest, CleanupLeavesOtherSessionsAlone) {
    (void)store_->storeChunk("a.pdf", 0, 1, makeBytes(10));
    (void)store_->storeChunk("b.pdf", 0, 1, makeBytes(10));

    (void)janitor_->cleanup("a.pdf");
    EXPECT_TRUE(store_->isComplete("b.pdf", 1));
}

TEST_F(SessionJanitorTest, PurgeOrphansKeepsRegisteredAndForeignEntries) {
    (void)store_->storeChunk("live.pdf", 0, 1, makeBytes(10));
    const fs::path orphan = makeOrphan("crashed.pdf");
    fs::create_directories(uploadRoot() / "engine");
    std::ofstream(uploadRoot() / "README") << "not a session";

    EXPECT_EQ(janitor_->purgeOrphans(), 1u);
    EXPECT_FALSE(fs::exists(orphan));
    EXPECT_TRUE(store_->isComplete("live.pdf", 1));
    EXPECT_TRUE(fs::exists(uploadRoot() / "engine"));
    EXPECT_TRUE(fs::exists(uploadRoot() / "README"));
}

TEST_F(SessionJanitorTest, PurgeOrphansHonorsMinimumAge) {
    const fs::path orphan = makeOrphan("recent.pdf");
    EXPECT_EQ(janitor_->purgeOrphans(1h), 0u);
    EXPECT_TRUE(fs::exists(orphan));

    fs::last_write_time(orphan, fs::file_time_type::clock::now() - 2h);
    EXPECT_EQ(janitor_->purgeOrphans(1h), 1u);
    EXPECT_FALSE(fs::exists(orphan));
}

TEST_F(SessionJanitorTest, PurgeOrphansSkipsLockedDirectories) {
    const fs::path orphan = makeOrphan("busy.pdf");
    auto guard = locks_.lockShared(makeSessionId("busy.pdf"));

    EXPECT_EQ(janitor_->purgeOrphans(), 0u);
    EXPECT_TRUE(fs::exists(orphan));
}

TEST_F(SessionJanitorTest, SweepExpiredRemovesOnlyOldIdleSessions) {
    (void)store_->storeChunk("old.pdf", 0, 2, makeBytes(10));
    (void)store_->storeChunk("busy.pdf", 0, 2, makeBytes(10));

    const auto later = std::chrono::system_clock::now() + 2h;

    auto guard = locks_.lockShared(makeSessionId("busy.pdf"));
    EXPECT_EQ(janitor_->sweepExpired(1h, later), 1u);
    EXPECT_FALSE(store_->session("old.pdf").has_value());
    EXPECT_TRUE(store_->session("busy.pdf").has_value());

    EXPECT_EQ(janitor_->sweepExpired(1h), 0u);
    EXPECT_TRUE(store_->session("busy.pdf").has_value());

    guard.unlock();
    EXPECT_EQ(janitor_->sweepExpired(1h, later), 1u);
    EXPECT_TRUE(store_->sessions().empty());
}

}  // namespace
}  // namespace pds::session
