#include "reaper.hpp"
#include "chunk_planner.hpp"
#include "test_helpers.hpp"
#include "upload_service.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <thread>

namespace shuttle {
namespace {

using namespace std::chrono_literals;
using test::MiB;

class ReaperTest : public ::testing::Test {
protected:
    ReaperTest()
        : service_(test::make_config(dir_), clock_.fn()),
          reaper_(io_context_, service_.registry(), service_.chunks(), 3600s, 24h) {}

    std::string create(const std::string& fingerprint, uint64_t size = 6 * MiB) {
        return service_.handshake(HandshakeRequest{fingerprint, size, chunk_count(size, CHUNK_SIZE), "f.bin"}).session_id;
    }

    void send_first_chunk(const std::string& id) {
        std::vector<uint8_t> payload(CHUNK_SIZE, 7);
        service_.upload_chunk(id, 0, 2, payload.data(), payload.size());
    }

    bool exists(const std::string& id) { return service_.store().find_by_id(id).has_value(); }

    test::TempDir dir_;
    test::ManualClock clock_;
    UploadService service_;
    boost::asio::io_context io_context_;
    Reaper reaper_;
};

TEST_F(ReaperTest, StaleIncompleteSessionIsRemoved) {
    auto id = create("stale");
    send_first_chunk(id);
    auto blob = service_.chunks().blob_path(id);
    ASSERT_TRUE(std::filesystem::exists(blob));

    clock_.now += 25h;
    EXPECT_EQ(reaper_.sweep_once(), 1u);
    EXPECT_FALSE(exists(id));
    EXPECT_FALSE(std::filesystem::exists(blob));
    EXPECT_TRUE(service_.store().uploaded_chunks(id).empty());

    // Gone for the client too; a new handshake starts from scratch
    auto again = service_.handshake(HandshakeRequest{"stale", 6 * MiB, 2, "f.bin"});
    EXPECT_NE(again.session_id, id);
    EXPECT_TRUE(again.uploaded_chunks.empty());
}

TEST_F(ReaperTest, RecentSessionSurvives) {
    auto id = create("recent");
    send_first_chunk(id);

    clock_.now += 1h;
    EXPECT_EQ(reaper_.sweep_once(), 0u);
    EXPECT_TRUE(exists(id));
    EXPECT_EQ(service_.store().uploaded_chunks(id), (std::vector<uint32_t>{0}));
}

TEST_F(ReaperTest, CompletedSessionSurvivesAnyAge) {
    std::vector<uint8_t> payload(1024, 3);
    auto id = create("done", payload.size());
    service_.upload_chunk(id, 0, 1, payload.data(), payload.size());
    service_.finalize(id);

    clock_.now += 24h * 365;
    EXPECT_EQ(reaper_.sweep_once(), 0u);
    EXPECT_TRUE(exists(id));
    EXPECT_TRUE(std::filesystem::exists(service_.chunks().blob_path(id)));
}

TEST_F(ReaperTest, FailedAndProcessingSessionsAreReaped) {
    auto failed = create("failed");
    auto processing = create("processing");
    ASSERT_TRUE(service_.store().compare_and_set_status(failed, SessionStatus::UPLOADING, SessionStatus::PROCESSING));
    ASSERT_TRUE(service_.store().compare_and_set_status(failed, SessionStatus::PROCESSING, SessionStatus::FAILED));
    ASSERT_TRUE(service_.store().compare_and_set_status(processing, SessionStatus::UPLOADING, SessionStatus::PROCESSING));

    clock_.now += 25h;
    EXPECT_EQ(reaper_.sweep_once(), 2u);
    EXPECT_FALSE(exists(failed));
    EXPECT_FALSE(exists(processing));
}

TEST_F(ReaperTest, SessionWithoutBlobIsReaped) {
    auto id = create("empty");
    clock_.now += 25h;
    EXPECT_EQ(reaper_.sweep_once(), 1u);
    EXPECT_FALSE(exists(id));
}

TEST_F(ReaperTest, SecondSweepIsNoOp) {
    create("a");
    create("b");
    clock_.now += 25h;
    EXPECT_EQ(reaper_.sweep_once(), 2u);
    EXPECT_EQ(reaper_.sweep_once(), 0u);
}

TEST_F(ReaperTest, OnlyOldSessionsGoInMixedSweep) {
    auto old_id = create("old");
    clock_.now += 23h;
    auto young_id = create("young");
    clock_.now += 2h;

    EXPECT_EQ(reaper_.sweep_once(), 1u);
    EXPECT_FALSE(exists(old_id));
    EXPECT_TRUE(exists(young_id));
}

TEST_F(ReaperTest, SessionCompletedAfterListingSurvives) {
    std::vector<uint8_t> payload(1024, 9);
    auto id = create("late-finish", payload.size());
    service_.upload_chunk(id, 0, 1, payload.data(), payload.size());
    clock_.now += 25h;

    auto expired = service_.store().list_expired(service_.registry().now() - 24 * 3600);
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired.front().id, id);

    // Finalize lands between the listing and the delete
    service_.finalize(id);
    ASSERT_EQ(service_.registry().get(id).status, SessionStatus::COMPLETED);

    EXPECT_FALSE(service_.store().delete_if_incomplete(id));
    EXPECT_EQ(reaper_.sweep_once(), 0u);
    EXPECT_TRUE(exists(id));
    EXPECT_TRUE(std::filesystem::exists(service_.chunks().blob_path(id)));
}

TEST_F(ReaperTest, DeleteIfIncompleteRemovesChunkRecords) {
    auto id = create("partial");
    send_first_chunk(id);
    EXPECT_TRUE(service_.store().delete_if_incomplete(id));
    EXPECT_FALSE(exists(id));
    EXPECT_TRUE(service_.store().uploaded_chunks(id).empty());
    EXPECT_FALSE(service_.store().delete_if_incomplete(id));
}

TEST(ReaperTimerTest, StopFromAnotherThreadEndsTheLoop) {
    test::TempDir dir;
    UploadService service(test::make_config(dir));
    boost::asio::io_context io_context;
    Reaper reaper(io_context, service.registry(), service.chunks(), 1s, 24h);

    reaper.start();
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
        threads.emplace_back([&io_context]() { io_context.run(); });
    }
    std::this_thread::sleep_for(50ms);

    reaper.stop();
    EXPECT_FALSE(reaper.running());
    // Once the pending wait is cancelled the io threads run out of work
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_TRUE(io_context.stopped());
}

TEST(ReaperTimerTest, TimerSweepsUntilStopped) {
    test::TempDir dir;
    test::ManualClock clock;
    UploadService service(test::make_config(dir), clock.fn());
    boost::asio::io_context io_context;
    Reaper reaper(io_context, service.registry(), service.chunks(), 1s, 24h);

    auto id = service.handshake(HandshakeRequest{"timer", 1024, 1, "t.bin"}).session_id;
    clock.now += 25h;

    reaper.start();
    EXPECT_TRUE(reaper.running());
    io_context.run_for(1500ms);
    EXPECT_FALSE(service.store().find_by_id(id).has_value());

    reaper.stop();
    EXPECT_FALSE(reaper.running());
    // The cancelled wait completes and nothing is rescheduled
    io_context.restart();
    io_context.run_for(100ms);
    EXPECT_TRUE(io_context.stopped());
}

} // namespace
} // namespace shuttle
