#include <chrono>
#include <cstdint>
#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "chunk/chunk.hpp"
#include "core/ingester.hpp"
#include "core/limits.hpp"
#include "core/ring_count.hpp"
#include "ingest/push_workers.hpp"

namespace {

constexpr auto kWaitInterval = std::chrono::milliseconds(5);
constexpr auto kMaxWait = std::chrono::seconds(5);

ingest::PushTask make_task(const std::string& tenant, const std::string& labels, std::int64_t ts) {
    ingest::PushTask task;
    task.tenant = tenant;
    task.request.streams.push_back(core::StreamPush{labels, {core::Entry{ts, "line"}, core::Entry{ts + 1, "line"}}});
    return task;
}

template <typename Pred>
bool wait_until(Pred pred) {
    const auto deadline = std::chrono::steady_clock::now() + kMaxWait;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(kWaitInterval);
    }
    return true;
}

class PushWorkerPoolTest : public ::testing::Test {
protected:
    PushWorkerPoolTest() : limits_(core::Limits{3}), ring_(1), ingester_(cfg_, limits_, ring_) {}

    core::IngesterConfig cfg_{};
    core::Overrides limits_;
    core::StaticReplicaCount ring_;
    core::Ingester ingester_;
};

TEST_F(PushWorkerPoolTest, ZeroWorkersThrows) {
    EXPECT_THROW({ ingest::PushWorkerPool pool(ingester_, 0); }, std::invalid_argument);
}

TEST_F(PushWorkerPoolTest, TasksReachTheIngester) {
    ingest::PushWorkerPool pool(ingester_, 2);
    EXPECT_EQ(pool.worker_count(), 2u);
    pool.start();

    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(pool.submit(make_task("tenant-" + std::to_string(i % 2), R"({app="w"})", i * 10)));
    }
    ASSERT_TRUE(wait_until([&] { return pool.stats().completed() == 10; }));
    pool.stop();

    const auto stats = pool.stats();
    EXPECT_EQ(stats.submitted, 10u);
    EXPECT_EQ(stats.dropped, 0u);
    EXPECT_EQ(stats.pushed, 10u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.entries, 20u);
    EXPECT_EQ(ingester_.tenant_count(), 2u);

    core::Stream* s = nullptr;
    ASSERT_TRUE(ingester_.get_or_create_stream("tenant-0", R"({app="w"})", s).ok());
    EXPECT_EQ(s->entry_count(), 10u);
}

TEST_F(PushWorkerPoolTest, FailuresAreCountedByCode) {
    ingest::PushWorkerPool pool(ingester_, 1);
    pool.start();

    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(pool.submit(make_task("acme", "{app=\"s" + std::to_string(i) + "\"}", 0)));
    }
    ASSERT_TRUE(pool.submit(make_task("acme", "not a label set", 0)));
    ASSERT_TRUE(pool.submit(make_task("", R"({app="s0"})", 0)));
    ASSERT_TRUE(wait_until([&] { return pool.stats().completed() == 6; }));
    pool.stop();

    const auto stats = pool.stats();
    EXPECT_EQ(stats.pushed, 3u);
    EXPECT_EQ(stats.failed, 3u);
    EXPECT_EQ(stats.failures(core::ErrorCode::StreamLimitExceeded), 1u);
    EXPECT_EQ(stats.failures(core::ErrorCode::InvalidLabelSet), 1u);
    EXPECT_EQ(stats.failures(core::ErrorCode::InvalidArgument), 1u);
}

TEST_F(PushWorkerPoolTest, ThrownPushIsCountedAsInternal) {
    core::Ingester failing(cfg_, limits_, ring_, []() -> std::unique_ptr<chunk::Chunk> { throw std::bad_alloc(); });
    ingest::PushWorkerPool pool(failing, 1);
    pool.start();

    ASSERT_TRUE(pool.submit(make_task("acme", R"({app="oom"})", 0)));
    ASSERT_TRUE(pool.submit(make_task("acme", "not a label set", 0)));
    ASSERT_TRUE(wait_until([&] { return pool.stats().completed() == 2; }));
    pool.stop();

    const auto stats = pool.stats();
    EXPECT_EQ(stats.failed, 2u);
    EXPECT_EQ(stats.failures(core::ErrorCode::Internal), 1u);
    EXPECT_EQ(stats.failures(core::ErrorCode::InvalidLabelSet), 1u);
    EXPECT_EQ(stats.failures(core::ErrorCode::ChunkAppendFailure), 0u);
    EXPECT_STREQ(core::error_code_name(core::ErrorCode::Internal), "Internal");

    // No half-built stream is left behind.
    auto inst = failing.find_instance("acme");
    ASSERT_NE(inst, nullptr);
    EXPECT_EQ(inst->stream_count(), 0u);
}

TEST_F(PushWorkerPoolTest, FullRingDropsAndStopDrains) {
    ingest::PushWorkerPool pool(ingester_, 1);
    // Not started: the ring fills up and nothing is consumed.
    const std::size_t capacity = ingest::PushRing::capacity() - 1;
    for (std::size_t i = 0; i < capacity; ++i) {
        ASSERT_TRUE(pool.submit(make_task("acme", R"({app="q"})", static_cast<std::int64_t>(i) * 2)));
    }
    EXPECT_FALSE(pool.submit(make_task("acme", R"({app="q"})", 0)));

    auto stats = pool.stats();
    EXPECT_EQ(stats.submitted, capacity + 1);
    EXPECT_EQ(stats.dropped, 1u);
    EXPECT_EQ(stats.completed(), 0u);

    pool.start();
    pool.stop();
    stats = pool.stats();
    EXPECT_EQ(stats.pushed, capacity);

    core::Stream* s = nullptr;
    ASSERT_TRUE(ingester_.get_or_create_stream("acme", R"({app="q"})", s).ok());
    EXPECT_EQ(s->entry_count(), capacity * 2);
}

TEST_F(PushWorkerPoolTest, StopIsIdempotent) {
    ingest::PushWorkerPool pool(ingester_, 3);
    pool.stop();
    pool.start();
    pool.start();
    pool.stop();
    pool.stop();
    EXPECT_EQ(pool.stats().submitted, 0u);
}

} // namespace
