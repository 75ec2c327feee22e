#include <cstdint>
#include <random>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "chunk/chunk.hpp"
#include "core/labels.hpp"
#include "core/push.hpp"
#include "core/stream.hpp"

namespace {

constexpr std::int64_t kSecond = 1'000'000'000LL;
constexpr std::int64_t kMinute = 60 * kSecond;

core::CanonicalLabels labels_of(const std::string& text) {
    core::CanonicalLabels out;
    EXPECT_TRUE(core::parse_labels(text, out).ok());
    return out;
}

chunk::ChunkFactory small_chunks(std::size_t target) {
    return chunk::make_chunk_factory(chunk::ChunkConfig{chunk::Encoding::Delta, 1024, target});
}

std::vector<core::Entry> entries(std::initializer_list<std::int64_t> ts, const std::string& line = "line") {
    std::vector<core::Entry> out;
    for (auto t : ts) {
        out.push_back(core::Entry{t, line});
    }
    return out;
}

std::size_t count_entries(const core::Stream& s) {
    std::size_t n = 0;
    EXPECT_TRUE(s.for_each_entry([&](std::int64_t, std::string_view) {
        ++n;
        return true;
    }));
    return n;
}

void expect_cut_invariant(const core::Stream& s, std::int64_t sync_period, double min_util) {
    const auto chunks = s.snapshot_chunks();
    for (std::size_t i = 0; i + 1 < chunks.size(); ++i) {
        const auto& c = *chunks[i];
        ASSERT_TRUE(c.closed()) << "only the last chunk may be open, chunk " << i;
        const auto [lo, hi] = c.bounds();
        const bool within_period = hi - lo < sync_period;
        EXPECT_TRUE(within_period || c.utilization() >= min_util)
            << "chunk " << i << " span_ns=" << (hi - lo) << " utilization=" << c.utilization();
    }
}

class StreamTest : public ::testing::Test {
protected:
    std::vector<core::Entry> random_walk(std::size_t n, std::int64_t start, std::uint32_t seed) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<std::int64_t> step(0, kSecond);
        std::vector<core::Entry> out;
        std::int64_t ts = start;
        for (std::size_t i = 0; i < n; ++i) {
            ts += step(rng);
            out.push_back(core::Entry{ts, "msg=\"request handled\" status=200 id=" + std::to_string(i)});
        }
        return out;
    }
};

TEST_F(StreamTest, SyncPeriodCutsKeepInvariant) {
    constexpr double min_util = 0.2;
    core::Stream s("test", labels_of(R"({app="sync"})"), small_chunks(16 * 1024));

    const auto batch = random_walk(1000, 1'600'000'000LL * kSecond, 42);
    for (const auto& e : batch) {
        ASSERT_TRUE(s.append(std::vector<core::Entry>{e}, kMinute, min_util).ok());
    }

    EXPECT_EQ(s.entry_count(), 1000u);
    EXPECT_EQ(count_entries(s), 1000u);
    EXPECT_GT(s.chunk_count(), 1u);
    EXPECT_GT(s.cut_counters().sync, 0u);
    expect_cut_invariant(s, kMinute, min_util);
}

TEST_F(StreamTest, LowUtilizationChunksOutliveSyncPeriod) {
    constexpr double min_util = 0.9;
    core::Stream s("test", labels_of(R"({app="sparse"})"), small_chunks(16 * 1024));

    const auto batch = random_walk(1000, 0, 7);
    ASSERT_TRUE(s.append(batch, kMinute, min_util).ok());

    const auto chunks = s.snapshot_chunks();
    ASSERT_GT(chunks.size(), 1u);
    const auto [lo, hi] = chunks.front()->bounds();
    EXPECT_GE(hi - lo, kMinute) << "first chunk should keep growing until it is 90% full";
    expect_cut_invariant(s, kMinute, min_util);
}

TEST_F(StreamTest, ZeroSyncPeriodNeverCutsOnTime) {
    core::Stream s("test", labels_of(R"({app="nocut"})"), small_chunks(1024 * 1024));
    ASSERT_TRUE(s.append(entries({0, 10 * kMinute, 100 * kMinute}), 0, 0.0).ok());
    EXPECT_EQ(s.chunk_count(), 1u);
    EXPECT_EQ(s.cut_counters().sync, 0u);
}

TEST_F(StreamTest, SpanReachingPeriodCutsWithoutUtilizationFloor) {
    core::Stream s("test", labels_of(R"({app="cut"})"), small_chunks(1024 * 1024));
    ASSERT_TRUE(s.append(entries({0, 30 * kSecond, 59 * kSecond}), kMinute, 0.0).ok());
    EXPECT_EQ(s.chunk_count(), 1u);

    ASSERT_TRUE(s.append(entries({60 * kSecond}), kMinute, 0.0).ok());
    EXPECT_EQ(s.chunk_count(), 2u);
    EXPECT_EQ(s.cut_counters().sync, 1u);
    EXPECT_EQ(s.last_cut_time(), 60 * kSecond);
    expect_cut_invariant(s, kMinute, 0.0);
}

TEST_F(StreamTest, FullChunkIsCutForCapacity) {
    core::Stream s("test", labels_of(R"({app="full"})"), small_chunks(1024));
    std::vector<core::Entry> batch;
    for (std::int64_t i = 0; i < 100; ++i) {
        batch.push_back(core::Entry{i, std::string(50, 'x')});
    }
    ASSERT_TRUE(s.append(batch, 0, 0.0).ok());
    EXPECT_GT(s.chunk_count(), 1u);
    EXPECT_GT(s.cut_counters().capacity, 0u);
    EXPECT_EQ(s.cut_counters().sync, 0u);
    EXPECT_EQ(count_entries(s), 100u);
    for (const auto& c : s.snapshot_chunks()) {
        EXPECT_LE(c->size(), 1024u);
    }
}

TEST_F(StreamTest, OversizedEntryFailsButRestIsAppended) {
    core::Stream s("test", labels_of(R"({app="big"})"), small_chunks(1024));
    std::vector<core::Entry> batch = entries({1, 2});
    batch.insert(batch.begin() + 1, core::Entry{3, std::string(4096, 'y')});

    const auto st = s.append(batch, 0, 0.0);
    EXPECT_EQ(st.code, core::ErrorCode::ChunkAppendFailure);
    EXPECT_NE(st.message.find("1 of 3"), std::string::npos) << st.message;
    EXPECT_EQ(s.entry_count(), 2u);
}

TEST_F(StreamTest, LastCutTimeIsFirstEntryOfActiveChunk) {
    core::Stream s("test", labels_of(R"({app="lct"})"), small_chunks(1024 * 1024));
    EXPECT_FALSE(s.last_cut_time().has_value());

    ASSERT_TRUE(s.append(entries({5 * kSecond, 6 * kSecond}), kMinute, 0.0).ok());
    EXPECT_EQ(s.last_cut_time(), 5 * kSecond);

    ASSERT_TRUE(s.append(entries({2 * kMinute, 2 * kMinute + kSecond}), kMinute, 0.0).ok());
    EXPECT_EQ(s.last_cut_time(), 2 * kMinute);
    EXPECT_EQ(s.highest_seen_timestamp(), 2 * kMinute + kSecond);
}

TEST_F(StreamTest, OutOfOrderAcceptedByDefault) {
    core::Stream s("test", labels_of(R"({app="ooo"})"), small_chunks(1024 * 1024));
    ASSERT_TRUE(s.append(entries({100, 50, 75}), 0, 0.0).ok());
    EXPECT_EQ(s.entry_count(), 3u);
    EXPECT_EQ(s.highest_seen_timestamp(), 100);
}

TEST_F(StreamTest, OutOfOrderRejectPolicySkipsOlderEntries) {
    core::Stream s("test", labels_of(R"({app="ooo"})"), small_chunks(1024 * 1024), core::OutOfOrderPolicy::Reject);
    const auto st = s.append(entries({100, 50, 100, 150}), 0, 0.0);
    EXPECT_EQ(st.code, core::ErrorCode::EntryOutOfOrder);
    EXPECT_NE(st.message.find("1 of 4"), std::string::npos) << st.message;
    EXPECT_EQ(s.entry_count(), 3u);

    std::vector<std::int64_t> seen;
    s.for_each_entry([&](std::int64_t ts, std::string_view) {
        seen.push_back(ts);
        return true;
    });
    EXPECT_EQ(seen, (std::vector<std::int64_t>{100, 100, 150}));
}

TEST_F(StreamTest, ClosedChunksAreHandedOffOnce) {
    core::Stream s("test", labels_of(R"({app="flush"})"), small_chunks(1024 * 1024));
    ASSERT_TRUE(s.append(entries({0, kMinute, 2 * kMinute, 3 * kMinute}), kMinute, 0.0).ok());
    ASSERT_EQ(s.chunk_count(), 4u);

    std::vector<core::ClosedChunk> out;
    EXPECT_EQ(s.collect_closed(out), 3u);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].fingerprint, s.fingerprint());
    EXPECT_EQ(out[0].labels, R"({app="flush"})");
    EXPECT_TRUE(out[0].chunk->closed());

    EXPECT_EQ(s.collect_closed(out), 0u);
    EXPECT_EQ(s.drop_handed_off(), 3u);
    EXPECT_EQ(s.chunk_count(), 1u);
    EXPECT_EQ(s.entry_count(), 1u);
}

} // namespace
