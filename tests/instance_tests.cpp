#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chunk/chunk.hpp"
#include "core/context.hpp"
#include "core/instance.hpp"
#include "core/labels.hpp"
#include "core/limiter.hpp"
#include "core/limits.hpp"
#include "core/push.hpp"
#include "core/ring_count.hpp"
#include "util/async_log.hpp"
#include "util/clock.hpp"

namespace {

constexpr std::int64_t kSecond = 1'000'000'000LL;

std::vector<core::Entry> make_entries(std::size_t n, std::int64_t start, const std::string& prefix = "line") {
    std::vector<core::Entry> out;
    out.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(core::Entry{start + static_cast<std::int64_t>(i) * kSecond, prefix + "-" + std::to_string(i)});
    }
    return out;
}

core::Fingerprint fingerprint_of(const std::string& labels) {
    core::CanonicalLabels canon;
    EXPECT_TRUE(core::parse_labels(labels, canon).ok());
    return canon.fingerprint;
}

class ManualClock final : public util::SteadyClock {
public:
    time_point now() const noexcept override { return now_; }
    void advance(std::chrono::nanoseconds d) noexcept { now_ += d; }

private:
    time_point now_{std::chrono::seconds(1000)};
};

class InstanceTest : public ::testing::Test {
protected:
    InstanceTest() : limits_(core::Limits{1000}), ring_(1), limiter_(limits_, ring_, 1) {
        cfg_.sync_period_ns = 60 * kSecond;
        cfg_.sync_min_utilization = 0.2;
        cfg_.chunk = chunk::ChunkConfig{chunk::Encoding::Delta, 512, 64 * 1024};
    }

    core::Instance make_instance(chunk::ChunkFactory factory = nullptr) {
        if (!factory) {
            factory = chunk::make_chunk_factory(cfg_.chunk);
        }
        return core::Instance("test", std::move(factory), limiter_, cfg_);
    }

    core::Overrides limits_;
    core::StaticReplicaCount ring_;
    core::Limiter limiter_;
    core::IngesterConfig cfg_{};
};

TEST_F(InstanceTest, CollidingLabelSetsGetDistinctStreams) {
    auto inst = make_instance();
    const std::int64_t t0 = 1'600'000'000LL * kSecond;

    // Pairs share a fast fingerprint; pair order inside each set is shuffled.
    const std::vector<std::string> sets = {
        R"({app="l",uniq0="0",uniq1="1"})", R"({uniq0="1",app="m",uniq1="1"})",
        R"({app="l",uniq0="1",uniq1="0"})", R"({uniq1="0",app="m",uniq0="0"})",
        R"({app="l",uniq0="0",uniq1="0"})", R"({uniq0="1",uniq1="0",app="m"})",
    };

    core::PushRequest req;
    for (std::size_t i = 0; i < sets.size(); ++i) {
        req.streams.push_back(core::StreamPush{sets[i], make_entries(5, t0 + static_cast<std::int64_t>(i) * kSecond)});
    }
    ASSERT_TRUE(inst.push(core::Context{}, req).ok());

    EXPECT_EQ(inst.stream_count(), 6u);
    EXPECT_EQ(inst.counters().fingerprint_collisions, 3u);
    for (std::size_t i = 0; i < sets.size(); i += 2) {
        const auto fp = fingerprint_of(sets[i]);
        EXPECT_EQ(fp, fingerprint_of(sets[i + 1]));
        EXPECT_EQ(inst.bucket_size(fp), 2u);
    }

    for (const auto& text : sets) {
        core::CanonicalLabels canon;
        ASSERT_TRUE(core::parse_labels(text, canon).ok());

        core::Stream* stream = nullptr;
        ASSERT_TRUE(inst.get_or_create_stream(text, stream).ok());
        ASSERT_NE(stream, nullptr);
        EXPECT_EQ(stream->labels(), canon.labels) << text;
        EXPECT_EQ(stream->entry_count(), 5u) << text;
        EXPECT_EQ(inst.find_stream(text), stream);
    }
    EXPECT_EQ(inst.stream_count(), 6u);
}

TEST_F(InstanceTest, CollidingStreamsAppendIndependently) {
    auto inst = make_instance();
    const std::string a = R"({app="l",uniq0="0",uniq1="1"})";
    const std::string b = R"({app="m",uniq0="1",uniq1="1"})";

    core::PushRequest req;
    req.streams.push_back(core::StreamPush{a, make_entries(3, 0, "a")});
    ASSERT_TRUE(inst.push(core::Context{}, req).ok());
    req.streams.front() = core::StreamPush{b, make_entries(7, 0, "b")};
    ASSERT_TRUE(inst.push(core::Context{}, req).ok());

    std::vector<std::string> lines_a;
    inst.find_stream(a)->for_each_entry([&](std::int64_t, std::string_view line) {
        lines_a.emplace_back(line);
        return true;
    });
    ASSERT_EQ(lines_a.size(), 3u);
    for (const auto& l : lines_a) {
        EXPECT_EQ(l.rfind("a-", 0), 0u) << l;
    }
    EXPECT_EQ(inst.find_stream(b)->entry_count(), 7u);
}

TEST_F(InstanceTest, StreamLimitRejectsOnlyNewStreams) {
    auto inst = make_instance();
    auto labels_for = [](int i) { return "{app=\"limit\", id=\"" + std::to_string(i) + "\"}"; };

    for (int i = 0; i < 1000; ++i) {
        core::PushRequest req;
        req.streams.push_back(core::StreamPush{labels_for(i), make_entries(1, i)});
        ASSERT_TRUE(inst.push(core::Context{}, req).ok()) << i;
    }
    EXPECT_EQ(inst.stream_count(), 1000u);

    core::PushRequest over;
    over.streams.push_back(core::StreamPush{labels_for(1000), make_entries(1, 0)});
    const auto st = inst.push(core::Context{}, over);
    EXPECT_EQ(st.code, core::ErrorCode::StreamLimitExceeded);
    EXPECT_EQ(inst.stream_count(), 1000u);
    EXPECT_EQ(inst.find_stream(labels_for(1000)), nullptr);
    EXPECT_EQ(inst.counters().limit_rejections, 1u);

    for (int i = 0; i < 1000; ++i) {
        core::PushRequest req;
        req.streams.push_back(core::StreamPush{labels_for(i), make_entries(1, 10 * kSecond + i)});
        ASSERT_TRUE(inst.push(core::Context{}, req).ok()) << i;
    }
    EXPECT_EQ(inst.stream_count(), 1000u);
}

TEST_F(InstanceTest, FailingGroupDoesNotStopOthers) {
    auto inst = make_instance();
    core::PushRequest req;
    req.streams.push_back(core::StreamPush{"{broken", make_entries(2, 0)});
    req.streams.push_back(core::StreamPush{R"({app="ok"})", make_entries(4, 0)});
    req.streams.push_back(core::StreamPush{R"({app="dup", app="dup"})", make_entries(1, 0)});

    const auto st = inst.push(core::Context{}, req);
    EXPECT_EQ(st.code, core::ErrorCode::InvalidLabelSet);
    EXPECT_NE(st.message.find("{broken"), std::string::npos) << "first error is reported";
    EXPECT_EQ(inst.stream_count(), 1u);
    ASSERT_NE(inst.find_stream(R"({app="ok"})"), nullptr);
    EXPECT_EQ(inst.find_stream(R"({app="ok"})")->entry_count(), 4u);
}

TEST_F(InstanceTest, ConcurrentPushesKeepStreamsIsolated) {
    auto inst = make_instance();
    constexpr int threads = 10;
    constexpr int batches = 100;
    constexpr int entries_per_batch = 20;

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            const std::string labels = "{app=\"concurrent\", thread=\"" + std::to_string(t) + "\"}";
            std::int64_t ts = 0;
            for (int b = 0; b < batches; ++b) {
                core::PushRequest req;
                core::StreamPush group{labels, {}};
                for (int e = 0; e < entries_per_batch; ++e) {
                    group.entries.push_back(core::Entry{ts, "t" + std::to_string(t) + "-" + std::to_string(ts)});
                    ts += kSecond / 10;
                }
                req.streams.push_back(std::move(group));
                if (!inst.push(core::Context{}, req).ok()) {
                    failures.fetch_add(1);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(failures.load(), 0);
    ASSERT_EQ(inst.stream_count(), static_cast<std::size_t>(threads));
    for (int t = 0; t < threads; ++t) {
        const std::string labels = "{app=\"concurrent\", thread=\"" + std::to_string(t) + "\"}";
        const core::Stream* s = inst.find_stream(labels);
        ASSERT_NE(s, nullptr);

        std::size_t n = 0;
        std::int64_t expected_ts = 0;
        const std::string prefix = "t" + std::to_string(t) + "-";
        s->for_each_entry([&](std::int64_t ts, std::string_view line) {
            EXPECT_EQ(ts, expected_ts);
            EXPECT_EQ(line, prefix + std::to_string(ts));
            expected_ts += kSecond / 10;
            ++n;
            return true;
        });
        EXPECT_EQ(n, static_cast<std::size_t>(batches * entries_per_batch)) << labels;
    }
}

TEST_F(InstanceTest, ConcurrentCreationOfSameLabelsYieldsOneStream) {
    auto inst = make_instance();
    constexpr int threads = 8;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            // Same set, different pair order per thread.
            const std::string labels = (t % 2 == 0) ? R"({a="1", b="2"})" : R"({b="2", a="1"})";
            for (int i = 0; i < 50; ++i) {
                core::PushRequest req;
                req.streams.push_back(core::StreamPush{labels, make_entries(1, t * 1000 + i)});
                EXPECT_TRUE(inst.push(core::Context{}, req).ok());
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    EXPECT_EQ(inst.stream_count(), 1u);
    EXPECT_EQ(inst.find_stream(R"({a="1", b="2"})")->entry_count(), static_cast<std::size_t>(threads * 50));
}

TEST_F(InstanceTest, CancelledContextFailsBeforeWork) {
    auto inst = make_instance();
    core::Context ctx;
    ctx.cancel();

    core::PushRequest req;
    req.streams.push_back(core::StreamPush{R"({app="x"})", make_entries(1, 0)});
    const auto st = inst.push(ctx, req);
    EXPECT_EQ(st.code, core::ErrorCode::Cancelled);
    EXPECT_EQ(inst.stream_count(), 0u);
}

TEST_F(InstanceTest, ExpiredDeadlineFailsBeforeWork) {
    auto inst = make_instance();
    ManualClock clock;
    const auto ctx = core::Context::with_timeout(std::chrono::milliseconds(5), clock);
    clock.advance(std::chrono::milliseconds(10));

    core::PushRequest req;
    req.streams.push_back(core::StreamPush{R"({app="x"})", make_entries(1, 0)});
    EXPECT_EQ(inst.push(ctx, req).code, core::ErrorCode::DeadlineExceeded);
    EXPECT_EQ(inst.stream_count(), 0u);
}

TEST_F(InstanceTest, CancellationTakesEffectBetweenGroups) {
    core::Context ctx;
    // Cancels the push as soon as the first group opens its chunk.
    auto base = chunk::make_chunk_factory(cfg_.chunk);
    auto inst = make_instance([ctx, base] {
        ctx.cancel();
        return base();
    });

    core::PushRequest req;
    req.streams.push_back(core::StreamPush{R"({app="first"})", make_entries(3, 0)});
    req.streams.push_back(core::StreamPush{R"({app="second"})", make_entries(3, 0)});

    const auto st = inst.push(ctx, req);
    EXPECT_EQ(st.code, core::ErrorCode::Cancelled);
    ASSERT_NE(inst.find_stream(R"({app="first"})"), nullptr);
    EXPECT_EQ(inst.find_stream(R"({app="first"})")->entry_count(), 3u) << "in-flight group completes";
    EXPECT_EQ(inst.find_stream(R"({app="second"})"), nullptr);
}

TEST_F(InstanceTest, RemoveStreamFreesLimitSlot) {
    auto inst = make_instance();
    core::Stream* s = nullptr;
    ASSERT_TRUE(inst.get_or_create_stream(R"({app="gone"})", s).ok());
    EXPECT_EQ(inst.stream_count(), 1u);

    EXPECT_TRUE(inst.remove_stream(R"({app="gone"})"));
    EXPECT_FALSE(inst.remove_stream(R"({app="gone"})"));
    EXPECT_EQ(inst.stream_count(), 0u);
    EXPECT_EQ(inst.find_stream(R"({app="gone"})"), nullptr);
    EXPECT_EQ(inst.counters().streams_removed, 1u);
}

TEST_F(InstanceTest, ForEachStreamAndCollectClosedChunks) {
    cfg_.sync_min_utilization = 0.0;
    auto inst = make_instance();

    core::PushRequest req;
    req.streams.push_back(core::StreamPush{R"({app="a"})", make_entries(3, 0)});
    // Two minutes apart: every entry after the first starts a new chunk.
    req.streams.push_back(core::StreamPush{R"({app="b"})",
                                           {core::Entry{0, "x"}, core::Entry{120 * kSecond, "y"},
                                            core::Entry{240 * kSecond, "z"}}});
    ASSERT_TRUE(inst.push(core::Context{}, req).ok());

    std::size_t visited = 0;
    inst.for_each_stream([&](core::Stream&) { ++visited; });
    EXPECT_EQ(visited, 2u);

    std::vector<core::ClosedChunk> closed;
    EXPECT_EQ(inst.collect_closed_chunks(closed), 2u);
    for (const auto& c : closed) {
        EXPECT_EQ(c.labels, R"({app="b"})");
    }
    EXPECT_EQ(inst.collect_closed_chunks(closed), 0u);
}

TEST_F(InstanceTest, GetOrCreateRejectsInvalidLabels) {
    auto inst = make_instance();
    core::Stream* s = nullptr;
    EXPECT_EQ(inst.get_or_create_stream("app=x", s).code, core::ErrorCode::InvalidLabelSet);
    EXPECT_EQ(s, nullptr);
    EXPECT_EQ(inst.find_stream("app=x"), nullptr);
}

TEST_F(InstanceTest, CollidingNewStreamIsStillLimited) {
    core::Overrides one(core::Limits{1});
    core::StaticReplicaCount single(1);
    core::Limiter limiter(one, single, 1);
    core::Instance inst("test", chunk::make_chunk_factory(cfg_.chunk), limiter, cfg_);

    const std::string first = R"({app="l",uniq0="0",uniq1="1"})";
    const std::string collider = R"({uniq0="1",app="m",uniq1="1"})";
    const auto fp = fingerprint_of(first);
    ASSERT_EQ(fp, fingerprint_of(collider));

    core::Stream* s = nullptr;
    ASSERT_TRUE(inst.get_or_create_stream(first, s).ok());

    core::Stream* other = nullptr;
    const auto st = inst.get_or_create_stream(collider, other);
    EXPECT_EQ(st.code, core::ErrorCode::StreamLimitExceeded);
    EXPECT_EQ(other, nullptr);
    EXPECT_EQ(inst.bucket_size(fp), 1u);
    EXPECT_EQ(inst.stream_count(), 1u);
    EXPECT_EQ(inst.counters().limit_rejections, 1u);
    EXPECT_EQ(inst.counters().fingerprint_collisions, 0u);

    // The existing member of the bucket still resolves.
    core::Stream* again = nullptr;
    ASSERT_TRUE(inst.get_or_create_stream(first, again).ok());
    EXPECT_EQ(again, s);
}

TEST_F(InstanceTest, CollisionLogNamesBothStrongFingerprints) {
    const auto path = std::filesystem::temp_directory_path() / "ingester_instance_collision.log";
    std::error_code ec;
    std::filesystem::remove(path, ec);

    util::AsyncLogger::Config log_cfg{};
    log_cfg.capacity_pow2 = 1u << 8;
    log_cfg.flush_every = 1;
    log_cfg.file_path = path.string();
    ASSERT_TRUE(util::init_ingest_logger(log_cfg));

    const std::string first = R"({app="l",uniq0="0",uniq1="1"})";
    const std::string collider = R"({uniq0="1",app="m",uniq1="1"})";
    {
        auto inst = make_instance();
        core::Stream* s = nullptr;
        ASSERT_TRUE(inst.get_or_create_stream(first, s).ok());
        ASSERT_TRUE(inst.get_or_create_stream(collider, s).ok());
        EXPECT_EQ(inst.counters().fingerprint_collisions, 1u);
    }
    util::shutdown_ingest_logger();

    core::CanonicalLabels a;
    core::CanonicalLabels b;
    ASSERT_TRUE(core::parse_labels(first, a).ok());
    ASSERT_TRUE(core::parse_labels(collider, b).ok());
    char expected[64];
    std::snprintf(expected, sizeof(expected), "strong %016llx vs %016llx",
                  static_cast<unsigned long long>(core::strong_fingerprint(b.labels)),
                  static_cast<unsigned long long>(core::strong_fingerprint(a.labels)));

    std::ifstream in(path);
    std::string line;
    std::size_t collisions = 0;
    while (std::getline(in, line)) {
        if (line.find("fingerprint collision") == std::string::npos) {
            continue;
        }
        ++collisions;
        EXPECT_NE(line.find("bucket size 2"), std::string::npos) << line;
        EXPECT_NE(line.find(expected), std::string::npos) << line;
    }
    EXPECT_EQ(collisions, 1u);
    std::filesystem::remove(path, ec);
}

} // namespace
