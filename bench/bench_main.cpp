#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/ingester.hpp"
#include "core/labels.hpp"
#include "core/limits.hpp"
#include "core/ring_count.hpp"
#include "ingest/push_codec.hpp"

namespace {

core::PushRequest make_request(std::size_t streams, std::size_t entries, std::int64_t base_ts) {
    core::PushRequest req;
    for (std::size_t s = 0; s < streams; ++s) {
        core::StreamPush group;
        group.labels = "{job=\"bench\", pod=\"pod-" + std::to_string(s) + "\", app=\"api\"}";
        for (std::size_t e = 0; e < entries; ++e) {
            group.entries.push_back(core::Entry{base_ts + static_cast<std::int64_t>(e) * 1'000'000,
                                                "level=info msg=\"request served\" status=200 latency_ms=12"});
        }
        req.streams.push_back(std::move(group));
    }
    return req;
}

template <typename Fn>
void time_loop(const char* name, std::size_t iterations, std::size_t units_per_iter, Fn&& fn) {
    const auto start = std::chrono::steady_clock::now();
    for (std::size_t i = 0; i < iterations; ++i) {
        fn(i);
    }
    const auto end = std::chrono::steady_clock::now();
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
    const auto units = iterations * units_per_iter;
    std::cout << name << ": " << units << " ops took " << ns << " ns (" << (ns / static_cast<long long>(units))
              << " ns/op)\n";
}

} // namespace

int main() {
    constexpr std::size_t iterations = 2000;
    constexpr std::size_t streams = 16;
    constexpr std::size_t entries = 50;

    const std::string labels = "{pod=\"pod-7\", job=\"bench\", app=\"api\", env=\"prod\"}";
    time_loop("parse_labels", 100000, 1, [&](std::size_t) {
        core::CanonicalLabels canon;
        (void)core::parse_labels(labels, canon);
    });

    core::IngesterConfig cfg = core::default_ingester_config();
    cfg.sync_period_ns = 60'000'000'000LL;
    cfg.sync_min_utilization = 0.2;
    const core::Overrides limits(core::Limits{});
    const core::StaticReplicaCount replicas(1);
    core::Ingester ingester(cfg, limits, replicas);

    time_loop("push", iterations, streams * entries, [&](std::size_t i) {
        const auto req = make_request(streams, entries, static_cast<std::int64_t>(i) * 60'000'000);
        (void)ingester.push(core::Context{}, "bench", req);
    });

    const auto req = make_request(streams, entries, 0);
    std::vector<std::byte> frame;
    std::string error;
    if (!ingest::encode_push_frame("bench", req, frame, error)) {
        std::cerr << "encode failed: " << error << "\n";
        return 1;
    }
    std::size_t decode_failures = 0;
    time_loop("decode_push_frame", iterations, streams * entries, [&](std::size_t) {
        ingest::DecodedPush decoded;
        std::size_t consumed = 0;
        if (ingest::decode_push_frame(frame, decoded, consumed) != ingest::DecodeResult::Ok) {
            ++decode_failures;
        }
    });
    if (decode_failures != 0) {
        std::cerr << "decode failed " << decode_failures << " times\n";
        return 1;
    }
    return 0;
}
