#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <Aeron.h>

#include "core/ingester.hpp"
#include "core/limits.hpp"
#include "core/ring_count.hpp"
#include "ingest/aeron_subscriber.hpp"
#include "ingest/push_workers.hpp"
#include "persist/config_file.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace {

void log_summary(const ingest::SubscriberStats& sub, const ingest::PushWorkerStats& push,
                 const core::Ingester& ingester) {
    LOG_SLOW_INFO("subscriber frames=%llu submitted=%llu drops=%llu decode_failures=%llu",
                  static_cast<unsigned long long>(sub.frames.load()),
                  static_cast<unsigned long long>(sub.submitted.load()),
                  static_cast<unsigned long long>(sub.drops.load()),
                  static_cast<unsigned long long>(sub.decode_failures.load()));
    LOG_SLOW_INFO("push workers pushed=%llu failed=%llu entries=%llu dropped=%llu",
                  static_cast<unsigned long long>(push.pushed), static_cast<unsigned long long>(push.failed),
                  static_cast<unsigned long long>(push.entries), static_cast<unsigned long long>(push.dropped));
    for (std::size_t i = 1; i < ingest::error_code_count; ++i) {
        const auto code = static_cast<core::ErrorCode>(i);
        if (push.failures(code) > 0) {
            LOG_SLOW_INFO("  %s: %llu", core::error_code_name(code),
                          static_cast<unsigned long long>(push.failures(code)));
        }
    }

    std::vector<core::ClosedChunk> closed;
    ingester.collect_closed_chunks(closed);
    LOG_SLOW_INFO("tenants=%zu closed_chunks=%zu", ingester.tenant_count(), closed.size());
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <channel> <stream_id> [config.json]" << std::endl;
        return 1;
    }

    const std::string channel = argv[1];
    char* stream_end = nullptr;
    const long stream_arg = std::strtol(argv[2], &stream_end, 10);
    if (stream_end == argv[2] || *stream_end != '\0') {
        std::cerr << "Invalid stream id: " << argv[2] << std::endl;
        return 1;
    }
    const auto stream_id = static_cast<std::int32_t>(stream_arg);

    persist::DaemonConfig cfg;
    if (argc > 3) {
        std::string error;
        if (!persist::parse_config_file(argv[3], cfg, error)) {
            LOG_SLOW_ERROR("config: %s", error.c_str());
            return 1;
        }
    }
    util::set_min_log_level(cfg.log.level);

    util::AsyncLogger::Config log_cfg{};
    log_cfg.capacity_pow2 = 1u << 15;
    log_cfg.min_level = cfg.log.level;
    log_cfg.file_path = cfg.log.file;
    if (!util::init_ingest_logger(log_cfg)) {
        LOG_SLOW_ERROR("Failed to start ingest logger (file=%s)", cfg.log.file.empty() ? "stderr" : cfg.log.file.c_str());
    }

    int rc = 0;
    try {
        const core::Overrides limits(cfg.limits, cfg.overrides);
        core::StaticReplicaCount replicas(cfg.ingester.replica_count);
        core::Ingester ingester(cfg.ingester, limits, replicas);
        ingest::PushWorkerPool workers(ingester, cfg.ingester.push_workers);
        ingest::SubscriberStats sub_stats;
        std::atomic<bool> stop_flag{false};

        aeron::Context context;
        auto client = aeron::Aeron::connect(context);

        ingest::AeronSubscriber subscriber(channel, stream_id, workers, sub_stats, client, stop_flag);

        LOG_SLOW_INFO("Starting ingesterd channel=%s stream=%d workers=%u encoding=%s sync_period_ms=%lld "
                      "min_util=%.2f max_streams=%u overrides=%zu",
                      channel.c_str(), stream_id, cfg.ingester.push_workers,
                      chunk::encoding_name(cfg.ingester.chunk.encoding),
                      static_cast<long long>(cfg.ingester.sync_period_ns / 1'000'000),
                      cfg.ingester.sync_min_utilization, cfg.limits.max_local_streams_per_user,
                      limits.override_count());

        workers.start();
        std::thread poller([&] { subscriber.run(); });

        const char* duration_env = std::getenv("INGESTERD_RUN_MS");
        if (duration_env) {
            const auto duration_ms = std::chrono::milliseconds{std::strtoul(duration_env, nullptr, 10)};
            LOG_SLOW_INFO("ingesterd running for %llu ms before shutdown.",
                          static_cast<unsigned long long>(duration_ms.count()));
            std::this_thread::sleep_for(duration_ms);
        } else {
            LOG_SLOW_INFO("ingesterd running. Press Enter to exit.");
            std::cin.get();
        }
        stop_flag.store(true, std::memory_order_release);
        poller.join();
        workers.stop();

        log_summary(sub_stats, workers.stats(), ingester);
    } catch (const std::exception& ex) {
        LOG_SLOW_FATAL("ingesterd: %s", ex.what());
        rc = 1;
    }

    util::shutdown_ingest_logger();
    return rc;
}
