#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/ingester.hpp"
#include "core/push.hpp"
#include "core/status.hpp"
#include "ingest/spsc_ring.hpp"

namespace ingest {

struct PushTask {
    std::string tenant;
    core::PushRequest request;
};

using PushRing = SpscRing<PushTask, 1u << 10>;

inline constexpr std::size_t error_code_count = static_cast<std::size_t>(core::ErrorCode::Internal) + 1;

struct PushWorkerStats {
    std::uint64_t submitted{0};
    std::uint64_t dropped{0};
    std::uint64_t pushed{0};   // requests applied without error
    std::uint64_t failed{0};   // requests that returned an error
    std::uint64_t entries{0};  // entries carried by completed requests
    std::array<std::uint64_t, error_code_count> failures_by_code{};

    std::uint64_t completed() const noexcept { return pushed + failed; }
    std::uint64_t failures(core::ErrorCode code) const noexcept {
        return failures_by_code[static_cast<std::size_t>(code)];
    }
};

// Fixed set of push threads. Each owns one SPSC ring; a single submitting
// thread (the transport poller) hands out tasks round-robin. A full ring
// drops the task. Workers call Ingester::push with a fresh context and drain
// their ring before exiting on stop().
class PushWorkerPool {
public:
    // Throws std::invalid_argument when worker_count is 0.
    PushWorkerPool(core::Ingester& ingester, std::size_t worker_count);
    ~PushWorkerPool();

    PushWorkerPool(const PushWorkerPool&) = delete;
    PushWorkerPool& operator=(const PushWorkerPool&) = delete;

    void start();
    void stop() noexcept;

    // Single producer only.
    bool submit(PushTask&& task);

    PushWorkerStats stats() const noexcept;
    std::size_t worker_count() const noexcept { return workers_.size(); }

private:
    struct Worker {
        PushRing ring;
        std::thread thread;
        std::atomic<std::uint64_t> pushed{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> entries{0};
        std::array<std::atomic<std::uint64_t>, error_code_count> failures_by_code{};
    };

    void run(Worker& w) noexcept;
    void execute(Worker& w, PushTask& task) noexcept;

    core::Ingester& ingester_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::atomic<bool> stop_{true};
    std::size_t next_{0};
    std::atomic<std::uint64_t> submitted_{0};
    std::atomic<std::uint64_t> dropped_{0};
};

} // namespace ingest
