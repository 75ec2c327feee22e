#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include <Aeron.h>

#include "ingest/aeron_client_view.hpp"
#include "ingest/push_codec.hpp"
#include "ingest/push_workers.hpp"

namespace ingest {

inline constexpr std::size_t decode_result_count = static_cast<std::size_t>(DecodeResult::EmptyTenant) + 1;

// Written by the poller thread only; readers on other threads see relaxed values.
struct SubscriberStats {
    std::atomic<std::uint64_t> frames{0};
    std::atomic<std::uint64_t> submitted{0};
    std::atomic<std::uint64_t> decode_failures{0};
    std::atomic<std::uint64_t> drops{0};
    std::array<std::atomic<std::uint64_t>, decode_result_count> decode_failures_by_result{};

    std::uint64_t failures(DecodeResult r) const noexcept {
        return decode_failures_by_result[static_cast<std::size_t>(r)].load(std::memory_order_relaxed);
    }
};

// Polls one Aeron subscription, decodes each reassembled message as exactly
// one push frame and hands it to the worker pool. Runs on the calling thread until
// stop_flag is raised.
class AeronSubscriber {
public:
    AeronSubscriber(std::string channel,
                    std::int32_t stream_id,
                    PushWorkerPool& workers,
                    SubscriberStats& stats,
                    std::shared_ptr<aeron::Aeron> client,
                    std::atomic<bool>& stop_flag);

    AeronSubscriber(std::string channel,
                    std::int32_t stream_id,
                    PushWorkerPool& workers,
                    SubscriberStats& stats,
                    std::shared_ptr<AeronClientView> client,
                    std::atomic<bool>& stop_flag) noexcept;

    void run();

    // Decodes and submits one reassembled message.
    void on_frame(std::span<const std::byte> bytes);

private:
    std::string channel_;
    std::int32_t stream_id_;
    PushWorkerPool& workers_;
    SubscriberStats& stats_;
    std::shared_ptr<AeronClientView> client_;
    std::atomic<bool>& stop_flag_;
};

} // namespace ingest
