#include "ingest/aeron_subscriber.hpp"

#include <span>
#include <thread>
#include <utility>

#include "util/log.hpp"

namespace ingest {

AeronSubscriber::AeronSubscriber(std::string channel,
                                 std::int32_t stream_id,
                                 PushWorkerPool& workers,
                                 SubscriberStats& stats,
                                 std::shared_ptr<aeron::Aeron> client,
                                 std::atomic<bool>& stop_flag)
    : AeronSubscriber(std::move(channel), stream_id, workers, stats, make_aeron_client_view(std::move(client)),
                      stop_flag) {}

AeronSubscriber::AeronSubscriber(std::string channel,
                                 std::int32_t stream_id,
                                 PushWorkerPool& workers,
                                 SubscriberStats& stats,
                                 std::shared_ptr<AeronClientView> client,
                                 std::atomic<bool>& stop_flag) noexcept
    : channel_(std::move(channel))
    , stream_id_(stream_id)
    , workers_(workers)
    , stats_(stats)
    , client_(std::move(client))
    , stop_flag_(stop_flag) {}

void AeronSubscriber::on_frame(std::span<const std::byte> bytes) {
    stats_.frames.fetch_add(1, std::memory_order_relaxed);

    DecodedPush decoded;
    std::size_t consumed = 0;
    DecodeResult res = decode_push_frame(bytes, decoded, consumed);
    if (res == DecodeResult::Ok && consumed != bytes.size()) {
        res = DecodeResult::Malformed; // one frame per message
    }
    if (res != DecodeResult::Ok) {
        stats_.decode_failures.fetch_add(1, std::memory_order_relaxed);
        stats_.decode_failures_by_result[static_cast<std::size_t>(res)].fetch_add(1, std::memory_order_relaxed);
        return;
    }

    if (workers_.submit(PushTask{std::move(decoded.tenant), std::move(decoded.request)})) {
        stats_.submitted.fetch_add(1, std::memory_order_relaxed);
    } else {
        stats_.drops.fetch_add(1, std::memory_order_relaxed);
    }
}

void AeronSubscriber::run() {
    constexpr int fragment_limit = 10;

    const auto registration_id = client_->add_subscription(channel_, stream_id_);

    std::shared_ptr<SubscriptionView> subscription;
    while (!stop_flag_.load(std::memory_order_acquire) && !subscription) {
        subscription = client_->find_subscription(registration_id);
        if (!subscription) {
            std::this_thread::yield();
        }
    }

    if (!subscription) {
        return;
    }
    LOG_SLOW_INFO("subscriber: polling %s stream=%d", channel_.c_str(), stream_id_);

    const FrameHandler handler = [this](std::span<const std::byte> bytes) { on_frame(bytes); };

    int idle_count = 0;
    while (!stop_flag_.load(std::memory_order_acquire)) {
        const int fragments = subscription->poll(handler, fragment_limit);
        if (fragments == 0) {
            if (idle_count < 32) {
                ++idle_count;
            } else {
                idle_count = 0;
                std::this_thread::yield();
            }
        } else {
            idle_count = 0;
        }
    }
}

} // namespace ingest
