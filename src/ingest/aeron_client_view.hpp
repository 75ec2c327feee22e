#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>

#include <Aeron.h>
#include <FragmentAssembler.h>
#include <concurrent/AtomicBuffer.h>
#include <concurrent/logbuffer/Header.h>

namespace ingest {

// One reassembled transport message; each carries exactly one push frame.
using FrameHandler = std::function<void(std::span<const std::byte>)>;

class SubscriptionView {
public:
    virtual ~SubscriptionView() = default;
    // Returns the number of transport fragments consumed.
    virtual int poll(const FrameHandler& handler, int fragment_limit) = 0;
};

class AeronClientView {
public:
    virtual ~AeronClientView() = default;
    virtual std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) = 0;
    // nullptr until the media driver has registered the subscription.
    virtual std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) = 0;
};

// Push frames above the term MTU arrive fragmented; the assembler keeps
// partial messages per session across polls.
class RealSubscriptionView final : public SubscriptionView {
public:
    explicit RealSubscriptionView(std::shared_ptr<aeron::Subscription> sub)
        : sub_(std::move(sub))
        , assembler_([this](aeron::concurrent::AtomicBuffer& buffer,
                            aeron::util::index_t offset,
                            aeron::util::index_t length,
                            aeron::concurrent::logbuffer::Header&) {
            if (current_) {
                (*current_)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer.buffer() + offset),
                                                       static_cast<std::size_t>(length)));
            }
        }) {}

    RealSubscriptionView(const RealSubscriptionView&) = delete;
    RealSubscriptionView& operator=(const RealSubscriptionView&) = delete;

    int poll(const FrameHandler& handler, int fragment_limit) override {
        current_ = &handler;
        const int fragments = sub_->poll(assembler_.handler(), fragment_limit);
        current_ = nullptr;
        return fragments;
    }

private:
    std::shared_ptr<aeron::Subscription> sub_;
    const FrameHandler* current_{nullptr};
    aeron::FragmentAssembler assembler_;
};

class RealAeronClientView final : public AeronClientView {
public:
    explicit RealAeronClientView(std::shared_ptr<aeron::Aeron> client) : client_(std::move(client)) {}

    std::int64_t add_subscription(const std::string& channel, std::int32_t stream_id) override {
        return client_->addSubscription(channel, stream_id);
    }

    std::shared_ptr<SubscriptionView> find_subscription(std::int64_t registration_id) override {
        auto subscription = client_->findSubscription(registration_id);
        if (!subscription) {
            return nullptr;
        }
        return std::make_shared<RealSubscriptionView>(std::move(subscription));
    }

private:
    std::shared_ptr<aeron::Aeron> client_;
};

inline std::shared_ptr<AeronClientView> make_aeron_client_view(std::shared_ptr<aeron::Aeron> client) {
    return std::make_shared<RealAeronClientView>(std::move(client));
}

} // namespace ingest
