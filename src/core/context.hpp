#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

#include "core/status.hpp"
#include "util/clock.hpp"

namespace core {

// Cancellation and deadline carried by a push. Copies share the cancellation
// flag, so a transport can cancel a request it already handed to a worker.
class Context {
public:
    Context() : state_(std::make_shared<State>()) {}

    static Context with_deadline(util::SteadyClock::time_point deadline,
                                 const util::SteadyClock& clock = util::default_steady_clock()) {
        Context ctx;
        ctx.clock_ = &clock;
        ctx.deadline_ = deadline;
        return ctx;
    }

    static Context with_timeout(std::chrono::nanoseconds timeout,
                                const util::SteadyClock& clock = util::default_steady_clock()) {
        return with_deadline(clock.now() + timeout, clock);
    }

    void cancel() const noexcept { state_->cancelled.store(true, std::memory_order_release); }

    bool cancelled() const noexcept { return state_->cancelled.load(std::memory_order_acquire); }

    bool expired() const noexcept { return deadline_ && clock_->now() >= *deadline_; }

    Status err() const {
        if (cancelled()) {
            return Status{ErrorCode::Cancelled, "push cancelled"};
        }
        if (expired()) {
            return Status{ErrorCode::DeadlineExceeded, "push deadline exceeded"};
        }
        return Status::ok_status();
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
    };

    std::shared_ptr<State> state_;
    const util::SteadyClock* clock_{nullptr};
    std::optional<util::SteadyClock::time_point> deadline_;
};

} // namespace core
