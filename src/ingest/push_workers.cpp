#include "ingest/push_workers.hpp"

#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

#include "core/context.hpp"
#include "util/async_log.hpp"
#include "util/log.hpp"

namespace ingest {

PushWorkerPool::PushWorkerPool(core::Ingester& ingester, std::size_t worker_count) : ingester_(ingester) {
    if (worker_count == 0) {
        throw std::invalid_argument("PushWorkerPool: worker_count must be positive");
    }
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.push_back(std::make_unique<Worker>());
    }
}

PushWorkerPool::~PushWorkerPool() {
    stop();
}

void PushWorkerPool::start() {
    bool expected = true;
    if (!stop_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return; // already running
    }
    for (auto& w : workers_) {
        Worker* worker = w.get();
        worker->thread = std::thread([this, worker] { run(*worker); });
    }
    LOG_SLOW_INFO("push workers: started %zu", workers_.size());
}

void PushWorkerPool::stop() noexcept {
    stop_.store(true, std::memory_order_release);
    for (auto& w : workers_) {
        if (w->thread.joinable()) {
            w->thread.join();
        }
    }
}

bool PushWorkerPool::submit(PushTask&& task) {
    submitted_.fetch_add(1, std::memory_order_relaxed);
    Worker& w = *workers_[next_];
    next_ = (next_ + 1) % workers_.size();
    if (!w.ring.try_push(std::move(task))) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

void PushWorkerPool::execute(Worker& w, PushTask& task) noexcept {
    std::size_t entries = 0;
    for (const auto& group : task.request.streams) {
        entries += group.entries.size();
    }

    core::Status st;
    try {
        st = ingester_.push(core::Context{}, task.tenant, task.request);
    } catch (const std::exception& ex) {
        st = core::Status{core::ErrorCode::Internal, ex.what()};
    }

    w.entries.fetch_add(entries, std::memory_order_relaxed);
    if (st.ok()) {
        w.pushed.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    w.failed.fetch_add(1, std::memory_order_relaxed);
    w.failures_by_code[static_cast<std::size_t>(st.code)].fetch_add(1, std::memory_order_relaxed);
    LOG_INGEST_DEBUG("PUSH", task.tenant, 0, "push failed: %s", st.to_string().c_str());
}

void PushWorkerPool::run(Worker& w) noexcept {
    PushTask task;
    int idle_count = 0;
    while (true) {
        if (w.ring.try_pop(task)) {
            idle_count = 0;
            execute(w, task);
            task = PushTask{};
            continue;
        }
        if (stop_.load(std::memory_order_acquire)) {
            // Producer has stopped submitting; the ring is drained.
            if (!w.ring.try_pop(task)) {
                break;
            }
            execute(w, task);
            continue;
        }
        if (idle_count < 64) {
            ++idle_count;
            std::this_thread::yield();
        } else {
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        }
    }
}

PushWorkerStats PushWorkerPool::stats() const noexcept {
    PushWorkerStats s;
    s.submitted = submitted_.load(std::memory_order_relaxed);
    s.dropped = dropped_.load(std::memory_order_relaxed);
    for (const auto& w : workers_) {
        s.pushed += w->pushed.load(std::memory_order_relaxed);
        s.failed += w->failed.load(std::memory_order_relaxed);
        s.entries += w->entries.load(std::memory_order_relaxed);
        for (std::size_t i = 0; i < error_code_count; ++i) {
            s.failures_by_code[i] += w->failures_by_code[i].load(std::memory_order_relaxed);
        }
    }
    return s;
}

} // namespace ingest
