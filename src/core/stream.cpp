#include "core/stream.hpp"

#include <algorithm>
#include <utility>

#include "util/async_log.hpp"

namespace core {

Stream::Stream(std::string tenant, CanonicalLabels labels, chunk::ChunkFactory factory,
               OutOfOrderPolicy out_of_order)
    : tenant_(std::move(tenant))
    , labels_(std::move(labels.labels))
    , labels_string_(labels_.to_string())
    , fingerprint_(labels.fingerprint)
    , factory_(std::move(factory))
    , out_of_order_(out_of_order) {}

void Stream::open_chunk() {
    chunks_.push_back(ChunkDesc{std::shared_ptr<chunk::Chunk>(factory_()), false, false});
    last_cut_time_.reset();
}

void Stream::cut_active(CutReason reason) {
    auto& desc = chunks_.back();
    desc.chunk->close();
    desc.closed = true;
    if (reason == CutReason::Sync) {
        ++cuts_.sync;
    } else {
        ++cuts_.capacity;
    }
    const auto [lo, hi] = desc.chunk->bounds();
    LOG_INGEST_DEBUG("STREAM", tenant_, fingerprint_, "cut chunk reason=%s entries=%zu util=%.3f span_ns=%lld",
                     reason == CutReason::Sync ? "sync" : "capacity", desc.chunk->entry_count(),
                     desc.chunk->utilization(), static_cast<long long>(hi - lo));
}

bool Stream::should_cut_for_sync(std::int64_t ts_ns, std::int64_t sync_period_ns,
                                 double min_utilization) const noexcept {
    if (sync_period_ns <= 0) {
        return false;
    }
    const chunk::Chunk& c = *chunks_.back().chunk;
    if (c.entry_count() == 0) {
        return false;
    }
    const auto [lo, hi] = c.bounds();
    const std::int64_t span = std::max(hi, ts_ns) - std::min(lo, ts_ns);
    if (span < sync_period_ns) {
        return false;
    }
    return min_utilization <= 0.0 || c.utilization() >= min_utilization;
}

chunk::AppendResult Stream::append_entry(const Entry& e, std::int64_t sync_period_ns, double min_utilization) {
    if (!has_active()) {
        open_chunk();
    } else if (should_cut_for_sync(e.timestamp_ns, sync_period_ns, min_utilization)) {
        cut_active(CutReason::Sync);
        open_chunk();
    }

    auto res = active().append(e.timestamp_ns, e.line);
    if (res == chunk::AppendResult::Full) {
        cut_active(CutReason::Capacity);
        open_chunk();
        res = active().append(e.timestamp_ns, e.line);
    }
    if (res != chunk::AppendResult::Ok) {
        return res;
    }

    if (active().entry_count() == 1) {
        last_cut_time_ = e.timestamp_ns;
    }
    highest_seen_ = highest_seen_ ? std::max(*highest_seen_, e.timestamp_ns) : e.timestamp_ns;
    return res;
}

Status Stream::append(std::span<const Entry> entries, std::int64_t sync_period_ns, double min_utilization) {
    std::size_t failed = 0;
    std::size_t out_of_order = 0;
    chunk::AppendResult first_failure = chunk::AppendResult::Ok;
    std::int64_t highest = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& e : entries) {
            if (out_of_order_ == OutOfOrderPolicy::Reject && highest_seen_ && e.timestamp_ns < *highest_seen_) {
                ++out_of_order;
                continue;
            }
            const auto res = append_entry(e, sync_period_ns, min_utilization);
            if (res != chunk::AppendResult::Ok) {
                if (failed == 0) {
                    first_failure = res;
                }
                ++failed;
            }
        }
        highest = highest_seen_.value_or(0);
    }

    if (failed > 0) {
        LOG_INGEST_WARN("STREAM", tenant_, fingerprint_, "%zu/%zu entries failed to append: %s", failed,
                        entries.size(), chunk::append_result_name(first_failure));
        return Status{ErrorCode::ChunkAppendFailure,
                      std::to_string(failed) + " of " + std::to_string(entries.size()) +
                          " entries failed to append to stream " + labels_string_ + ": " +
                          chunk::append_result_name(first_failure)};
    }
    if (out_of_order > 0) {
        return Status{ErrorCode::EntryOutOfOrder,
                      std::to_string(out_of_order) + " of " + std::to_string(entries.size()) +
                          " entries older than newest timestamp " + std::to_string(highest) + " for stream " +
                          labels_string_};
    }
    return Status::ok_status();
}

std::size_t Stream::chunk_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return chunks_.size();
}

std::size_t Stream::entry_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t total = 0;
    for (const auto& desc : chunks_) {
        total += desc.chunk->entry_count();
    }
    return total;
}

std::optional<std::int64_t> Stream::highest_seen_timestamp() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return highest_seen_;
}

std::optional<std::int64_t> Stream::last_cut_time() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return last_cut_time_;
}

CutCounters Stream::cut_counters() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cuts_;
}

std::vector<std::shared_ptr<const chunk::Chunk>> Stream::snapshot_chunks() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::shared_ptr<const chunk::Chunk>> out;
    out.reserve(chunks_.size());
    for (const auto& desc : chunks_) {
        out.push_back(desc.chunk);
    }
    return out;
}

bool Stream::for_each_entry(const chunk::EntryVisitor& visit) const {
    std::lock_guard<std::mutex> lock(mtx_);
    bool keep_going = true;
    const chunk::EntryVisitor wrapped = [&](std::int64_t ts, std::string_view line) {
        keep_going = visit(ts, line);
        return keep_going;
    };
    for (const auto& desc : chunks_) {
        if (!desc.chunk->for_each(wrapped)) {
            return false;
        }
        if (!keep_going) {
            break;
        }
    }
    return true;
}

std::size_t Stream::collect_closed(std::vector<ClosedChunk>& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t n = 0;
    for (auto& desc : chunks_) {
        if (desc.closed && !desc.handed_off) {
            out.push_back(ClosedChunk{fingerprint_, labels_string_, desc.chunk});
            desc.handed_off = true;
            ++n;
        }
    }
    return n;
}

std::size_t Stream::drop_handed_off() {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto before = chunks_.size();
    std::erase_if(chunks_, [](const ChunkDesc& d) { return d.closed && d.handed_off; });
    return before - chunks_.size();
}

} // namespace core
