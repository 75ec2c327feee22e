#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "chunk/chunk.hpp"
#include "core/ingester_config.hpp"
#include "core/labels.hpp"
#include "core/push.hpp"
#include "core/status.hpp"

namespace core {

// A closed chunk handed to the flush collaborator. The Stream keeps its own
// reference until drop_handed_off() or eviction.
struct ClosedChunk {
    Fingerprint fingerprint{0};
    std::string labels;
    std::shared_ptr<const chunk::Chunk> chunk;
};

struct CutCounters {
    std::uint64_t sync{0};     // span reached the sync period with enough utilization
    std::uint64_t capacity{0}; // next entry did not fit under the target size
};

// The chunk sequence of one canonical label set. All mutation happens under
// the stream's own mutex; different streams never contend.
//
// Cut policy: before an entry is appended, the active chunk is cut when the
// span it would cover with the entry reaches sync_period and its utilization
// is at least min_utilization. A chunk below the utilization threshold keeps
// growing past the sync period. Every closed chunk therefore satisfies
//   span < sync_period || utilization >= min_utilization
// unless it was closed because the entry did not fit.
class Stream {
public:
    Stream(std::string tenant, CanonicalLabels labels, chunk::ChunkFactory factory,
           OutOfOrderPolicy out_of_order = OutOfOrderPolicy::Accept);

    Stream(const Stream&) = delete;
    Stream& operator=(const Stream&) = delete;

    // Appends in the given order. Entries that fail are skipped and the rest
    // still go in; the returned status describes the first failure kind
    // (ChunkAppendFailure takes precedence over EntryOutOfOrder).
    Status append(std::span<const Entry> entries, std::int64_t sync_period_ns, double min_utilization);

    const LabelSet& labels() const noexcept { return labels_; }
    const std::string& labels_string() const noexcept { return labels_string_; }
    Fingerprint fingerprint() const noexcept { return fingerprint_; }
    const std::string& tenant() const noexcept { return tenant_; }

    std::size_t chunk_count() const;
    std::size_t entry_count() const;
    std::optional<std::int64_t> highest_seen_timestamp() const;
    // First entry timestamp of the active chunk.
    std::optional<std::int64_t> last_cut_time() const;
    CutCounters cut_counters() const;

    // Read-only handles to every chunk, oldest first. The active chunk may
    // still change after the call; use for_each_entry() while pushes run.
    std::vector<std::shared_ptr<const chunk::Chunk>> snapshot_chunks() const;

    // Visits all entries of all chunks under the stream lock.
    bool for_each_entry(const chunk::EntryVisitor& visit) const;

    // Appends closed chunks not handed off yet; returns how many.
    std::size_t collect_closed(std::vector<ClosedChunk>& out);

    // Forgets closed chunks already handed off; returns how many.
    std::size_t drop_handed_off();

private:
    struct ChunkDesc {
        std::shared_ptr<chunk::Chunk> chunk;
        bool closed{false};
        bool handed_off{false};
    };

    enum class CutReason : std::uint8_t { Sync, Capacity };

    bool has_active() const noexcept { return !chunks_.empty() && !chunks_.back().closed; }
    chunk::Chunk& active() noexcept { return *chunks_.back().chunk; }
    void open_chunk();
    void cut_active(CutReason reason);
    bool should_cut_for_sync(std::int64_t ts_ns, std::int64_t sync_period_ns, double min_utilization) const noexcept;
    chunk::AppendResult append_entry(const Entry& e, std::int64_t sync_period_ns, double min_utilization);

    const std::string tenant_;
    const LabelSet labels_;
    const std::string labels_string_;
    const Fingerprint fingerprint_;
    const chunk::ChunkFactory factory_;
    const OutOfOrderPolicy out_of_order_;

    mutable std::mutex mtx_;
    std::vector<ChunkDesc> chunks_;
    std::optional<std::int64_t> last_cut_time_;
    std::optional<std::int64_t> highest_seen_;
    CutCounters cuts_{};
};

} // namespace core
