#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chunk/chunk.hpp"
#include "core/context.hpp"
#include "core/ingester_config.hpp"
#include "core/labels.hpp"
#include "core/limiter.hpp"
#include "core/push.hpp"
#include "core/status.hpp"
#include "core/stream.hpp"

namespace core {

struct InstanceCounters {
    std::uint64_t streams_created{0};
    std::uint64_t streams_removed{0};
    std::uint64_t limit_rejections{0};
    std::uint64_t fingerprint_collisions{0}; // streams created into a non-empty bucket
};

// Per-tenant stream table. Streams are keyed by fingerprint; each key holds a
// small bucket of streams so that distinct label sets with equal fingerprints
// coexist. Buckets are scanned linearly; more than one entry is rare.
//
// One mutex guards the table and the stream count and is held only for
// lookup/insert. Appends run under the individual stream's mutex.
class Instance {
public:
    Instance(std::string tenant, chunk::ChunkFactory factory, const Limiter& limiter,
             const IngesterConfig& cfg = default_ingester_config());

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    // Appends every group to its stream. A failing group does not stop later
    // groups; the first failure is returned and nothing is rolled back. The
    // context is checked before the first group and between groups.
    Status push(const Context& ctx, const PushRequest& req);

    // Returned pointer stays valid until remove_stream() for those labels.
    Status get_or_create_stream(std::string_view labels, Stream*& out);
    Status get_or_create_stream(const CanonicalLabels& labels, Stream*& out);

    // nullptr when absent or when labels do not parse.
    Stream* find_stream(std::string_view labels) const;

    // Visits a snapshot of the streams without holding the table lock.
    void for_each_stream(const std::function<void(Stream&)>& fn) const;

    std::size_t collect_closed_chunks(std::vector<ClosedChunk>& out) const;

    // Retention hook; never called by the write path itself.
    bool remove_stream(std::string_view labels);

    std::size_t stream_count() const;
    std::size_t bucket_size(Fingerprint fp) const;
    InstanceCounters counters() const;

    const std::string& tenant() const noexcept { return tenant_; }
    const IngesterConfig& config() const noexcept { return cfg_; }

private:
    using Bucket = std::vector<std::shared_ptr<Stream>>;

    Status resolve(const CanonicalLabels& labels, std::shared_ptr<Stream>& out);

    const std::string tenant_;
    const chunk::ChunkFactory factory_;
    const Limiter& limiter_;
    const IngesterConfig cfg_;

    mutable std::mutex mtx_;
    std::unordered_map<Fingerprint, Bucket> streams_;
    std::size_t stream_count_{0};
    InstanceCounters counters_{};
};

} // namespace core
