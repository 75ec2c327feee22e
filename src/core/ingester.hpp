#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "chunk/chunk.hpp"
#include "core/context.hpp"
#include "core/ingester_config.hpp"
#include "core/instance.hpp"
#include "core/limiter.hpp"
#include "core/limits.hpp"
#include "core/push.hpp"
#include "core/ring_count.hpp"
#include "core/status.hpp"

namespace core {

// Process-wide tenant table. Instances are created on first contact and live
// until evict_tenant(). The registry lock covers lookup/insert only; pushes
// run against a shared handle so eviction never pulls an Instance out from
// under a running push.
//
// The limits source and the replica-count oracle must outlive the Ingester.
class Ingester {
public:
    // Throws std::invalid_argument on a bad chunk configuration or a zero
    // replication factor.
    Ingester(const IngesterConfig& cfg, const TenantLimits& limits, const ReplicaCountOracle& ring);
    Ingester(const IngesterConfig& cfg, const TenantLimits& limits, const ReplicaCountOracle& ring,
             chunk::ChunkFactory factory);

    Ingester(const Ingester&) = delete;
    Ingester& operator=(const Ingester&) = delete;

    Status get_or_create_instance(std::string_view tenant, std::shared_ptr<Instance>& out);

    Status push(const Context& ctx, std::string_view tenant, const PushRequest& req);

    // The returned pointer is owned by the tenant's Instance and dangles once
    // the tenant is evicted or the stream removed. Callers that may race
    // evict_tenant() take the overload that also hands back the Instance.
    Status get_or_create_stream(std::string_view tenant, std::string_view labels, Stream*& out);
    Status get_or_create_stream(std::string_view tenant, std::string_view labels, Stream*& out,
                                std::shared_ptr<Instance>& owner);

    // nullptr when the tenant has never pushed (or was evicted).
    std::shared_ptr<Instance> find_instance(std::string_view tenant) const;

    bool evict_tenant(std::string_view tenant);

    std::size_t tenant_count() const;

    std::size_t collect_closed_chunks(std::vector<ClosedChunk>& out) const;

    const IngesterConfig& config() const noexcept { return cfg_; }
    const Limiter& limiter() const noexcept { return limiter_; }

private:
    using InstanceMap = std::map<std::string, std::shared_ptr<Instance>, std::less<>>;

    const IngesterConfig cfg_;
    const chunk::ChunkFactory factory_;
    const Limiter limiter_;

    mutable std::mutex mtx_;
    InstanceMap instances_;
};

} // namespace core
