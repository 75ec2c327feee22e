#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "core/limits.hpp"
#include "core/ring_count.hpp"
#include "core/status.hpp"

namespace core {

// Converts a tenant's configured stream limit into this replica's share:
//   ceil(max * replication_factor / replica_count), floor 1.
// A configured maximum of 0 means unlimited; a replica count <= 0 leaves the
// configured maximum unchanged.
//
// Advisory only: replicas do not coordinate, so concurrent creation across
// replicas (or replica-count churn) can transiently over-admit. Holds no state
// of its own; the Instance does the counting.
class Limiter {
public:
    static constexpr std::size_t unlimited = static_cast<std::size_t>(-1);

    // Throws std::invalid_argument when replication_factor is 0.
    Limiter(const TenantLimits& limits, const ReplicaCountOracle& ring, std::uint32_t replication_factor = 1);

    std::size_t effective_limit(std::string_view tenant) const;

    // True when one more stream may be created for the tenant.
    bool check_and_reserve(std::string_view tenant, std::size_t current_streams) const;

    // Same decision, with a descriptive StreamLimitExceeded on rejection.
    Status assert_max_streams_per_user(std::string_view tenant, std::size_t current_streams) const;

private:
    const TenantLimits& limits_;
    const ReplicaCountOracle& ring_;
    std::uint32_t replication_factor_;
};

} // namespace core
