#include "core/limiter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace core {

Limiter::Limiter(const TenantLimits& limits, const ReplicaCountOracle& ring, std::uint32_t replication_factor)
    : limits_(limits)
    , ring_(ring)
    , replication_factor_(replication_factor) {
    if (replication_factor_ == 0) {
        throw std::invalid_argument("Limiter replication_factor must be > 0");
    }
}

std::size_t Limiter::effective_limit(std::string_view tenant) const {
    const std::uint64_t configured = limits_.max_local_streams_per_user(tenant);
    if (configured == 0) {
        return unlimited;
    }
    const int replicas = ring_.replica_count();
    if (replicas <= 0) {
        return static_cast<std::size_t>(configured);
    }
    const std::uint64_t scaled = configured * replication_factor_;
    const std::uint64_t n = static_cast<std::uint64_t>(replicas);
    const std::uint64_t share = (scaled + n - 1) / n;
    return static_cast<std::size_t>(std::max<std::uint64_t>(1, share));
}

bool Limiter::check_and_reserve(std::string_view tenant, std::size_t current_streams) const {
    return current_streams < effective_limit(tenant);
}

Status Limiter::assert_max_streams_per_user(std::string_view tenant, std::size_t current_streams) const {
    const std::size_t limit = effective_limit(tenant);
    if (current_streams < limit) {
        return Status::ok_status();
    }
    std::string msg = "per-user streams limit exceeded for tenant ";
    msg.append(tenant);
    msg += ": " + std::to_string(current_streams) + " streams, effective limit " + std::to_string(limit);
    msg += " (configured " + std::to_string(limits_.max_local_streams_per_user(tenant));
    msg += ", replicas " + std::to_string(ring_.replica_count());
    msg += ", replication factor " + std::to_string(replication_factor_) + ")";
    return Status{ErrorCode::StreamLimitExceeded, std::move(msg)};
}

} // namespace core
