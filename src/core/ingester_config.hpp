#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

#include "chunk/chunk.hpp"

namespace core {

// What a Stream does with an entry older than the newest one it has seen.
enum class OutOfOrderPolicy : std::uint8_t {
    Accept, // append as received
    Reject, // skip it and report EntryOutOfOrder
};

inline std::optional<OutOfOrderPolicy> out_of_order_policy_from_string(std::string_view s) noexcept {
    if (s == "accept") return OutOfOrderPolicy::Accept;
    if (s == "reject") return OutOfOrderPolicy::Reject;
    return std::nullopt;
}

// Ingester write-path settings. Time values are in nanoseconds.
struct IngesterConfig {
    // Target span of a chunk before it is cut; 0 disables time-based cuts.
    std::int64_t sync_period_ns{0};
    // A chunk that reached sync_period keeps growing until it is at least this full.
    double sync_min_utilization{0.0};

    chunk::ChunkConfig chunk{};

    OutOfOrderPolicy out_of_order{OutOfOrderPolicy::Accept};

    // Replication of each stream across ingesters and the static replica count
    // used when no membership service is wired in.
    std::uint32_t replication_factor{1};
    int replica_count{1};

    std::uint32_t push_workers{4};
};

static_assert(std::is_trivially_copyable_v<IngesterConfig>, "IngesterConfig must be trivially copyable");

[[nodiscard]] inline constexpr IngesterConfig default_ingester_config() noexcept {
    return IngesterConfig{};
}

} // namespace core
