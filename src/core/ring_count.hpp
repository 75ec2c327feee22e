#pragma once

#include <atomic>
#include <cstdint>

namespace core {

// Cluster-membership view: how many ingester replicas share the tenants.
class ReplicaCountOracle {
public:
    virtual ~ReplicaCountOracle() = default;
    virtual int replica_count() const noexcept = 0;
};

// Fixed-size deployment; the count may be updated by whoever tracks membership.
class StaticReplicaCount final : public ReplicaCountOracle {
public:
    explicit StaticReplicaCount(int count) noexcept : count_(count) {}

    int replica_count() const noexcept override { return count_.load(std::memory_order_relaxed); }
    void set(int count) noexcept { count_.store(count, std::memory_order_relaxed); }

private:
    std::atomic<int> count_;
};

} // namespace core
