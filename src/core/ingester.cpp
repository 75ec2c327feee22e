#include "core/ingester.hpp"

#include <utility>

#include "util/log.hpp"

namespace core {

namespace {

Status empty_tenant() {
    return Status{ErrorCode::InvalidArgument, "tenant id must not be empty"};
}

} // namespace

Ingester::Ingester(const IngesterConfig& cfg, const TenantLimits& limits, const ReplicaCountOracle& ring)
    : Ingester(cfg, limits, ring, chunk::make_chunk_factory(cfg.chunk)) {}

Ingester::Ingester(const IngesterConfig& cfg, const TenantLimits& limits, const ReplicaCountOracle& ring,
                   chunk::ChunkFactory factory)
    : cfg_(cfg)
    , factory_(std::move(factory))
    , limiter_(limits, ring, cfg.replication_factor) {}

Status Ingester::get_or_create_instance(std::string_view tenant, std::shared_ptr<Instance>& out) {
    if (tenant.empty()) {
        return empty_tenant();
    }
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = instances_.find(tenant);
    if (it == instances_.end()) {
        it = instances_.emplace(std::string(tenant),
                                std::make_shared<Instance>(std::string(tenant), factory_, limiter_, cfg_)).first;
        LOG_SLOW_DEBUG("ingester: new tenant %.*s (%zu total)", static_cast<int>(tenant.size()), tenant.data(),
                       instances_.size());
    }
    out = it->second;
    return Status::ok_status();
}

Status Ingester::push(const Context& ctx, std::string_view tenant, const PushRequest& req) {
    if (Status st = ctx.err(); !st.ok()) {
        return st;
    }
    std::shared_ptr<Instance> inst;
    if (Status st = get_or_create_instance(tenant, inst); !st.ok()) {
        return st;
    }
    return inst->push(ctx, req);
}

Status Ingester::get_or_create_stream(std::string_view tenant, std::string_view labels, Stream*& out) {
    std::shared_ptr<Instance> owner;
    return get_or_create_stream(tenant, labels, out, owner);
}

Status Ingester::get_or_create_stream(std::string_view tenant, std::string_view labels, Stream*& out,
                                      std::shared_ptr<Instance>& owner) {
    std::shared_ptr<Instance> inst;
    if (Status st = get_or_create_instance(tenant, inst); !st.ok()) {
        return st;
    }
    Status st = inst->get_or_create_stream(labels, out);
    if (st.ok()) {
        owner = std::move(inst);
    }
    return st;
}

std::shared_ptr<Instance> Ingester::find_instance(std::string_view tenant) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = instances_.find(tenant);
    return it == instances_.end() ? nullptr : it->second;
}

bool Ingester::evict_tenant(std::string_view tenant) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = instances_.find(tenant);
    if (it == instances_.end()) {
        return false;
    }
    instances_.erase(it);
    LOG_SLOW_INFO("ingester: evicted tenant %.*s", static_cast<int>(tenant.size()), tenant.data());
    return true;
}

std::size_t Ingester::tenant_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return instances_.size();
}

std::size_t Ingester::collect_closed_chunks(std::vector<ClosedChunk>& out) const {
    std::vector<std::shared_ptr<Instance>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        snapshot.reserve(instances_.size());
        for (const auto& [name, inst] : instances_) {
            snapshot.push_back(inst);
        }
    }
    std::size_t n = 0;
    for (const auto& inst : snapshot) {
        n += inst->collect_closed_chunks(out);
    }
    return n;
}

} // namespace core
