#include "core/limits.hpp"

#include <utility>

namespace core {

Overrides::Overrides(Limits defaults, TenantMap per_tenant)
    : defaults_(defaults)
    , per_tenant_(std::move(per_tenant)) {}

const Limits& Overrides::for_tenant(std::string_view tenant) const noexcept {
    const auto it = per_tenant_.find(tenant);
    return it == per_tenant_.end() ? defaults_ : it->second;
}

std::uint32_t Overrides::max_local_streams_per_user(std::string_view tenant) const {
    return for_tenant(tenant).max_local_streams_per_user;
}

} // namespace core
