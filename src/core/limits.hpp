#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

namespace core {

struct Limits {
    // 0 disables the limit.
    std::uint32_t max_local_streams_per_user{10'000};
};

// Per-tenant limits source consulted by the Limiter.
class TenantLimits {
public:
    virtual ~TenantLimits() = default;
    virtual std::uint32_t max_local_streams_per_user(std::string_view tenant) const = 0;
};

// Defaults plus per-tenant overrides. Immutable once built, so concurrent
// readers need no locking.
class Overrides final : public TenantLimits {
public:
    using TenantMap = std::map<std::string, Limits, std::less<>>;

    explicit Overrides(Limits defaults, TenantMap per_tenant = {});

    std::uint32_t max_local_streams_per_user(std::string_view tenant) const override;

    const Limits& defaults() const noexcept { return defaults_; }
    const Limits& for_tenant(std::string_view tenant) const noexcept;
    std::size_t override_count() const noexcept { return per_tenant_.size(); }

private:
    Limits defaults_;
    TenantMap per_tenant_;
};

} // namespace core
