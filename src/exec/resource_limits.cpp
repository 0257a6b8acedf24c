#include "exec/resource_limits.hpp"
#include <spdlog/spdlog.h>

namespace runbox::exec {

namespace {

const ResourceLimits FREE_LIMITS = {
    5000,          // timeout_ms
    128,           // memory_mb
    256,           // cpu_shares
    64 * 1024      // max_output_bytes
};

const ResourceLimits PRO_LIMITS = {
    30000,
    512,
    512,
    1024 * 1024
};

const ResourceLimits ENTERPRISE_LIMITS = {
    120000,
    2048,
    1024,
    10 * 1024 * 1024
};

} // namespace

const ResourceLimits& ResourceLimitPolicy::limits_for(Tier tier) {
    switch (tier) {
        case Tier::PRO:        return PRO_LIMITS;
        case Tier::ENTERPRISE: return ENTERPRISE_LIMITS;
        case Tier::FREE:
        default:               return FREE_LIMITS;
    }
}

ResourceLimits ResourceLimitPolicy::effective_limits(Tier tier,
                                                     std::optional<int64_t> requested_timeout_ms) {
    ResourceLimits limits = limits_for(tier);

    if (requested_timeout_ms && *requested_timeout_ms > 0 &&
        static_cast<uint64_t>(*requested_timeout_ms) < limits.timeout_ms) {
        spdlog::debug("Caller tightened timeout: {}ms -> {}ms",
            limits.timeout_ms, *requested_timeout_ms);
        limits.timeout_ms = static_cast<uint64_t>(*requested_timeout_ms);
    }

    return limits;
}

} // namespace runbox::exec
