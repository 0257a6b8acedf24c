/**
 * Runbox Resource Limits
 *
 * Fixed per-tier resource ceilings. Every field widens monotonically
 * from FREE to PRO to ENTERPRISE.
 */
#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace runbox::exec {

// Subscription tiers, ordered from most to least restricted
enum class Tier {
    FREE,
    PRO,
    ENTERPRISE
};

inline const char* tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::FREE:       return "free";
        case Tier::PRO:        return "pro";
        case Tier::ENTERPRISE: return "enterprise";
        default: return "free";
    }
}

// Unknown tier names resolve to FREE
inline Tier tier_from_string(const std::string& str) {
    if (str == "pro")        return Tier::PRO;
    if (str == "enterprise") return Tier::ENTERPRISE;
    return Tier::FREE;
}

struct ResourceLimits {
    uint64_t timeout_ms = 0;
    uint64_t memory_mb = 0;
    uint64_t cpu_shares = 0;
    uint64_t max_output_bytes = 0;
};

class ResourceLimitPolicy {
public:
    // Tier defaults
    static const ResourceLimits& limits_for(Tier tier);

    // Tier defaults with an optional caller timeout applied. The caller
    // value only wins when it is strictly smaller than the tier ceiling.
    static ResourceLimits effective_limits(Tier tier,
                                           std::optional<int64_t> requested_timeout_ms);
};

} // namespace runbox::exec
