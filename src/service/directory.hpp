/**
 * Runbox Directory
 *
 * Identity and entitlement collaborators. IdentityProvider maps a
 * bearer token to a user id; TierResolver maps a user id to a tier.
 * JsonDirectory implements both from a JSON document:
 *
 *   {"users": [{"id": "u1", "tier": "pro", "tokens": ["..."]}]}
 */
#pragma once
#include <string>
#include <optional>
#include <unordered_map>
#include <shared_mutex>
#include <nlohmann/json.hpp>
#include "exec/resource_limits.hpp"

namespace runbox::service {

class IdentityProvider {
public:
    virtual ~IdentityProvider() = default;
    virtual std::optional<std::string> authenticate(const std::string& token) const = 0;
};

class TierResolver {
public:
    virtual ~TierResolver() = default;
    // Unknown users resolve to FREE
    virtual exec::Tier tier_for(const std::string& user_id) const = 0;
};

class JsonDirectory : public IdentityProvider, public TierResolver {
public:
    std::optional<std::string> authenticate(const std::string& token) const override;
    exec::Tier tier_for(const std::string& user_id) const override;

    // Replace the contents; false plus error if the document is invalid
    bool load_json(const nlohmann::json& j, std::string& error);
    bool load_file(const std::string& path, std::string& error);

    void add_user(const std::string& user_id, exec::Tier tier, const std::string& token);

    size_t user_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::string> tokens_;     // token -> user id
    std::unordered_map<std::string, exec::Tier> tiers_;       // user id -> tier
};

} // namespace runbox::service
