#include "service/directory.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <fstream>
#include <mutex>

using json = nlohmann::json;

namespace runbox::service {

std::optional<std::string> JsonDirectory::authenticate(const std::string& token) const {
    if (token.empty()) {
        return std::nullopt;
    }
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tokens_.find(token);
    if (it == tokens_.end()) {
        return std::nullopt;
    }
    return it->second;
}

exec::Tier JsonDirectory::tier_for(const std::string& user_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tiers_.find(user_id);
    return it == tiers_.end() ? exec::Tier::FREE : it->second;
}

void JsonDirectory::add_user(const std::string& user_id, exec::Tier tier, const std::string& token) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    tiers_[user_id] = tier;
    if (!token.empty()) {
        tokens_[token] = user_id;
    }
}

size_t JsonDirectory::user_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return tiers_.size();
}

bool JsonDirectory::load_json(const json& j, std::string& error) {
    if (!j.is_object() || !j.contains("users") || !j["users"].is_array()) {
        error = "directory must be an object with a \"users\" array";
        return false;
    }

    std::unordered_map<std::string, std::string> tokens;
    std::unordered_map<std::string, exec::Tier> tiers;

    size_t index = 0;
    for (const auto& user : j["users"]) {
        if (!user.is_object() || !user.contains("id") || !user["id"].is_string()) {
            error = fmt::format("users[{}] has no string \"id\"", index);
            return false;
        }
        const std::string id = user["id"].get<std::string>();

        std::string tier_name = "free";
        if (user.contains("tier") && user["tier"].is_string()) {
            tier_name = user["tier"].get<std::string>();
        }
        exec::Tier tier = exec::tier_from_string(tier_name);
        if (tier_name != exec::tier_to_string(tier)) {
            spdlog::warn("Directory user {} has unknown tier '{}', using free", id, tier_name);
        }
        tiers[id] = tier;

        auto add_token = [&](const json& t) {
            if (t.is_string() && !t.get<std::string>().empty()) {
                tokens[t.get<std::string>()] = id;
            }
        };
        if (user.contains("token")) add_token(user["token"]);
        if (user.contains("tokens") && user["tokens"].is_array()) {
            for (const auto& t : user["tokens"]) add_token(t);
        }
        ++index;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    tokens_ = std::move(tokens);
    tiers_ = std::move(tiers);
    return true;
}

bool JsonDirectory::load_file(const std::string& path, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = fmt::format("cannot open {}", path);
        return false;
    }

    try {
        json j = json::parse(file);
        if (!load_json(j, error)) {
            return false;
        }
    } catch (const json::exception& e) {
        error = fmt::format("invalid JSON in {}: {}", path, e.what());
        return false;
    }

    spdlog::info("Loaded directory from {} ({} users)", path, user_count());
    return true;
}

} // namespace runbox::service
