/**
 * Runbox Remote Provider
 *
 * Shared base for the HTTP-backed sandbox adapters. Holds the endpoint,
 * credential and transport, turns exceptions into PERMANENT failures,
 * and decodes the common {stdout, stderr, exit_code, ...} result body.
 */
#pragma once
#include <string>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "providers/provider.hpp"
#include "providers/http_client.hpp"

namespace runbox::providers {

struct RemoteProviderConfig {
    std::string id;
    std::string endpoint;
    std::string api_key;
    uint64_t request_overhead_ms = 2000;     // Added to the snippet timeout for each HTTP call

    bool configured() const { return !endpoint.empty() && !api_key.empty(); }
};

class RemoteProvider : public ExecutionProvider {
public:
    RemoteProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client);

    const std::string& id() const override { return config_.id; }
    const RemoteProviderConfig& config() const { return config_; }

    ProviderResponse execute(const ExecutionTask& task) final;

    // Seconds granted to the remote sandbox (rounded up, at least 1)
    static uint64_t timeout_seconds(const exec::ResourceLimits& limits);

    // Decode a result body; nullopt plus error on a protocol mismatch
    static std::optional<RawExecution> decode_result(const nlohmann::json& body, std::string& error);

protected:
    RemoteProviderConfig config_;
    std::shared_ptr<HttpClient> client_;

    virtual ProviderResponse run(const ExecutionTask& task) = 0;

    HttpRequest make_request(const std::string& method, const std::string& url,
                             const exec::ResourceLimits& limits) const;

    // Parse a 2xx body into a JSON object, or produce the failure to return
    std::optional<ProviderResponse> parse_object(const std::string& step,
                                                 const HttpResponse& response,
                                                 nlohmann::json& out) const;

    static std::string serialize(const nlohmann::json& body);
};

} // namespace runbox::providers
