#include "providers/remote_provider.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

using json = nlohmann::json;

namespace runbox::providers {

RemoteProvider::RemoteProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client)
    : config_(std::move(config))
    , client_(std::move(client)) {}

ProviderResponse RemoteProvider::execute(const ExecutionTask& task) {
    if (!client_) {
        return ProviderResponse::fail(FailureKind::PERMANENT, config_.id + " has no transport");
    }
    if (task.cancelled()) {
        return ProviderResponse::fail(FailureKind::TRANSIENT, config_.id + " attempt cancelled");
    }

    try {
        return run(task);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Adapter error: {}", config_.id, e.what());
        return ProviderResponse::fail(FailureKind::PERMANENT,
            fmt::format("{} adapter error: {}", config_.id, e.what()));
    }
}

uint64_t RemoteProvider::timeout_seconds(const exec::ResourceLimits& limits) {
    uint64_t seconds = (limits.timeout_ms + 999) / 1000;
    return seconds == 0 ? 1 : seconds;
}

HttpRequest RemoteProvider::make_request(const std::string& method, const std::string& url,
                                         const exec::ResourceLimits& limits) const {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout_ms = limits.timeout_ms + config_.request_overhead_ms;
    request.headers.emplace_back("Content-Type", "application/json");
    return request;
}

std::string RemoteProvider::serialize(const json& body) {
    // Snippets may carry invalid UTF-8; replace rather than throw
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<ProviderResponse> RemoteProvider::parse_object(const std::string& step,
                                                             const HttpResponse& response,
                                                             json& out) const {
    if (!http_success(response)) {
        ProviderResponse failure = failure_from_http(config_.id, step, response);
        if (failure.failure == FailureKind::PERMANENT) {
            spdlog::warn("[{}] {}", config_.id, failure.error);
        } else {
            spdlog::info("[{}] {}", config_.id, failure.error);
        }
        return failure;
    }

    try {
        out = json::parse(response.body);
    } catch (const json::parse_error& e) {
        spdlog::warn("[{}] Unparseable {} response: {}", config_.id, step, e.what());
        return ProviderResponse::fail(FailureKind::PERMANENT,
            fmt::format("{} {} returned an unparseable body", config_.id, step));
    }

    if (!out.is_object()) {
        return ProviderResponse::fail(FailureKind::PERMANENT,
            fmt::format("{} {} returned a non-object body", config_.id, step));
    }
    return std::nullopt;
}

std::optional<RawExecution> RemoteProvider::decode_result(const json& body, std::string& error) {
    RawExecution raw;

    auto text_field = [&](const char* key, std::string& target) {
        if (!body.contains(key) || body[key].is_null()) return true;
        if (!body[key].is_string()) {
            error = fmt::format("field '{}' is not a string", key);
            return false;
        }
        target = body[key].get<std::string>();
        return true;
    };

    if (!text_field("stdout", raw.stdout_data)) return std::nullopt;
    if (!text_field("stderr", raw.stderr_data)) return std::nullopt;

    if (body.contains("exit_code") && !body["exit_code"].is_null()) {
        raw.exit_status = body["exit_code"];
    } else if (body.contains("exitCode")) {
        raw.exit_status = body["exitCode"];
    }

    // A zero time means the provider did not measure
    if (body.contains("execution_time_ms") && body["execution_time_ms"].is_number()) {
        double ms = body["execution_time_ms"].get<double>();
        if (ms > 0) raw.reported_time_ms = static_cast<uint64_t>(ms);
    }

    if (body.contains("memory_used_mb") && body["memory_used_mb"].is_number()) {
        raw.memory_used_mb = body["memory_used_mb"].get<double>();
    }

    if (body.contains("security_warnings") && body["security_warnings"].is_array()) {
        for (const auto& w : body["security_warnings"]) {
            if (w.is_string()) raw.warnings.push_back(w.get<std::string>());
        }
    }

    return raw;
}

} // namespace runbox::providers
