#include "providers/primary_provider.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runbox::providers {

PrimaryProvider::PrimaryProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client)
    : RemoteProvider(std::move(config), std::move(client)) {
    if (config_.id.empty()) {
        config_.id = DEFAULT_ID;
    }
}

json PrimaryProvider::build_body(const ExecutionTask& task) {
    json body = {
        {"code", task.code},
        {"language", exec::language_to_string(task.language)},
        {"user_id", task.user_id.empty() ? "anonymous" : task.user_id},
        {"tier", exec::tier_to_string(task.tier)},
        {"timeout_seconds", timeout_seconds(task.limits)}
    };
    if (task.stdin_data) {
        body["stdin"] = *task.stdin_data;
    }
    return body;
}

ProviderResponse PrimaryProvider::run(const ExecutionTask& task) {
    spdlog::debug("[{}] Submitting {} snippet ({} bytes)", config_.id,
                  exec::language_to_string(task.language), task.code.size());

    HttpRequest request = make_request("POST", config_.endpoint, task.limits);
    request.headers.emplace_back("X-API-Key", config_.api_key);
    request.body = serialize(build_body(task));

    HttpResponse response = client_->send(request, task.cancel);

    json body;
    if (auto failure = parse_object("execute", response, body)) {
        return *failure;
    }

    std::string error;
    auto raw = decode_result(body, error);
    if (!raw) {
        spdlog::warn("[{}] Protocol mismatch: {}", config_.id, error);
        return ProviderResponse::fail(FailureKind::PERMANENT, config_.id + " protocol mismatch: " + error);
    }

    return ProviderResponse::ok(std::move(*raw));
}

} // namespace runbox::providers
