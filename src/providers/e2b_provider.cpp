#include "providers/e2b_provider.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runbox::providers {

E2bProvider::E2bProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client)
    : RemoteProvider(std::move(config), std::move(client)) {
    if (config_.id.empty()) config_.id = DEFAULT_ID;
    if (config_.endpoint.empty()) config_.endpoint = DEFAULT_ENDPOINT;
}

const char* E2bProvider::template_for(exec::Language language) {
    switch (language) {
        case exec::Language::PYTHON:     return "Python3";
        case exec::Language::JAVASCRIPT: return "Node";
        case exec::Language::SHELL:      return "Bash";
        default: return "Python3";
    }
}

std::string E2bProvider::base_url() const {
    std::string base = config_.endpoint;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base;
}

ProviderResponse E2bProvider::run(const ExecutionTask& task) {
    const std::string base = base_url();
    const uint64_t timeout = timeout_seconds(task.limits);

    // Create
    HttpRequest create = make_request("POST", base + "/sandboxes", task.limits);
    create.headers.emplace_back("X-API-Key", config_.api_key);
    create.body = serialize({
        {"template", template_for(task.language)},
        {"timeout", timeout}
    });

    json created;
    if (auto failure = parse_object("sandbox create", client_->send(create, task.cancel), created)) {
        return *failure;
    }
    if (!created.contains("id") || !created["id"].is_string() ||
        created["id"].get<std::string>().empty()) {
        return ProviderResponse::fail(FailureKind::PERMANENT, config_.id + " sandbox create returned no id");
    }
    const std::string sandbox_id = created["id"].get<std::string>();
    spdlog::debug("[{}] Created sandbox {}", config_.id, sandbox_id);

    if (task.cancelled()) {
        destroy_sandbox(sandbox_id);
        return ProviderResponse::fail(FailureKind::TRANSIENT, config_.id + " attempt cancelled");
    }

    // Run
    HttpRequest exec_request = make_request("POST", base + "/sandboxes/" + sandbox_id + "/code", task.limits);
    exec_request.headers.emplace_back("X-API-Key", config_.api_key);
    exec_request.body = serialize({
        {"code", task.code},
        {"timeout", timeout}
    });
    HttpResponse exec_response = client_->send(exec_request, task.cancel);

    // Delete
    destroy_sandbox(sandbox_id);

    json body;
    if (auto failure = parse_object("code run", exec_response, body)) {
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

void E2bProvider::destroy_sandbox(const std::string& sandbox_id) {
    HttpRequest request;
    request.method = "DELETE";
    request.url = base_url() + "/sandboxes/" + sandbox_id;
    request.timeout_ms = CLEANUP_TIMEOUT_MS;
    request.headers.emplace_back("X-API-Key", config_.api_key);

    // Cleanup runs even after the attempt was cancelled
    HttpResponse response = client_->send(request, nullptr);
    if (!http_success(response)) {
        spdlog::warn("[{}] Failed to delete sandbox {}: {}", config_.id, sandbox_id,
                     response.transport_ok ? "HTTP " + std::to_string(response.status) : response.error);
    }
}

} // namespace runbox::providers
