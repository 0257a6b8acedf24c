#include "providers/modal_provider.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace runbox::providers {

ModalProvider::ModalProvider(RemoteProviderConfig config, std::shared_ptr<HttpClient> client)
    : RemoteProvider(std::move(config), std::move(client)) {
    if (config_.id.empty()) config_.id = DEFAULT_ID;
    if (config_.endpoint.empty()) config_.endpoint = DEFAULT_ENDPOINT;
}

const char* ModalProvider::image_for(exec::Language language) {
    switch (language) {
        case exec::Language::PYTHON:     return "python:3.11-slim";
        case exec::Language::JAVASCRIPT: return "node:20-slim";
        case exec::Language::SHELL:      return "ubuntu:22.04";
        default: return "python:3.11-slim";
    }
}

std::vector<std::string> ModalProvider::command_for(exec::Language language, const std::string& code) {
    switch (language) {
        case exec::Language::JAVASCRIPT: return {"node", "-e", code};
        case exec::Language::SHELL:      return {"bash", "-c", code};
        case exec::Language::PYTHON:
        default:                         return {"python3", "-c", code};
    }
}

json ModalProvider::build_body(const ExecutionTask& task) {
    return {
        {"image", image_for(task.language)},
        {"command", command_for(task.language, task.code)},
        {"timeout", timeout_seconds(task.limits)},
        {"memory_mb", task.limits.memory_mb},
        {"cpu", static_cast<double>(task.limits.cpu_shares) / 1024.0}
    };
}

ProviderResponse ModalProvider::run(const ExecutionTask& task) {
    HttpRequest request = make_request("POST", config_.endpoint, task.limits);
    request.headers.emplace_back("Authorization", "Bearer " + config_.api_key);
    request.body = serialize(build_body(task));

    json body;
    if (auto failure = parse_object("execute", client_->send(request, task.cancel), body)) {
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
