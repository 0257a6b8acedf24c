#include "service/execution_service.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cctype>
#include <cstdint>

using json = nlohmann::json;

namespace runbox::service {

namespace {

const char* EXECUTE_PATH = "/v1/execute";
const char* EXECUTE_ALIAS = "/execute";
const char* HEALTH_PATH = "/health";
const char* AUDIT_PATH = "/v1/audit";

constexpr uint64_t AUDIT_PAGE_MAX = 100;

void add_cors(ipc::Response& response) {
    response.headers.emplace_back("Access-Control-Allow-Origin", "*");
    response.headers.emplace_back("Access-Control-Allow-Headers",
                                  "authorization, x-client-info, apikey, content-type");
    response.headers.emplace_back("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
}

ipc::Response method_not_allowed(const char* allow) {
    auto response = ipc::Response::error(405, "Method not allowed");
    response.headers.emplace_back("Allow", allow);
    return response;
}

// Optional string field: absent or null is nullopt, anything else must be a string
bool optional_string(const json& body, const char* key,
                     std::optional<std::string>& out, std::string& error) {
    if (!body.contains(key) || body[key].is_null()) {
        return true;
    }
    if (!body[key].is_string()) {
        error = fmt::format("{} must be a string", key);
        return false;
    }
    out = body[key].get<std::string>();
    return true;
}

// Decimal query value; absent leaves out untouched
bool query_number(const ipc::Request& request, const char* key, uint64_t& out, std::string& error) {
    auto value = request.query_param(key);
    if (!value) {
        return true;
    }
    if (value->empty() || value->size() > 19 ||
        !std::all_of(value->begin(), value->end(), [](unsigned char c) { return std::isdigit(c); })) {
        error = fmt::format("{} must be a non-negative integer", key);
        return false;
    }
    out = std::stoull(*value);
    return true;
}

} // namespace

ExecutionService::ExecutionService(ExecutionServiceDeps deps)
    : deps_(std::move(deps)) {}

// ============================================================================
// Routing
// ============================================================================

ipc::Response ExecutionService::handle(const ipc::Request& request) {
    ipc::Response response;
    try {
        const bool execute = request.path == EXECUTE_PATH || request.path == EXECUTE_ALIAS;

        if (request.method == "OPTIONS" &&
            (execute || request.path == HEALTH_PATH || request.path == AUDIT_PATH)) {
            response.status = 204;
        } else if (execute) {
            response = request.method == "POST" ? handle_execute(request)
                                                : method_not_allowed("POST, OPTIONS");
        } else if (request.path == HEALTH_PATH) {
            response = request.method == "GET" ? handle_health()
                                               : method_not_allowed("GET, OPTIONS");
        } else if (request.path == AUDIT_PATH) {
            response = request.method == "GET" ? handle_audit(request)
                                               : method_not_allowed("GET, OPTIONS");
        } else {
            response = ipc::Response::error(404, "Not found");
        }
    } catch (const std::exception& e) {
        spdlog::error("[service] Unhandled error on {} {}: {}", request.method, request.path, e.what());
        response = ipc::Response::error(500, "Internal server error");
    }
    add_cors(response);
    return response;
}

ipc::Response ExecutionService::handle_health() const {
    return ipc::Response::make_json(200, {
        {"status", "ok"},
        {"providers", deps_.orchestrator->provider_ids()}
    });
}

// ============================================================================
// Execute
// ============================================================================

std::optional<std::string> ExecutionService::authenticate(const ipc::Request& request,
                                                          ipc::Response& rejection) const {
    auto authorization = request.header("authorization");
    if (!authorization || authorization->empty()) {
        rejection = ipc::Response::error(401, "Missing authorization header");
        return std::nullopt;
    }

    auto user_id = deps_.identity->authenticate(bearer_token(*authorization));
    if (!user_id) {
        rejection = ipc::Response::error(401, "Invalid token");
    }
    return user_id;
}

ipc::Response ExecutionService::handle_execute(const ipc::Request& request) {
    ipc::Response rejection;
    auto user_id = authenticate(request, rejection);
    if (!user_id) {
        return rejection;
    }

    if (deps_.rate_limiter) {
        auto decision = deps_.rate_limiter->check(*user_id);
        if (!decision.allowed) {
            spdlog::info("[service] Rate limit hit for user {}", *user_id);
            if (deps_.audit) {
                deps_.audit->log(audit::AuditCategory::RATE_LIMIT, "RATE_LIMITED", "", *user_id,
                                 {{"retry_after_sec", decision.retry_after_sec}}, false);
            }
            auto response = ipc::Response::error(429, "Rate limit exceeded");
            response.headers.emplace_back("Retry-After", std::to_string(decision.retry_after_sec));
            return response;
        }
    }

    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::parse_error&) {
        return ipc::Response::error(400, "Request body must be valid JSON");
    }
    if (!body.is_object()) {
        return ipc::Response::error(400, "Request body must be a JSON object");
    }

    std::string error;
    auto parsed = parse_execute_body(body, error);
    if (!parsed) {
        return ipc::Response::error(400, error);
    }

    exec::CallerContext caller;
    caller.user_id = *user_id;
    caller.tier = deps_.tiers->tier_for(*user_id);

    auto outcome = deps_.orchestrator->execute(*parsed, caller);
    return respond(outcome, *parsed, caller);
}

// ============================================================================
// Audit
// ============================================================================

ipc::Response ExecutionService::handle_audit(const ipc::Request& request) const {
    ipc::Response rejection;
    auto user_id = authenticate(request, rejection);
    if (!user_id) {
        return rejection;
    }
    if (!deps_.audit) {
        return ipc::Response::error(503, "Audit trail is not enabled");
    }

    std::vector<audit::AuditLogEntry> entries;
    if (auto execution_id = request.query_param("execution_id")) {
        // One execution's trail, including provider attempts, if the caller owns it
        entries = deps_.audit->get_entries_for_execution(*execution_id);
        const bool owned = std::any_of(entries.begin(), entries.end(),
                                       [&](const audit::AuditLogEntry& e) { return e.user_id == *user_id; });
        if (!owned) {
            return ipc::Response::error(404, "Execution not found");
        }
    } else {
        uint64_t since_id = 0;
        uint64_t limit = AUDIT_PAGE_MAX;
        std::string error;
        if (!query_number(request, "since_id", since_id, error) ||
            !query_number(request, "limit", limit, error)) {
            return ipc::Response::error(400, error);
        }
        if (limit == 0 || limit > AUDIT_PAGE_MAX) {
            return ipc::Response::error(400, fmt::format("limit must be between 1 and {}", AUDIT_PAGE_MAX));
        }

        std::optional<audit::AuditCategory> category;
        if (auto name = request.query_param("category")) {
            category = audit::audit_category_from_string(*name);
            if (audit::audit_category_to_string(*category) != *name) {
                return ipc::Response::error(400, fmt::format("Unknown audit category '{}'", *name));
            }
        }

        entries = deps_.audit->get_entries(category ? &*category : nullptr, &*user_id,
                                           since_id, static_cast<size_t>(limit));
    }

    json body;
    body["count"] = entries.size();
    body["last_id"] = deps_.audit->last_entry_id();
    body["entries"] = json::array();
    for (const auto& entry : entries) {
        body["entries"].push_back(entry.to_json());
    }
    return ipc::Response::make_json(200, body);
}

std::optional<exec::ExecutionRequest> ExecutionService::parse_execute_body(const json& body,
                                                                           std::string& error) {
    const bool has_code = body.contains("code") && body["code"].is_string() &&
                          !body["code"].get<std::string>().empty();
    const bool has_language = body.contains("language") && body["language"].is_string() &&
                              !body["language"].get<std::string>().empty();
    if (!has_code || !has_language) {
        error = "Missing required fields: code, language";
        return std::nullopt;
    }

    exec::ExecutionRequest request;
    request.code = body["code"].get<std::string>();
    request.language = body["language"].get<std::string>();

    if (!optional_string(body, "stdin", request.stdin_data, error) ||
        !optional_string(body, "task_id", request.task_id, error) ||
        !optional_string(body, "sandbox_id", request.sandbox_id, error)) {
        return std::nullopt;
    }

    if (body.contains("timeout_ms") && !body["timeout_ms"].is_null()) {
        const auto& t = body["timeout_ms"];
        if (!t.is_number_integer()) {
            error = "timeout_ms must be an integer";
            return std::nullopt;
        }
        if (t.is_number_unsigned() && t.get<uint64_t>() > static_cast<uint64_t>(INT64_MAX)) {
            request.requested_timeout_ms = INT64_MAX;
        } else {
            request.requested_timeout_ms = t.get<int64_t>();
        }
    }
    return request;
}

std::string ExecutionService::bearer_token(const std::string& header) {
    const std::string prefix = "bearer ";
    if (header.size() <= prefix.size() || ipc::to_lower(header.substr(0, prefix.size())) != prefix) {
        return "";
    }
    size_t start = header.find_first_not_of(' ', prefix.size());
    if (start == std::string::npos) {
        return "";
    }
    size_t end = header.find_last_not_of(" \t");
    return header.substr(start, end - start + 1);
}

json ExecutionService::success_body(const std::string& execution_id,
                                    const exec::ExecutionResult& result) {
    json body = {
        {"success", true},
        {"execution_id", execution_id},
        {"stdout", result.stdout_data},
        {"stderr", result.stderr_data},
        {"exit_code", result.exit_code},
        {"execution_time_ms", result.execution_time_ms},
        {"truncated", result.truncated},
        {"security_warnings", result.security_warnings},
        {"sandbox_region", result.provider_id}
    };
    if (result.memory_used_mb) {
        body["memory_used_mb"] = *result.memory_used_mb;
    }
    return body;
}

ipc::Response ExecutionService::respond(const exec::ExecutionOutcome& outcome,
                                        const exec::ExecutionRequest& request,
                                        const exec::CallerContext& caller) {
    switch (outcome.status) {
        case exec::ExecutionStatus::OK:
            record_usage(outcome, request, caller);
            return ipc::Response::make_json(200, success_body(outcome.execution_id, *outcome.result));

        case exec::ExecutionStatus::BLOCKED:
            return ipc::Response::make_json(403, {
                {"error", outcome.error},
                {"security_warnings", outcome.warnings}
            });

        case exec::ExecutionStatus::VALIDATION_ERROR:
            return ipc::Response::error(400, outcome.error);

        case exec::ExecutionStatus::UNAVAILABLE:
            return ipc::Response::make_json(503, {
                {"error", outcome.error},
                {"security_warnings", outcome.warnings}
            });

        case exec::ExecutionStatus::INTERNAL_ERROR:
        default:
            return ipc::Response::error(500, "Internal server error");
    }
}

void ExecutionService::record_usage(const exec::ExecutionOutcome& outcome,
                                    const exec::ExecutionRequest& request,
                                    const exec::CallerContext& caller) {
    if (!deps_.ledger || !outcome.result) {
        return;
    }

    const auto& result = *outcome.result;
    audit::ExecutionRecord record;
    record.execution_id = outcome.execution_id;
    record.user_id = caller.user_id;
    record.tier = exec::tier_to_string(caller.tier);
    record.language = exec::language_to_string(outcome.language);
    record.task_id = request.task_id;
    record.sandbox_id = request.sandbox_id;
    record.code = request.code;
    record.stdin_data = request.stdin_data.value_or("");
    record.stdout_data = result.stdout_data;
    record.stderr_data = result.stderr_data;
    record.exit_code = result.exit_code;
    record.execution_time_ms = result.execution_time_ms;
    record.memory_used_mb = result.memory_used_mb;
    record.provider_id = result.provider_id;
    record.created_at = util::now_iso8601();

    auto recorded = deps_.ledger->record_execution(record);
    if (recorded == audit::RecordOutcome::FAILED) {
        spdlog::error("[service] Failed to record execution {} for user {}",
                      outcome.execution_id, caller.user_id);
    } else if (recorded == audit::RecordOutcome::DUPLICATE) {
        spdlog::debug("[service] Execution {} already recorded", outcome.execution_id);
    }
}

} // namespace runbox::service
