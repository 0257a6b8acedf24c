#include "exec/orchestrator.hpp"
#include "exec/result_assembler.hpp"
#include "audit/audit_log.hpp"
#include "providers/simulated_provider.hpp"
#include "util/ids.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <thread>

using json = nlohmann::json;

namespace runbox::exec {

using providers::ExecutionTask;
using providers::FailureKind;
using providers::ProviderPtr;
using providers::ProviderResponse;

namespace {

uint64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count());
}

json findings_to_json(const std::vector<SecurityFinding>& findings) {
    json arr = json::array();
    for (const auto& f : findings) {
        arr.push_back({{"description", f.description}, {"severity", severity_to_string(f.severity)}});
    }
    return arr;
}

std::string failure_summary(const std::vector<ProviderFailure>& failures) {
    std::string summary;
    for (const auto& f : failures) {
        if (!summary.empty()) summary += ", ";
        summary += fmt::format("{} ({})", f.provider_id, providers::failure_kind_to_string(f.kind));
    }
    return summary;
}

} // namespace

ExecutionOrchestrator::ExecutionOrchestrator(std::vector<ProviderPtr> providers,
                                             const OrchestratorConfig& config,
                                             std::shared_ptr<audit::AuditLogger> audit)
    : providers_(std::move(providers))
    , config_(config)
    , audit_(std::move(audit)) {

    providers_.erase(std::remove(providers_.begin(), providers_.end(), nullptr), providers_.end());
    std::stable_partition(providers_.begin(), providers_.end(),
        [](const ProviderPtr& p) { return !p->is_simulated(); });

    if (providers_.empty() || !providers_.back()->is_simulated()) {
        providers_.push_back(std::make_shared<providers::SimulatedProvider>());
    }

    spdlog::info("Execution providers: {}", fmt::join(provider_ids(), " -> "));
}

std::vector<std::string> ExecutionOrchestrator::provider_ids() const {
    std::vector<std::string> ids;
    ids.reserve(providers_.size());
    for (const auto& p : providers_) {
        ids.push_back(p->id());
    }
    return ids;
}

ExecutionOutcome ExecutionOrchestrator::execute(const ExecutionRequest& request, const CallerContext& caller) {
    ExecutionOutcome outcome;
    outcome.execution_id = util::generate_execution_id();

    try {
        run(request, caller, outcome);
    } catch (const std::exception& e) {
        spdlog::error("[{}] Unexpected execution error: {}", outcome.execution_id, e.what());
        outcome.status = ExecutionStatus::INTERNAL_ERROR;
        outcome.result.reset();
        outcome.error = "Internal execution error";

        if (audit_) {
            try {
                audit_->log(audit::AuditCategory::INTERNAL, "EXECUTION_ERROR", outcome.execution_id,
                            caller.user_id, {{"error", e.what()}}, false);
            } catch (const std::exception& audit_error) {
                spdlog::error("[{}] Audit write failed: {}", outcome.execution_id, audit_error.what());
            }
        }
    }
    return outcome;
}

std::optional<std::string> ExecutionOrchestrator::validate(const ExecutionRequest& request) const {
    if (request.code.empty()) {
        return std::string("code is required");
    }
    if (request.language.empty()) {
        return std::string("language is required");
    }
    if (!language_from_string(request.language)) {
        return fmt::format("Unsupported language: {}. Supported: python, javascript, shell",
                           request.language);
    }
    if (request.code.size() > config_.max_code_bytes) {
        return fmt::format("code exceeds {} bytes", config_.max_code_bytes);
    }
    if (request.requested_timeout_ms && *request.requested_timeout_ms <= 0) {
        return std::string("timeout_ms must be positive");
    }
    return std::nullopt;
}

void ExecutionOrchestrator::run(const ExecutionRequest& request,
                                const CallerContext& caller,
                                ExecutionOutcome& outcome) {
    const std::string& exec_id = outcome.execution_id;

    // Init
    if (auto error = validate(request)) {
        spdlog::info("[{}] Rejected request: {}", exec_id, *error);
        outcome.status = ExecutionStatus::VALIDATION_ERROR;
        outcome.error = *error;
        if (audit_) {
            audit_->log(audit::AuditCategory::VALIDATION, "REQUEST_REJECTED", exec_id,
                        caller.user_id, {{"error", *error}}, false);
        }
        return;
    }
    const Language language = *language_from_string(request.language);
    outcome.language = language;

    // Security gate
    outcome.findings = scanner_.scan(request.code, language);
    std::vector<std::string> scanner_warnings = SecurityScanner::descriptions(outcome.findings);

    if (SecurityScanner::has_critical(outcome.findings)) {
        spdlog::warn("[{}] Blocked {} snippet from user {} ({} findings)",
                     exec_id, language_to_string(language), caller.user_id, outcome.findings.size());
        outcome.status = ExecutionStatus::BLOCKED;
        outcome.warnings = scanner_warnings;
        outcome.error = "Code blocked for security reasons";
        if (audit_) {
            audit_->log_security("EXECUTION_BLOCKED", exec_id, caller.user_id, {
                {"language", language_to_string(language)},
                {"code_bytes", request.code.size()},
                {"findings", findings_to_json(outcome.findings)}
            });
        }
        return;
    }

    outcome.limits = ResourceLimitPolicy::effective_limits(caller.tier, request.requested_timeout_ms);
    const uint64_t deadline_ms = outcome.limits.timeout_ms + config_.provider_overhead_ms;

    // Attempting
    const auto started = std::chrono::steady_clock::now();
    std::optional<std::string> wrapped;

    for (const auto& provider : providers_) {
        if (provider->needs_wrapping() && config_.refuse_wrapped_on_warnings && !scanner_warnings.empty()) {
            spdlog::info("[{}] Skipping {}: strict wrapping with {} warnings",
                         exec_id, provider->id(), scanner_warnings.size());
            outcome.failures.push_back({provider->id(), FailureKind::PERMANENT,
                                        "skipped in strict mode"});
            continue;
        }

        ExecutionTask task;
        if (provider->needs_wrapping()) {
            if (!wrapped) {
                wrapped = wrapper_.wrap(request.code, language, request.stdin_data, outcome.limits);
            }
            task.code = *wrapped;
        } else {
            task.code = request.code;
        }
        task.language = language;
        task.limits = outcome.limits;
        task.stdin_data = request.stdin_data;
        task.user_id = caller.user_id;
        task.tier = caller.tier;
        task.cancel = providers::make_cancel_flag();

        spdlog::debug("[{}] Attempting {} (deadline {}ms)", exec_id, provider->id(), deadline_ms);
        ProviderResponse response = attempt(provider, task, deadline_ms);

        if (response.success) {
            ExecutionResult result = ResultAssembler::assemble(
                scanner_warnings, response.output, provider->id(), outcome.limits, elapsed_ms(started));

            if (provider->is_simulated()) {
                result.security_warnings.push_back(outcome.failures.empty()
                    ? std::string("No sandbox provider is configured")
                    : "All sandbox providers failed: " + failure_summary(outcome.failures));
            }

            spdlog::info("[{}] {} completed on {} in {}ms (exit={}, truncated={})",
                         exec_id, language_to_string(language), provider->id(),
                         result.execution_time_ms, result.exit_code, result.truncated);

            if (audit_) {
                audit_->log(audit::AuditCategory::EXECUTION, "EXECUTION_COMPLETED", exec_id, caller.user_id, {
                    {"provider_id", provider->id()},
                    {"language", language_to_string(language)},
                    {"tier", tier_to_string(caller.tier)},
                    {"exit_code", result.exit_code},
                    {"execution_time_ms", result.execution_time_ms},
                    {"truncated", result.truncated},
                    {"warnings", result.security_warnings.size()}
                });
            }

            outcome.status = ExecutionStatus::OK;
            outcome.result = std::move(result);
            return;
        }

        if (response.failure == FailureKind::PERMANENT) {
            spdlog::warn("[{}] Provider {} failed permanently: {}", exec_id, provider->id(), response.error);
        } else {
            spdlog::info("[{}] Provider {} failed transiently: {}", exec_id, provider->id(), response.error);
        }
        if (audit_) {
            audit_->log_provider_failure(exec_id, provider->id(),
                                         providers::failure_kind_to_string(response.failure),
                                         response.error);
        }
        outcome.failures.push_back({provider->id(), response.failure, response.error});
    }

    // Even the simulated fallback failed
    spdlog::error("[{}] No provider produced a result: {}", exec_id, failure_summary(outcome.failures));
    outcome.status = ExecutionStatus::UNAVAILABLE;
    outcome.error = "No execution provider is available";
    outcome.warnings = scanner_warnings;
    for (const auto& f : outcome.failures) {
        outcome.warnings.push_back(fmt::format("Provider {} failed ({})",
            f.provider_id, providers::failure_kind_to_string(f.kind)));
    }
}

ProviderResponse ExecutionOrchestrator::attempt(const ProviderPtr& provider,
                                                const ExecutionTask& task,
                                                uint64_t deadline_ms) {
    auto promise = std::make_shared<std::promise<ProviderResponse>>();
    std::future<ProviderResponse> future = promise->get_future();

    // The thread owns copies of everything it touches, so it may
    // outlive this call
    std::thread([provider, task, promise]() {
        try {
            promise->set_value(provider->execute(task));
        } catch (const std::exception& e) {
            promise->set_value(ProviderResponse::fail(FailureKind::PERMANENT,
                fmt::format("{} raised: {}", provider->id(), e.what())));
        }
    }).detach();

    if (future.wait_for(std::chrono::milliseconds(deadline_ms)) == std::future_status::timeout) {
        if (task.cancel) {
            task.cancel->store(true);
        }
        return ProviderResponse::fail(FailureKind::TRANSIENT,
            fmt::format("{} exceeded the {}ms deadline", provider->id(), deadline_ms));
    }

    try {
        return future.get();
    } catch (const std::exception& e) {
        return ProviderResponse::fail(FailureKind::PERMANENT,
            fmt::format("{} attempt failed: {}", provider->id(), e.what()));
    }
}

} // namespace runbox::exec
