/**
 * Runbox Execution Orchestrator
 *
 * Runs one request through the pipeline:
 *
 *   validate -> security gate -> tier limits -> providers in fixed
 *   priority order, each tried once under a hard deadline -> assemble
 *
 * A critical finding ends the request before any provider is called.
 * Provider failures of either kind advance to the next provider; the
 * simulated provider is always last, so it only answers when every
 * real provider failed.
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include "exec/types.hpp"
#include "exec/resource_limits.hpp"
#include "exec/security_scanner.hpp"
#include "exec/code_wrapper.hpp"
#include "providers/provider.hpp"

namespace runbox::audit {
class AuditLogger;
}

namespace runbox::exec {

enum class ExecutionStatus {
    OK,
    VALIDATION_ERROR,
    BLOCKED,
    UNAVAILABLE,
    INTERNAL_ERROR
};

inline const char* execution_status_to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::OK:               return "ok";
        case ExecutionStatus::VALIDATION_ERROR: return "validation_error";
        case ExecutionStatus::BLOCKED:          return "blocked";
        case ExecutionStatus::UNAVAILABLE:      return "unavailable";
        case ExecutionStatus::INTERNAL_ERROR:   return "internal_error";
        default: return "internal_error";
    }
}

// Who is asking, as resolved by the identity collaborator
struct CallerContext {
    std::string user_id;
    Tier tier = Tier::FREE;
};

struct ProviderFailure {
    std::string provider_id;
    providers::FailureKind kind = providers::FailureKind::TRANSIENT;
    std::string message;                     // Internal detail, not returned to callers
};

struct ExecutionOutcome {
    ExecutionStatus status = ExecutionStatus::INTERNAL_ERROR;
    std::string execution_id;
    std::optional<ExecutionResult> result;   // Set only when OK
    std::vector<SecurityFinding> findings;   // All scan findings
    std::vector<std::string> warnings;       // Returned with BLOCKED and UNAVAILABLE
    std::vector<ProviderFailure> failures;   // Attempts that did not produce the result
    std::string error;
    ResourceLimits limits;                   // Effective limits once past validation
    Language language = Language::PYTHON;

    bool ok() const { return status == ExecutionStatus::OK; }
};

struct OrchestratorConfig {
    uint64_t provider_overhead_ms = 2000;    // Added to the snippet timeout per attempt
    size_t max_code_bytes = 256 * 1024;
    bool refuse_wrapped_on_warnings = false; // Strict mode
};

class ExecutionOrchestrator {
public:
    // Providers are tried in the given order. Simulated providers are
    // moved to the end; one is appended if none was supplied.
    ExecutionOrchestrator(std::vector<providers::ProviderPtr> providers,
                          const OrchestratorConfig& config = OrchestratorConfig{},
                          std::shared_ptr<audit::AuditLogger> audit = nullptr);

    // Never throws. Unexpected errors become INTERNAL_ERROR.
    ExecutionOutcome execute(const ExecutionRequest& request, const CallerContext& caller);

    const std::vector<providers::ProviderPtr>& providers() const { return providers_; }
    std::vector<std::string> provider_ids() const;
    const OrchestratorConfig& config() const { return config_; }

private:
    std::vector<providers::ProviderPtr> providers_;
    OrchestratorConfig config_;
    std::shared_ptr<audit::AuditLogger> audit_;
    SecurityScanner scanner_;
    CodeWrapper wrapper_;

    void run(const ExecutionRequest& request, const CallerContext& caller, ExecutionOutcome& outcome);
    std::optional<std::string> validate(const ExecutionRequest& request) const;

    // One attempt on its own thread; abandoned with a cancel signal
    // once the deadline passes
    providers::ProviderResponse attempt(const providers::ProviderPtr& provider,
                                        const providers::ExecutionTask& task,
                                        uint64_t deadline_ms);
};

} // namespace runbox::exec
