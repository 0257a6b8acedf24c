/**
 * Runbox Execution Service
 *
 * Maps the JSON API onto the orchestrator:
 *
 *   POST /v1/execute   run a snippet (also served at /execute)
 *   GET  /health       liveness and the provider chain
 *   GET  /v1/audit     the caller's own audit trail
 *
 * Each execute call is authenticated with a bearer token, rate limited
 * per user, decoded, orchestrated and, when it succeeds, recorded in
 * the usage ledger. Audit reads take the same token and only ever see
 * entries attributed to that user, paged with since_id and limit, or
 * one owned execution's full trail via execution_id.
 */
#pragma once
#include <string>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>
#include "ipc/http_message.hpp"
#include "exec/orchestrator.hpp"
#include "service/directory.hpp"
#include "service/rate_limiter.hpp"
#include "audit/usage_ledger.hpp"
#include "audit/audit_log.hpp"

namespace runbox::service {

struct ExecutionServiceDeps {
    std::shared_ptr<exec::ExecutionOrchestrator> orchestrator;
    std::shared_ptr<IdentityProvider> identity;
    std::shared_ptr<TierResolver> tiers;
    std::shared_ptr<audit::UsageLedger> ledger;
    std::shared_ptr<RateLimiter> rate_limiter;   // May be null
    std::shared_ptr<audit::AuditLogger> audit;   // May be null
};

class ExecutionService {
public:
    explicit ExecutionService(ExecutionServiceDeps deps);

    // Route one request. Never throws.
    ipc::Response handle(const ipc::Request& request);

    // Decode an execute body; nullopt plus error on a malformed field
    static std::optional<exec::ExecutionRequest> parse_execute_body(const nlohmann::json& body,
                                                                    std::string& error);

    // Token from "Bearer <token>"; empty if the header has another form
    static std::string bearer_token(const std::string& header);

    // Success body for an assembled result
    static nlohmann::json success_body(const std::string& execution_id,
                                       const exec::ExecutionResult& result);

private:
    ExecutionServiceDeps deps_;

    // Caller's user id; on failure, nullopt plus a 401 in rejection
    std::optional<std::string> authenticate(const ipc::Request& request,
                                            ipc::Response& rejection) const;

    ipc::Response handle_execute(const ipc::Request& request);
    ipc::Response handle_health() const;
    ipc::Response handle_audit(const ipc::Request& request) const;

    ipc::Response respond(const exec::ExecutionOutcome& outcome,
                          const exec::ExecutionRequest& request,
                          const exec::CallerContext& caller);

    void record_usage(const exec::ExecutionOutcome& outcome,
                      const exec::ExecutionRequest& request,
                      const exec::CallerContext& caller);
};

} // namespace runbox::service
