/**
 * Runbox Server
 *
 * Owns every subsystem of a running service:
 * - Provider chain (primary, secondary, tertiary, simulated)
 * - ExecutionOrchestrator
 * - Directory, RateLimiter, UsageLedger, AuditLogger
 * - ExecutionService on an HttpServer
 */
#pragma once
#include <string>
#include <vector>
#include <memory>
#include <atomic>
#include "util/config.hpp"
#include "providers/provider.hpp"
#include "providers/http_client.hpp"
#include "exec/orchestrator.hpp"
#include "service/directory.hpp"
#include "service/rate_limiter.hpp"
#include "service/execution_service.hpp"
#include "audit/audit_log.hpp"
#include "audit/usage_ledger.hpp"
#include "ipc/http_server.hpp"

namespace runbox::service {

class Server {
public:
    static constexpr int PRUNE_INTERVAL_SEC = 60;

    explicit Server(const util::ServiceConfig& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Build the subsystems and start listening
    bool init();

    // Block until shutdown() is called or a SIGINT/SIGTERM arrives
    void run();
    void shutdown();

    uint16_t port() const;
    const util::ServiceConfig& config() const { return config_; }

    // Remote providers in priority order; unconfigured ones are left out
    static std::vector<providers::ProviderPtr> build_providers(
        const util::ServiceConfig& config,
        std::shared_ptr<providers::HttpClient> client);

private:
    util::ServiceConfig config_;
    std::atomic<bool> running_{false};

    std::shared_ptr<audit::AuditLogger> audit_;
    std::shared_ptr<audit::UsageLedger> ledger_;
    std::shared_ptr<JsonDirectory> directory_;
    std::shared_ptr<RateLimiter> rate_limiter_;
    std::shared_ptr<exec::ExecutionOrchestrator> orchestrator_;
    std::unique_ptr<ExecutionService> service_;
    std::unique_ptr<ipc::HttpServer> http_server_;
};

} // namespace runbox::service
