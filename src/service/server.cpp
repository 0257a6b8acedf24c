#include "service/server.hpp"
#include "providers/primary_provider.hpp"
#include "providers/e2b_provider.hpp"
#include "providers/modal_provider.hpp"
#include <spdlog/spdlog.h>
#include <csignal>
#include <thread>
#include <chrono>

namespace runbox::service {

// Global server pointer for signal handling
static Server* g_server = nullptr;

static void signal_handler(int) {
    if (g_server) {
        g_server->shutdown();
    }
}

namespace {

providers::RemoteProviderConfig remote_config(const util::ProviderSettings& settings,
                                              uint64_t overhead_ms) {
    providers::RemoteProviderConfig config;
    config.id = settings.id;
    config.endpoint = settings.url;
    config.api_key = settings.api_key;
    config.request_overhead_ms = overhead_ms;
    return config;
}

} // namespace

Server::Server(const util::ServiceConfig& config)
    : config_(config) {}

Server::~Server() {
    if (http_server_) {
        http_server_->stop();
    }
    if (g_server == this) {
        g_server = nullptr;
    }
}

std::vector<providers::ProviderPtr> Server::build_providers(
    const util::ServiceConfig& config,
    std::shared_ptr<providers::HttpClient> client) {
    std::vector<providers::ProviderPtr> chain;

    auto add = [&](const char* tier, const util::ProviderSettings& settings, auto make) {
        if (!settings.configured()) {
            spdlog::warn("{} provider '{}' has no {}, skipping", tier, settings.id,
                         settings.url.empty() ? "url" : "api key");
            return;
        }
        chain.push_back(make(remote_config(settings, config.provider_overhead_ms)));
    };

    add("Primary", config.primary, [&](providers::RemoteProviderConfig c) -> providers::ProviderPtr {
        return std::make_shared<providers::PrimaryProvider>(std::move(c), client);
    });
    add("Secondary", config.secondary, [&](providers::RemoteProviderConfig c) -> providers::ProviderPtr {
        return std::make_shared<providers::E2bProvider>(std::move(c), client);
    });
    add("Tertiary", config.tertiary, [&](providers::RemoteProviderConfig c) -> providers::ProviderPtr {
        return std::make_shared<providers::ModalProvider>(std::move(c), client);
    });
    return chain;
}

bool Server::init() {
    spdlog::info("Initializing Runbox...");

    // Audit trail
    audit::AuditConfig audit_config;
    audit_config.jsonl_path = config_.audit_file;
    audit_ = std::make_shared<audit::AuditLogger>(audit_config);
    if (!config_.audit_file.empty() && !audit_->persistent()) {
        spdlog::error("Cannot open audit file {}", config_.audit_file);
        return false;
    }

    // Usage ledger
    if (config_.ledger_file.empty()) {
        spdlog::warn("No ledger file configured, usage is kept in memory only");
        ledger_ = std::make_shared<audit::InMemoryUsageLedger>();
    } else {
        auto ledger = std::make_shared<audit::JsonlUsageLedger>(config_.ledger_file);
        if (!ledger->is_open()) {
            spdlog::error("Cannot open ledger file {}", config_.ledger_file);
            return false;
        }
        ledger_ = ledger;
    }

    // Identity and tiers
    directory_ = std::make_shared<JsonDirectory>();
    if (config_.directory_file.empty()) {
        spdlog::warn("No directory file configured, every token will be rejected");
    } else {
        std::string error;
        if (!directory_->load_file(config_.directory_file, error)) {
            spdlog::error("Failed to load directory: {}", error);
            return false;
        }
    }

    rate_limiter_ = std::make_shared<RateLimiter>(
        config_.rate_limit_requests, std::chrono::seconds(config_.rate_limit_window_sec));

    // Provider chain
    providers::CurlClientConfig curl_config;
    curl_config.curl_binary = config_.curl_binary;
    auto client = std::make_shared<providers::CurlHttpClient>(curl_config);

    exec::OrchestratorConfig orchestrator_config;
    orchestrator_config.provider_overhead_ms = config_.provider_overhead_ms;
    orchestrator_config.max_code_bytes = config_.max_code_bytes;
    orchestrator_config.refuse_wrapped_on_warnings = config_.strict_wrapping;
    orchestrator_ = std::make_shared<exec::ExecutionOrchestrator>(
        build_providers(config_, client), orchestrator_config, audit_);

    ExecutionServiceDeps deps;
    deps.orchestrator = orchestrator_;
    deps.identity = directory_;
    deps.tiers = directory_;
    deps.ledger = ledger_;
    deps.rate_limiter = rate_limiter_;
    deps.audit = audit_;
    service_ = std::make_unique<ExecutionService>(std::move(deps));

    // Listener
    ipc::HttpServerConfig http_config;
    http_config.host = config_.host;
    http_config.port = config_.port;
    http_config.workers = config_.workers;
    http_config.limits.max_body_bytes = config_.max_body_bytes;
    http_server_ = std::make_unique<ipc::HttpServer>(http_config);
    http_server_->set_handler([this](const ipc::Request& request) {
        return service_->handle(request);
    });

    if (!http_server_->start()) {
        spdlog::error("Failed to start HTTP server on {}:{}", config_.host, config_.port);
        return false;
    }

    // Set up signal handlers
    g_server = this;
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    spdlog::info("Runbox initialized successfully");
    spdlog::info("Strict wrapping: {}", config_.strict_wrapping ? "enabled" : "disabled");
    spdlog::info("Rate limit: {} requests per {}s", config_.rate_limit_requests,
                 config_.rate_limit_window_sec);
    return true;
}

void Server::run() {
    running_ = true;
    spdlog::info("Runbox listening on {}:{}", config_.host, port());
    spdlog::info("Press Ctrl+C to exit");

    auto last_prune = std::chrono::steady_clock::now();
    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (now - last_prune >= std::chrono::seconds(PRUNE_INTERVAL_SEC)) {
            size_t removed = rate_limiter_->prune();
            if (removed > 0) {
                spdlog::debug("Pruned {} rate limit windows", removed);
            }
            last_prune = now;
        }
    }

    spdlog::info("Runbox shutting down...");
    http_server_->stop();
    spdlog::info("Served {} requests", http_server_->total_requests());
    spdlog::info("Runbox stopped");
}

void Server::shutdown() {
    running_ = false;
}

uint16_t Server::port() const {
    return http_server_ ? http_server_->bound_port() : config_.port;
}

} // namespace runbox::service
