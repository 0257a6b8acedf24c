/**
 * Runbox Service Configuration
 *
 * Built-in defaults, overlaid by an optional JSON file, then by the
 * environment. A .env file fills in environment variables that are
 * not already set; real environment always wins.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace runbox::util {

struct ProviderSettings {
    std::string id;
    std::string url;
    std::string api_key;

    bool configured() const { return !url.empty() && !api_key.empty(); }
};

struct ServiceConfig {
    // Listener
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t workers = 0;                      // 0 = hardware concurrency
    size_t max_body_bytes = 1024 * 1024;

    std::string log_level = "info";

    // Providers, in priority order
    ProviderSettings primary{"ch-gva-2", "", ""};
    ProviderSettings secondary{"e2b", "https://api.e2b.dev", ""};
    ProviderSettings tertiary{"modal", "https://api.modal.com/v1/apps/code-sandbox/functions/execute", ""};
    std::string curl_binary = "curl";

    // Orchestration
    uint64_t provider_overhead_ms = 2000;
    size_t max_code_bytes = 256 * 1024;
    bool strict_wrapping = false;

    // Collaborators
    std::string directory_file;
    std::string ledger_file;                 // Empty = in-memory ledger
    std::string audit_file;                  // Empty = in-memory audit only

    // Per-caller fixed window
    uint32_t rate_limit_requests = 30;
    uint32_t rate_limit_window_sec = 60;

    // Overlay keys present in j. Throws nlohmann::json::exception on
    // wrongly typed values.
    void apply_json(const nlohmann::json& j);

    // Overlay RUNBOX_* variables; false plus error on a malformed value
    bool apply_env(std::string& error);

    // Credentials are redacted
    nlohmann::json to_json() const;

    // to_json() as one line for logging; invalid UTF-8 becomes U+FFFD
    std::string summary() const;
};

// Load KEY=VALUE lines from the first .env found next to the working
// directory or the executable. Existing variables are never replaced.
void load_dotenv();

// Load one .env file; false if it does not exist
bool load_dotenv_file(const std::filesystem::path& path);

// Defaults, then the JSON file (if path is non-empty), then .env and
// environment. nullopt plus error if any layer is invalid.
std::optional<ServiceConfig> load_service_config(const std::string& path, std::string& error);

} // namespace runbox::util
