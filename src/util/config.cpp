#include "util/config.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <climits>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <unistd.h>

using json = nlohmann::json;

namespace runbox::util {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool parse_unsigned(const char* name, const char* text, uint64_t max, uint64_t& out, std::string& error) {
    std::string value = text;
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        error = fmt::format("{} must be a non-negative integer, got '{}'", name, value);
        return false;
    }
    try {
        out = std::stoull(value);
    } catch (const std::exception&) {
        error = fmt::format("{} is out of range", name);
        return false;
    }
    if (out > max) {
        error = fmt::format("{} must be at most {}", name, max);
        return false;
    }
    return true;
}

bool parse_bool(const char* name, const char* text, bool& out, std::string& error) {
    std::string value = text;
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    error = fmt::format("{} must be a boolean, got '{}'", name, value);
    return false;
}

void apply_provider_json(const json& j, ProviderSettings& settings) {
    if (j.contains("id")) settings.id = j["id"].get<std::string>();
    if (j.contains("url")) settings.url = j["url"].get<std::string>();
    if (j.contains("api_key")) settings.api_key = j["api_key"].get<std::string>();
}

void apply_provider_env(const char* prefix, ProviderSettings& settings) {
    std::string base = std::string("RUNBOX_") + prefix;
    if (const char* v = env((base + "_URL").c_str())) settings.url = v;
    if (const char* v = env((base + "_API_KEY").c_str())) settings.api_key = v;
    if (const char* v = env((base + "_ID").c_str())) settings.id = v;
}

json provider_to_json(const ProviderSettings& settings) {
    return {
        {"id", settings.id},
        {"url", settings.url},
        {"api_key", settings.api_key.empty() ? "" : "<redacted>"}
    };
}

} // namespace

// ============================================================================
// ServiceConfig Implementation
// ============================================================================

void ServiceConfig::apply_json(const json& j) {
    if (j.contains("host")) host = j["host"].get<std::string>();
    if (j.contains("port")) port = j["port"].get<uint16_t>();
    if (j.contains("workers")) workers = j["workers"].get<size_t>();
    if (j.contains("max_body_bytes")) max_body_bytes = j["max_body_bytes"].get<size_t>();
    if (j.contains("log_level")) log_level = j["log_level"].get<std::string>();

    if (j.contains("providers")) {
        const auto& p = j["providers"];
        if (p.contains("primary")) apply_provider_json(p["primary"], primary);
        if (p.contains("secondary")) apply_provider_json(p["secondary"], secondary);
        if (p.contains("tertiary")) apply_provider_json(p["tertiary"], tertiary);
    }
    if (j.contains("curl_binary")) curl_binary = j["curl_binary"].get<std::string>();

    if (j.contains("provider_overhead_ms")) provider_overhead_ms = j["provider_overhead_ms"].get<uint64_t>();
    if (j.contains("max_code_bytes")) max_code_bytes = j["max_code_bytes"].get<size_t>();
    if (j.contains("strict_wrapping")) strict_wrapping = j["strict_wrapping"].get<bool>();

    if (j.contains("directory_file")) directory_file = j["directory_file"].get<std::string>();
    if (j.contains("ledger_file")) ledger_file = j["ledger_file"].get<std::string>();
    if (j.contains("audit_file")) audit_file = j["audit_file"].get<std::string>();

    if (j.contains("rate_limit")) {
        const auto& rl = j["rate_limit"];
        if (rl.contains("requests")) rate_limit_requests = rl["requests"].get<uint32_t>();
        if (rl.contains("window_sec")) rate_limit_window_sec = rl["window_sec"].get<uint32_t>();
    }
}

bool ServiceConfig::apply_env(std::string& error) {
    uint64_t number = 0;

    if (const char* v = env("RUNBOX_HOST")) host = v;
    if (const char* v = env("RUNBOX_PORT")) {
        if (!parse_unsigned("RUNBOX_PORT", v, std::numeric_limits<uint16_t>::max(), number, error)) return false;
        port = static_cast<uint16_t>(number);
    }
    if (const char* v = env("RUNBOX_WORKERS")) {
        if (!parse_unsigned("RUNBOX_WORKERS", v, 1024, number, error)) return false;
        workers = static_cast<size_t>(number);
    }
    if (const char* v = env("RUNBOX_LOG_LEVEL")) log_level = v;

    apply_provider_env("PRIMARY", primary);
    apply_provider_env("SECONDARY", secondary);
    apply_provider_env("TERTIARY", tertiary);
    if (const char* v = env("RUNBOX_CURL_BINARY")) curl_binary = v;

    if (const char* v = env("RUNBOX_PROVIDER_OVERHEAD_MS")) {
        if (!parse_unsigned("RUNBOX_PROVIDER_OVERHEAD_MS", v, 600000, number, error)) return false;
        provider_overhead_ms = number;
    }
    if (const char* v = env("RUNBOX_STRICT_WRAPPING")) {
        if (!parse_bool("RUNBOX_STRICT_WRAPPING", v, strict_wrapping, error)) return false;
    }

    if (const char* v = env("RUNBOX_DIRECTORY_FILE")) directory_file = v;
    if (const char* v = env("RUNBOX_LEDGER_FILE")) ledger_file = v;
    if (const char* v = env("RUNBOX_AUDIT_FILE")) audit_file = v;

    if (const char* v = env("RUNBOX_RATE_LIMIT_REQUESTS")) {
        if (!parse_unsigned("RUNBOX_RATE_LIMIT_REQUESTS", v, std::numeric_limits<uint32_t>::max(), number, error)) return false;
        rate_limit_requests = static_cast<uint32_t>(number);
    }
    if (const char* v = env("RUNBOX_RATE_LIMIT_WINDOW_SEC")) {
        if (!parse_unsigned("RUNBOX_RATE_LIMIT_WINDOW_SEC", v, 86400, number, error)) return false;
        rate_limit_window_sec = static_cast<uint32_t>(number);
    }
    return true;
}

json ServiceConfig::to_json() const {
    return {
        {"host", host},
        {"port", port},
        {"workers", workers},
        {"max_body_bytes", max_body_bytes},
        {"log_level", log_level},
        {"providers", {
            {"primary", provider_to_json(primary)},
            {"secondary", provider_to_json(secondary)},
            {"tertiary", provider_to_json(tertiary)}
        }},
        {"curl_binary", curl_binary},
        {"provider_overhead_ms", provider_overhead_ms},
        {"max_code_bytes", max_code_bytes},
        {"strict_wrapping", strict_wrapping},
        {"directory_file", directory_file},
        {"ledger_file", ledger_file},
        {"audit_file", audit_file},
        {"rate_limit", {
            {"requests", rate_limit_requests},
            {"window_sec", rate_limit_window_sec}
        }}
    };
}

std::string ServiceConfig::summary() const {
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace);
}

// ============================================================================
// .env loading
// ============================================================================

bool load_dotenv_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        // Trim whitespace
        size_t start = line.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) continue;
        line = line.substr(start);

        // Skip comments
        if (line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = line.substr(7);

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = line.substr(0, eq_pos);
        std::string value = line.substr(eq_pos + 1);

        size_t key_end = key.find_last_not_of(" \t");
        if (key_end != std::string::npos) key = key.substr(0, key_end + 1);

        start = value.find_first_not_of(" \t");
        value = start == std::string::npos ? "" : value.substr(start);
        size_t val_end = value.find_last_not_of(" \t\r\n");
        if (val_end != std::string::npos) value = value.substr(0, val_end + 1);

        // Remove surrounding quotes
        if (value.size() >= 2) {
            if ((value.front() == '"' && value.back() == '"') ||
                (value.front() == '\'' && value.back() == '\'')) {
                value = value.substr(1, value.size() - 2);
            }
        }

        // Only set if not already in environment
        if (!key.empty() && !value.empty() && std::getenv(key.c_str()) == nullptr) {
            setenv(key.c_str(), value.c_str(), 0);
        }
    }

    spdlog::debug("Loaded environment from {}", path.string());
    return true;
}

void load_dotenv() {
    std::error_code ec;
    std::vector<std::filesystem::path> search_paths = {
        std::filesystem::current_path(ec) / ".env",
        "../.env",
    };

    // Also check relative to executable
    char exe_path[PATH_MAX];
    ssize_t len = readlink("/proc/self/exe", exe_path, sizeof(exe_path) - 1);
    if (len != -1) {
        exe_path[len] = '\0';
        auto exe_dir = std::filesystem::path(exe_path).parent_path();
        search_paths.push_back(exe_dir / ".env");
        search_paths.push_back(exe_dir.parent_path() / ".env");
    }

    for (const auto& env_path : search_paths) {
        if (load_dotenv_file(env_path)) {
            break;
        }
    }
}

std::optional<ServiceConfig> load_service_config(const std::string& path, std::string& error) {
    ServiceConfig config;

    if (!path.empty()) {
        std::ifstream file(path);
        if (!file.is_open()) {
            error = fmt::format("Cannot open config file {}", path);
            return std::nullopt;
        }
        try {
            json j = json::parse(file);
            if (!j.is_object()) {
                error = fmt::format("Config file {} must hold a JSON object", path);
                return std::nullopt;
            }
            config.apply_json(j);
        } catch (const json::exception& e) {
            error = fmt::format("Invalid config file {}: {}", path, e.what());
            return std::nullopt;
        }
    }

    load_dotenv();
    if (!config.apply_env(error)) {
        return std::nullopt;
    }

    if (config.rate_limit_window_sec == 0) {
        error = "rate limit window must be at least one second";
        return std::nullopt;
    }
    if (config.max_code_bytes == 0) {
        error = "max_code_bytes must be positive";
        return std::nullopt;
    }
    return config;
}

} // namespace runbox::util
