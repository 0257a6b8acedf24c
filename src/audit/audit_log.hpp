/**
 * Runbox Audit Log
 *
 * Categorized audit trail for security blocks, provider failures and
 * completed executions. Entries are kept in a bounded in-memory ring
 * and can optionally be appended to a JSONL file as they are logged.
 * Snippet source is never written here; only ids, sizes and findings.
 */
#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <fstream>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace runbox::audit {

// Audit event categories
enum class AuditCategory {
    SECURITY,         // Critical findings, blocked executions
    VALIDATION,       // Rejected requests
    EXECUTION,        // Completed executions
    PROVIDER,         // Failed provider attempts
    RATE_LIMIT,       // Callers over their window
    INTERNAL          // Unexpected errors
};

inline std::string audit_category_to_string(AuditCategory cat) {
    switch (cat) {
        case AuditCategory::SECURITY:   return "SECURITY";
        case AuditCategory::VALIDATION: return "VALIDATION";
        case AuditCategory::EXECUTION:  return "EXECUTION";
        case AuditCategory::PROVIDER:   return "PROVIDER";
        case AuditCategory::RATE_LIMIT: return "RATE_LIMIT";
        case AuditCategory::INTERNAL:   return "INTERNAL";
        default: return "UNKNOWN";
    }
}

inline AuditCategory audit_category_from_string(const std::string& str) {
    if (str == "SECURITY")   return AuditCategory::SECURITY;
    if (str == "VALIDATION") return AuditCategory::VALIDATION;
    if (str == "EXECUTION")  return AuditCategory::EXECUTION;
    if (str == "PROVIDER")   return AuditCategory::PROVIDER;
    if (str == "RATE_LIMIT") return AuditCategory::RATE_LIMIT;
    return AuditCategory::INTERNAL;
}

struct AuditLogEntry {
    uint64_t id = 0;
    std::chrono::system_clock::time_point timestamp;
    AuditCategory category = AuditCategory::INTERNAL;
    std::string event_type;                   // e.g. "EXECUTION_BLOCKED"
    std::string execution_id;
    std::string user_id;
    nlohmann::json details;
    bool success = true;

    nlohmann::json to_json() const;
    std::string to_jsonl() const;
};

struct AuditConfig {
    size_t max_entries = 10000;               // Max entries in memory
    std::string jsonl_path;                   // Empty = memory only
    bool log_security = true;
    bool log_validation = true;
    bool log_execution = true;
    bool log_provider = true;
    bool log_rate_limit = true;
    bool log_internal = true;

    bool is_enabled(AuditCategory cat) const;
};

class AuditLogger {
public:
    AuditLogger();
    explicit AuditLogger(const AuditConfig& config);
    ~AuditLogger() = default;

    void log(AuditCategory category,
             const std::string& event_type,
             const std::string& execution_id,
             const std::string& user_id,
             const nlohmann::json& details,
             bool success = true);

    // Convenience methods for common events
    void log_security(const std::string& event_type, const std::string& execution_id,
                      const std::string& user_id, const nlohmann::json& details);
    void log_provider_failure(const std::string& execution_id, const std::string& provider_id,
                              const std::string& kind, const std::string& message);

    // Most recent entries, oldest first. Null filters match everything.
    std::vector<AuditLogEntry> get_entries(
        const AuditCategory* category = nullptr,
        const std::string* user_id = nullptr,
        uint64_t since_id = 0,
        size_t limit = 100
    ) const;

    std::vector<AuditLogEntry> get_entries_for_execution(const std::string& execution_id) const;

    const AuditConfig& get_config() const { return config_; }
    bool persistent() const { return file_.is_open(); }

    size_t entry_count() const;
    uint64_t last_entry_id() const;

private:
    AuditConfig config_;
    std::deque<AuditLogEntry> entries_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    uint64_t next_id_ = 1;

    void open_file();
    void trim_entries();
};

} // namespace runbox::audit
