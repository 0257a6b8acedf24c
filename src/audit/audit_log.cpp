#include "audit/audit_log.hpp"
#include "util/time_format.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace runbox::audit {

using json = nlohmann::json;

// ============================================================================
// AuditLogEntry Implementation
// ============================================================================

json AuditLogEntry::to_json() const {
    json j;
    j["id"] = id;
    j["timestamp"] = util::format_iso8601(timestamp);
    j["category"] = audit_category_to_string(category);
    j["event_type"] = event_type;
    if (!execution_id.empty()) {
        j["execution_id"] = execution_id;
    }
    if (!user_id.empty()) {
        j["user_id"] = user_id;
    }
    j["success"] = success;
    j["details"] = details;
    return j;
}

std::string AuditLogEntry::to_jsonl() const {
    return to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

// ============================================================================
// AuditConfig Implementation
// ============================================================================

bool AuditConfig::is_enabled(AuditCategory cat) const {
    switch (cat) {
        case AuditCategory::SECURITY:   return log_security;
        case AuditCategory::VALIDATION: return log_validation;
        case AuditCategory::EXECUTION:  return log_execution;
        case AuditCategory::PROVIDER:   return log_provider;
        case AuditCategory::RATE_LIMIT: return log_rate_limit;
        case AuditCategory::INTERNAL:   return log_internal;
        default: return false;
    }
}

// ============================================================================
// AuditLogger Implementation
// ============================================================================

AuditLogger::AuditLogger() : config_() {
    spdlog::debug("AuditLogger initialized with default config");
}

AuditLogger::AuditLogger(const AuditConfig& config) : config_(config) {
    open_file();
    spdlog::debug("AuditLogger initialized (max_entries={}, file={})",
                  config_.max_entries, config_.jsonl_path.empty() ? "none" : config_.jsonl_path);
}

void AuditLogger::open_file() {
    if (config_.jsonl_path.empty()) {
        return;
    }
    file_.open(config_.jsonl_path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open audit file {}; keeping audit in memory only", config_.jsonl_path);
    }
}

void AuditLogger::log(AuditCategory category,
                      const std::string& event_type,
                      const std::string& execution_id,
                      const std::string& user_id,
                      const json& details,
                      bool success) {
    if (!config_.is_enabled(category)) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    AuditLogEntry entry;
    entry.id = next_id_++;
    entry.timestamp = std::chrono::system_clock::now();
    entry.category = category;
    entry.event_type = event_type;
    entry.execution_id = execution_id;
    entry.user_id = user_id;
    entry.details = details;
    entry.success = success;

    if (file_.is_open()) {
        file_ << entry.to_jsonl();
        file_.flush();
        if (!file_) {
            spdlog::error("Audit file write failed; further entries stay in memory");
            file_.close();
        }
    }

    entries_.push_back(std::move(entry));
    trim_entries();

    spdlog::trace("Audit[{}]: {} execution_id={} success={}",
                  audit_category_to_string(category), event_type, execution_id, success);
}

void AuditLogger::log_security(const std::string& event_type,
                               const std::string& execution_id,
                               const std::string& user_id,
                               const json& details) {
    log(AuditCategory::SECURITY, event_type, execution_id, user_id, details, false);
}

void AuditLogger::log_provider_failure(const std::string& execution_id,
                                       const std::string& provider_id,
                                       const std::string& kind,
                                       const std::string& message) {
    json details;
    details["provider_id"] = provider_id;
    details["kind"] = kind;
    details["message"] = message;
    log(AuditCategory::PROVIDER, "PROVIDER_FAILED", execution_id, "", details, false);
}

std::vector<AuditLogEntry> AuditLogger::get_entries(
    const AuditCategory* category,
    const std::string* user_id,
    uint64_t since_id,
    size_t limit) const {

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;

    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < limit; ++it) {
        const auto& entry = *it;
        if (entry.id <= since_id) {
            continue;
        }
        if (category && entry.category != *category) {
            continue;
        }
        if (user_id && entry.user_id != *user_id) {
            continue;
        }
        result.push_back(entry);
    }

    std::reverse(result.begin(), result.end());
    return result;
}

std::vector<AuditLogEntry> AuditLogger::get_entries_for_execution(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuditLogEntry> result;
    for (const auto& entry : entries_) {
        if (entry.execution_id == execution_id) {
            result.push_back(entry);
        }
    }
    return result;
}

size_t AuditLogger::entry_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

uint64_t AuditLogger::last_entry_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

void AuditLogger::trim_entries() {
    // Caller must hold the mutex
    while (entries_.size() > config_.max_entries) {
        entries_.pop_front();
    }
}

} // namespace runbox::audit
