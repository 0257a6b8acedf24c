/**
 * Runbox Execution Types
 *
 * Request, finding and result records shared by the scanner,
 * orchestrator, providers and the HTTP service layer.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace runbox::exec {

// Supported snippet languages
enum class Language {
    PYTHON,
    JAVASCRIPT,
    SHELL
};

inline const char* language_to_string(Language lang) {
    switch (lang) {
        case Language::PYTHON:     return "python";
        case Language::JAVASCRIPT: return "javascript";
        case Language::SHELL:      return "shell";
        default: return "unknown";
    }
}

// Strict parse: only the wire names are accepted
inline std::optional<Language> language_from_string(const std::string& str) {
    if (str == "python")     return Language::PYTHON;
    if (str == "javascript") return Language::JAVASCRIPT;
    if (str == "shell")      return Language::SHELL;
    return std::nullopt;
}

enum class Severity {
    WARNING,
    CRITICAL
};

inline const char* severity_to_string(Severity severity) {
    return severity == Severity::CRITICAL ? "critical" : "warning";
}

struct SecurityFinding {
    std::string description;
    Severity severity = Severity::WARNING;
};

// One inbound execution call
struct ExecutionRequest {
    std::string code;
    std::string language;                      // Raw wire value, validated by the orchestrator
    std::optional<std::string> stdin_data;
    std::optional<int64_t> requested_timeout_ms;
    std::optional<std::string> task_id;
    std::optional<std::string> sandbox_id;
};

// Final, assembled result of one execution
struct ExecutionResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;
    uint64_t execution_time_ms = 0;
    std::optional<double> memory_used_mb;
    bool truncated = false;
    std::vector<std::string> security_warnings;
    std::string provider_id;
};

} // namespace runbox::exec
