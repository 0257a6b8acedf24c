/**
 * Runbox Security Scanner
 *
 * Pattern-based static screening of snippets before execution.
 * Findings are either WARNING (recorded, execution continues) or
 * CRITICAL (execution is blocked before any provider is called).
 *
 * This is a deterrent layer only. Isolation is the job of the
 * provider that actually runs the code.
 */
#pragma once
#include <string>
#include <vector>
#include <regex>
#include <cstddef>
#include "exec/types.hpp"

namespace runbox::exec {

// Compiled detection rule
struct ScanRule {
    std::regex pattern;
    std::string label;       // Human-readable construct name
    Severity severity;
};

class SecurityScanner {
public:
    // Obfuscation heuristics
    static constexpr size_t MAX_LINE_LENGTH = 1000;
    static constexpr size_t MIN_BASE64_RUN = 100;

    SecurityScanner();

    // Scan code for the given language. Rules are read-only after
    // construction, so one scanner may be shared across threads.
    std::vector<SecurityFinding> scan(const std::string& code, Language language) const;

    // True if any finding is CRITICAL
    static bool has_critical(const std::vector<SecurityFinding>& findings);

    // Descriptions only, in scan order
    static std::vector<std::string> descriptions(const std::vector<SecurityFinding>& findings);

    // Whitespace runs collapsed to one character (newline if the run
    // held one). Long lines become overlapping windows on separate
    // lines, so no match can recurse deeply and nothing is dropped.
    static std::string regex_view(const std::string& code);

    // Length of the longest run of base64 alphabet characters
    static size_t longest_base64_run(const std::string& code);

private:
    std::vector<ScanRule> python_rules_;
    std::vector<ScanRule> javascript_rules_;
    std::vector<ScanRule> shell_rules_;
    std::vector<ScanRule> common_critical_rules_;   // Applied to every language

    const std::vector<ScanRule>& rules_for(Language language) const;
    static void apply_rules(const std::vector<ScanRule>& rules,
                            const std::string& code,
                            std::vector<SecurityFinding>& findings);
    static void apply_heuristics(const std::string& code,
                                 std::vector<SecurityFinding>& findings);
};

} // namespace runbox::exec
