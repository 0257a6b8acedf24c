#include "exec/security_scanner.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <sstream>

namespace runbox::exec {

namespace {

struct RuleDef {
    const char* pattern;
    const char* label;
    Severity severity;
    bool icase;
};

// Python: process spawning, filesystem damage, dynamic evaluation, network
const std::vector<RuleDef> PYTHON_RULES = {
    {R"(\bos\.(system|popen|exec[lv]p?e?|spawn\w*)\s*\()", "process spawning via os module", Severity::WARNING, false},
    {R"(\bsubprocess\.(run|call|Popen|check_call|check_output|getoutput)\b)", "process spawning via subprocess", Severity::WARNING, false},
    {R"(\beval\s*\()", "dynamic code evaluation (eval)", Severity::WARNING, false},
    {R"(\bexec\s*\()", "dynamic code execution (exec)", Severity::WARNING, false},
    {R"(__import__\s*\()", "dynamic import (__import__)", Severity::WARNING, false},
    {R"(\bopen\s*\([^)]*['"](/etc|/proc|/sys|/dev))", "access to system paths", Severity::WARNING, true},
    {R"(\bshutil\.(rmtree|move|copy\w*)\s*\()", "filesystem manipulation via shutil", Severity::WARNING, false},
    {R"(\bos\.(remove|rmdir|removedirs|unlink|chmod|chown)\s*\()", "destructive filesystem operation", Severity::WARNING, false},
    {R"(\bsocket\s*\.\s*socket\b)", "raw socket access", Severity::WARNING, true},
    {R"(\burllib\b|\bhttp\.client\b|\brequests\.(get|post|put|delete)\b)", "network access", Severity::WARNING, true},
    {R"(\bctypes\b)", "native code loading (ctypes)", Severity::WARNING, false},
    {R"(\bos\.(setuid|setgid|seteuid|setegid)\s*\()", "privilege manipulation", Severity::WARNING, false},
    {R"(while\s+(True|1)\s*:[\s\S]{0,120}?\bos\.fork\s*\()", "fork bomb (unbounded os.fork loop)", Severity::CRITICAL, false},
    {R"(\bshutil\.rmtree\s*\(\s*['"]/['"])", "recursive deletion of the filesystem root", Severity::CRITICAL, false},
};

const std::vector<RuleDef> JAVASCRIPT_RULES = {
    {R"(require\s*\(\s*['"](node:)?child_process['"]\s*\))", "process spawning module (child_process)", Severity::WARNING, true},
    {R"(\b(spawn|spawnSync|exec|execSync|execFile|execFileSync|fork)\s*\()", "process spawning call", Severity::WARNING, false},
    {R"(\bprocess\.(exit|kill|abort)\b)", "process control", Severity::WARNING, false},
    {R"(\bfs\.(unlink|unlinkSync|rmdir|rmdirSync|rm|rmSync|writeFile|writeFileSync|appendFile|appendFileSync)\s*\()", "destructive filesystem operation", Severity::WARNING, false},
    {R"(\beval\s*\()", "dynamic code evaluation (eval)", Severity::WARNING, false},
    {R"(\bnew\s+Function\s*\()", "dynamic code evaluation (Function constructor)", Severity::WARNING, false},
    {R"(require\s*\(\s*['"](node:)?(net|http|https|dgram|tls)['"]\s*\))", "raw network access", Severity::WARNING, true},
    {R"(\b(global|globalThis)\s*\[)", "dynamic global access", Severity::WARNING, false},
    {R"(while\s*\(\s*(true|1)\s*\)\s*\{?[\s\S]{0,120}?\b(fork|spawn)\s*\()", "fork bomb (unbounded process spawn loop)", Severity::CRITICAL, false},
};

const std::vector<RuleDef> SHELL_RULES = {
    {R"(\brm\s+(-[a-zA-Z-]+\s+)*-[a-zA-Z]*[rR])", "recursive file deletion", Severity::WARNING, false},
    {R"(\bdd\s+if=)", "raw disk copy (dd)", Severity::WARNING, true},
    {R"(\bmkfs\b)", "filesystem creation (mkfs)", Severity::WARNING, true},
    {R"(\b(wget|curl)\b[^\n|]*\|\s*(ba|z|da)?sh\b)", "remote script piped into a shell", Severity::WARNING, true},
    {R"(\bchmod\s+(-R\s+)?[0-7]*777\b)", "world-writable permissions", Severity::WARNING, false},
    {R"(>\s*/dev/(?!null\b))", "write to a device file", Severity::WARNING, true},
    {R"(\b(sudo|doas)\b|\bsu\s+-)", "privilege escalation", Severity::WARNING, true},
    {R"(/etc/(passwd|shadow|sudoers))", "access to credential files", Severity::WARNING, true},
    {R"(\bnc\s+-[a-zA-Z]*l|\bnetcat\b|\bncat\b)", "network listener (netcat)", Severity::WARNING, true},
};

// Catastrophic constructs, checked whatever the language (a shell
// command embedded in a Python string is just as destructive)
const std::vector<RuleDef> COMMON_CRITICAL_RULES = {
    {R"(:\s*\(\s*\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb", Severity::CRITICAL, false},
    {R"(\b(\w+)\s*\(\s*\)\s*\{\s*\1\s*\|\s*\1\s*&\s*\})", "fork bomb (self-piping function)", Severity::CRITICAL, false},
    {R"(\brm\s+(-[a-zA-Z]+\s+)*-[a-zA-Z]*[rR][a-zA-Z]*\s+(-[a-zA-Z-]+\s+)*/\*?(?=[\s;&|'"`)]|$))", "recursive deletion of the filesystem root", Severity::CRITICAL, false},
    {R"(\bdd\s+[^\n]*\bof=/dev/(sd|hd|vd|xvd|nvme|mmcblk))", "disk wipe (dd onto a block device)", Severity::CRITICAL, false},
    {R"(\bmkfs(\.\w+)?\s+[^\n]*/dev/)", "disk wipe (mkfs on a block device)", Severity::CRITICAL, false},
    {R"(\b(shred|wipefs)\b[^\n]*/dev/)", "disk wipe (shred/wipefs on a device)", Severity::CRITICAL, false},
    {R"(>\s*/dev/(sd|hd|vd|xvd|nvme|mmcblk))", "disk wipe (redirect onto a block device)", Severity::CRITICAL, false},
};

std::vector<ScanRule> compile_rules(const std::vector<RuleDef>& defs) {
    std::vector<ScanRule> rules;
    rules.reserve(defs.size());

    for (const auto& def : defs) {
        auto flags = std::regex::ECMAScript | std::regex::optimize;
        if (def.icase) {
            flags |= std::regex::icase;
        }
        rules.push_back(ScanRule{std::regex(def.pattern, flags), def.label, def.severity});
    }

    return rules;
}

// Longer lines are split into windows in the regex view. Consecutive
// windows share REGEX_VIEW_OVERLAP characters, so any match shorter
// than the overlap lands whole in at least one window.
constexpr size_t REGEX_VIEW_LINE_CAP = 4096;
constexpr size_t REGEX_VIEW_OVERLAP = 512;

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

// ============================================================================
// SecurityScanner Implementation
// ============================================================================

SecurityScanner::SecurityScanner()
    : python_rules_(compile_rules(PYTHON_RULES))
    , javascript_rules_(compile_rules(JAVASCRIPT_RULES))
    , shell_rules_(compile_rules(SHELL_RULES))
    , common_critical_rules_(compile_rules(COMMON_CRITICAL_RULES)) {
    spdlog::debug("SecurityScanner initialized ({} python, {} javascript, {} shell, {} common rules)",
        python_rules_.size(), javascript_rules_.size(),
        shell_rules_.size(), common_critical_rules_.size());
}

const std::vector<ScanRule>& SecurityScanner::rules_for(Language language) const {
    switch (language) {
        case Language::JAVASCRIPT: return javascript_rules_;
        case Language::SHELL:      return shell_rules_;
        case Language::PYTHON:
        default:                   return python_rules_;
    }
}

std::vector<SecurityFinding> SecurityScanner::scan(const std::string& code, Language language) const {
    std::vector<SecurityFinding> findings;

    // std::regex matches recursively, so rules run over a bounded view
    std::string view = regex_view(code);
    apply_rules(rules_for(language), view, findings);
    apply_rules(common_critical_rules_, view, findings);
    apply_heuristics(code, findings);

    if (!findings.empty()) {
        spdlog::debug("Scan of {} snippet ({} chars): {} finding(s), critical={}",
            language_to_string(language), code.size(), findings.size(), has_critical(findings));
    }

    return findings;
}

void SecurityScanner::apply_rules(const std::vector<ScanRule>& rules,
                                  const std::string& code,
                                  std::vector<SecurityFinding>& findings) {
    for (const auto& rule : rules) {
        if (!std::regex_search(code, rule.pattern)) {
            continue;
        }

        SecurityFinding finding;
        finding.severity = rule.severity;
        if (rule.severity == Severity::CRITICAL) {
            finding.description = fmt::format(
                "Critical security pattern detected: {} - execution blocked", rule.label);
        } else {
            finding.description = fmt::format(
                "Potentially dangerous pattern detected: {}", rule.label);
        }

        // Same construct may be listed per-language and in the common set
        bool duplicate = std::any_of(findings.begin(), findings.end(),
            [&](const SecurityFinding& f) { return f.description == finding.description; });
        if (!duplicate) {
            findings.push_back(std::move(finding));
        }
    }
}

void SecurityScanner::apply_heuristics(const std::string& code,
                                       std::vector<SecurityFinding>& findings) {
    // Suspiciously long lines
    std::istringstream stream(code);
    std::string line;
    size_t line_no = 0;
    while (std::getline(stream, line)) {
        line_no++;
        if (line.size() > MAX_LINE_LENGTH) {
            findings.push_back(SecurityFinding{
                fmt::format("Line {} is suspiciously long ({} chars) - potential obfuscation",
                    line_no, line.size()),
                Severity::WARNING});
        }
    }

    // Long base64-like token
    if (longest_base64_run(code) >= MIN_BASE64_RUN) {
        findings.push_back(SecurityFinding{
            "Large base64-encoded content detected - potential payload hiding",
            Severity::WARNING});
    }
}

std::string SecurityScanner::regex_view(const std::string& code) {
    std::string view;
    view.reserve(code.size() + code.size() / 8);

    size_t line_start = 0;
    bool in_space = false;
    bool space_has_newline = false;

    auto emit = [&](char c) {
        if (view.size() - line_start >= REGEX_VIEW_LINE_CAP) {
            std::string tail = view.substr(view.size() - REGEX_VIEW_OVERLAP);
            view.push_back('\n');
            line_start = view.size();
            view += tail;
        }
        view.push_back(c);
    };

    for (char c : code) {
        bool is_space = c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
        if (is_space) {
            in_space = true;
            if (c == '\n') space_has_newline = true;
            continue;
        }

        if (in_space) {
            if (space_has_newline) {
                view.push_back('\n');
                line_start = view.size();
            } else {
                emit(' ');
            }
            in_space = false;
            space_has_newline = false;
        }

        emit(c);
    }

    return view;
}

size_t SecurityScanner::longest_base64_run(const std::string& code) {
    size_t longest = 0;
    size_t current = 0;

    for (char c : code) {
        if (is_base64_char(c)) {
            current++;
            longest = std::max(longest, current);
        } else {
            current = 0;
        }
    }

    return longest;
}

bool SecurityScanner::has_critical(const std::vector<SecurityFinding>& findings) {
    return std::any_of(findings.begin(), findings.end(),
        [](const SecurityFinding& f) { return f.severity == Severity::CRITICAL; });
}

std::vector<std::string> SecurityScanner::descriptions(const std::vector<SecurityFinding>& findings) {
    std::vector<std::string> out;
    out.reserve(findings.size());
    for (const auto& f : findings) {
        out.push_back(f.description);
    }
    return out;
}

} // namespace runbox::exec
