#include "exec/result_assembler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <unordered_set>

using json = nlohmann::json;

namespace runbox::exec {

namespace {

constexpr int GENERIC_FAILURE = 1;
constexpr int SIGNAL_EXIT_BASE = 128;

int clamp_to_int(double value) {
    if (!std::isfinite(value)) return GENERIC_FAILURE;
    double truncated = std::trunc(value);
    if (truncated > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (truncated < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(truncated);
}

std::optional<double> parse_numeric(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return std::nullopt;
    size_t end = text.find_last_not_of(" \t\r\n");
    std::string trimmed = text.substr(start, end - start + 1);

    char* parse_end = nullptr;
    double value = std::strtod(trimmed.c_str(), &parse_end);
    if (parse_end != trimmed.c_str() + trimmed.size()) return std::nullopt;
    return value;
}

int from_signal(const json& signal) {
    int number = 0;
    if (signal.is_number()) {
        number = clamp_to_int(signal.get<double>());
    } else if (signal.is_string()) {
        auto numeric = parse_numeric(signal.get<std::string>());
        number = numeric ? clamp_to_int(*numeric)
                         : ResultAssembler::signal_number(signal.get<std::string>());
    }
    return number > 0 && number < SIGNAL_EXIT_BASE ? SIGNAL_EXIT_BASE + number : GENERIC_FAILURE;
}

} // namespace

size_t ResultAssembler::utf8_cut(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text.size();
    }
    // Back off over continuation bytes so no character is split
    size_t cut = max_bytes;
    for (int back = 0; back <= 3; ++back) {
        if ((static_cast<unsigned char>(text[cut]) & 0xC0) != 0x80) {
            return cut;
        }
        if (cut == 0) {
            break;
        }
        --cut;
    }
    // Not a valid sequence; plain byte cut
    return max_bytes;
}

int ResultAssembler::signal_number(const std::string& name) {
    std::string key = name;
    if (key.rfind("SIG", 0) == 0) key = key.substr(3);

    if (key == "HUP")  return 1;
    if (key == "INT")  return 2;
    if (key == "QUIT") return 3;
    if (key == "ILL")  return 4;
    if (key == "ABRT") return 6;
    if (key == "BUS")  return 7;
    if (key == "FPE")  return 8;
    if (key == "KILL") return 9;
    if (key == "SEGV") return 11;
    if (key == "PIPE") return 13;
    if (key == "ALRM") return 14;
    if (key == "TERM") return 15;
    if (key == "XCPU") return 24;
    if (key == "XFSZ") return 25;
    return 0;
}

int ResultAssembler::normalize_exit_code(const json& status) {
    switch (status.type()) {
        case json::value_t::null:
        case json::value_t::discarded:
            return 0;
        case json::value_t::boolean:
            return status.get<bool>() ? GENERIC_FAILURE : 0;
        case json::value_t::number_integer: {
            int64_t v = status.get<int64_t>();
            if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
            if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
            return static_cast<int>(v);
        }
        case json::value_t::number_unsigned: {
            uint64_t v = status.get<uint64_t>();
            return v > static_cast<uint64_t>(std::numeric_limits<int>::max())
                ? std::numeric_limits<int>::max() : static_cast<int>(v);
        }
        case json::value_t::number_float:
            return clamp_to_int(status.get<double>());
        case json::value_t::string: {
            auto numeric = parse_numeric(status.get<std::string>());
            return numeric ? clamp_to_int(*numeric) : GENERIC_FAILURE;
        }
        case json::value_t::object: {
            auto code = status.find("code");
            if (code != status.end() && !code->is_null()) {
                return normalize_exit_code(*code);
            }
            auto signal = status.find("signal");
            if (signal != status.end() && !signal->is_null()) {
                return from_signal(*signal);
            }
            // {"code": null} with no signal reports a clean exit
            return code != status.end() ? 0 : GENERIC_FAILURE;
        }
        default:
            return GENERIC_FAILURE;
    }
}

ExecutionResult ResultAssembler::assemble(const std::vector<std::string>& scanner_warnings,
                                          const providers::RawExecution& raw,
                                          const std::string& provider_id,
                                          const ResourceLimits& limits,
                                          uint64_t wall_time_ms) {
    ExecutionResult result;

    // Scanner findings first, then provider notes; drop exact repeats
    std::unordered_set<std::string> seen;
    for (const auto* list : {&scanner_warnings, &raw.warnings}) {
        for (const auto& warning : *list) {
            if (seen.insert(warning).second) {
                result.security_warnings.push_back(warning);
            }
        }
    }

    result.stdout_data = raw.stdout_data;
    if (result.stdout_data.size() > limits.max_output_bytes) {
        result.stdout_data.resize(utf8_cut(result.stdout_data, limits.max_output_bytes));
        result.truncated = true;
        spdlog::debug("Truncated stdout from {} to {} bytes", raw.stdout_data.size(), result.stdout_data.size());
    }

    result.stderr_data = raw.stderr_data;
    if (result.stderr_data.size() > MAX_STDERR_BYTES) {
        result.stderr_data.resize(utf8_cut(result.stderr_data, MAX_STDERR_BYTES));
    }

    result.exit_code = normalize_exit_code(raw.exit_status);
    result.execution_time_ms = raw.reported_time_ms.value_or(wall_time_ms);
    result.memory_used_mb = raw.memory_used_mb;
    result.provider_id = provider_id;
    return result;
}

} // namespace runbox::exec
