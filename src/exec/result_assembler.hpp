/**
 * Runbox Result Assembler
 *
 * Turns a provider's raw output into the final ExecutionResult:
 * scanner and provider warnings merged, stdout cut to the tier's
 * byte ceiling on a character boundary, stderr cut to a fixed ceiling, exit status reduced
 * to one integer and the provider identity stamped.
 */
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "exec/types.hpp"
#include "exec/resource_limits.hpp"
#include "providers/provider.hpp"

namespace runbox::exec {

class ResultAssembler {
public:
    static constexpr size_t MAX_STDERR_BYTES = 256 * 1024;

    static ExecutionResult assemble(const std::vector<std::string>& scanner_warnings,
                                    const providers::RawExecution& raw,
                                    const std::string& provider_id,
                                    const ResourceLimits& limits,
                                    uint64_t wall_time_ms);

    // Integer, float, numeric string, {code}, {signal} or null.
    // null means the provider did not report a failure (0); anything
    // unrecognized counts as a generic failure (1).
    static int normalize_exit_code(const nlohmann::json& status);

    // Signal number for a name such as "SIGKILL" or "KILL"; 0 if unknown
    static int signal_number(const std::string& name);

    // Longest prefix of at most max_bytes that does not end inside a
    // UTF-8 sequence
    static size_t utf8_cut(const std::string& text, size_t max_bytes);
};

} // namespace runbox::exec
