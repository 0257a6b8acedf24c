/**
 * Runbox Code Wrapper
 *
 * Builds a per-language preamble around a snippet for providers that
 * do not isolate at the kernel level: process resource ceilings,
 * removal or shadowing of dangerous built-ins, and stdin injected as
 * an in-memory source.
 *
 * The wrapper is a secondary layer. It is never sufficient isolation
 * on its own and is only sent to remote providers.
 */
#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include "exec/types.hpp"
#include "exec/resource_limits.hpp"

namespace runbox::exec {

// Ceilings that do not vary by tier
struct WrapperCeilings {
    uint64_t max_file_bytes = 1024 * 1024;   // Largest file the snippet may write
    uint64_t max_open_files = 32;
    uint64_t js_max_timeout_ms = 5000;       // setTimeout clamp
    uint64_t js_min_interval_ms = 100;       // setInterval clamp
};

class CodeWrapper {
public:
    CodeWrapper() = default;
    explicit CodeWrapper(const WrapperCeilings& ceilings) : ceilings_(ceilings) {}

    // Wrap code for the given language under the given limits
    std::string wrap(const std::string& code,
                     Language language,
                     const std::optional<std::string>& stdin_data,
                     const ResourceLimits& limits) const;

    // CPU seconds granted for a wall-clock timeout (rounded up, at least 1)
    static uint64_t cpu_seconds_for(const ResourceLimits& limits);

    // Heredoc terminator that does not occur as a line of the payload
    static std::string heredoc_delimiter(const std::string& payload);

    const WrapperCeilings& ceilings() const { return ceilings_; }

private:
    WrapperCeilings ceilings_;

    std::string wrap_python(const std::string& code, const std::string& stdin_data,
                            const ResourceLimits& limits) const;
    std::string wrap_javascript(const std::string& code, const std::string& stdin_data,
                                const ResourceLimits& limits) const;
    std::string wrap_shell(const std::string& code, const std::string& stdin_data,
                           const ResourceLimits& limits) const;
};

} // namespace runbox::exec
