/**
 * Runbox Execution Provider
 *
 * Uniform contract for every execution backend. Adapters translate
 * an ExecutionTask into their own protocol and report failure as a
 * TRANSIENT or PERMANENT kind plus a message; no adapter-specific
 * error type crosses this interface.
 */
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "exec/types.hpp"
#include "exec/resource_limits.hpp"

namespace runbox::providers {

enum class FailureKind {
    TRANSIENT,   // Timeout, connection failure, remote 5xx
    PERMANENT    // Malformed request, unsupported language, protocol mismatch
};

inline const char* failure_kind_to_string(FailureKind kind) {
    return kind == FailureKind::PERMANENT ? "permanent" : "transient";
}

// Best-effort cancellation signal shared with an in-flight attempt
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

inline CancelFlag make_cancel_flag() {
    return std::make_shared<std::atomic<bool>>(false);
}

// Everything an adapter needs for one attempt
struct ExecutionTask {
    std::string code;                        // Wrapped if the provider asked for it
    exec::Language language = exec::Language::PYTHON;
    exec::ResourceLimits limits;
    std::optional<std::string> stdin_data;
    std::string user_id;
    exec::Tier tier = exec::Tier::FREE;
    CancelFlag cancel;                       // May be null

    bool cancelled() const { return cancel && cancel->load(); }
};

// Provider output before assembly
struct RawExecution {
    std::string stdout_data;
    std::string stderr_data;
    nlohmann::json exit_status;              // Provider-specific representation
    std::optional<uint64_t> reported_time_ms;
    std::optional<double> memory_used_mb;
    std::vector<std::string> warnings;
};

struct ProviderResponse {
    bool success = false;
    RawExecution output;
    FailureKind failure = FailureKind::TRANSIENT;
    std::string error;

    static ProviderResponse ok(RawExecution output) {
        ProviderResponse r;
        r.success = true;
        r.output = std::move(output);
        return r;
    }

    static ProviderResponse fail(FailureKind kind, std::string message) {
        ProviderResponse r;
        r.success = false;
        r.failure = kind;
        r.error = std::move(message);
        return r;
    }
};

class ExecutionProvider {
public:
    virtual ~ExecutionProvider() = default;

    // Stable identity, reported to callers as sandbox_region
    virtual const std::string& id() const = 0;

    // True if the provider lacks kernel-level isolation and must be
    // given wrapped code
    virtual bool needs_wrapping() const = 0;

    // True only for the local approximation used as last resort
    virtual bool is_simulated() const { return false; }

    // Run one attempt. Must not throw.
    virtual ProviderResponse execute(const ExecutionTask& task) = 0;
};

using ProviderPtr = std::shared_ptr<ExecutionProvider>;

} // namespace runbox::providers
