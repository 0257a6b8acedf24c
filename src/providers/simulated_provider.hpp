/**
 * Runbox Simulated Provider
 *
 * Last-resort fallback. Never executes anything: it recognizes
 * print(...), console.log(...) and echo statements in the source text,
 * evaluates string literals and integer/float arithmetic, and otherwise
 * returns a placeholder banner. Every result carries a warning that
 * the output is simulated.
 */
#pragma once
#include <string>
#include <optional>
#include "providers/provider.hpp"

namespace runbox::providers {

class SimulatedProvider : public ExecutionProvider {
public:
    static constexpr const char* ID = "simulated";
    static constexpr const char* WARNING =
        "Running in simulation mode - no execution provider was available, output is approximated";

    const std::string& id() const override { return id_; }
    bool needs_wrapping() const override { return false; }
    bool is_simulated() const override { return true; }

    ProviderResponse execute(const ExecutionTask& task) override;

    // Approximate stdout of a snippet
    static std::string simulate(const std::string& code, exec::Language language);

    // Evaluate an arithmetic expression with the language's number
    // semantics and formatting; nullopt if it is not plain arithmetic
    static std::optional<std::string> evaluate(const std::string& expr, exec::Language language);

private:
    std::string id_ = ID;
};

} // namespace runbox::providers
