#include <gtest/gtest.h>
#include "exec/orchestrator.hpp"
#include "audit/audit_log.hpp"
#include "providers/simulated_provider.hpp"
#include "fakes.hpp"
#include <algorithm>

using namespace runbox;
using namespace runbox::exec;
using runbox::providers::FailureKind;
using runbox::test::FakeProvider;

namespace {

// Last-resort provider that cannot answer either
class BrokenSimulation : public FakeProvider {
public:
    BrokenSimulation()
        : FakeProvider("broken-sim", providers::ProviderResponse::fail(FailureKind::PERMANENT, "no")) {}
    bool is_simulated() const override { return true; }
};

ExecutionRequest request(const std::string& code, const std::string& language) {
    ExecutionRequest r;
    r.code = code;
    r.language = language;
    return r;
}

CallerContext caller(Tier tier = Tier::FREE) {
    return CallerContext{"user-1", tier};
}

bool contains(const std::vector<std::string>& list, const std::string& needle) {
    return std::any_of(list.begin(), list.end(),
        [&](const std::string& s) { return s.find(needle) != std::string::npos; });
}

} // namespace

TEST(OrchestratorTest, SimulatedProviderIsAlwaysLast) {
    auto p1 = FakeProvider::succeeding("p1", "x");
    ExecutionOrchestrator orchestrator({std::make_shared<providers::SimulatedProvider>(), p1, nullptr});

    auto ids = orchestrator.provider_ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], "p1");
    EXPECT_EQ(ids[1], "simulated");
}

TEST(OrchestratorTest, SimulatedProviderIsAppended) {
    ExecutionOrchestrator orchestrator({FakeProvider::succeeding("p1", "x")});
    auto ids = orchestrator.provider_ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids.back(), "simulated");
}

TEST(OrchestratorTest, CriticalFindingBlocksBeforeAnyProvider) {
    auto p1 = FakeProvider::succeeding("p1", "ran");
    auto audit = std::make_shared<audit::AuditLogger>();
    ExecutionOrchestrator orchestrator({p1}, OrchestratorConfig{}, audit);

    auto outcome = orchestrator.execute(request(":(){ :|:& };:", "shell"), caller());

    EXPECT_EQ(outcome.status, ExecutionStatus::BLOCKED);
    EXPECT_EQ(outcome.error, "Code blocked for security reasons");
    EXPECT_FALSE(outcome.result.has_value());
    EXPECT_TRUE(contains(outcome.warnings, "fork bomb"));
    EXPECT_EQ(p1->calls(), 0);

    auto entries = audit->get_entries_for_execution(outcome.execution_id);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, audit::AuditCategory::SECURITY);
    EXPECT_EQ(entries[0].event_type, "EXECUTION_BLOCKED");
    EXPECT_FALSE(entries[0].success);
}

TEST(OrchestratorTest, FallsBackToSecondProvider) {
    auto p1 = FakeProvider::failing("p1", FailureKind::TRANSIENT);
    auto p2 = FakeProvider::succeeding("p2", "hello from p2\n");
    auto p3 = FakeProvider::succeeding("p3", "unused");
    ExecutionOrchestrator orchestrator({p1, p2, p3});

    auto outcome = orchestrator.execute(request("print('hi')", "python"), caller());

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_EQ(outcome.result->stdout_data, "hello from p2\n");
    EXPECT_EQ(outcome.result->provider_id, "p2");
    EXPECT_EQ(outcome.result->exit_code, 0);
    EXPECT_EQ(p1->calls(), 1);
    EXPECT_EQ(p2->calls(), 1);
    EXPECT_EQ(p3->calls(), 0);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].provider_id, "p1");
}

TEST(OrchestratorTest, PermanentFailureAlsoAdvances) {
    auto p1 = FakeProvider::failing("p1", FailureKind::PERMANENT);
    auto p2 = FakeProvider::succeeding("p2", "ok");
    ExecutionOrchestrator orchestrator({p1, p2});

    auto outcome = orchestrator.execute(request("print('hi')", "python"), caller());
    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(outcome.result->provider_id, "p2");
}

TEST(OrchestratorTest, SimulatedResultWhenNothingConfigured) {
    ExecutionOrchestrator orchestrator({});

    auto outcome = orchestrator.execute(request("print(1+1)", "python"), caller());

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(outcome.result->stdout_data, "2\n");
    EXPECT_EQ(outcome.result->provider_id, "simulated");
    EXPECT_EQ(outcome.result->exit_code, 0);
    EXPECT_TRUE(contains(outcome.result->security_warnings, "simulation mode"));
    EXPECT_TRUE(contains(outcome.result->security_warnings, "No sandbox provider is configured"));
}

TEST(OrchestratorTest, SimulatedResultNamesFailedProviders) {
    auto p1 = FakeProvider::failing("p1", FailureKind::TRANSIENT);
    ExecutionOrchestrator orchestrator({p1});

    auto outcome = orchestrator.execute(request("console.log(6 * 7)", "javascript"), caller());

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(outcome.result->stdout_data, "42\n");
    EXPECT_TRUE(contains(outcome.result->security_warnings, "All sandbox providers failed: p1 (transient)"));
}

TEST(OrchestratorTest, DeadlineAbandonsSlowProvider) {
    auto slow = FakeProvider::succeeding("slow", "late");
    slow->set_delay(std::chrono::milliseconds(5000));
    auto fast = FakeProvider::succeeding("fast", "on time");

    OrchestratorConfig config;
    config.provider_overhead_ms = 50;
    ExecutionOrchestrator orchestrator({slow, fast}, config);

    auto req = request("print('hi')", "python");
    req.requested_timeout_ms = 100;

    auto started = std::chrono::steady_clock::now();
    auto outcome = orchestrator.execute(req, caller());
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(outcome.result->provider_id, "fast");
    EXPECT_LT(elapsed, std::chrono::milliseconds(2000));
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].kind, FailureKind::TRANSIENT);

    // The abandoned attempt sees the cancel signal
    for (int i = 0; i < 100 && !slow->saw_cancel(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(slow->saw_cancel());
}

TEST(OrchestratorTest, UnavailableWhenEveryProviderFails) {
    auto p1 = FakeProvider::failing("p1", FailureKind::PERMANENT);
    auto sim = std::make_shared<BrokenSimulation>();
    ExecutionOrchestrator orchestrator({p1, sim});

    auto outcome = orchestrator.execute(request("import subprocess\nsubprocess.run(['ls'])", "python"),
                                        caller());

    EXPECT_EQ(outcome.status, ExecutionStatus::UNAVAILABLE);
    EXPECT_EQ(outcome.error, "No execution provider is available");
    EXPECT_FALSE(outcome.result.has_value());
    EXPECT_TRUE(contains(outcome.warnings, "subprocess"));
    EXPECT_TRUE(contains(outcome.warnings, "Provider p1 failed (permanent)"));
    EXPECT_TRUE(contains(outcome.warnings, "Provider broken-sim failed (permanent)"));
}

TEST(OrchestratorTest, WrappingProvidersReceiveWrappedCode) {
    auto wrapped = FakeProvider::failing("wrapped", FailureKind::TRANSIENT, true);
    auto plain = FakeProvider::succeeding("plain", "ok");
    ExecutionOrchestrator orchestrator({wrapped, plain});

    auto outcome = orchestrator.execute(request("print('hi')", "python"), caller());

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_NE(wrapped->last_code().find("guarded_import"), std::string::npos);
    EXPECT_EQ(plain->last_code(), "print('hi')");
}

TEST(OrchestratorTest, StrictModeSkipsWrappingProvidersOnWarnings) {
    auto wrapped = FakeProvider::succeeding("wrapped", "should not run", true);
    auto plain = FakeProvider::succeeding("plain", "isolated");

    OrchestratorConfig config;
    config.refuse_wrapped_on_warnings = true;
    ExecutionOrchestrator orchestrator({wrapped, plain}, config);

    auto outcome = orchestrator.execute(request("eval('1+1')", "python"), caller());

    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(wrapped->calls(), 0);
    EXPECT_EQ(outcome.result->provider_id, "plain");
    EXPECT_TRUE(contains(outcome.result->security_warnings, "eval"));
}

TEST(OrchestratorTest, StrictModeAllowsWrappingForCleanCode) {
    auto wrapped = FakeProvider::succeeding("wrapped", "ran", true);

    OrchestratorConfig config;
    config.refuse_wrapped_on_warnings = true;
    ExecutionOrchestrator orchestrator({wrapped}, config);

    auto outcome = orchestrator.execute(request("print('hi')", "python"), caller());
    ASSERT_EQ(outcome.status, ExecutionStatus::OK);
    EXPECT_EQ(outcome.result->provider_id, "wrapped");
}

TEST(OrchestratorTest, TierLimitsReachProvider) {
    auto p1 = FakeProvider::succeeding("p1", "ok");
    ExecutionOrchestrator orchestrator({p1});

    orchestrator.execute(request("print(1)", "python"), caller(Tier::PRO));
    EXPECT_EQ(p1->last_limits().timeout_ms, 30000u);
    EXPECT_EQ(p1->last_limits().memory_mb, 512u);

    auto req = request("print(1)", "python");
    req.requested_timeout_ms = 1000;
    auto outcome = orchestrator.execute(req, caller(Tier::PRO));
    EXPECT_EQ(p1->last_limits().timeout_ms, 1000u);
    EXPECT_EQ(outcome.limits.timeout_ms, 1000u);
}

TEST(OrchestratorTest, ValidationErrors) {
    auto p1 = FakeProvider::succeeding("p1", "ok");
    ExecutionOrchestrator orchestrator({p1});

    auto unsupported = orchestrator.execute(request("puts 1", "ruby"), caller());
    EXPECT_EQ(unsupported.status, ExecutionStatus::VALIDATION_ERROR);
    EXPECT_EQ(unsupported.error, "Unsupported language: ruby. Supported: python, javascript, shell");

    auto empty = orchestrator.execute(request("", "python"), caller());
    EXPECT_EQ(empty.status, ExecutionStatus::VALIDATION_ERROR);

    auto req = request("print(1)", "python");
    req.requested_timeout_ms = -1;
    EXPECT_EQ(orchestrator.execute(req, caller()).status, ExecutionStatus::VALIDATION_ERROR);

    EXPECT_EQ(p1->calls(), 0);
}

TEST(OrchestratorTest, OversizedCodeIsRejected) {
    OrchestratorConfig config;
    config.max_code_bytes = 16;
    ExecutionOrchestrator orchestrator({}, config);

    auto outcome = orchestrator.execute(request("print('" + std::string(32, 'a') + "')", "python"), caller());
    EXPECT_EQ(outcome.status, ExecutionStatus::VALIDATION_ERROR);
}

TEST(OrchestratorTest, ExecutionIdsAreUnique) {
    ExecutionOrchestrator orchestrator({FakeProvider::succeeding("p1", "ok")});
    auto a = orchestrator.execute(request("print(1)", "python"), caller());
    auto b = orchestrator.execute(request("print(1)", "python"), caller());
    EXPECT_EQ(a.execution_id.size(), 36u);
    EXPECT_NE(a.execution_id, b.execution_id);
}

TEST(OrchestratorTest, CompletionIsAudited) {
    auto audit = std::make_shared<audit::AuditLogger>();
    auto p1 = FakeProvider::failing("p1", FailureKind::TRANSIENT);
    auto p2 = FakeProvider::succeeding("p2", "ok");
    ExecutionOrchestrator orchestrator({p1, p2}, OrchestratorConfig{}, audit);

    auto outcome = orchestrator.execute(request("print(1)", "python"), caller());

    auto entries = audit->get_entries_for_execution(outcome.execution_id);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].event_type, "PROVIDER_FAILED");
    EXPECT_EQ(entries[0].details["provider_id"], "p1");
    EXPECT_EQ(entries[1].event_type, "EXECUTION_COMPLETED");
    EXPECT_EQ(entries[1].details["provider_id"], "p2");
}
