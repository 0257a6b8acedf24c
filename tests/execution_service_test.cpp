#include <gtest/gtest.h>
#include "service/execution_service.hpp"
#include "exec/result_assembler.hpp"
#include "fakes.hpp"

using namespace runbox;
using namespace runbox::service;
using runbox::test::FakeProvider;
using json = nlohmann::json;

namespace {

std::string header_value(const ipc::Response& response, const std::string& name) {
    for (const auto& [key, value] : response.headers) {
        if (key == name) return value;
    }
    return "";
}

} // namespace

class ExecutionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory = std::make_shared<JsonDirectory>();
        directory->add_user("alice", exec::Tier::PRO, "token-alice");
        directory->add_user("bob", exec::Tier::FREE, "token-bob");
        ledger = std::make_shared<audit::InMemoryUsageLedger>();
        audit_log = std::make_shared<audit::AuditLogger>();
        rate_limiter = std::make_shared<RateLimiter>(100, std::chrono::seconds(60));
    }

    std::unique_ptr<ExecutionService> make_service(std::vector<providers::ProviderPtr> providers) {
        ExecutionServiceDeps deps;
        deps.orchestrator = std::make_shared<exec::ExecutionOrchestrator>(
            std::move(providers), exec::OrchestratorConfig{}, audit_log);
        deps.identity = directory;
        deps.tiers = directory;
        deps.ledger = ledger;
        deps.rate_limiter = rate_limiter;
        deps.audit = audit_log;
        return std::make_unique<ExecutionService>(std::move(deps));
    }

    static ipc::Request execute_request(const json& body, const std::string& token = "token-alice") {
        ipc::Request request;
        request.method = "POST";
        request.target = "/v1/execute";
        request.path = "/v1/execute";
        request.version = "HTTP/1.1";
        if (!token.empty()) {
            request.headers.emplace_back("authorization", "Bearer " + token);
        }
        request.body = body.dump();
        return request;
    }

    static ipc::Request audit_request(const std::string& query, const std::string& token = "token-alice") {
        ipc::Request request;
        request.method = "GET";
        request.target = "/v1/audit" + query;
        request.path = "/v1/audit";
        request.version = "HTTP/1.1";
        if (!token.empty()) {
            request.headers.emplace_back("authorization", "Bearer " + token);
        }
        return request;
    }

    std::shared_ptr<JsonDirectory> directory;
    std::shared_ptr<audit::InMemoryUsageLedger> ledger;
    std::shared_ptr<audit::AuditLogger> audit_log;
    std::shared_ptr<RateLimiter> rate_limiter;
};

TEST_F(ExecutionServiceTest, SuccessfulExecution) {
    auto p1 = FakeProvider::succeeding("ch-gva-2", "4\n");
    auto service = make_service({p1});

    auto response = service->handle(execute_request({
        {"code", "print(2+2)"},
        {"language", "python"},
        {"stdin", "data"},
        {"task_id", "task-9"}
    }));

    ASSERT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stdout"], "4\n");
    EXPECT_EQ(body["stderr"], "");
    EXPECT_EQ(body["exit_code"], 0);
    EXPECT_EQ(body["sandbox_region"], "ch-gva-2");
    EXPECT_EQ(body["truncated"], false);
    EXPECT_TRUE(body["security_warnings"].is_array());
    EXPECT_FALSE(body.contains("memory_used_mb"));

    const std::string execution_id = body["execution_id"].get<std::string>();
    auto record = ledger->find(execution_id);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->user_id, "alice");
    EXPECT_EQ(record->tier, "pro");
    EXPECT_EQ(record->language, "python");
    EXPECT_EQ(record->task_id.value_or(""), "task-9");
    EXPECT_EQ(record->stdin_data, "data");
    EXPECT_EQ(record->provider_id, "ch-gva-2");
    EXPECT_EQ(record->credits_used, 1u);
    EXPECT_FALSE(record->created_at.empty());
}

TEST_F(ExecutionServiceTest, TierComesFromDirectory) {
    auto p1 = FakeProvider::succeeding("p1", "ok");
    auto service = make_service({p1});

    service->handle(execute_request({{"code", "print(1)"}, {"language", "python"}}, "token-bob"));
    EXPECT_EQ(p1->last_limits().timeout_ms, 5000u);

    service->handle(execute_request({{"code", "print(1)"}, {"language", "python"}}, "token-alice"));
    EXPECT_EQ(p1->last_limits().timeout_ms, 30000u);
}

TEST_F(ExecutionServiceTest, MissingAuthorization) {
    auto service = make_service({});
    auto response = service->handle(execute_request({{"code", "print(1)"}, {"language", "python"}}, ""));
    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(json::parse(response.body)["error"], "Missing authorization header");
}

TEST_F(ExecutionServiceTest, InvalidToken) {
    auto service = make_service({});
    auto response = service->handle(execute_request({{"code", "print(1)"}, {"language", "python"}}, "nope"));
    EXPECT_EQ(response.status, 401);
    EXPECT_EQ(json::parse(response.body)["error"], "Invalid token");
}

TEST_F(ExecutionServiceTest, MissingFields) {
    auto service = make_service({});
    auto response = service->handle(execute_request({{"code", "print(1)"}}));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(json::parse(response.body)["error"], "Missing required fields: code, language");
    EXPECT_EQ(ledger->size(), 0u);
}

TEST_F(ExecutionServiceTest, MalformedBodies) {
    auto service = make_service({});

    auto request = execute_request({});
    request.body = "{not json";
    EXPECT_EQ(service->handle(request).status, 400);

    request.body = "[1,2]";
    EXPECT_EQ(service->handle(request).status, 400);

    auto bad_timeout = service->handle(execute_request({
        {"code", "print(1)"}, {"language", "python"}, {"timeout_ms", "fast"}}));
    EXPECT_EQ(bad_timeout.status, 400);

    auto bad_stdin = service->handle(execute_request({
        {"code", "print(1)"}, {"language", "python"}, {"stdin", 5}}));
    EXPECT_EQ(bad_stdin.status, 400);
}

TEST_F(ExecutionServiceTest, UnsupportedLanguage) {
    auto service = make_service({});
    auto response = service->handle(execute_request({{"code", "puts 1"}, {"language", "ruby"}}));
    EXPECT_EQ(response.status, 400);
    EXPECT_EQ(json::parse(response.body)["error"],
              "Unsupported language: ruby. Supported: python, javascript, shell");
}

TEST_F(ExecutionServiceTest, BlockedCodeIsForbidden) {
    auto p1 = FakeProvider::succeeding("p1", "ran");
    auto service = make_service({p1});

    auto response = service->handle(execute_request({{"code", "rm -rf /"}, {"language", "shell"}}));

    ASSERT_EQ(response.status, 403);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["error"], "Code blocked for security reasons");
    ASSERT_TRUE(body["security_warnings"].is_array());
    EXPECT_FALSE(body["security_warnings"].empty());
    EXPECT_EQ(p1->calls(), 0);
    EXPECT_EQ(ledger->size(), 0u);
}

TEST_F(ExecutionServiceTest, SimulatedFallbackStillSucceeds) {
    auto service = make_service({FakeProvider::failing("p1", providers::FailureKind::TRANSIENT)});

    auto response = service->handle(execute_request({{"code", "print(1+1)"}, {"language", "python"}}));

    ASSERT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["stdout"], "2\n");
    EXPECT_EQ(body["sandbox_region"], "simulated");
    EXPECT_EQ(ledger->size(), 1u);
}

TEST_F(ExecutionServiceTest, RateLimitReturns429) {
    rate_limiter = std::make_shared<RateLimiter>(1, std::chrono::seconds(60));
    auto service = make_service({FakeProvider::succeeding("p1", "ok")});
    json body = {{"code", "print(1)"}, {"language", "python"}};

    EXPECT_EQ(service->handle(execute_request(body)).status, 200);
    auto limited = service->handle(execute_request(body));
    EXPECT_EQ(limited.status, 429);
    EXPECT_FALSE(header_value(limited, "Retry-After").empty());

    // Limits are per user
    EXPECT_EQ(service->handle(execute_request(body, "token-bob")).status, 200);

    audit::AuditCategory category = audit::AuditCategory::RATE_LIMIT;
    EXPECT_EQ(audit_log->get_entries(&category).size(), 1u);
}

TEST_F(ExecutionServiceTest, HealthListsProviders) {
    auto service = make_service({FakeProvider::succeeding("p1", "ok")});

    ipc::Request request;
    request.method = "GET";
    request.path = "/health";
    auto response = service->handle(request);

    ASSERT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["providers"], json::array({"p1", "simulated"}));
}

TEST_F(ExecutionServiceTest, RoutingErrors) {
    auto service = make_service({});

    ipc::Request unknown;
    unknown.method = "GET";
    unknown.path = "/nope";
    EXPECT_EQ(service->handle(unknown).status, 404);

    ipc::Request wrong_method;
    wrong_method.method = "GET";
    wrong_method.path = "/v1/execute";
    auto response = service->handle(wrong_method);
    EXPECT_EQ(response.status, 405);
    EXPECT_EQ(header_value(response, "Allow"), "POST, OPTIONS");

    ipc::Request preflight;
    preflight.method = "OPTIONS";
    preflight.path = "/execute";
    auto options = service->handle(preflight);
    EXPECT_EQ(options.status, 204);
    EXPECT_EQ(header_value(options, "Access-Control-Allow-Origin"), "*");
}

TEST_F(ExecutionServiceTest, AuditShowsOnlyCallersEntries) {
    auto service = make_service({FakeProvider::failing("p1", providers::FailureKind::TRANSIENT)});
    ASSERT_EQ(service->handle(execute_request({{"code", "print(1+1)"}, {"language", "python"}})).status, 200);
    ASSERT_EQ(service->handle(execute_request({{"code", "rm -rf /"}, {"language", "shell"}}, "token-bob")).status, 403);

    auto response = service->handle(audit_request(""));
    ASSERT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    EXPECT_EQ(body["count"], 1);
    EXPECT_EQ(body["last_id"], 3);
    ASSERT_EQ(body["entries"].size(), 1u);
    EXPECT_EQ(body["entries"][0]["event_type"], "EXECUTION_COMPLETED");
    EXPECT_EQ(body["entries"][0]["user_id"], "alice");

    auto bob = json::parse(service->handle(audit_request("?category=SECURITY", "token-bob")).body);
    ASSERT_EQ(bob["entries"].size(), 1u);
    EXPECT_EQ(bob["entries"][0]["event_type"], "EXECUTION_BLOCKED");

    auto after = json::parse(service->handle(audit_request("?since_id=2")).body);
    EXPECT_EQ(after["count"], 0);
}

TEST_F(ExecutionServiceTest, AuditExecutionTrailRequiresOwnership) {
    auto service = make_service({FakeProvider::failing("p1", providers::FailureKind::TRANSIENT)});
    auto executed = service->handle(execute_request({{"code", "print(1+1)"}, {"language", "python"}}));
    ASSERT_EQ(executed.status, 200);
    auto execution_id = json::parse(executed.body)["execution_id"].get<std::string>();

    auto response = service->handle(audit_request("?execution_id=" + execution_id));
    ASSERT_EQ(response.status, 200);
    auto body = json::parse(response.body);
    ASSERT_EQ(body["entries"].size(), 2u);
    EXPECT_EQ(body["entries"][0]["event_type"], "PROVIDER_FAILED");
    EXPECT_EQ(body["entries"][0]["details"]["provider_id"], "p1");
    EXPECT_EQ(body["entries"][1]["event_type"], "EXECUTION_COMPLETED");

    EXPECT_EQ(service->handle(audit_request("?execution_id=" + execution_id, "token-bob")).status, 404);
    EXPECT_EQ(service->handle(audit_request("?execution_id=missing")).status, 404);
}

TEST_F(ExecutionServiceTest, AuditRejectsBadQueries) {
    auto service = make_service({});

    EXPECT_EQ(service->handle(audit_request("", "")).status, 401);
    EXPECT_EQ(service->handle(audit_request("", "nope")).status, 401);

    auto zero = service->handle(audit_request("?limit=0"));
    EXPECT_EQ(zero.status, 400);
    EXPECT_EQ(json::parse(zero.body)["error"], "limit must be between 1 and 100");
    EXPECT_EQ(service->handle(audit_request("?limit=101")).status, 400);
    EXPECT_EQ(service->handle(audit_request("?limit=5")).status, 200);

    auto since = service->handle(audit_request("?since_id=-1"));
    EXPECT_EQ(since.status, 400);
    EXPECT_EQ(json::parse(since.body)["error"], "since_id must be a non-negative integer");

    auto category = service->handle(audit_request("?category=security"));
    EXPECT_EQ(category.status, 400);
    EXPECT_EQ(json::parse(category.body)["error"], "Unknown audit category 'security'");

    auto post = audit_request("");
    post.method = "POST";
    auto wrong_method = service->handle(post);
    EXPECT_EQ(wrong_method.status, 405);
    EXPECT_EQ(header_value(wrong_method, "Allow"), "GET, OPTIONS");

    auto preflight = audit_request("", "");
    preflight.method = "OPTIONS";
    EXPECT_EQ(service->handle(preflight).status, 204);
}

TEST_F(ExecutionServiceTest, AuditUnavailableWithoutTrail) {
    audit_log.reset();
    auto service = make_service({});
    auto response = service->handle(audit_request(""));
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(json::parse(response.body)["error"], "Audit trail is not enabled");
}

TEST_F(ExecutionServiceTest, ParseExecuteBody) {
    std::string error;
    auto parsed = ExecutionService::parse_execute_body(json{
        {"code", "x"}, {"language", "shell"}, {"timeout_ms", 250}, {"stdin", nullptr}, {"sandbox_id", "sb"}
    }, error);

    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->requested_timeout_ms.value_or(0), 250);
    EXPECT_FALSE(parsed->stdin_data.has_value());
    EXPECT_EQ(parsed->sandbox_id.value_or(""), "sb");

    EXPECT_FALSE(ExecutionService::parse_execute_body(
        json{{"code", "x"}, {"language", "shell"}, {"timeout_ms", 1.5}}, error).has_value());
    EXPECT_EQ(error, "timeout_ms must be an integer");
}

TEST(SuccessBodyTest, SerializedStdoutStaysWithinCap) {
    exec::ResourceLimits limits;
    limits.max_output_bytes = 10;
    providers::RawExecution raw;
    raw.stdout_data = "123456789\xC3\xA9";
    auto result = exec::ResultAssembler::assemble({}, raw, "p1", limits, 5);

    auto response = ipc::Response::make_json(200, ExecutionService::success_body("e1", result));
    auto body = json::parse(response.body);
    EXPECT_LE(body["stdout"].get<std::string>().size(), 10u);
    EXPECT_EQ(body["truncated"], true);
}

TEST(BearerTokenTest, Parsing) {
    EXPECT_EQ(ExecutionService::bearer_token("Bearer abc"), "abc");
    EXPECT_EQ(ExecutionService::bearer_token("bearer   abc  "), "abc");
    EXPECT_EQ(ExecutionService::bearer_token("Basic abc"), "");
    EXPECT_EQ(ExecutionService::bearer_token("Bearer "), "");
    EXPECT_EQ(ExecutionService::bearer_token("abc"), "");
}
