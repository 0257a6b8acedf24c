#include <gtest/gtest.h>
#include "providers/primary_provider.hpp"
#include "providers/e2b_provider.hpp"
#include "providers/modal_provider.hpp"
#include "fakes.hpp"

using namespace runbox;
using namespace runbox::providers;
using runbox::test::FakeHttpClient;
using json = nlohmann::json;

namespace {

RemoteProviderConfig config(const std::string& id, const std::string& endpoint) {
    RemoteProviderConfig c;
    c.id = id;
    c.endpoint = endpoint;
    c.api_key = "secret-key";
    c.request_overhead_ms = 1000;
    return c;
}

ExecutionTask task(const std::string& code, exec::Language language) {
    ExecutionTask t;
    t.code = code;
    t.language = language;
    t.limits = exec::ResourceLimitPolicy::limits_for(exec::Tier::FREE);
    t.user_id = "user-1";
    t.tier = exec::Tier::FREE;
    t.cancel = make_cancel_flag();
    return t;
}

} // namespace

// ============================================================================
// Shared decoding
// ============================================================================

TEST(RemoteProviderTest, TimeoutSecondsRoundUp) {
    exec::ResourceLimits limits;
    limits.timeout_ms = 2500;
    EXPECT_EQ(RemoteProvider::timeout_seconds(limits), 3u);
    limits.timeout_ms = 0;
    EXPECT_EQ(RemoteProvider::timeout_seconds(limits), 1u);
}

TEST(RemoteProviderTest, DecodeResultAcceptsEitherExitCodeSpelling) {
    std::string error;
    auto snake = RemoteProvider::decode_result(json{{"stdout", "a"}, {"exit_code", 2}}, error);
    ASSERT_TRUE(snake.has_value());
    EXPECT_EQ(snake->exit_status, 2);

    auto camel = RemoteProvider::decode_result(json{{"stdout", "a"}, {"exitCode", 3}}, error);
    ASSERT_TRUE(camel.has_value());
    EXPECT_EQ(camel->exit_status, 3);
}

TEST(RemoteProviderTest, DecodeResultOptionalFields) {
    std::string error;
    auto raw = RemoteProvider::decode_result(json{
        {"stdout", nullptr},
        {"stderr", "warn"},
        {"execution_time_ms", 0},
        {"memory_used_mb", 3.5},
        {"security_warnings", {"remote note", 7}}
    }, error);

    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw->stdout_data, "");
    EXPECT_EQ(raw->stderr_data, "warn");
    EXPECT_FALSE(raw->reported_time_ms.has_value());
    EXPECT_DOUBLE_EQ(raw->memory_used_mb.value_or(0), 3.5);
    ASSERT_EQ(raw->warnings.size(), 1u);
    EXPECT_EQ(raw->warnings[0], "remote note");
}

TEST(RemoteProviderTest, DecodeResultRejectsWrongTypes) {
    std::string error;
    EXPECT_FALSE(RemoteProvider::decode_result(json{{"stdout", 42}}, error).has_value());
    EXPECT_NE(error.find("stdout"), std::string::npos);
}

TEST(RemoteProviderTest, MissingTransportIsPermanent) {
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), nullptr);
    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.failure, FailureKind::PERMANENT);
}

TEST(RemoteProviderTest, CancelledTaskIsNotSent) {
    auto client = std::make_shared<FakeHttpClient>();
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto t = task("print(1)", exec::Language::PYTHON);
    t.cancel->store(true);
    auto response = provider.execute(t);

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.failure, FailureKind::TRANSIENT);
    EXPECT_TRUE(client->requests().empty());
}

// ============================================================================
// Primary
// ============================================================================

TEST(PrimaryProviderTest, SendsRequestAndDecodesResult) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, R"({"stdout":"2\n","stderr":"","exit_code":0,"execution_time_ms":17})");
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto t = task("print(1+1)", exec::Language::PYTHON);
    t.stdin_data = "input";
    auto response = provider.execute(t);

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.output.stdout_data, "2\n");
    EXPECT_EQ(response.output.reported_time_ms.value_or(0), 17u);

    ASSERT_EQ(client->requests().size(), 1u);
    const auto& request = client->requests()[0];
    EXPECT_EQ(request.method, "POST");
    EXPECT_EQ(request.url, "http://sandbox.local/execute");
    EXPECT_EQ(FakeHttpClient::header(request, "X-API-Key"), "secret-key");
    EXPECT_EQ(request.timeout_ms, 5000u + 1000u);

    auto body = json::parse(request.body);
    EXPECT_EQ(body["code"], "print(1+1)");
    EXPECT_EQ(body["language"], "python");
    EXPECT_EQ(body["user_id"], "user-1");
    EXPECT_EQ(body["tier"], "free");
    EXPECT_EQ(body["timeout_seconds"], 5);
    EXPECT_EQ(body["stdin"], "input");
}

TEST(PrimaryProviderTest, AnonymousUserAndNoStdin) {
    auto t = task("print(1)", exec::Language::PYTHON);
    t.user_id.clear();
    auto body = PrimaryProvider::build_body(t);
    EXPECT_EQ(body["user_id"], "anonymous");
    EXPECT_FALSE(body.contains("stdin"));
}

TEST(PrimaryProviderTest, ServerErrorIsTransient) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(503, "busy");
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.failure, FailureKind::TRANSIENT);
    EXPECT_EQ(response.error.find("secret-key"), std::string::npos);
}

TEST(PrimaryProviderTest, ClientErrorIsPermanent) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(400, R"({"error":"unsupported"})");
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_EQ(response.failure, FailureKind::PERMANENT);
}

TEST(PrimaryProviderTest, UnparseableBodyIsPermanent) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, "<html>oops</html>");
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.failure, FailureKind::PERMANENT);
}

TEST(PrimaryProviderTest, ConnectionFailureIsTransient) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push_transport_error(7);
    PrimaryProvider provider(config("ch-gva-2", "http://sandbox.local/execute"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_EQ(response.failure, FailureKind::TRANSIENT);
}

// ============================================================================
// E2B
// ============================================================================

TEST(E2bProviderTest, CreatesRunsAndDeletesSandbox) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, R"({"id":"sbx-1"})");
    client->push(200, R"({"stdout":"hi\n","stderr":"","exitCode":0})");
    client->push(204, "");
    E2bProvider provider(config("e2b", "https://api.e2b.test/"), client);

    auto response = provider.execute(task("console.log('hi')", exec::Language::JAVASCRIPT));

    ASSERT_TRUE(response.success);
    EXPECT_EQ(response.output.stdout_data, "hi\n");

    const auto& requests = client->requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].url, "https://api.e2b.test/sandboxes");
    EXPECT_EQ(json::parse(requests[0].body)["template"], "Node");
    EXPECT_EQ(requests[1].url, "https://api.e2b.test/sandboxes/sbx-1/code");
    EXPECT_EQ(json::parse(requests[1].body)["code"], "console.log('hi')");
    EXPECT_EQ(requests[2].method, "DELETE");
    EXPECT_EQ(requests[2].url, "https://api.e2b.test/sandboxes/sbx-1");
    EXPECT_EQ(requests[2].timeout_ms, E2bProvider::CLEANUP_TIMEOUT_MS);
}

TEST(E2bProviderTest, SandboxIsDeletedWhenRunFails) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, R"({"id":"sbx-2"})");
    client->push(502, "bad gateway");
    client->push(500, "cleanup failed too");
    E2bProvider provider(config("e2b", "https://api.e2b.test"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.failure, FailureKind::TRANSIENT);
    ASSERT_EQ(client->requests().size(), 3u);
    EXPECT_EQ(client->requests()[2].method, "DELETE");
}

TEST(E2bProviderTest, CreateWithoutIdIsPermanent) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, R"({"status":"ok"})");
    E2bProvider provider(config("e2b", "https://api.e2b.test"), client);

    auto response = provider.execute(task("print(1)", exec::Language::PYTHON));
    EXPECT_EQ(response.failure, FailureKind::PERMANENT);
    EXPECT_EQ(client->requests().size(), 1u);
}

TEST(E2bProviderTest, DefaultsAndTemplates) {
    E2bProvider provider(RemoteProviderConfig{}, nullptr);
    EXPECT_EQ(provider.id(), "e2b");
    EXPECT_EQ(provider.config().endpoint, E2bProvider::DEFAULT_ENDPOINT);
    EXPECT_TRUE(provider.needs_wrapping());
    EXPECT_STREQ(E2bProvider::template_for(exec::Language::SHELL), "Bash");
    EXPECT_STREQ(E2bProvider::template_for(exec::Language::PYTHON), "Python3");
}

// ============================================================================
// Modal
// ============================================================================

TEST(ModalProviderTest, BuildsCommandAndUsesBearerToken) {
    auto client = std::make_shared<FakeHttpClient>();
    client->push(200, R"({"stdout":"ok\n","exit_code":{"code":0}})");
    ModalProvider provider(config("modal", "https://modal.test/execute"), client);

    auto response = provider.execute(task("echo ok", exec::Language::SHELL));

    ASSERT_TRUE(response.success);
    ASSERT_EQ(client->requests().size(), 1u);
    const auto& request = client->requests()[0];
    EXPECT_EQ(FakeHttpClient::header(request, "Authorization"), "Bearer secret-key");

    auto body = json::parse(request.body);
    EXPECT_EQ(body["image"], "ubuntu:22.04");
    EXPECT_EQ(body["command"], json::array({"bash", "-c", "echo ok"}));
    EXPECT_EQ(body["timeout"], 5);
    EXPECT_EQ(body["memory_mb"], 128);
    EXPECT_DOUBLE_EQ(body["cpu"].get<double>(), 0.25);
}

TEST(ModalProviderTest, CommandPerLanguage) {
    EXPECT_EQ(ModalProvider::command_for(exec::Language::PYTHON, "x")[0], "python3");
    EXPECT_EQ(ModalProvider::command_for(exec::Language::JAVASCRIPT, "x")[1], "-e");
}
