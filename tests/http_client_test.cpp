#include <gtest/gtest.h>
#include "providers/http_client.hpp"

using namespace runbox::providers;

namespace {

HttpResponse http(int status, const std::string& body = "") {
    HttpResponse r;
    r.transport_ok = true;
    r.status = status;
    r.body = body;
    return r;
}

HttpResponse transport_failure(int code) {
    HttpResponse r;
    r.transport_ok = false;
    r.transport_code = code;
    r.error = "boom";
    return r;
}

} // namespace

TEST(CurlHttpClientTest, ConfigQuoteEscapes) {
    EXPECT_EQ(CurlHttpClient::config_quote("plain"), "\"plain\"");
    EXPECT_EQ(CurlHttpClient::config_quote("a\"b\\c"), "\"a\\\"b\\\\c\"");
    EXPECT_EQ(CurlHttpClient::config_quote("tab\there"), "\"tab\\there\"");
}

TEST(CurlHttpClientTest, SplitStatusTrailer) {
    std::string body;
    int status = 0;
    ASSERT_TRUE(CurlHttpClient::split_status_trailer("{\"a\":1}\n200", body, status));
    EXPECT_EQ(body, "{\"a\":1}");
    EXPECT_EQ(status, 200);

    ASSERT_TRUE(CurlHttpClient::split_status_trailer("line1\nline2\n503", body, status));
    EXPECT_EQ(body, "line1\nline2");
    EXPECT_EQ(status, 503);

    EXPECT_FALSE(CurlHttpClient::split_status_trailer("no trailer", body, status));
    EXPECT_FALSE(CurlHttpClient::split_status_trailer("body\nabc", body, status));
}

TEST(CurlHttpClientTest, MissingBinaryIsPermanent) {
    CurlClientConfig config;
    config.curl_binary = "/nonexistent/runbox-curl";
    CurlHttpClient client(config);

    HttpRequest request;
    request.url = "http://127.0.0.1:9/";
    request.body = "{}";
    request.timeout_ms = 2000;

    auto response = client.send(request, make_cancel_flag());
    EXPECT_FALSE(response.transport_ok);
    EXPECT_EQ(response.transport_code, 127);
    EXPECT_EQ(classify_http_failure(response), FailureKind::PERMANENT);
}

TEST(HttpFailureTest, StatusClassification) {
    EXPECT_EQ(classify_http_failure(http(500)), FailureKind::TRANSIENT);
    EXPECT_EQ(classify_http_failure(http(503)), FailureKind::TRANSIENT);
    EXPECT_EQ(classify_http_failure(http(429)), FailureKind::TRANSIENT);
    EXPECT_EQ(classify_http_failure(http(408)), FailureKind::TRANSIENT);
    EXPECT_EQ(classify_http_failure(http(400)), FailureKind::PERMANENT);
    EXPECT_EQ(classify_http_failure(http(401)), FailureKind::PERMANENT);
    EXPECT_EQ(classify_http_failure(http(404)), FailureKind::PERMANENT);
}

TEST(HttpFailureTest, TransportClassification) {
    EXPECT_EQ(classify_http_failure(transport_failure(7)), FailureKind::TRANSIENT);    // connect refused
    EXPECT_EQ(classify_http_failure(transport_failure(28)), FailureKind::TRANSIENT);   // timeout
    EXPECT_EQ(classify_http_failure(transport_failure(6)), FailureKind::TRANSIENT);    // DNS
    EXPECT_EQ(classify_http_failure(transport_failure(3)), FailureKind::PERMANENT);    // bad URL
    EXPECT_EQ(classify_http_failure(transport_failure(1)), FailureKind::PERMANENT);
}

TEST(HttpFailureTest, SuccessRange) {
    EXPECT_TRUE(http_success(http(200)));
    EXPECT_TRUE(http_success(http(204)));
    EXPECT_FALSE(http_success(http(302)));
    EXPECT_FALSE(http_success(transport_failure(7)));
}

TEST(HttpFailureTest, MessageIsBounded) {
    auto failure = failure_from_http("p1", "execute", http(500, std::string(1000, 'x')));
    EXPECT_FALSE(failure.success);
    EXPECT_EQ(failure.error.rfind("p1 execute returned HTTP 500: ", 0), 0u);
    EXPECT_LT(failure.error.size(), 300u);

    HttpResponse timed_out = transport_failure(28);
    timed_out.timed_out = true;
    EXPECT_EQ(failure_from_http("p1", "execute", timed_out).error, "p1 execute failed: timed out");
}
