/**
 * Runbox HTTP Client
 *
 * Transport used by the remote provider adapters. The production
 * client drives the curl binary as a subprocess, the same way the
 * kernel drives its helper processes: pipes, poll, SIGTERM on
 * cancellation.
 */
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include "providers/provider.hpp"

namespace runbox::providers {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;                        // Sent only when non-empty
    uint64_t timeout_ms = 30000;
};

struct HttpResponse {
    bool transport_ok = false;               // Request reached the server and a status came back
    int status = 0;
    std::string body;
    std::string error;
    bool timed_out = false;
    int transport_code = 0;                  // curl exit code, 0 on success
};

class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual HttpResponse send(const HttpRequest& request, const CancelFlag& cancel) = 0;
};

struct CurlClientConfig {
    std::string curl_binary = "curl";
    uint64_t connect_timeout_ms = 10000;
    size_t max_response_bytes = 32 * 1024 * 1024;
    std::string temp_dir = "/tmp";
};

class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient() = default;
    explicit CurlHttpClient(const CurlClientConfig& config) : config_(config) {}

    HttpResponse send(const HttpRequest& request, const CancelFlag& cancel) override;

    const CurlClientConfig& config() const { return config_; }

    // Quote a value for a curl config file
    static std::string config_quote(const std::string& value);

    // Split "<body>\n<status>" as written by -w
    static bool split_status_trailer(const std::string& raw, std::string& body, int& status);

private:
    CurlClientConfig config_;

    std::string make_temp_file(const std::string& prefix, const std::string& contents) const;
};

// Classify a non-2xx or failed exchange for the fallback loop
FailureKind classify_http_failure(const HttpResponse& response);

// True for 2xx
inline bool http_success(const HttpResponse& response) {
    return response.transport_ok && response.status >= 200 && response.status < 300;
}

// Failure response with a message that carries no credentials
ProviderResponse failure_from_http(const std::string& provider_id,
                                   const std::string& step,
                                   const HttpResponse& response);

} // namespace runbox::providers
