/**
 * Runbox HTTP Messages
 *
 * Minimal HTTP/1.1 request parsing and response serialization for
 * the JSON API. Bodies are delimited by Content-Length only; chunked
 * request bodies are rejected.
 */
#pragma once
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace runbox::ipc {

struct Request {
    std::string method;
    std::string target;                      // As sent, including any query
    std::string path;                        // Target without the query
    std::string version;                     // "HTTP/1.1"
    std::vector<std::pair<std::string, std::string>> headers;   // Names lowercased
    std::string body;

    // First header with this (case-insensitive) name
    std::optional<std::string> header(const std::string& name) const;

    // First query parameter with this name, percent-decoded
    std::optional<std::string> query_param(const std::string& name) const;

    bool keep_alive() const;
};

struct Response {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;

    static Response make_json(int status, const nlohmann::json& body);
    static Response error(int status, const std::string& message);

    std::string serialize(bool keep_alive) const;
};

// Reason phrase for the status codes this service emits
const char* status_reason(int status);

enum class ParseStatus {
    COMPLETE,
    INCOMPLETE,   // Need more bytes
    INVALID       // Respond with error_status and close
};

struct ParseResult {
    ParseStatus status = ParseStatus::INCOMPLETE;
    Request request;
    size_t consumed = 0;                     // Bytes of the buffer used by the request
    int error_status = 400;
    std::string error;
};

struct ParseLimits {
    size_t max_header_bytes = 16 * 1024;
    size_t max_body_bytes = 1024 * 1024;
};

ParseResult parse_request(const std::string& buffer, const ParseLimits& limits);

std::string to_lower(const std::string& s);

} // namespace runbox::ipc
