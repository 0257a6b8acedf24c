#include "ipc/http_message.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>

namespace runbox::ipc {

using json = nlohmann::json;

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

ParseResult invalid(int status, const std::string& message) {
    ParseResult result;
    result.status = ParseStatus::INVALID;
    result.error_status = status;
    result.error = message;
    return result;
}

bool is_token(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || (c != 0 && std::strchr("!#$%&'*+-.^_`|~", c));
    });
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// '+' is a space; a malformed escape is kept literally
std::string percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '+') {
            out += ' ';
        } else if (s[i] == '%' && i + 2 < s.size() &&
                   hex_value(s[i + 1]) >= 0 && hex_value(s[i + 2]) >= 0) {
            out += static_cast<char>(hex_value(s[i + 1]) * 16 + hex_value(s[i + 2]));
            i += 2;
        } else {
            out += s[i];
        }
    }
    return out;
}

} // namespace

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// ============================================================================
// Request
// ============================================================================

std::optional<std::string> Request::header(const std::string& name) const {
    const std::string key = to_lower(name);
    for (const auto& [k, v] : headers) {
        if (k == key) return v;
    }
    return std::nullopt;
}

std::optional<std::string> Request::query_param(const std::string& name) const {
    size_t start = target.find('?');
    if (start == std::string::npos) return std::nullopt;
    const std::string query = target.substr(start + 1, target.find('#') - start - 1);

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        pos = amp + 1;
        if (pair.empty()) continue;

        size_t eq = pair.find('=');
        if (percent_decode(pair.substr(0, eq)) == name) {
            return eq == std::string::npos ? "" : percent_decode(pair.substr(eq + 1));
        }
    }
    return std::nullopt;
}

bool Request::keep_alive() const {
    std::string connection = to_lower(header("connection").value_or(""));
    if (version == "HTTP/1.0") {
        return connection == "keep-alive";
    }
    return connection != "close";
}

ParseResult parse_request(const std::string& buffer, const ParseLimits& limits) {
    size_t header_end = buffer.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (buffer.size() > limits.max_header_bytes) {
            return invalid(431, "Request headers too large");
        }
        return ParseResult{};
    }
    if (header_end > limits.max_header_bytes) {
        return invalid(431, "Request headers too large");
    }

    ParseResult result;
    Request& req = result.request;

    // Request line
    size_t line_end = buffer.find("\r\n");
    std::istringstream request_line(buffer.substr(0, line_end));
    std::string extra;
    if (!(request_line >> req.method >> req.target >> req.version) || (request_line >> extra)) {
        return invalid(400, "Malformed request line");
    }
    if (!is_token(req.method)) {
        return invalid(400, "Malformed request method");
    }
    if (req.version != "HTTP/1.1" && req.version != "HTTP/1.0") {
        return invalid(505, "HTTP version not supported");
    }
    if (req.target.empty() || req.target[0] != '/') {
        return invalid(400, "Malformed request target");
    }
    req.path = req.target.substr(0, req.target.find('?'));

    // Headers
    size_t pos = line_end + 2;
    while (pos < header_end) {
        size_t eol = buffer.find("\r\n", pos);
        if (eol == std::string::npos || eol > header_end) eol = header_end;
        std::string line = buffer.substr(pos, eol - pos);
        pos = eol + 2;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            return invalid(400, "Malformed header line");
        }
        std::string name = line.substr(0, colon);
        if (!is_token(name)) {
            return invalid(400, "Malformed header name");
        }
        req.headers.emplace_back(to_lower(name), trim(line.substr(colon + 1)));
    }

    if (auto te = req.header("transfer-encoding")) {
        if (to_lower(*te) != "identity") {
            return invalid(501, "Transfer-Encoding is not supported");
        }
    }

    size_t content_length = 0;
    if (auto cl = req.header("content-length")) {
        if (cl->empty() || cl->size() > 18 ||
            !std::all_of(cl->begin(), cl->end(), [](unsigned char c) { return std::isdigit(c); })) {
            return invalid(400, "Invalid Content-Length");
        }
        content_length = std::stoull(*cl);
    }
    if (content_length > limits.max_body_bytes) {
        return invalid(413, "Request body too large");
    }

    const size_t body_start = header_end + 4;
    if (buffer.size() < body_start + content_length) {
        return ParseResult{};
    }

    req.body = buffer.substr(body_start, content_length);
    result.consumed = body_start + content_length;
    result.status = ParseStatus::COMPLETE;
    return result;
}

// ============================================================================
// Response
// ============================================================================

const char* status_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

Response Response::make_json(int status, const nlohmann::json& body) {
    Response response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    // Invalid UTF-8 is dropped, never expanded, so output caps hold on the wire
    response.body = body.dump(-1, ' ', false, json::error_handler_t::ignore);
    return response;
}

Response Response::error(int status, const std::string& message) {
    return make_json(status, {{"error", message}});
}

std::string Response::serialize(bool keep_alive) const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << status_reason(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << body.size() << "\r\n";
    out << "Connection: " << (keep_alive ? "keep-alive" : "close") << "\r\n";
    out << "\r\n";
    out << body;
    return out.str();
}

} // namespace runbox::ipc
