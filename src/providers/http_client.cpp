#include "providers/http_client.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace runbox::providers {

namespace {

constexpr int CURL_EXEC_FAILED = 127;
constexpr int CURL_UNSUPPORTED_PROTOCOL = 1;
constexpr int CURL_URL_MALFORMAT = 3;
constexpr int CURL_OPERATION_TIMEDOUT = 28;

int decode_exit_code(int rc) {
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    if (WIFSIGNALED(rc)) return 128 + WTERMSIG(rc);
    return rc;
}

// Header text must stay on one line
std::string strip_line_breaks(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c != '\r' && c != '\n') out.push_back(c);
    }
    return out;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

} // namespace

// ============================================================================
// CurlHttpClient Implementation
// ============================================================================

std::string CurlHttpClient::config_quote(const std::string& value) {
    std::string out = "\"";
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:   out.push_back(c);
        }
    }
    out += "\"";
    return out;
}

bool CurlHttpClient::split_status_trailer(const std::string& raw, std::string& body, int& status) {
    size_t nl = raw.rfind('\n');
    if (nl == std::string::npos) {
        return false;
    }

    std::string code = trim(raw.substr(nl + 1));
    if (code.empty() || !std::all_of(code.begin(), code.end(), ::isdigit)) {
        return false;
    }

    status = std::stoi(code);
    body = raw.substr(0, nl);
    return true;
}

std::string CurlHttpClient::make_temp_file(const std::string& prefix, const std::string& contents) const {
    std::string tmpl = config_.temp_dir + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    // mkstemp creates the file 0600
    int fd = mkstemp(buf.data());
    if (fd < 0) {
        spdlog::error("[http] mkstemp failed in {}: {}", config_.temp_dir, strerror(errno));
        return "";
    }

    size_t written = 0;
    while (written < contents.size()) {
        ssize_t n = write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[http] Failed to write temp file: {}", strerror(errno));
            close(fd);
            std::remove(buf.data());
            return "";
        }
        written += static_cast<size_t>(n);
    }

    close(fd);
    return std::string(buf.data());
}

HttpResponse CurlHttpClient::send(const HttpRequest& request, const CancelFlag& cancel) {
    HttpResponse response;

    // URL and headers go through a config file so credentials never
    // appear in the process table
    std::ostringstream cfg;
    cfg << "url = " << config_quote(strip_line_breaks(request.url)) << "\n";
    for (const auto& [name, value] : request.headers) {
        cfg << "header = " << config_quote(strip_line_breaks(name + ": " + value)) << "\n";
    }

    std::string config_path = make_temp_file("runbox_curl_cfg_", cfg.str());
    if (config_path.empty()) {
        response.error = "failed to prepare request";
        response.transport_code = -1;
        return response;
    }

    std::string body_path;
    if (!request.body.empty()) {
        body_path = make_temp_file("runbox_curl_body_", request.body);
        if (body_path.empty()) {
            std::remove(config_path.c_str());
            response.error = "failed to prepare request body";
            response.transport_code = -1;
            return response;
        }
    }

    auto cleanup_files = [&]() {
        std::remove(config_path.c_str());
        if (!body_path.empty()) std::remove(body_path.c_str());
    };

    uint64_t connect_ms = std::min(config_.connect_timeout_ms, request.timeout_ms);
    std::vector<std::string> args = {
        config_.curl_binary,
        "-sS",
        "-X", request.method,
        "--max-time", fmt::format("{:.3f}", request.timeout_ms / 1000.0),
        "--connect-timeout", fmt::format("{:.3f}", connect_ms / 1000.0),
        "-K", config_path,
        "-o", "-",
        "-w", "\n%{http_code}",
    };
    if (!body_path.empty()) {
        args.push_back("--data-binary");
        args.push_back("@" + body_path);
    }

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe(stdout_pipe) == -1) {
        cleanup_files();
        response.error = "failed to create pipes";
        response.transport_code = -1;
        return response;
    }
    if (pipe(stderr_pipe) == -1) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        cleanup_files();
        response.error = "failed to create pipes";
        response.transport_code = -1;
        return response;
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid == -1) {
        spdlog::error("[http] Failed to fork curl: {}", strerror(errno));
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        cleanup_files();
        response.error = "failed to start transport";
        response.transport_code = -1;
        return response;
    }

    if (pid == 0) {
        // Child process
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        close(stdout_pipe[0]);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stderr_pipe[1]);

        execvp(argv[0], argv.data());
        _exit(CURL_EXEC_FAILED);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    int out_fd = stdout_pipe[0];
    int err_fd = stderr_pipe[0];

    std::string out_data;
    std::string err_data;
    bool cancelled = false;
    bool oversized = false;
    char buffer[8192];

    while (out_fd >= 0 || err_fd >= 0) {
        if (!cancelled && cancel && cancel->load()) {
            cancelled = true;
            kill(pid, SIGTERM);
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        int ready = poll(fds, nfds, 100);
        if (ready < 0) {
            if (errno == EINTR) continue;
            spdlog::error("[http] poll failed: {}", strerror(errno));
            kill(pid, SIGKILL);
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < nfds; ++i) {
            if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;

            ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) continue;

            bool is_out = fds[i].fd == out_fd;
            if (n <= 0) {
                if (is_out) close_fd(out_fd);
                else close_fd(err_fd);
                continue;
            }

            if (is_out) {
                out_data.append(buffer, static_cast<size_t>(n));
                if (!oversized && out_data.size() > config_.max_response_bytes) {
                    oversized = true;
                    kill(pid, SIGTERM);
                }
            } else if (err_data.size() < 16 * 1024) {
                err_data.append(buffer, static_cast<size_t>(n));
            }
        }
    }

    close_fd(out_fd);
    close_fd(err_fd);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    cleanup_files();

    int exit_code = decode_exit_code(status);
    response.transport_code = exit_code;

    if (cancelled) {
        response.error = "request cancelled";
        response.timed_out = true;
        return response;
    }
    if (oversized) {
        response.error = fmt::format("response exceeded {} bytes", config_.max_response_bytes);
        return response;
    }
    if (exit_code == CURL_EXEC_FAILED) {
        response.error = fmt::format("could not run {}", config_.curl_binary);
        return response;
    }
    if (exit_code != 0) {
        response.timed_out = exit_code == CURL_OPERATION_TIMEDOUT;
        std::string detail = trim(err_data);
        response.error = detail.empty() ? fmt::format("curl exited with code {}", exit_code) : detail;
        return response;
    }

    if (!split_status_trailer(out_data, response.body, response.status)) {
        response.error = "malformed transport output";
        response.transport_code = -1;
        return response;
    }

    response.transport_ok = response.status != 0;
    if (!response.transport_ok) {
        response.error = "no HTTP status received";
    }
    return response;
}

// ============================================================================
// Failure classification
// ============================================================================

FailureKind classify_http_failure(const HttpResponse& response) {
    if (!response.transport_ok) {
        switch (response.transport_code) {
            case CURL_EXEC_FAILED:
            case CURL_UNSUPPORTED_PROTOCOL:
            case CURL_URL_MALFORMAT:
                return FailureKind::PERMANENT;
            default:
                return FailureKind::TRANSIENT;
        }
    }

    if (response.status == 408 || response.status == 429 || response.status >= 500) {
        return FailureKind::TRANSIENT;
    }
    return FailureKind::PERMANENT;
}

ProviderResponse failure_from_http(const std::string& provider_id,
                                   const std::string& step,
                                   const HttpResponse& response) {
    FailureKind kind = classify_http_failure(response);
    std::string message;

    if (!response.transport_ok) {
        message = fmt::format("{} {} failed: {}", provider_id, step,
            response.timed_out ? "timed out" : response.error);
    } else {
        // Keep remote error bodies short; they are logged, not returned
        std::string snippet = response.body.substr(0, 200);
        message = fmt::format("{} {} returned HTTP {}: {}", provider_id, step,
            response.status, snippet);
    }

    return ProviderResponse::fail(kind, message);
}

} // namespace runbox::providers
