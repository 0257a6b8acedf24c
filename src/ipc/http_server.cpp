#include "ipc/http_server.hpp"
#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace runbox::ipc {

HttpServer::HttpServer(const HttpServerConfig& config)
    : config_(config) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::set_handler(RequestHandler handler) {
    handler_ = std::move(handler);
}

bool HttpServer::start() {
    if (running_) {
        return true;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) {
        spdlog::error("Failed to create socket: {}", strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("Invalid listen address: {}", config_.host);
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        spdlog::error("Failed to bind {}:{}: {}", config_.host, config_.port, strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, config_.backlog) < 0) {
        spdlog::error("Failed to listen: {}", strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        bound_port_ = ntohs(addr.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_ = true;
    accept_thread_ = std::thread(&HttpServer::accept_loop, this);

    size_t num_workers = config_.workers;
    if (num_workers == 0) {
        num_workers = std::thread::hardware_concurrency();
        if (num_workers < 2) num_workers = 2;
    }
    for (size_t i = 0; i < num_workers; i++) {
        workers_.emplace_back(&HttpServer::worker_loop, this);
    }

    spdlog::info("HTTP server listening on {}:{} ({} workers)", config_.host, bound_port_, num_workers);
    return true;
}

void HttpServer::stop() {
    bool was_running = running_.exchange(false);
    cv_.notify_all();

    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();

    // Connections still queued never reached a worker
    std::lock_guard<std::mutex> lock(mutex_);
    while (!connections_.empty()) {
        close(connections_.front());
        connections_.pop();
    }

    if (was_running) {
        spdlog::info("HTTP server stopped ({} requests served)", total_requests_.load());
    }
}

void HttpServer::accept_loop() {
    while (running_) {
        struct pollfd pfd;
        pfd.fd = server_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int ret = poll(&pfd, 1, 200);
        if (ret <= 0) continue;

        int client_fd = accept(server_fd_, nullptr, nullptr);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR && running_) {
                spdlog::error("Failed to accept: {}", strerror(errno));
            }
            continue;
        }

        bool queued = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (connections_.size() < config_.max_queue) {
                connections_.push(client_fd);
                queued = true;
            }
        }

        if (queued) {
            cv_.notify_one();
        } else {
            spdlog::warn("Connection queue full, rejecting client");
            send_all(client_fd, Response::error(503, "Server busy").serialize(false));
            close(client_fd);
        }
    }
}

void HttpServer::worker_loop() {
    while (running_) {
        int client_fd = -1;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(500), [this] {
                return !connections_.empty() || !running_;
            });

            if (!running_) break;
            if (connections_.empty()) continue;

            client_fd = connections_.front();
            connections_.pop();
        }

        handle_connection(client_fd);
        close(client_fd);
    }
}

void HttpServer::handle_connection(int client_fd) {
    struct timeval tv;
    tv.tv_sec = config_.idle_timeout_sec;
    tv.tv_usec = 0;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    std::string buffer;
    char chunk[16384];

    while (running_) {
        ParseResult parsed = parse_request(buffer, config_.limits);

        if (parsed.status == ParseStatus::INVALID) {
            spdlog::debug("Rejecting malformed request: {}", parsed.error);
            send_all(client_fd, Response::error(parsed.error_status, parsed.error).serialize(false));
            return;
        }

        if (parsed.status == ParseStatus::INCOMPLETE) {
            ssize_t n = recv(client_fd, chunk, sizeof(chunk), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return;      // Closed, reset or idle timeout
            buffer.append(chunk, static_cast<size_t>(n));
            continue;
        }

        buffer.erase(0, parsed.consumed);
        const bool keep_alive = parsed.request.keep_alive();

        Response response = dispatch(parsed.request);
        total_requests_++;

        if (!send_all(client_fd, response.serialize(keep_alive)) || !keep_alive) {
            return;
        }
    }
}

Response HttpServer::dispatch(const Request& request) {
    if (!handler_) {
        return Response::error(503, "No handler installed");
    }
    try {
        return handler_(request);
    } catch (const std::exception& e) {
        spdlog::error("Unhandled error serving {} {}: {}", request.method, request.path, e.what());
        return Response::error(500, "Internal server error");
    }
}

bool HttpServer::send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::debug("Write error: {}", strerror(errno));
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    return true;
}

} // namespace runbox::ipc
