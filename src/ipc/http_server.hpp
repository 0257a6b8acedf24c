/**
 * Runbox HTTP Server
 *
 * TCP listener for the JSON API. One accept thread polls the listening
 * socket and queues connections; a pool of worker threads serves them,
 * so requests run in parallel and a slow execution only occupies one
 * worker.
 */
#pragma once
#include <string>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <cstdint>
#include "ipc/http_message.hpp"

namespace runbox::ipc {

using RequestHandler = std::function<Response(const Request&)>;

struct HttpServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;                    // 0 = ephemeral, see bound_port()
    size_t workers = 0;                      // 0 = hardware concurrency, at least 2
    size_t max_queue = 256;                  // Pending connections before 503
    int backlog = 64;
    int idle_timeout_sec = 30;               // Per read on a connection
    ParseLimits limits;
};

class HttpServer {
public:
    explicit HttpServer(const HttpServerConfig& config);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    void set_handler(RequestHandler handler);

    // Bind, listen and start the threads
    bool start();
    void stop();

    bool is_running() const { return running_; }
    uint16_t bound_port() const { return bound_port_; }
    uint64_t total_requests() const { return total_requests_; }
    size_t worker_count() const { return workers_.size(); }

private:
    HttpServerConfig config_;
    RequestHandler handler_;
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> total_requests_{0};

    std::thread accept_thread_;
    std::vector<std::thread> workers_;
    std::queue<int> connections_;
    std::mutex mutex_;
    std::condition_variable cv_;

    void accept_loop();
    void worker_loop();
    void handle_connection(int client_fd);
    Response dispatch(const Request& request);

    static bool send_all(int fd, const std::string& data);
};

} // namespace runbox::ipc
