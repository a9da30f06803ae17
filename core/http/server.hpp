#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>

#include "runtime/config.hpp"

namespace tether {
namespace runtime { class Lifecycle; }

namespace http {

/**
 * @brief Local HTTP control surface for the surrounding application
 *
 * Exposes the Lifecycle commands over JSON so a UI process can fetch the
 * sidecar port and request a kill ahead of an update:
 * - GET  /v0/sidecar/port     -> handle_get_port
 * - POST /v0/sidecar/kill     -> handle_post_kill
 * - GET  /v0/runtime/status   -> handle_get_runtime_status
 *
 * Thread model:
 * - Server runs in its own thread (httplib::Server::listen_after_bind)
 * - Handlers execute in httplib's thread pool and only call thread-safe
 *   Lifecycle methods
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, runtime::Lifecycle &lifecycle);
    ~HttpServer();

    // Bind and start the server thread. config.port == 0 binds an ephemeral port.
    bool start(std::string &error);

    // Stop and join. Safe to call multiple times.
    void stop();

    bool is_running() const { return running_.load(); }

    // Port actually bound (valid after start)
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    int port_ = 0;

    runtime::Lifecycle &lifecycle_;
    std::chrono::steady_clock::time_point started_at_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();

    // Route handlers (handlers/*.cpp)
    void handle_get_port(const httplib::Request &req, httplib::Response &res);
    void handle_post_kill(const httplib::Request &req, httplib::Response &res);
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace tether
