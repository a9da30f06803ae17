#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace tether {
namespace runtime {

namespace {
constexpr int kIdleTickMs = 100;
}  // namespace

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing Tether");

    if (!init_sidecar(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_sidecar(std::string &error) {
    lifecycle_ = std::make_unique<Lifecycle>(config_);
    return lifecycle_->start(error);
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP control surface disabled");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *lifecycle_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

bool Runtime::should_stop() const { return SignalHandler::is_shutdown_requested(); }

void Runtime::run() {
    LOG_INFO("[Runtime] Waiting for sidecar port announcement");
    auto port = lifecycle_->wait_for_port(config_.readiness, [this]() { return should_stop(); });
    if (port) {
        LOG_INFO("[Runtime] Sidecar ready on port " << *port);
    } else if (!should_stop()) {
        // Not fatal: the port may still arrive, callers keep polling
        LOG_WARN("[Runtime] Sidecar did not announce a port after " << config_.readiness.max_attempts
                                                                     << " attempts");
    }

    while (!should_stop()) {
        if (SignalHandler::consume_update_request()) {
            lifecycle_->on_before_update();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kIdleTickMs));
    }

    LOG_INFO("[Runtime] Main loop exiting");
}

void Runtime::shutdown() {
    if (lifecycle_) {
        lifecycle_->on_exit();
    }

    if (http_server_) {
        http_server_->stop();
        http_server_.reset();
    }

    // Supervisor teardown joins the drain threads
    lifecycle_.reset();
}

}  // namespace runtime
}  // namespace tether
