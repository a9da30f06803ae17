#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "lifecycle.hpp"

namespace tether {
namespace runtime {

class Runtime {
public:
    Runtime(const RuntimeConfig &config);
    ~Runtime();

    // Spawn the sidecar and start the control surface
    bool initialize(std::string &error);

    // Wait for the port announcement, then idle until shutdown (blocking)
    void run();

    // Exit hook + control surface teardown. Safe to call multiple times.
    void shutdown();

private:
    bool init_sidecar(std::string &error);
    bool init_http(std::string &error);
    bool should_stop() const;

    RuntimeConfig config_;

    std::unique_ptr<Lifecycle> lifecycle_;
    std::unique_ptr<http::HttpServer> http_server_;
};

}  // namespace runtime
}  // namespace tether
