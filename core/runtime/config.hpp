#pragma once

#include <string>
#include <vector>

#include "../sidecar/port_registry.hpp"
#include "../sidecar/sidecar_config.hpp"

namespace tether {
namespace runtime {

struct DiscoveryConfig {
    sidecar::DuplicatePolicy duplicate_policy = sidecar::DuplicatePolicy::LAST_WINS;
};

// Backoff used while waiting for the sidecar to announce its port
struct ReadinessConfig {
    int max_attempts = 20;
    int initial_delay_ms = 300;
    int max_delay_ms = 5000;  // delay doubles per attempt up to this cap
};

struct HttpConfig {
    bool enabled = true;            // Control surface enabled
    std::string bind = "127.0.0.1";  // Bind address (keep local)
    int port = 8765;                 // Control port
    int thread_pool_size = 4;        // Worker thread pool size
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    sidecar::SidecarConfig sidecar;
    DiscoveryConfig discovery;
    ReadinessConfig readiness;
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace tether
