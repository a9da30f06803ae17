#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "../logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {

void load_string_list(const YAML::Node &node, std::vector<std::string> &out) {
    out.clear();
    if (node.IsSequence()) {
        for (const auto &item : node) {
            out.push_back(item.as<std::string>());
        }
    } else if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    }
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate sidecar settings
    const auto &sidecar = config.sidecar;
    if (sidecar.mode == sidecar::LaunchMode::DEVELOPMENT) {
        if (sidecar.interpreter.empty()) {
            error = "sidecar.interpreter must not be empty in development mode";
            return false;
        }
        if (sidecar.script.empty()) {
            error = "sidecar.script must not be empty in development mode";
            return false;
        }
    } else {
        if (sidecar.binary_name.empty()) {
            error = "sidecar.binary_name must not be empty in bundled mode";
            return false;
        }
    }

    if (sidecar.kill_wait_ms < 0) {
        error = "sidecar.kill_wait_ms must be >= 0";
        return false;
    }
    if (sidecar.drain_join_timeout_ms < 0) {
        error = "sidecar.drain_join_timeout_ms must be >= 0";
        return false;
    }
    if (sidecar.exit_lock_timeout_ms < 1) {
        error = "sidecar.exit_lock_timeout_ms must be >= 1";
        return false;
    }

    // Validate readiness settings
    if (config.readiness.max_attempts < 1) {
        error = "readiness.max_attempts must be >= 1";
        return false;
    }
    if (config.readiness.initial_delay_ms < 1) {
        error = "readiness.initial_delay_ms must be >= 1";
        return false;
    }
    if (config.readiness.max_delay_ms < config.readiness.initial_delay_ms) {
        error = "readiness.max_delay_ms must be >= readiness.initial_delay_ms";
        return false;
    }

    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        warn_unknown_keys(yaml, "", {"sidecar", "discovery", "readiness", "http", "logging"});

        // Load sidecar config
        if (const auto node = yaml["sidecar"]) {
            warn_unknown_keys(node, "sidecar",
                              {"mode", "project_root", "interpreter", "interpreter_args", "script_dir", "script",
                               "bundle_dir", "binary_name", "target_triple", "args", "kill_wait_ms",
                               "drain_join_timeout_ms", "exit_lock_timeout_ms", "kill_on_parent_death"});

            auto &sidecar = config.sidecar;
            if (node["mode"]) {
                auto mode_str = node["mode"].as<std::string>();
                auto mode = sidecar::parse_launch_mode(mode_str);
                if (!mode) {
                    error = "Invalid sidecar mode '" + mode_str + "': must be development or bundled";
                    return false;
                }
                sidecar.mode = *mode;
            }
            if (node["project_root"]) {
                sidecar.project_root = node["project_root"].as<std::string>();
            }
            if (node["interpreter"]) {
                sidecar.interpreter = node["interpreter"].as<std::string>();
            }
            if (node["interpreter_args"]) {
                load_string_list(node["interpreter_args"], sidecar.interpreter_args);
            }
            if (node["script_dir"]) {
                sidecar.script_dir = node["script_dir"].as<std::string>();
            }
            if (node["script"]) {
                sidecar.script = node["script"].as<std::string>();
            }
            if (node["bundle_dir"]) {
                sidecar.bundle_dir = node["bundle_dir"].as<std::string>();
            }
            if (node["binary_name"]) {
                sidecar.binary_name = node["binary_name"].as<std::string>();
            }
            if (node["target_triple"]) {
                sidecar.target_triple = node["target_triple"].as<std::string>();
            }
            if (node["args"]) {
                load_string_list(node["args"], sidecar.args);
            }
            if (node["kill_wait_ms"]) {
                sidecar.kill_wait_ms = node["kill_wait_ms"].as<int>();
            }
            if (node["drain_join_timeout_ms"]) {
                sidecar.drain_join_timeout_ms = node["drain_join_timeout_ms"].as<int>();
            }
            if (node["exit_lock_timeout_ms"]) {
                sidecar.exit_lock_timeout_ms = node["exit_lock_timeout_ms"].as<int>();
            }
            if (node["kill_on_parent_death"]) {
                sidecar.kill_on_parent_death = node["kill_on_parent_death"].as<bool>();
            }
        }

        // Load discovery config
        if (const auto node = yaml["discovery"]) {
            if (node["duplicate_policy"]) {
                auto policy_str = node["duplicate_policy"].as<std::string>();
                auto policy = sidecar::parse_duplicate_policy(policy_str);
                if (!policy) {
                    error = "Invalid discovery.duplicate_policy '" + policy_str + "': must be last_wins or first_wins";
                    return false;
                }
                config.discovery.duplicate_policy = *policy;
            }
        }

        // Load readiness config
        if (const auto node = yaml["readiness"]) {
            if (node["max_attempts"]) {
                config.readiness.max_attempts = node["max_attempts"].as<int>();
            }
            if (node["initial_delay_ms"]) {
                config.readiness.initial_delay_ms = node["initial_delay_ms"].as<int>();
            }
            if (node["max_delay_ms"]) {
                config.readiness.max_delay_ms = node["max_delay_ms"].as<int>();
            }
        }

        // Load HTTP config
        if (const auto node = yaml["http"]) {
            if (node["enabled"]) {
                config.http.enabled = node["enabled"].as<bool>();
            }
            if (node["bind"]) {
                config.http.bind = node["bind"].as<std::string>();
            }
            if (node["port"]) {
                config.http.port = node["port"].as<int>();
            }
            if (node["thread_pool_size"]) {
                config.http.thread_pool_size = node["thread_pool_size"].as<int>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Sidecar mode: " << sidecar::launch_mode_to_string(config.sidecar.mode));
        LOG_INFO("[Config] Duplicate port policy: "
                 << sidecar::duplicate_policy_to_string(config.discovery.duplicate_policy));

        std::stringstream http_msg;
        http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
        if (config.http.enabled) {
            http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
        }
        LOG_INFO(http_msg.str());

        LOG_INFO("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace tether
