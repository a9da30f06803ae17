#pragma once

#include <optional>
#include <string>
#include <vector>

namespace tether {
namespace sidecar {

// Where the sidecar executable comes from
enum class LaunchMode {
    DEVELOPMENT,  // interpreter + project-relative script
    BUNDLED       // packaged binary next to tetherd
};

inline std::optional<LaunchMode> parse_launch_mode(const std::string &mode_str) {
    if (mode_str == "development") {
        return LaunchMode::DEVELOPMENT;
    }
    if (mode_str == "bundled") {
        return LaunchMode::BUNDLED;
    }
    return std::nullopt;
}

inline std::string launch_mode_to_string(LaunchMode mode) {
    switch (mode) {
        case LaunchMode::DEVELOPMENT:
            return "development";
        case LaunchMode::BUNDLED:
            return "bundled";
        default:
            return "unknown";
    }
}

struct SidecarConfig {
    LaunchMode mode = LaunchMode::DEVELOPMENT;

    // Development mode
    std::string project_root;                           // "" = current directory
    std::string interpreter = "sidecar/.venv/bin/python3";  // relative to project_root, or a bare name on PATH
    std::vector<std::string> interpreter_args{"-u"};    // -u: unbuffered stdout so PORT: arrives promptly
    std::string script_dir = "sidecar";                 // working directory, relative to project_root
    std::string script = "main.py";                     // entry script inside script_dir

    // Bundled mode
    std::string bundle_dir;                             // "" = directory of the running executable
    std::string binary_name = "sidecar";
    std::string target_triple = "x86_64-unknown-linux-gnu";  // suffix tried when binary_name is absent

    std::vector<std::string> args;                      // Extra arguments for the sidecar

    int kill_wait_ms = 2000;           // How long kill waits for the process to be reaped
    int drain_join_timeout_ms = 1000;  // How long teardown waits for the drainers to hit EOF
    int exit_lock_timeout_ms = 500;    // Exit hook gives up on the handle lock after this
    bool kill_on_parent_death = true;  // PR_SET_PDEATHSIG: sidecar gets SIGKILL if tetherd dies
};

}  // namespace sidecar
}  // namespace tether
