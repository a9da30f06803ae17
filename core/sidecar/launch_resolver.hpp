#pragma once

#include <optional>
#include <string>
#include <vector>

#include "sidecar_config.hpp"

namespace tether {
namespace sidecar {

// Fully resolved command line for the sidecar
struct LaunchSpec {
    std::string executable;         // absolute path
    std::vector<std::string> args;  // not including argv[0]
    std::string working_directory;  // absolute path
};

// Resolve the executable, arguments and working directory for the configured
// deployment mode. Fails if any required file or directory is missing.
bool resolve_launch(const SidecarConfig &config, LaunchSpec &spec, std::string &error);

// Directory containing the running executable (/proc/self/exe)
std::string current_executable_dir();

// Look up a bare command name on $PATH
std::optional<std::string> find_in_path(const std::string &name);

bool is_executable_file(const std::string &path);

}  // namespace sidecar
}  // namespace tether
