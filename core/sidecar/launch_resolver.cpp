#include "launch_resolver.hpp"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "logging/logger.hpp"

namespace fs = std::filesystem;

namespace tether {
namespace sidecar {

namespace {

bool resolve_development(const SidecarConfig &config, LaunchSpec &spec, std::string &error) {
    std::error_code ec;
    fs::path root = config.project_root.empty() ? fs::current_path(ec) : fs::path(config.project_root);
    if (ec) {
        error = "Cannot determine project root: " + ec.message();
        return false;
    }
    root = fs::absolute(root, ec);

    fs::path working_dir = root / config.script_dir;
    if (!fs::is_directory(working_dir, ec)) {
        error = "Sidecar directory not found: " + working_dir.string();
        return false;
    }

    if (!fs::exists(working_dir / config.script, ec)) {
        error = "Sidecar script not found: " + (working_dir / config.script).string();
        return false;
    }

    std::string interpreter;
    if (config.interpreter.find('/') == std::string::npos) {
        auto found = find_in_path(config.interpreter);
        if (!found) {
            error = "Interpreter not found on PATH: " + config.interpreter;
            return false;
        }
        interpreter = *found;
    } else {
        fs::path candidate(config.interpreter);
        if (candidate.is_relative()) {
            candidate = root / candidate;
        }
        if (!is_executable_file(candidate.string())) {
            error = "Executable not found: " + candidate.string();
            return false;
        }
        interpreter = candidate.lexically_normal().string();
    }

    spec.executable = interpreter;
    spec.args = config.interpreter_args;
    spec.args.push_back(config.script);
    spec.working_directory = working_dir.lexically_normal().string();
    return true;
}

bool resolve_bundled(const SidecarConfig &config, LaunchSpec &spec, std::string &error) {
    std::error_code ec;
    fs::path dir = config.bundle_dir.empty() ? fs::path(current_executable_dir()) : fs::path(config.bundle_dir);
    if (dir.empty()) {
        error = "Cannot determine bundle directory";
        return false;
    }
    dir = fs::absolute(dir, ec);

    fs::path binary = dir / config.binary_name;
    if (!is_executable_file(binary.string())) {
        fs::path suffixed = dir / (config.binary_name + "-" + config.target_triple);
        if (!is_executable_file(suffixed.string())) {
            error = "Executable not found: " + binary.string() + " (also tried " + suffixed.filename().string() + ")";
            return false;
        }
        binary = suffixed;
    }

    spec.executable = binary.lexically_normal().string();
    spec.args.clear();
    spec.working_directory = dir.lexically_normal().string();
    return true;
}

}  // namespace

bool resolve_launch(const SidecarConfig &config, LaunchSpec &spec, std::string &error) {
    LaunchSpec resolved;

    bool ok = false;
    switch (config.mode) {
        case LaunchMode::DEVELOPMENT:
            ok = resolve_development(config, resolved, error);
            break;
        case LaunchMode::BUNDLED:
            ok = resolve_bundled(config, resolved, error);
            break;
    }
    if (!ok) {
        return false;
    }

    resolved.args.insert(resolved.args.end(), config.args.begin(), config.args.end());
    spec = std::move(resolved);

    LOG_DEBUG("[Launch] Mode: " << launch_mode_to_string(config.mode));
    LOG_DEBUG("[Launch] Executable: " << spec.executable);
    LOG_DEBUG("[Launch] Working directory: " << spec.working_directory);
    return true;
}

std::string current_executable_dir() {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return "";
    }
    return self.parent_path().string();
}

std::optional<std::string> find_in_path(const std::string &name) {
    const char *path_env = std::getenv("PATH");
    if (path_env == nullptr || name.empty()) {
        return std::nullopt;
    }

    std::stringstream dirs(path_env);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        fs::path candidate = fs::path(dir) / name;
        if (is_executable_file(candidate.string())) {
            std::error_code ec;
            return fs::absolute(candidate, ec).lexically_normal().string();
        }
    }
    return std::nullopt;
}

bool is_executable_file(const std::string &path) {
    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

}  // namespace sidecar
}  // namespace tether
