#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "child_slot.hpp"
#include "launch_resolver.hpp"
#include "port_registry.hpp"
#include "process_handle.hpp"
#include "sidecar_config.hpp"
#include "stream_drainer.hpp"

namespace tether {
namespace sidecar {

// SidecarSupervisor manages the lifecycle of the single sidecar process
// Responsibilities:
// - Spawn the process with stdout/stderr redirected to pipes
// - Drain both pipes concurrently (stdout feeds the PortRegistry)
// - Log unexpected termination
// - Idempotent, race-safe kill (take-once handle)
class SidecarSupervisor {
public:
    SidecarSupervisor(const SidecarConfig &config, std::shared_ptr<PortRegistry> registry, LineSink sink = nullptr);
    ~SidecarSupervisor();

    // Delete copy/move
    SidecarSupervisor(const SidecarSupervisor &) = delete;
    SidecarSupervisor &operator=(const SidecarSupervisor &) = delete;

    // Resolve the launch spec from config and spawn.
    // Returns false on failure (sets error); the caller treats this as fatal.
    bool spawn(std::string &error);

    // Spawn an already resolved command line.
    // With kill_on_parent_death the child is tied to the calling thread
    // (PR_SET_PDEATHSIG), so spawn from a thread that outlives the sidecar.
    bool spawn(const LaunchSpec &spec, std::string &error);

    // Supervise a process started elsewhere. No drainers are attached.
    bool adopt(std::shared_ptr<IProcessHandle> handle);

    // Kill the sidecar. A second call, or a call after another trigger
    // already took the handle, is a successful no-op.
    bool kill(std::string &error);

    // As kill(), but fails instead of waiting longer than lock_timeout for
    // the handle lock. Used on paths that must not stall (exit hook).
    bool kill_with_timeout(std::chrono::milliseconds lock_timeout, std::string &error);

    // Wait up to timeout for both drainers to reach end-of-stream, stop any
    // still running, and join them.
    void join_drainers(std::chrono::milliseconds timeout);

    bool is_running() const;

    // PID of the held process, -1 once killed or before spawn
    int pid() const;

    const std::shared_ptr<PortRegistry> &registry() const { return registry_; }
    const SidecarConfig &config() const { return config_; }

private:
    SidecarConfig config_;
    std::shared_ptr<PortRegistry> registry_;
    LineSink sink_;

    ChildSlot slot_;

    // Guards spawn against teardown; never taken by kill paths
    std::mutex threads_mutex_;
    bool spawned_ = false;
    std::unique_ptr<StreamDrainer> stdout_drainer_;
    std::unique_ptr<StreamDrainer> stderr_drainer_;
    std::thread exit_watcher_;

    bool kill_handle(std::shared_ptr<IProcessHandle> handle, std::string &error);
    static void watch_exit(std::shared_ptr<ProcessHandle> handle);
};

}  // namespace sidecar
}  // namespace tether
