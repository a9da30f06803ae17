#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "config.hpp"
#include "sidecar/port_registry.hpp"
#include "sidecar/sidecar_supervisor.hpp"

namespace tether {
namespace runtime {

// Error returned by get_discovered_port before the sidecar has announced itself
constexpr const char *kSidecarNotReady = "Sidecar not ready";

/**
 * @brief Entry points the surrounding application uses to reach the sidecar
 *
 * Owns the supervisor and shares the port registry with it. Passed by
 * reference to the HTTP control surface and the runtime loop; there is no
 * global instance.
 *
 * Commands (synchronous, bool + error string):
 * - get_discovered_port: never blocks or retries
 * - force_kill_sidecar: tolerates the sidecar already being gone
 *
 * Event hooks:
 * - on_exit: application shutdown; bounded wait on the handle lock
 * - on_before_update: binaries are about to be replaced
 * - on_second_instance: no sidecar interaction
 */
class Lifecycle {
public:
    Lifecycle(std::shared_ptr<sidecar::PortRegistry> registry, std::unique_ptr<sidecar::SidecarSupervisor> supervisor);

    // Build registry and supervisor from config
    explicit Lifecycle(const RuntimeConfig &config);

    // Delete copy/move
    Lifecycle(const Lifecycle &) = delete;
    Lifecycle &operator=(const Lifecycle &) = delete;

    // Spawn the sidecar. Failure is fatal for the application.
    bool start(std::string &error);

    // Commands
    bool get_discovered_port(uint16_t &port, std::string &error) const;
    bool force_kill_sidecar(std::string &error);

    // Event hooks
    void on_exit();
    void on_before_update();
    void on_second_instance();

    // Poll get_discovered_port with exponential backoff until it succeeds,
    // attempts run out, or should_abort returns true.
    std::optional<uint16_t> wait_for_port(const ReadinessConfig &policy,
                                          const std::function<bool()> &should_abort = nullptr) const;

    sidecar::SidecarSupervisor &supervisor() { return *supervisor_; }
    const sidecar::SidecarSupervisor &supervisor() const { return *supervisor_; }
    const sidecar::PortRegistry &port_registry() const { return *registry_; }

    bool exit_handled() const { return exit_handled_.load(); }

private:
    std::shared_ptr<sidecar::PortRegistry> registry_;
    std::unique_ptr<sidecar::SidecarSupervisor> supervisor_;
    std::atomic<bool> exit_handled_{false};
};

}  // namespace runtime
}  // namespace tether
