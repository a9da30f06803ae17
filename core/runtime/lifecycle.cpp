#include "lifecycle.hpp"

#include <algorithm>
#include <system_error>
#include <thread>

#include "logging/logger.hpp"

namespace tether {
namespace runtime {

namespace {
// Granularity of the abort check while sleeping between readiness polls
constexpr int kAbortCheckMs = 50;
}  // namespace

Lifecycle::Lifecycle(std::shared_ptr<sidecar::PortRegistry> registry,
                     std::unique_ptr<sidecar::SidecarSupervisor> supervisor)
    : registry_(std::move(registry)), supervisor_(std::move(supervisor)) {}

Lifecycle::Lifecycle(const RuntimeConfig &config)
    : registry_(std::make_shared<sidecar::PortRegistry>(config.discovery.duplicate_policy)),
      supervisor_(std::make_unique<sidecar::SidecarSupervisor>(config.sidecar, registry_)) {}

bool Lifecycle::start(std::string &error) {
    if (!supervisor_->spawn(error)) {
        error = "Failed to spawn sidecar: " + error;
        return false;
    }
    return true;
}

bool Lifecycle::get_discovered_port(uint16_t &port, std::string &error) const {
    std::optional<uint16_t> current;
    try {
        current = registry_->get();
    } catch (const std::system_error &e) {
        error = e.what();
        LOG_ERROR("[Lifecycle] Port registry lock failed: " << error);
        return false;
    }

    if (!current) {
        error = kSidecarNotReady;
        return false;
    }

    port = *current;
    return true;
}

bool Lifecycle::force_kill_sidecar(std::string &error) {
    if (!supervisor_->kill(error)) {
        return false;
    }
    LOG_INFO("[Lifecycle] Sidecar killed for update");
    return true;
}

void Lifecycle::on_exit() {
    if (exit_handled_.exchange(true)) {
        return;
    }

    LOG_INFO("[Lifecycle] Application exiting, stopping sidecar");
    std::string error;
    auto timeout = std::chrono::milliseconds(supervisor_->config().exit_lock_timeout_ms);
    if (!supervisor_->kill_with_timeout(timeout, error)) {
        LOG_ERROR("[Lifecycle] Exit hook could not kill sidecar: " << error);
        return;
    }
}

void Lifecycle::on_before_update() {
    LOG_INFO("[Lifecycle] Update pending, stopping sidecar");
    std::string error;
    if (!force_kill_sidecar(error)) {
        LOG_ERROR("[Lifecycle] Update hook could not kill sidecar: " << error);
    }
}

void Lifecycle::on_second_instance() {
    LOG_DEBUG("[Lifecycle] Second instance launched; sidecar unaffected");
}

std::optional<uint16_t> Lifecycle::wait_for_port(const ReadinessConfig &policy,
                                                 const std::function<bool()> &should_abort) const {
    int delay_ms = policy.initial_delay_ms;

    for (int attempt = 0; attempt < policy.max_attempts; ++attempt) {
        if (should_abort && should_abort()) {
            return std::nullopt;
        }

        uint16_t port = 0;
        std::string error;
        if (get_discovered_port(port, error)) {
            return port;
        }
        LOG_DEBUG("[Lifecycle] Port query attempt " << (attempt + 1) << "/" << policy.max_attempts << ": " << error);

        if (attempt + 1 == policy.max_attempts) {
            break;
        }

        // Sleep in slices so an abort is noticed promptly
        auto wake = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
        while (std::chrono::steady_clock::now() < wake) {
            if (should_abort && should_abort()) {
                return std::nullopt;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(wake - std::chrono::steady_clock::now());
            std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(kAbortCheckMs)));
        }

        delay_ms = std::min(delay_ms * 2, policy.max_delay_ms);
    }

    return std::nullopt;
}

}  // namespace runtime
}  // namespace tether
