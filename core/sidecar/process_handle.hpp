#pragma once

#include <sys/types.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

#include "i_process_handle.hpp"

namespace tether {
namespace sidecar {

// ProcessHandle owns the pid of a spawned child until it is reaped.
//
// kill(2) and waitpid(2) are serialized by an internal mutex so a signal is
// never delivered to a pid that has already been reaped (and possibly
// reused). The mutex only covers those two non-blocking syscalls.
class ProcessHandle : public IProcessHandle {
public:
    explicit ProcessHandle(pid_t pid);
    ~ProcessHandle() override;

    // Delete copy/move
    ProcessHandle(const ProcessHandle &) = delete;
    ProcessHandle &operator=(const ProcessHandle &) = delete;

    int pid() const override { return pid_; }
    bool is_running() const override;
    bool terminate(int wait_ms, std::string &error) override;
    std::optional<ExitStatus> exit_status() const override;

    // Blocks until the process exits, then reaps it. Intended for a dedicated
    // watcher thread; returns std::nullopt if someone else reaped it first
    // without a status (ECHILD).
    std::optional<ExitStatus> wait_for_exit();

    // Reap without blocking. Returns true once the process is reaped.
    bool try_reap();

    // True once terminate() has been called
    bool kill_requested() const { return kill_requested_.load(); }

private:
    const pid_t pid_;

    mutable std::mutex mutex_;
    bool reaped_ = false;
    std::optional<ExitStatus> status_;

    std::atomic<bool> kill_requested_{false};

    bool reap_locked(int options);
};

}  // namespace sidecar
}  // namespace tether
