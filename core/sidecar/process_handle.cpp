#include "process_handle.hpp"

#include <errno.h>
#include <signal.h>
#include <sys/wait.h>

#include <chrono>
#include <cstring>
#include <thread>

#include "logging/logger.hpp"

namespace tether {
namespace sidecar {

ExitStatus ExitStatus::from_wait_status(int wait_status) {
    ExitStatus status;
    if (WIFSIGNALED(wait_status)) {
        status.signaled = true;
        status.code = WTERMSIG(wait_status);
    } else if (WIFEXITED(wait_status)) {
        status.code = WEXITSTATUS(wait_status);
    }
    return status;
}

std::string ExitStatus::to_string() const {
    if (signaled) {
        const char *name = strsignal(code);
        return "killed by signal " + std::to_string(code) + (name != nullptr ? std::string(" (") + name + ")" : "");
    }
    return "exit code " + std::to_string(code);
}

ProcessHandle::ProcessHandle(pid_t pid) : pid_(pid) {}

ProcessHandle::~ProcessHandle() {
    // Collect a zombie if the process already ended; never kills.
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) {
        reap_locked(WNOHANG);
    }
}

bool ProcessHandle::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) {
        return false;
    }

    // WNOWAIT leaves the zombie in place for the watcher to reap
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
        return false;
    }
    return info.si_pid == 0;
}

bool ProcessHandle::terminate(int wait_ms, std::string &error) {
    kill_requested_.store(true);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reaped_) {
            LOG_INFO("[Sidecar] Process " << pid_ << " already exited, nothing to kill");
            return true;
        }

        if (::kill(pid_, SIGKILL) < 0) {
            if (errno != ESRCH) {
                error = "kill(" + std::to_string(pid_) + ") failed: " + std::string(strerror(errno));
                return false;
            }
            LOG_INFO("[Sidecar] Process " << pid_ << " is already gone");
        } else {
            LOG_INFO("[Sidecar] Sent SIGKILL to process " << pid_);
        }
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }

        auto elapsed = std::chrono::steady_clock::now() - start;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= wait_ms) {
            LOG_WARN("[Sidecar] Process " << pid_ << " not reaped within " << wait_ms << "ms after SIGKILL");
            return true;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::optional<ExitStatus> ProcessHandle::exit_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

std::optional<ExitStatus> ProcessHandle::wait_for_exit() {
    siginfo_t info;
    while (true) {
        std::memset(&info, 0, sizeof(info));
        if (waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == 0) {
            break;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: already reaped by terminate()
        break;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_) {
        reap_locked(WNOHANG);
    }
    return status_;
}

bool ProcessHandle::try_reap() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) {
        return true;
    }
    return reap_locked(WNOHANG);
}

bool ProcessHandle::reap_locked(int options) {
    if (pid_ <= 0) {
        reaped_ = true;
        return true;
    }

    while (true) {
        int status = 0;
        pid_t result = waitpid(pid_, &status, options);
        if (result == pid_) {
            reaped_ = true;
            status_ = ExitStatus::from_wait_status(status);
            return true;
        }
        if (result == 0) {
            return false;  // still running
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == ECHILD) {
            // Reaped outside this handle; no status to report
            reaped_ = true;
            return true;
        }
        return false;
    }
}

}  // namespace sidecar
}  // namespace tether
