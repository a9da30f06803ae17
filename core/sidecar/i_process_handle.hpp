#pragma once

#include <optional>
#include <string>

namespace tether {
namespace sidecar {

// How the sidecar process ended. Only ever used for logging.
struct ExitStatus {
    bool signaled = false;  // true: terminated by signal `code`
    int code = 0;           // exit code, or signal number when signaled

    static ExitStatus from_wait_status(int wait_status);
    std::string to_string() const;
};

// Interface for ProcessHandle to enable mocking
class IProcessHandle {
public:
    virtual ~IProcessHandle() = default;

    virtual int pid() const = 0;

    // True until the process has exited (does not reap)
    virtual bool is_running() const = 0;

    // Sends SIGKILL and waits up to wait_ms for the process to be reaped.
    // An already-exited process is not an error.
    virtual bool terminate(int wait_ms, std::string &error) = 0;

    // Set once the process has been reaped
    virtual std::optional<ExitStatus> exit_status() const = 0;
};

}  // namespace sidecar
}  // namespace tether
