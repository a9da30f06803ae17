#include "sidecar_supervisor.hpp"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <system_error>
#include <vector>

#include "logging/logger.hpp"

namespace tether {
namespace sidecar {

namespace {

// Reported by the child over the status pipe when it fails before exec
enum ChildStage : int { kStageChdir = 1, kStageRedirect = 2, kStageExec = 3 };

[[noreturn]] void report_child_failure(int status_fd, int stage, int err) {
    int msg[2] = {stage, err};
    ssize_t written = write(status_fd, msg, sizeof(msg));
    (void)written;
    _exit(127);
}

void close_pipe(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) {
            close(fds[i]);
            fds[i] = -1;
        }
    }
}

std::string describe_child_failure(const LaunchSpec &spec, int stage, int err) {
    switch (stage) {
        case kStageChdir:
            return "Failed to change directory to " + spec.working_directory + ": " + strerror(err);
        case kStageRedirect:
            return "Failed to redirect sidecar output: " + std::string(strerror(err));
        case kStageExec:
            if (err == ENOENT) {
                return "Executable not found: " + spec.executable;
            }
            return "Failed to exec " + spec.executable + ": " + strerror(err);
        default:
            return "Sidecar failed before exec";
    }
}

}  // namespace

SidecarSupervisor::SidecarSupervisor(const SidecarConfig &config, std::shared_ptr<PortRegistry> registry,
                                     LineSink sink)
    : config_(config), registry_(std::move(registry)), sink_(std::move(sink)) {
    if (!registry_) {
        registry_ = std::make_shared<PortRegistry>();
    }
}

SidecarSupervisor::~SidecarSupervisor() {
    std::string error;
    bool killed = kill(error);
    if (!killed) {
        LOG_ERROR("[Sidecar] Kill during teardown failed: " << error);
    }

    join_drainers(std::chrono::milliseconds(config_.drain_join_timeout_ms));

    std::lock_guard<std::mutex> lock(threads_mutex_);
    if (exit_watcher_.joinable()) {
        if (killed) {
            exit_watcher_.join();
        } else {
            // Process may still be alive; the watcher only holds its own handle
            exit_watcher_.detach();
        }
    }
}

bool SidecarSupervisor::spawn(std::string &error) {
    LaunchSpec spec;
    if (!resolve_launch(config_, spec, error)) {
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }
    return spawn(spec, error);
}

bool SidecarSupervisor::spawn(const LaunchSpec &spec, std::string &error) {
    std::lock_guard<std::mutex> lock(threads_mutex_);

    if (spawned_) {
        error = "Sidecar already spawned";
        return false;
    }

    LOG_INFO("[Sidecar] Spawning: " << spec.executable);
    LOG_INFO("[Sidecar] Working directory: " << spec.working_directory);

    // Everything the child needs is prepared before fork; after fork the
    // child only makes async-signal-safe calls.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(spec.executable);
    argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());

    std::vector<char *> argv;
    for (auto &arg : argv_storage) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const char *cwd = spec.working_directory.empty() ? nullptr : spec.working_directory.c_str();
    const bool pdeathsig = config_.kill_on_parent_death;
    const pid_t parent_pid = getpid();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(stdout_pipe, O_CLOEXEC) < 0) {
        error = "Failed to create stdout pipe: " + std::string(strerror(errno));
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
        error = "Failed to create stderr pipe: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        error = "Failed to create status pipe: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0) {
        error = "Fork failed: " + std::string(strerror(errno));
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        close_pipe(status_pipe);
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }

    if (pid == 0) {
        // Child process

        // Signal mask and ignored dispositions survive exec; reset both
        sigset_t empty_set;
        sigemptyset(&empty_set);
        sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        struct sigaction sa_dfl;
        std::memset(&sa_dfl, 0, sizeof(sa_dfl));
        sa_dfl.sa_handler = SIG_DFL;
        for (int sig = 1; sig < NSIG; ++sig) {
            sigaction(sig, &sa_dfl, nullptr);  // fails harmlessly for SIGKILL/SIGSTOP
        }

        if (pdeathsig) {
            prctl(PR_SET_PDEATHSIG, SIGKILL);
            if (getppid() != parent_pid) {
                _exit(127);  // parent already gone
            }
        }

        if (cwd != nullptr && chdir(cwd) != 0) {
            report_child_failure(status_pipe[1], kStageChdir, errno);
        }

        // stdin stays connected to the parent's stdin
        if (dup2(stdout_pipe[1], STDOUT_FILENO) < 0 || dup2(stderr_pipe[1], STDERR_FILENO) < 0) {
            report_child_failure(status_pipe[1], kStageRedirect, errno);
        }

        // Environment is inherited
        execv(argv[0], argv.data());

        // If we get here, exec failed
        report_child_failure(status_pipe[1], kStageExec, errno);
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(status_pipe[1]);
    stdout_pipe[1] = stderr_pipe[1] = status_pipe[1] = -1;

    // EOF on the status pipe means exec succeeded (close-on-exec)
    int msg[2] = {0, 0};
    ssize_t n;
    do {
        n = read(status_pipe[0], msg, sizeof(msg));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(msg))) {
        error = describe_child_failure(spec, msg[0], msg[1]);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
        }
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }

    auto handle = std::make_shared<ProcessHandle>(pid);

    stdout_drainer_ = std::make_unique<StreamDrainer>(Channel::STDOUT, stdout_pipe[0], sink_, registry_);
    stderr_drainer_ = std::make_unique<StreamDrainer>(Channel::STDERR, stderr_pipe[0], sink_);
    stdout_drainer_->start();
    stderr_drainer_->start();

    exit_watcher_ = std::thread(&SidecarSupervisor::watch_exit, handle);

    // spawned_ was false under threads_mutex_, so the slot is empty
    if (!slot_.put(handle)) {
        LOG_WARN("[Sidecar] Handle slot already occupied");
    }
    spawned_ = true;

    LOG_INFO("[Sidecar] Process spawned successfully (PID=" << pid << ")");
    return true;
}

bool SidecarSupervisor::adopt(std::shared_ptr<IProcessHandle> handle) {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    if (spawned_ || !handle) {
        return false;
    }
    if (!slot_.put(std::move(handle))) {
        return false;
    }
    spawned_ = true;
    return true;
}

bool SidecarSupervisor::kill(std::string &error) {
    try {
        return kill_handle(slot_.take(), error);
    } catch (const std::system_error &e) {
        error = "Failed to lock sidecar handle: " + std::string(e.what());
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }
}

bool SidecarSupervisor::kill_with_timeout(std::chrono::milliseconds lock_timeout, std::string &error) {
    try {
        bool timed_out = false;
        auto handle = slot_.try_take_for(lock_timeout, timed_out);
        if (timed_out) {
            error = "Timed out after " + std::to_string(lock_timeout.count()) + "ms waiting for sidecar handle";
            LOG_WARN("[Sidecar] " << error);
            return false;
        }
        return kill_handle(std::move(handle), error);
    } catch (const std::system_error &e) {
        error = "Failed to lock sidecar handle: " + std::string(e.what());
        LOG_ERROR("[Sidecar] " << error);
        return false;
    }
}

bool SidecarSupervisor::kill_handle(std::shared_ptr<IProcessHandle> handle, std::string &error) {
    if (!handle) {
        LOG_DEBUG("[Sidecar] Kill requested but no sidecar is held");
        return true;
    }

    LOG_INFO("[Sidecar] Killing process " << handle->pid());
    if (!handle->terminate(config_.kill_wait_ms, error)) {
        LOG_ERROR("[Sidecar] Kill failed: " << error);
        // Give the handle back so another trigger can retry
        if (!slot_.put(std::move(handle))) {
            LOG_ERROR("[Sidecar] Could not return handle to slot; retry is not possible");
        }
        return false;
    }

    LOG_INFO("[Sidecar] Sidecar process killed");
    return true;
}

void SidecarSupervisor::join_drainers(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(threads_mutex_);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (StreamDrainer *drainer : {stdout_drainer_.get(), stderr_drainer_.get()}) {
        if (drainer == nullptr) {
            continue;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                               std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        if (!drainer->wait_finished(remaining)) {
            // A grandchild may still hold the pipe open
            LOG_WARN("[Sidecar] " << channel_name(drainer->channel()) << " still open after " << timeout.count()
                                  << "ms, stopping drain");
            drainer->request_stop();
        }
        drainer->join();
    }
}

bool SidecarSupervisor::is_running() const {
    auto handle = slot_.peek();
    return handle && handle->is_running();
}

int SidecarSupervisor::pid() const {
    auto handle = slot_.peek();
    return handle ? handle->pid() : -1;
}

void SidecarSupervisor::watch_exit(std::shared_ptr<ProcessHandle> handle) {
    auto status = handle->wait_for_exit();
    std::string description = status ? status->to_string() : "status unavailable";

    if (handle->kill_requested()) {
        LOG_INFO("[Sidecar] Process " << handle->pid() << " terminated (" << description << ")");
    } else {
        LOG_WARN("[Sidecar] Process " << handle->pid() << " exited unexpectedly (" << description << ")");
    }
}

}  // namespace sidecar
}  // namespace tether
