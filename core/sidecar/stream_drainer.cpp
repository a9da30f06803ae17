#include "stream_drainer.hpp"

#include <errno.h>
#include <poll.h>
#include <unistd.h>

#include <cstring>
#include <exception>

#include "discovery_protocol.hpp"
#include "logging/logger.hpp"

namespace tether {
namespace sidecar {

namespace {
// Upper bound on how long request_stop() takes to be observed
constexpr int kPollIntervalMs = 100;
constexpr size_t kReadChunkSize = 4096;
}  // namespace

const char *channel_name(Channel channel) {
    switch (channel) {
        case Channel::STDOUT:
            return "stdout";
        case Channel::STDERR:
            return "stderr";
        default:
            return "unknown";
    }
}

void log_sidecar_line(Channel channel, const std::string &line) {
    LOG_INFO("[sidecar " << channel_name(channel) << "] " << line);
}

StreamDrainer::StreamDrainer(Channel channel, int fd, LineSink sink, std::shared_ptr<PortRegistry> registry)
    : channel_(channel), fd_(fd), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = log_sidecar_line;
    }
    if (registry && channel_ == Channel::STDOUT) {
        registry_ = std::move(registry);
    } else if (registry) {
        LOG_WARN("[Drainer] Discovery is only applied to stdout, ignoring registry for " << channel_name(channel_));
    }
}

StreamDrainer::~StreamDrainer() {
    request_stop();
    join();
    if (fd_ >= 0) {
        close(fd_);
        fd_ = -1;
    }
}

void StreamDrainer::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void StreamDrainer::request_stop() { stop_requested_.store(true); }

bool StreamDrainer::wait_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(done_mutex_);
    return done_cv_.wait_for(lock, timeout, [this]() { return done_; });
}

void StreamDrainer::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StreamDrainer::finished() const {
    std::lock_guard<std::mutex> lock(done_mutex_);
    return done_;
}

void StreamDrainer::run() {
    LOG_DEBUG("[Drainer] " << channel_name(channel_) << " drain started");

    std::string pending;
    bool continuation = false;  // pending starts in the middle of an over-long line
    char buf[kReadChunkSize];

    while (!stop_requested_.load()) {
        struct pollfd pfd;
        pfd.fd = fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;

        int result = poll(&pfd, 1, kPollIntervalMs);
        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[Drainer] poll failed on " << channel_name(channel_) << ": " << strerror(errno));
            break;
        }
        if (result == 0) {
            continue;
        }
        if ((pfd.revents & POLLNVAL) != 0) {
            LOG_ERROR("[Drainer] Invalid " << channel_name(channel_) << " pipe");
            break;
        }

        // POLLIN or POLLHUP: read() drains remaining data and returns 0 at EOF
        ssize_t r = read(fd_, buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            LOG_ERROR("[Drainer] Read failed on " << channel_name(channel_) << ": " << strerror(errno));
            break;
        }
        if (r == 0) {
            break;  // EOF
        }

        pending.append(buf, static_cast<size_t>(r));

        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, newline - start);
            bool may_discover = !continuation;
            while (line.size() > kMaxLineLength) {
                emit_line(line.substr(0, kMaxLineLength), false);
                line.erase(0, kMaxLineLength);
                may_discover = false;
            }
            emit_line(std::move(line), may_discover);
            continuation = false;
            start = newline + 1;
        }
        pending.erase(0, start);

        while (pending.size() >= kMaxLineLength) {
            emit_line(pending.substr(0, kMaxLineLength), false);
            pending.erase(0, kMaxLineLength);
            continuation = true;
        }
    }

    if (!pending.empty()) {
        emit_line(pending, !continuation);
    }

    LOG_DEBUG("[Drainer] " << channel_name(channel_) << " drain finished (" << lines_.load() << " lines)");
    mark_done();
}

void StreamDrainer::emit_line(std::string line, bool may_discover) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    try {
        sink_(channel_, line);
    } catch (const std::exception &e) {
        LOG_ERROR("[Drainer] Line sink threw: " << e.what());
    }
    ++lines_;

    if (!registry_ || !may_discover) {
        return;
    }

    auto port = parse_discovery_line(line);
    if (port && registry_->set(*port)) {
        LOG_INFO("[Sidecar] Sidecar started on port " << *port);
    }
}

void StreamDrainer::mark_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

}  // namespace sidecar
}  // namespace tether
