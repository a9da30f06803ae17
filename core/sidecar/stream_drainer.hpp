#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "port_registry.hpp"

namespace tether {
namespace sidecar {

// Longest line forwarded in one piece; longer lines are split into chunks
// and never treated as discovery lines.
constexpr size_t kMaxLineLength = 64u * 1024u;

enum class Channel { STDOUT, STDERR };

const char *channel_name(Channel channel);

// Receives every line read from a sidecar output channel
using LineSink = std::function<void(Channel, const std::string &)>;

// Default sink: "[sidecar stdout] <line>" at INFO
void log_sidecar_line(Channel channel, const std::string &line);

// StreamDrainer consumes one output pipe of the sidecar on its own thread
// Responsibilities:
// - Keep the pipe empty so the sidecar never blocks on a full buffer
// - Forward each line to the sink
// - On stdout only: apply the discovery protocol to the PortRegistry
//
// The loop ends at end-of-stream (the sidecar closed the pipe, normally by
// exiting), on a read error, or after request_stop().
class StreamDrainer {
public:
    // Takes ownership of fd. `registry` is only consulted for Channel::STDOUT.
    StreamDrainer(Channel channel, int fd, LineSink sink, std::shared_ptr<PortRegistry> registry = nullptr);
    ~StreamDrainer();

    // Delete copy/move (owns fd and thread)
    StreamDrainer(const StreamDrainer &) = delete;
    StreamDrainer &operator=(const StreamDrainer &) = delete;

    // Start the drain thread
    void start();

    // Ask the loop to exit at its next poll wakeup
    void request_stop();

    // Wait until the loop has ended; false on timeout
    bool wait_finished(std::chrono::milliseconds timeout);

    // Join the drain thread (call after the loop has ended or stop was requested)
    void join();

    bool finished() const;
    size_t line_count() const { return lines_.load(); }
    Channel channel() const { return channel_; }

private:
    Channel channel_;
    int fd_;
    LineSink sink_;
    std::shared_ptr<PortRegistry> registry_;  // nullptr for non-discovery channels

    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<size_t> lines_{0};

    mutable std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool done_ = false;

    void run();
    void emit_line(std::string line, bool may_discover);
    void mark_done();
};

}  // namespace sidecar
}  // namespace tether
