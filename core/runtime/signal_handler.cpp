#include "signal_handler.hpp"

#include <csignal>

namespace tether {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<bool> SignalHandler::update_requested_{false};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGUSR1, handle_signal);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

bool SignalHandler::consume_update_request() { return update_requested_.exchange(false); }

void SignalHandler::reset() {
    shutdown_requested_.store(false);
    update_requested_.store(false);
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations allowed
    if (signal == SIGUSR1) {
        update_requested_.store(true);
    } else {
        shutdown_requested_.store(true);
    }
}

}  // namespace runtime
}  // namespace tether
