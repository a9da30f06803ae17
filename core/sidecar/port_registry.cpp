#include "port_registry.hpp"

#include "logging/logger.hpp"

namespace tether {
namespace sidecar {

std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string &policy_str) {
    if (policy_str == "last_wins") {
        return DuplicatePolicy::LAST_WINS;
    }
    if (policy_str == "first_wins") {
        return DuplicatePolicy::FIRST_WINS;
    }
    return std::nullopt;
}

std::string duplicate_policy_to_string(DuplicatePolicy policy) {
    switch (policy) {
        case DuplicatePolicy::LAST_WINS:
            return "last_wins";
        case DuplicatePolicy::FIRST_WINS:
            return "first_wins";
        default:
            return "unknown";
    }
}

PortRegistry::PortRegistry(DuplicatePolicy policy) : policy_(policy) {}

bool PortRegistry::set(uint16_t port) {
    std::optional<uint16_t> previous;
    bool stored = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = port_;
        ++announcements_;
        if (!port_ || policy_ == DuplicatePolicy::LAST_WINS) {
            port_ = port;
            stored = true;
        }
    }

    if (previous && *previous != port) {
        LOG_WARN("[PortRegistry] Sidecar announced a second port (previous=" << *previous << ", new=" << port
                                                                             << "), keeping "
                                                                             << (stored ? port : *previous));
    }
    return stored;
}

std::optional<uint16_t> PortRegistry::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_;
}

size_t PortRegistry::announcement_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return announcements_;
}

}  // namespace sidecar
}  // namespace tether
