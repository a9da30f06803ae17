#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tether {
namespace sidecar {

// What to do when the sidecar announces a port more than once
enum class DuplicatePolicy { LAST_WINS, FIRST_WINS };

std::optional<DuplicatePolicy> parse_duplicate_policy(const std::string &policy_str);
std::string duplicate_policy_to_string(DuplicatePolicy policy);

/**
 * @brief Holds the port discovered from the sidecar's stdout
 *
 * Written by the stdout drainer thread, read by any number of callers
 * (command handlers, HTTP threads, the runtime main loop). The mutex is held
 * only for the copy in or out.
 *
 * Once a value is set it is never cleared; a restart of the sidecar is not
 * part of this object's lifecycle.
 */
class PortRegistry {
public:
    explicit PortRegistry(DuplicatePolicy policy = DuplicatePolicy::LAST_WINS);

    // Non-copyable, non-movable (manages mutex)
    PortRegistry(const PortRegistry &) = delete;
    PortRegistry &operator=(const PortRegistry &) = delete;

    /**
     * @brief Record an announced port
     *
     * The first announcement is always stored. Later announcements overwrite
     * the value under LAST_WINS and are dropped under FIRST_WINS; either way a
     * changed value is logged as a warning.
     *
     * @return true if the stored value was set by this call
     */
    bool set(uint16_t port);

    /**
     * @brief Current port, or std::nullopt while the sidecar is not ready
     *
     * Never blocks waiting for a value. Callers that need the port poll.
     */
    std::optional<uint16_t> get() const;

    bool is_ready() const { return get().has_value(); }

    // Number of discovery lines seen, including dropped duplicates
    size_t announcement_count() const;

    DuplicatePolicy policy() const { return policy_; }

private:
    const DuplicatePolicy policy_;

    mutable std::mutex mutex_;
    std::optional<uint16_t> port_;
    size_t announcements_ = 0;
};

}  // namespace sidecar
}  // namespace tether
