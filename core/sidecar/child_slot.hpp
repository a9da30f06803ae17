#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "i_process_handle.hpp"

namespace tether {
namespace sidecar {

/**
 * @brief Lock-guarded storage for the single live sidecar handle
 *
 * Kill paths (exit hook, update hook, explicit command) race for the handle.
 * take() swaps the slot with empty under the lock, so exactly one caller
 * receives the handle and performs the kill; the others see nullptr and do
 * nothing. The lock is never held while signalling or waiting on the process.
 */
class ChildSlot {
public:
    ChildSlot() = default;

    // Non-copyable, non-movable (manages mutex)
    ChildSlot(const ChildSlot &) = delete;
    ChildSlot &operator=(const ChildSlot &) = delete;

    // Store a handle. Returns false (and leaves the slot unchanged) if a
    // handle is already held.
    bool put(std::shared_ptr<IProcessHandle> handle);

    // Remove and return the held handle; nullptr if empty
    std::shared_ptr<IProcessHandle> take();

    // As take(), but gives up if the lock cannot be acquired within timeout.
    // Sets timed_out accordingly; returns nullptr in that case.
    std::shared_ptr<IProcessHandle> try_take_for(std::chrono::milliseconds timeout, bool &timed_out);

    // Copy of the held handle without removing it (status queries)
    std::shared_ptr<IProcessHandle> peek() const;

    bool empty() const;

private:
    mutable std::timed_mutex mutex_;
    std::shared_ptr<IProcessHandle> handle_;
};

}  // namespace sidecar
}  // namespace tether
