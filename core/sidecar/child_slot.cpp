#include "child_slot.hpp"

namespace tether {
namespace sidecar {

bool ChildSlot::put(std::shared_ptr<IProcessHandle> handle) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    if (handle_) {
        return false;
    }
    handle_ = std::move(handle);
    return true;
}

std::shared_ptr<IProcessHandle> ChildSlot::take() {
    std::shared_ptr<IProcessHandle> taken;
    std::lock_guard<std::timed_mutex> lock(mutex_);
    taken.swap(handle_);
    return taken;
}

std::shared_ptr<IProcessHandle> ChildSlot::try_take_for(std::chrono::milliseconds timeout, bool &timed_out) {
    std::unique_lock<std::timed_mutex> lock(mutex_, std::defer_lock);
    if (!lock.try_lock_for(timeout)) {
        timed_out = true;
        return nullptr;
    }

    timed_out = false;
    std::shared_ptr<IProcessHandle> taken;
    taken.swap(handle_);
    return taken;
}

std::shared_ptr<IProcessHandle> ChildSlot::peek() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return handle_;
}

bool ChildSlot::empty() const {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    return handle_ == nullptr;
}

}  // namespace sidecar
}  // namespace tether
