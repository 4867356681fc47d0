#include "atomicstore/change_notifier.hpp"

namespace atomicstore {

std::mutex& ChangeNotifier::mutex() noexcept {
    return mutex_;
}

void ChangeNotifier::notify_all() {
    {
        std::lock_guard lock(mutex_);
        ++generation_;
    }
    cv_.notify_all();
}

bool ChangeNotifier::wait(std::stop_token stop_token) {
    std::unique_lock lock(mutex_);
    const uint64_t seen = generation_;
    // The stop_token overload registers a stop callback for the duration of
    // the wait, which wakes us on cancellation. Spurious wakeups fall through
    // to the generation check.
    return cv_.wait(lock, stop_token, [this, seen]() {
        return generation_ != seen;
    });
}

} // namespace atomicstore
