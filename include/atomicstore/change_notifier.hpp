#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stop_token>

namespace atomicstore {

/*
 * Store-wide mutex plus a broadcast condition.
 *
 * Waiters block until the next broadcast or until their stop_token fires.
 * Broadcasts are not buffered: a wait that starts after notify_all()
 * does not see it.
 */
class ChangeNotifier {
public:
    ChangeNotifier() = default;

    ChangeNotifier(const ChangeNotifier&) = delete;
    ChangeNotifier& operator=(const ChangeNotifier&) = delete;

    // The lock writers hold while mutating the store
    std::mutex& mutex() noexcept;

    // Wake every thread currently in wait(). Takes the mutex.
    void notify_all();

    // Returns true when woken by notify_all(), false if stop was requested.
    bool wait(std::stop_token stop_token);

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    uint64_t generation_{0}; // guarded by mutex_
};

} // namespace atomicstore
