#pragma once

#include <atomic>
#include <cstdint>

namespace atomicstore {

/*
 * Counter safe under concurrent inc/dec/get.
 *
 * A dec may race ahead of the inc it balances (non-lockable stores do this),
 * so the internal value is signed and get() clamps a transient negative to 0.
 */
class AtomicCounter {
public:
    void inc() noexcept;
    void dec() noexcept;
    uint64_t get() const noexcept;
    void reset() noexcept;

private:
    std::atomic<int64_t> value_{0};
};

} // namespace atomicstore
