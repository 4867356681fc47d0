#include "atomicstore/atomic_counter.hpp"

namespace atomicstore {

void AtomicCounter::inc() noexcept {
    value_.fetch_add(1, std::memory_order_relaxed);
}

void AtomicCounter::dec() noexcept {
    value_.fetch_sub(1, std::memory_order_relaxed);
}

uint64_t AtomicCounter::get() const noexcept {
    int64_t value = value_.load(std::memory_order_acquire);
    return value > 0 ? static_cast<uint64_t>(value) : 0;
}

void AtomicCounter::reset() noexcept {
    value_.store(0, std::memory_order_relaxed);
}

} // namespace atomicstore
