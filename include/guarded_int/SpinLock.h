#pragma once

#include <atomic>
#include <thread>

namespace guarded_int {

// Test-and-set spin lock. Satisfies Lockable, so it works with std::lock_guard.
class SpinLock {
    std::atomic_flag flag = ATOMIC_FLAG_INIT;
public:
    void lock() {
        int spins = 0;
        while (flag.test_and_set(std::memory_order_acquire)) {
            if (++spins % 100 == 0) {
                std::this_thread::yield();
            }
        }
    }

    bool try_lock() {
        return !flag.test_and_set(std::memory_order_acquire);
    }

    void unlock() {
        flag.clear(std::memory_order_release);
    }
};

} // namespace guarded_int
