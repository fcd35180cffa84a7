#pragma once

#include <cstdint>
#include <mutex>
#include <shared_mutex>

namespace guarded_int {

// Integer cell guarded by a reader/writer lock.
// Every operation is one critical section, so operations on the same
// instance are linearizable. The lock is not reentrant.
class GuardedInt {
public:
    using value_type = std::int64_t;

private:
    mutable std::shared_mutex mtx;
    value_type value;

    // Wraps around on overflow instead of invoking signed-overflow UB.
    static value_type wrappingAdd(value_type a, value_type b) noexcept {
        return static_cast<value_type>(static_cast<std::uint64_t>(a) + static_cast<std::uint64_t>(b));
    }

public:
    explicit GuardedInt(value_type initial = 0) : value(initial) {}

    GuardedInt(const GuardedInt&) = delete;
    GuardedInt& operator=(const GuardedInt&) = delete;

    value_type get() const {
        std::shared_lock<std::shared_mutex> lock(mtx);
        return value;
    }

    void set(value_type newValue) {
        std::lock_guard<std::shared_mutex> lock(mtx);
        value = newValue;
    }

    value_type getAndSet(value_type newValue) {
        std::lock_guard<std::shared_mutex> lock(mtx);
        value_type old = value;
        value = newValue;
        return old;
    }

    value_type addAndGet(value_type delta) {
        std::lock_guard<std::shared_mutex> lock(mtx);
        value = wrappingAdd(value, delta);
        return value;
    }

    value_type getAndAdd(value_type delta) {
        std::lock_guard<std::shared_mutex> lock(mtx);
        value_type old = value;
        value = wrappingAdd(value, delta);
        return old;
    }

    value_type incrementAndGet() {
        return addAndGet(1);
    }

    value_type getAndIncrement() {
        return getAndAdd(1);
    }

    value_type decrementAndGet() {
        return addAndGet(-1);
    }

    value_type getAndDecrement() {
        return getAndAdd(-1);
    }

    // Returns false and leaves the value untouched when it differs from expect.
    bool compareAndSet(value_type expect, value_type update) {
        std::lock_guard<std::shared_mutex> lock(mtx);
        if (value != expect) {
            return false;
        }
        value = update;
        return true;
    }
};

} // namespace guarded_int
