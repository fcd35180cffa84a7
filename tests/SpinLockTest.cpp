#include <gtest/gtest.h>

#include <mutex>
#include <thread>
#include <vector>
#include <guarded_int/SpinLock.h>

using guarded_int::SpinLock;

TEST(SpinLockTest, TryLockFailsWhileHeld) {
    SpinLock spin;
    spin.lock();
    EXPECT_FALSE(spin.try_lock());
    spin.unlock();
    EXPECT_TRUE(spin.try_lock());
    spin.unlock();
}

TEST(SpinLockTest, ProtectsPlainCounter) {
    SpinLock spin;
    long long counter = 0;

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&spin, &counter]() {
            for (int j = 0; j < 10000; ++j) {
                std::lock_guard<SpinLock> lock(spin);
                ++counter;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(counter, 40000);
}
