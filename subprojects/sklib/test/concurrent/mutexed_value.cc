#include <gtest/gtest.h>
#include <optional>
#include <sklib/concurrent/mutexed_value.hh>
#include <string>
#include <thread>
#include <vector>

using concurrent::MutexedValue;

// NOLINTNEXTLINE
TEST(MutexedValue, perform_returns_the_result) {
    MutexedValue<std::optional<std::string>> value;
    EXPECT_FALSE(value.copy().has_value());

    bool set = value.perform([](auto& opt) {
        if (opt) {
            return false;
        }
        opt = "first";
        return true;
    });
    EXPECT_TRUE(set);
    EXPECT_EQ(value.copy(), "first");
}

// NOLINTNEXTLINE
TEST(MutexedValue, concurrent_updates) {
    MutexedValue<int> counter(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 1000; ++i) {
                counter.perform([](int& x) { ++x; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(counter.copy(), 4000);
}
