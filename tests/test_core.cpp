#include "core/kdc.hpp"
#include "session/Session.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <type_traits>
#include <vector>

TEST(CoreTest, BasicTypesAreDefined) {
    EXPECT_EQ(sizeof(Kdc::i8), 1);
    EXPECT_EQ(sizeof(Kdc::i16), 2);
    EXPECT_EQ(sizeof(Kdc::i32), 4);
    EXPECT_EQ(sizeof(Kdc::i64), 8);

    EXPECT_EQ(sizeof(Kdc::u8), 1);
    EXPECT_EQ(sizeof(Kdc::u16), 2);
    EXPECT_EQ(sizeof(Kdc::u32), 4);
    EXPECT_EQ(sizeof(Kdc::u64), 8);
}

namespace {
    class Counter : public Kdc::Singleton<Counter> {
        friend class Kdc::Singleton<Counter>;

    public:
        ~Counter() = default;
        int Next() { return ++value_; }

    private:
        Counter() = default;
        std::atomic<int> value_{0};
    };
}// namespace

TEST(CoreTest, SingletonReturnsSameInstance) {
    Counter *seen[4] = {};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&seen, i]() { seen[i] = &Counter::GetInstance(); });
    }
    for (auto &t: threads) {
        t.join();
    }
    for (auto *ptr: seen) {
        EXPECT_EQ(ptr, &Counter::GetInstance());
    }
    int before = Counter::GetInstance().Next();
    EXPECT_EQ(Counter::GetInstance().Next(), before + 1);
}

TEST(CoreTest, SessionIsMoveOnly) {
    EXPECT_FALSE(std::is_copy_constructible_v<Kdc::Session>);
    EXPECT_FALSE(std::is_copy_assignable_v<Kdc::Session>);
    EXPECT_TRUE(std::is_move_constructible_v<Kdc::Session>);
    EXPECT_TRUE(std::is_move_assignable_v<Kdc::Session>);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
