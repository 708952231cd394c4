#include "command/kv_commands.hpp"
#include "command/queue_commands.hpp"
#include "kdc_test_env.hpp"
#include <gtest/gtest.h>

using namespace Kdc;
using namespace Kdc::Commands;
using namespace std::chrono_literals;

class QueueCommandsTest : public KdcTest::SessionTest {
protected:
    void push(const std::string &prefix, std::initializer_list<const char *> values) {
        for (const char *value: values) {
            ASSERT_TRUE(QueueAddCommand(prefix, value).Execute(session_).IsSuccess());
        }
    }
};

TEST_F(QueueCommandsTest, FifoOrder) {
    push("jobs", {"first", "second", "third"});
    auto result = QueueRemoveCommand("jobs", 2).Execute(session_);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.GetValue(), StringList({"first", "second"}));
}

TEST_F(QueueCommandsTest, LifoOrder) {
    push("jobs", {"first", "second", "third"});
    auto result = QueueRemoveCommand("jobs", 2, false).Execute(session_);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.GetValue(), StringList({"third", "second"}));
}

TEST_F(QueueCommandsTest, DefaultRemovesOne) {
    push("jobs", {"only", "next"});
    auto result = QueueRemoveCommand("jobs").Execute(session_);
    EXPECT_EQ(result.GetValue(), StringList({"only"}));
}

TEST_F(QueueCommandsTest, CountMustBePositive) {
    EXPECT_THROW(QueueRemoveCommand("jobs", 0), InvalidArgument);
    EXPECT_THROW(QueueRemoveCommand("jobs", -3), InvalidArgument);
    EXPECT_THROW(QueueRemoveCommand("", 1), InvalidArgument);
    EXPECT_THROW(KeyQueueRemoveCommand("jobs", 0), InvalidArgument);
    EXPECT_THROW(QueueAddCommand("jobs", "v", kDefaultPass, -1s), InvalidArgument);
}

TEST_F(QueueCommandsTest, ShortQueueKeepsPoppedValues) {
    push("jobs", {"a", "b"});
    auto result = QueueRemoveCommand("jobs", 3).Execute(session_);
    EXPECT_FALSE(result.IsSuccess());
    EXPECT_EQ(result.GetStatus(), Status::NotFound);
    EXPECT_EQ(result.GetValue(), StringList({"a", "b"}));
}

TEST_F(QueueCommandsTest, EmptyQueueIsNotFound) {
    auto result = QueueRemoveCommand("nothing").Execute(session_);
    EXPECT_EQ(result.GetStatus(), Status::NotFound);
    EXPECT_TRUE(result.GetValue().empty());
}

TEST_F(QueueCommandsTest, RemoveWithoutReturnValue) {
    push("jobs", {"a", "b", "c"});
    auto dropped = QueueRemoveCommand("jobs", 2, true, kDefaultPass, false).Execute(session_);
    EXPECT_TRUE(dropped.IsSuccess());
    EXPECT_TRUE(dropped.GetValue().empty());
    EXPECT_EQ(QueueRemoveCommand("jobs").Execute(session_).GetValue(), StringList({"c"}));
}

TEST_F(QueueCommandsTest, ProtectedQueueItems) {
    ASSERT_TRUE(QueueAddCommand("jobs", "secret", "pw").Execute(session_).IsSuccess());
    auto denied = QueueRemoveCommand("jobs").Execute(session_);
    EXPECT_EQ(denied.GetStatus(), Status::Failed);
    EXPECT_EQ(denied.GetSubcode(), ResponseSubcode::BadPassword);

    auto granted = QueueRemoveCommand("jobs", 1, true, "pw").Execute(session_);
    EXPECT_EQ(granted.GetValue(), StringList({"secret"}));
}

TEST_F(QueueCommandsTest, ExpiredItemsAreSkipped) {
    ASSERT_TRUE(QueueAddCommand("jobs", "stale", kDefaultPass, 1s).Execute(session_).IsSuccess());
    ASSERT_TRUE(QueueAddCommand("jobs", "fresh").Execute(session_).IsSuccess());
    advance(2s);
    EXPECT_EQ(QueueRemoveCommand("jobs").Execute(session_).GetValue(), StringList({"fresh"}));
}

TEST_F(QueueCommandsTest, KeyQueueRoundTrip) {
    ASSERT_TRUE(KeyQueueAddCommand("kq", "job1", "payload1").Execute(session_).IsSuccess());
    ASSERT_TRUE(KeyQueueAddCommand("kq", "job2", "payload2").Execute(session_).IsSuccess());
    EXPECT_EQ(GetCommand("job2").Execute(session_).GetValue(), "payload2");

    auto result = KeyQueueRemoveCommand("kq", 2).Execute(session_);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.GetValue(), StringMap({{"job1", "payload1"}, {"job2", "payload2"}}));
    EXPECT_EQ(GetCommand("job1").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(QueueCommandsTest, KeyQueueRemoveWithoutReturnValue) {
    ASSERT_TRUE(KeyQueueAddCommand("kq", "job1", "payload1").Execute(session_).IsSuccess());
    auto result = KeyQueueRemoveCommand("kq", 1, true, kDefaultPass, false).Execute(session_);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_TRUE(result.GetValue().empty());
    EXPECT_EQ(GetCommand("job1").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(QueueCommandsTest, KeyQueueValidatesArguments) {
    EXPECT_THROW(KeyQueueAddCommand("kq", "", "v"), InvalidArgument);
    EXPECT_THROW(KeyQueueAddCommand("kq", "k", ""), InvalidArgument);
    EXPECT_THROW(KeyQueueAddCommand("", "k", "v"), InvalidArgument);
}
