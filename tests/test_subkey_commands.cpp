#include "command/kv_commands.hpp"
#include "command/subkey_commands.hpp"
#include "kdc_test_env.hpp"
#include <gtest/gtest.h>

using namespace Kdc;
using namespace Kdc::Commands;
using namespace std::chrono_literals;

class SubkeyCommandsTest : public KdcTest::SessionTest {
protected:
    StringList subkeysOf(const std::string &key) {
        return GetSubkeysCommand(key).Execute(session_).GetValue();
    }
};

TEST_F(SubkeyCommandsTest, SetAndGetPreservesOrder) {
    ASSERT_TRUE(SetSubkeysCommand("k", {"c", "a", "b"}).Execute(session_).IsSuccess());
    auto result = GetSubkeysCommand("k").Execute(session_);
    EXPECT_TRUE(result.IsSuccess());
    EXPECT_EQ(result.GetValue(), StringList({"c", "a", "b"}));
}

TEST_F(SubkeyCommandsTest, GetWithoutSubkeysIsNotFound) {
    ASSERT_TRUE(SetCommand("k", "v").Execute(session_).IsSuccess());
    auto result = GetSubkeysCommand("k").Execute(session_);
    EXPECT_EQ(result.GetStatus(), Status::NotFound);
    EXPECT_TRUE(result.GetValue().empty());
}

TEST_F(SubkeyCommandsTest, SetSubkeysValidatesList) {
    EXPECT_THROW(SetSubkeysCommand("k", {}), InvalidArgument);
    EXPECT_THROW(SetSubkeysCommand("k", {"a", ""}), InvalidArgument);
    EXPECT_THROW(SetSubkeysCommand("", {"a"}), InvalidArgument);
}

TEST_F(SubkeyCommandsTest, AddSubkeyPrepends) {
    ASSERT_TRUE(SetSubkeysCommand("k", {"a", "b"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(AddSubkeyCommand("k", "c").Execute(session_).IsSuccess());
    EXPECT_EQ(subkeysOf("k"), StringList({"c", "a", "b"}));

    // 不去重
    ASSERT_TRUE(AddSubkeyCommand("k", "a").Execute(session_).IsSuccess());
    EXPECT_EQ(subkeysOf("k"), StringList({"a", "c", "a", "b"}));
}

TEST_F(SubkeyCommandsTest, AddSubkeyToKeyWithoutSubkeys) {
    ASSERT_TRUE(SetCommand("k", "v").Execute(session_).IsSuccess());
    ASSERT_TRUE(AddSubkeyCommand("k", "first").Execute(session_).IsSuccess());
    EXPECT_EQ(subkeysOf("k"), StringList({"first"}));
    EXPECT_EQ(GetCommand("k").Execute(session_).GetValue(), "v");
}

TEST_F(SubkeyCommandsTest, RemoveSubkeyDropsOneEntry) {
    ASSERT_TRUE(SetSubkeysCommand("k", {"a", "b", "c"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(RemoveSubkeyCommand("k", "b").Execute(session_).IsSuccess());
    EXPECT_EQ(subkeysOf("k"), StringList({"a", "c"}));

    auto missing = RemoveSubkeyCommand("k", "zzz").Execute(session_);
    EXPECT_EQ(missing.GetStatus(), Status::NotFound);
}

TEST_F(SubkeyCommandsTest, RemoveSubkeyRecursively) {
    ASSERT_TRUE(SetCommand("child", "c").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetCommand("grandchild", "g").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetSubkeysCommand("child", {"grandchild"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(SetSubkeysCommand("k", {"child"}).Execute(session_).IsSuccess());

    ASSERT_TRUE(RemoveSubkeyCommand("k", "child", true).Execute(session_).IsSuccess());
    EXPECT_EQ(GetCommand("child").Execute(session_).GetStatus(), Status::NotFound);
    EXPECT_EQ(GetCommand("grandchild").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(SubkeyCommandsTest, ClearSubkeys) {
    ASSERT_TRUE(SetCommand("child", "c").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetAllCommand("k", "v", {"child"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(ClearSubkeysCommand("k").Execute(session_).IsSuccess());

    EXPECT_EQ(GetSubkeysCommand("k").Execute(session_).GetStatus(), Status::NotFound);
    EXPECT_EQ(GetCommand("child").Execute(session_).GetStatus(), Status::NotFound);
    EXPECT_EQ(GetCommand("k").Execute(session_).GetValue(), "v");
    EXPECT_EQ(ClearSubkeysCommand("absent").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(SubkeyCommandsTest, AttributesOfPlainKeyAreEmpty) {
    ASSERT_TRUE(SetCommand("k", "v").Execute(session_).IsSuccess());
    auto attrs = GetAttrsCommand("k").Execute(session_);
    EXPECT_EQ(attrs.GetStatus(), Status::NotFound);
    EXPECT_TRUE(attrs.GetValue().empty());
}

TEST_F(SubkeyCommandsTest, AttributesOfProtectedKey) {
    ASSERT_TRUE(SetCommand("k", "v", false, "pw", 120s).Execute(session_).IsSuccess());
    auto attrs = GetAttrsCommand("k").Execute(session_);
    ASSERT_TRUE(attrs.IsSuccess());
    EXPECT_EQ(attrs.GetValue().size(), 2u);
    EXPECT_EQ(attrs.GetValue().at("encrypt"), "on");
    EXPECT_EQ(attrs.GetValue().count("expire"), 1u);
}
