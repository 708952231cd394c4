#include "command/kv_commands.hpp"
#include "kdc_test_env.hpp"
#include <gtest/gtest.h>

using namespace Kdc;
using namespace Kdc::Commands;
using namespace std::chrono_literals;

class KvCommandsTest : public KdcTest::SessionTest {};

TEST_F(KvCommandsTest, SetThenGet) {
    auto set = SetCommand("name", "Alice").Execute(session_);
    EXPECT_TRUE(set.IsSuccess());
    EXPECT_TRUE(set.GetValue());
    EXPECT_EQ(set.GetCode(), ResponseCode::Success);
    EXPECT_EQ(set.GetStatus(), Status::Ok);

    auto get = GetCommand("name").Execute(session_);
    EXPECT_TRUE(get.IsSuccess());
    EXPECT_EQ(get.GetValue(), "Alice");
    EXPECT_EQ(get.GetCmd(), "GetCommand");
}

TEST_F(KvCommandsTest, GetMissingKeyIsNotFound) {
    auto get = GetCommand("missing").Execute(session_);
    EXPECT_FALSE(get.IsSuccess());
    EXPECT_EQ(get.GetValue(), "");
    EXPECT_EQ(get.GetCode(), ResponseCode::Error);
    EXPECT_EQ(get.GetSubcode(), ResponseSubcode::NoData);
    EXPECT_EQ(get.GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, WrongPasswordIsFailure) {
    ASSERT_TRUE(SetCommand("k", "v", kDefaultIsClearSubkeys, "pw", kDefaultExpiration).Execute(session_).IsSuccess());
    auto denied = GetCommand("k", "nope").Execute(session_);
    EXPECT_FALSE(denied.IsSuccess());
    EXPECT_EQ(denied.GetStatus(), Status::Failed);
    EXPECT_EQ(denied.GetSubcode(), ResponseSubcode::BadPassword);
    EXPECT_EQ(GetCommand("k", "pw").Execute(session_).GetValue(), "v");
}

TEST_F(KvCommandsTest, ExpiredValueIsNotFound) {
    ASSERT_TRUE(SetCommand("k", "v", false, kDefaultPass, 30s).Execute(session_).IsSuccess());
    advance(31s);
    EXPECT_EQ(GetCommand("k").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, HugeTtlKeepsValue) {
    ASSERT_TRUE(SetCommand("k", "v", false, kDefaultPass, std::chrono::seconds(10'000'000'000LL))
                        .Execute(session_)
                        .IsSuccess());
    auto result = GetCommand("k").Execute(session_);
    EXPECT_EQ(result.GetStatus(), Status::Ok);
    EXPECT_EQ(result.GetValue(), "v");
}

TEST_F(KvCommandsTest, ConstructionValidatesArguments) {
    EXPECT_THROW(GetCommand(""), InvalidArgument);
    EXPECT_THROW(SetCommand("", "v"), InvalidArgument);
    EXPECT_THROW(SetCommand("k", ""), InvalidArgument);
    EXPECT_THROW(SetCommand("k", "v", false, "", -1s), InvalidArgument);
    EXPECT_THROW(SetAllCommand("k", "v", {"a", ""}), InvalidArgument);
    EXPECT_THROW(RemoveCommand(""), InvalidArgument);
    EXPECT_THROW(RenameCommand("k", ""), InvalidArgument);
    EXPECT_THROW(RenameCommand("k", "k2", "", false, "", -5s), InvalidArgument);
}

TEST_F(KvCommandsTest, ExecuteRequiresOpenSession) {
    Session unopened;
    EXPECT_THROW(GetCommand("k").Execute(unopened), InvalidArgument);

    session_.Close();
    EXPECT_THROW(SetCommand("k", "v").Execute(session_), InvalidArgument);
}

TEST_F(KvCommandsTest, SetAllWritesSubkeys) {
    ASSERT_TRUE(SetAllCommand("parent", "p", {"c1", "c2"}).Execute(session_).IsSuccess());
    EXPECT_EQ(backend_->GetSubkeys(session_.GetHandle(), "parent"), StringList({"c1", "c2"}));
    EXPECT_EQ(GetCommand("parent").Execute(session_).GetValue(), "p");
}

TEST_F(KvCommandsTest, SetWithClearSubkeys) {
    ASSERT_TRUE(SetAllCommand("parent", "p", {"child"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(SetCommand("child", "c").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetCommand("parent", "p2", true, kDefaultPass, kDefaultExpiration).Execute(session_).IsSuccess());
    EXPECT_EQ(GetCommand("child").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, RemoveMissingKeyIsNotFound) {
    auto removed = RemoveCommand("missing").Execute(session_);
    EXPECT_FALSE(removed.IsSuccess());
    EXPECT_EQ(removed.GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, RemoveWithSubkeys) {
    ASSERT_TRUE(SetCommand("child", "c").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetAllCommand("parent", "p", {"child"}).Execute(session_).IsSuccess());
    ASSERT_TRUE(RemoveCommand("parent", true).Execute(session_).IsSuccess());
    EXPECT_EQ(GetCommand("parent").Execute(session_).GetStatus(), Status::NotFound);
    EXPECT_EQ(GetCommand("child").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, RenameKey) {
    ASSERT_TRUE(SetCommand("old", "v").Execute(session_).IsSuccess());
    ASSERT_TRUE(RenameCommand("old", "new").Execute(session_).IsSuccess());
    EXPECT_EQ(GetCommand("new").Execute(session_).GetValue(), "v");
    EXPECT_EQ(GetCommand("old").Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(KvCommandsTest, RenameUnderParent) {
    ASSERT_TRUE(SetCommand("old", "v").Execute(session_).IsSuccess());
    ASSERT_TRUE(SetAllCommand("parent", "p", {"old"}).Execute(session_).IsSuccess());
    auto renamed = RenameCommand("old", "new", "parent", kDefaultCheckParentAttrs, kDefaultPass, kDefaultExpiration)
                           .Execute(session_);
    ASSERT_TRUE(renamed.IsSuccess());
    EXPECT_EQ(backend_->GetSubkeys(session_.GetHandle(), "parent"), StringList({"new"}));

    auto mismatch = RenameCommand("new", "newer", "nobody", false, "", 0s).Execute(session_);
    EXPECT_EQ(mismatch.GetStatus(), Status::Failed);
    EXPECT_EQ(mismatch.GetSubcode(), ResponseSubcode::ParentMismatch);
}

TEST_F(KvCommandsTest, ToStringMasksPassword) {
    SetCommand cmd("k", "v", false, "top-secret", 10s);
    std::string text = cmd.ToString();
    EXPECT_EQ(text.find("top-secret"), std::string::npos);
    EXPECT_NE(text.find("****"), std::string::npos);
    EXPECT_NE(text.find("key=k"), std::string::npos);
    EXPECT_EQ(cmd.Name(), "SetCommand");
}

TEST_F(KvCommandsTest, ResultToString) {
    auto get = GetCommand("missing").Execute(session_);
    std::string text = get.ToString();
    EXPECT_NE(text.find("cmd=GetCommand"), std::string::npos);
    EXPECT_NE(text.find("success=false"), std::string::npos);
    EXPECT_NE(text.find("subcode=NO_DATA"), std::string::npos);
}

TEST(ResponseCodeTest, EverySubcodeHasAName) {
    const auto last = static_cast<i64>(ResponseSubcode::ParentMismatch);
    for (i64 raw = 0; raw <= last; ++raw) {
        EXPECT_EQ(ToString(static_cast<ResponseSubcode>(raw)).find("UNKNOWN"), std::string::npos) << raw;
    }
    EXPECT_EQ(ToString(static_cast<ResponseSubcode>(last + 1)), "UNKNOWN(" + std::to_string(last + 1) + ")");
    EXPECT_EQ(ToString(ResponseSubcode::CasMismatch), "CAS_MISMATCH");
}
