#include "codec/value_codec.hpp"
#include "command/cas_commands.hpp"
#include "command/kv_commands.hpp"
#include "kdc_test_env.hpp"
#include <gtest/gtest.h>

using namespace Kdc;
using namespace Kdc::Commands;
using namespace std::chrono_literals;

class CasCommandsTest : public KdcTest::SessionTest {};

TEST_F(CasCommandsTest, InitAndGetEachWidth) {
    ASSERT_TRUE(CasInitCommand("b", i8(-7)).Execute(session_).IsSuccess());
    ASSERT_TRUE(CasInitCommand("s", i16(1234)).Execute(session_).IsSuccess());
    ASSERT_TRUE(CasInitCommand("i", i32(-123456)).Execute(session_).IsSuccess());
    ASSERT_TRUE(CasInitCommand("l", i64(1) << 40).Execute(session_).IsSuccess());

    EXPECT_EQ(Codec::BytesToByte(CasGetCommand("b", Codec::DataType::Byte).Execute(session_).GetValue()), -7);
    EXPECT_EQ(Codec::BytesToShort(CasGetCommand("s", Codec::DataType::Short).Execute(session_).GetValue()), 1234);
    EXPECT_EQ(Codec::BytesToInt(CasGetCommand("i", Codec::DataType::Int).Execute(session_).GetValue()), -123456);
    EXPECT_EQ(Codec::BytesToLong(CasGetCommand("l", Codec::DataType::Long).Execute(session_).GetValue()),
              i64(1) << 40);
}

TEST_F(CasCommandsTest, InitRecordsDataType) {
    EXPECT_EQ(CasInitCommand("k", i16(1)).GetDataType(), Codec::DataType::Short);
    EXPECT_EQ(CasInitCommand("k", Bytes({1, 2, 3, 4, 5, 6, 7, 8})).GetDataType(), Codec::DataType::Long);
    EXPECT_THROW(CasInitCommand("k", Bytes({1, 2, 3})), InvalidArgument);
    EXPECT_THROW(CasInitCommand("", i32(1)), InvalidArgument);
}

TEST_F(CasCommandsTest, GetWithWrongWidthIsTypeMismatch) {
    ASSERT_TRUE(CasInitCommand("k", i32(5)).Execute(session_).IsSuccess());
    auto result = CasGetCommand("k", Codec::DataType::Long).Execute(session_);
    EXPECT_EQ(result.GetStatus(), Status::Failed);
    EXPECT_EQ(result.GetSubcode(), ResponseSubcode::TypeMismatch);
    EXPECT_TRUE(result.GetValue().empty());
}

TEST_F(CasCommandsTest, GetMissingIsNotFound) {
    EXPECT_EQ(CasGetCommand("missing", Codec::DataType::Int).Execute(session_).GetStatus(), Status::NotFound);
}

TEST_F(CasCommandsTest, CompareAndSwap) {
    ASSERT_TRUE(CasInitCommand("k", i32(10)).Execute(session_).IsSuccess());

    auto stale = CasSetCommand("k", i32(9), i32(20)).Execute(session_);
    EXPECT_FALSE(stale.IsSuccess());
    EXPECT_EQ(stale.GetSubcode(), ResponseSubcode::CasMismatch);
    EXPECT_EQ(Codec::BytesToInt(CasGetCommand("k", Codec::DataType::Int).Execute(session_).GetValue()), 10);

    ASSERT_TRUE(CasSetCommand("k", i32(10), i32(20)).Execute(session_).IsSuccess());
    EXPECT_EQ(Codec::BytesToInt(CasGetCommand("k", Codec::DataType::Int).Execute(session_).GetValue()), 20);
}

TEST_F(CasCommandsTest, CasSetValidatesWidths) {
    EXPECT_THROW(CasSetCommand("k", Codec::IntToBytes(1), Codec::LongToBytes(2)), InvalidArgument);
    EXPECT_THROW(CasSetCommand("k", Bytes({1, 2, 3}), Bytes({1, 2, 3})), InvalidArgument);
}

TEST_F(CasCommandsTest, IncrementAndDecrement) {
    ASSERT_TRUE(CasInitCommand("k", i64(5)).Execute(session_).IsSuccess());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(CasIncDecCommand("k").Execute(session_).IsSuccess());
    }
    ASSERT_TRUE(CasIncDecCommand("k", false).Execute(session_).IsSuccess());
    EXPECT_EQ(Codec::BytesToLong(CasGetCommand("k", Codec::DataType::Long).Execute(session_).GetValue()), 7);
}

TEST_F(CasCommandsTest, IncrementWrapsAtUnitWidth) {
    ASSERT_TRUE(CasInitCommand("k", i16(32767)).Execute(session_).IsSuccess());
    ASSERT_TRUE(CasIncDecCommand("k").Execute(session_).IsSuccess());
    EXPECT_EQ(Codec::BytesToShort(CasGetCommand("k", Codec::DataType::Short).Execute(session_).GetValue()), -32768);
}

TEST_F(CasCommandsTest, IncrementOnPlainValueFails) {
    ASSERT_TRUE(SetCommand("plain", "v").Execute(session_).IsSuccess());
    auto result = CasIncDecCommand("plain").Execute(session_);
    EXPECT_EQ(result.GetStatus(), Status::Failed);
    EXPECT_EQ(result.GetSubcode(), ResponseSubcode::TypeMismatch);
}

TEST_F(CasCommandsTest, ProtectedUnit) {
    ASSERT_TRUE(CasInitCommand("k", i8(1), "pw").Execute(session_).IsSuccess());
    EXPECT_EQ(CasGetCommand("k", Codec::DataType::Byte).Execute(session_).GetSubcode(), ResponseSubcode::BadPassword);
    EXPECT_TRUE(CasGetCommand("k", Codec::DataType::Byte, "pw").Execute(session_).IsSuccess());
    EXPECT_TRUE(CasIncDecCommand("k", true, "pw").Execute(session_).IsSuccess());
}

TEST_F(CasCommandsTest, UnitExpires) {
    ASSERT_TRUE(CasInitCommand("k", i32(1), kDefaultPass, 5s).Execute(session_).IsSuccess());
    // ttl 为 0 的自增保留原有期限
    ASSERT_TRUE(CasIncDecCommand("k").Execute(session_).IsSuccess());
    advance(6s);
    EXPECT_EQ(CasGetCommand("k", Codec::DataType::Int).Execute(session_).GetStatus(), Status::NotFound);
}
