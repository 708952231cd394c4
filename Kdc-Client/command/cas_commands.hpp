#pragma once
#include "codec/value_codec.hpp"
#include "command.hpp"
#include "core/types.hpp"
#include <chrono>
#include <string>

namespace Kdc::Commands {

    // 初始化 CAS 单元，单元宽度由参数类型决定（1/2/4/8 字节）
    class CasInitCommand : public Command<bool> {
    public:
        CasInitCommand(const std::string &key, i8 value, const std::string &pass = kDefaultPass,
                       std::chrono::seconds ttl = kDefaultExpiration);
        CasInitCommand(const std::string &key, i16 value, const std::string &pass = kDefaultPass,
                       std::chrono::seconds ttl = kDefaultExpiration);
        CasInitCommand(const std::string &key, i32 value, const std::string &pass = kDefaultPass,
                       std::chrono::seconds ttl = kDefaultExpiration);
        CasInitCommand(const std::string &key, i64 value, const std::string &pass = kDefaultPass,
                       std::chrono::seconds ttl = kDefaultExpiration);
        // 已编码的单元，长度不是 1/2/4/8 时抛出 InvalidArgument
        CasInitCommand(const std::string &key, const Bytes &value, const std::string &pass = kDefaultPass,
                       std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "CasInitCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

        Codec::DataType GetDataType() const { return type_; }

    private:
        std::string key_;
        Bytes value_;
        Codec::DataType type_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    // 读取 CAS 单元的原始小端字节
    class CasGetCommand : public Command<Bytes> {
    public:
        CasGetCommand(const std::string &key, Codec::DataType type, const std::string &pass = kDefaultPass);

        std::string Name() const override { return "CasGetCommand"; }
        std::string ToString() const override;
        Result<Bytes> Execute(Session &session) const override;

    private:
        std::string key_;
        Codec::DataType type_;
        std::string pass_;
    };

    // 比较并交换：当前值等于 old 时写入 new
    class CasSetCommand : public Command<bool> {
    public:
        CasSetCommand(const std::string &key, i8 old_value, i8 new_value,
                      const std::string &pass = kDefaultPass, std::chrono::seconds ttl = kDefaultExpiration);
        CasSetCommand(const std::string &key, i16 old_value, i16 new_value,
                      const std::string &pass = kDefaultPass, std::chrono::seconds ttl = kDefaultExpiration);
        CasSetCommand(const std::string &key, i32 old_value, i32 new_value,
                      const std::string &pass = kDefaultPass, std::chrono::seconds ttl = kDefaultExpiration);
        CasSetCommand(const std::string &key, i64 old_value, i64 new_value,
                      const std::string &pass = kDefaultPass, std::chrono::seconds ttl = kDefaultExpiration);
        CasSetCommand(const std::string &key, const Bytes &old_value, const Bytes &new_value,
                      const std::string &pass = kDefaultPass, std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "CasSetCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        Bytes old_value_;
        Bytes new_value_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    // 单元值加一或减一，按单元宽度回绕
    class CasIncDecCommand : public Command<bool> {
    public:
        explicit CasIncDecCommand(const std::string &key, bool increment = kDefaultIsIncrement,
                                  const std::string &pass = kDefaultPass,
                                  std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "CasIncDecCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        bool increment_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

}// namespace Kdc::Commands
