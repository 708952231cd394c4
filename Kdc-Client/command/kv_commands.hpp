#pragma once
#include "command.hpp"
#include "core/types.hpp"
#include <chrono>
#include <string>

namespace Kdc::Commands {

    // GET：读取键值，未找到或失败时值为空串，由 Status 区分
    class GetCommand : public Command<std::string> {
    public:
        explicit GetCommand(const std::string &key, const std::string &pass = kDefaultPass);

        std::string Name() const override { return "GetCommand"; }
        std::string ToString() const override;
        Result<std::string> Execute(Session &session) const override;

        const std::string &GetKey() const { return key_; }

    private:
        std::string key_;
        std::string pass_;
    };

    // SET：写入键值
    class SetCommand : public Command<bool> {
    public:
        SetCommand(const std::string &key, const std::string &value)
            : SetCommand(key, value, kDefaultIsClearSubkeys, kDefaultPass, kDefaultExpiration) {}

        SetCommand(const std::string &key, const std::string &value, bool clear_subkeys,
                   const std::string &pass, std::chrono::seconds ttl);

        std::string Name() const override { return "SetCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        std::string value_;
        bool clear_subkeys_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    // SETALL：一次写入值和完整的子键列表
    class SetAllCommand : public Command<bool> {
    public:
        SetAllCommand(const std::string &key, const std::string &value,
                      const StringList &subkeys = {},
                      const std::string &pass = kDefaultPass,
                      std::chrono::seconds ttl = kDefaultExpiration);

        std::string Name() const override { return "SetAllCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        std::string value_;
        StringList subkeys_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

    // REMOVE：删除键，可选同时删除子键
    class RemoveCommand : public Command<bool> {
    public:
        explicit RemoveCommand(const std::string &key, bool remove_subkeys = kDefaultRemoveSubkeys);

        std::string Name() const override { return "RemoveCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        bool remove_subkeys_;
    };

    // RENAME：改名，给出父键时同步更新父键的子键列表
    class RenameCommand : public Command<bool> {
    public:
        RenameCommand(const std::string &key, const std::string &new_key)
            : RenameCommand(key, new_key, "", kDefaultCheckParentAttrs, kDefaultPass, kDefaultExpiration) {}

        RenameCommand(const std::string &key, const std::string &new_key, const std::string &parent_key,
                      bool check_parent_attrs, const std::string &pass, std::chrono::seconds ttl);

        std::string Name() const override { return "RenameCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        std::string new_key_;
        std::string parent_key_;
        bool check_parent_attrs_;
        std::string pass_;
        std::chrono::seconds ttl_;
    };

}// namespace Kdc::Commands
