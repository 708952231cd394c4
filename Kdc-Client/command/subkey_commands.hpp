#pragma once
#include "command.hpp"
#include "core/types.hpp"
#include <string>

namespace Kdc::Commands {

    // 读取直接子键，按存储顺序返回
    class GetSubkeysCommand : public Command<StringList> {
    public:
        explicit GetSubkeysCommand(const std::string &key);

        std::string Name() const override { return "GetSubkeysCommand"; }
        std::string ToString() const override;
        Result<StringList> Execute(Session &session) const override;

    private:
        std::string key_;
    };

    // 整体替换子键列表
    class SetSubkeysCommand : public Command<bool> {
    public:
        SetSubkeysCommand(const std::string &key, const StringList &subkeys);

        std::string Name() const override { return "SetSubkeysCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        StringList subkeys_;
    };

    /**
     * 追加一个子键：先读出列表，把新子键放到最前面，再整体写回。
     * 读和写是两次独立调用，并发修改同一个键时不保证原子性。
     */
    class AddSubkeyCommand : public Command<bool> {
    public:
        AddSubkeyCommand(const std::string &key, const std::string &subkey);

        std::string Name() const override { return "AddSubkeyCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        std::string subkey_;
    };

    // 从列表中删除一个子键，recursive 时连同子键条目及其后代一起删除
    class RemoveSubkeyCommand : public Command<bool> {
    public:
        RemoveSubkeyCommand(const std::string &key, const std::string &subkey,
                            bool recursive = kDefaultRemoveRecursively);

        std::string Name() const override { return "RemoveSubkeyCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
        std::string subkey_;
        bool recursive_;
    };

    class ClearSubkeysCommand : public Command<bool> {
    public:
        explicit ClearSubkeysCommand(const std::string &key);

        std::string Name() const override { return "ClearSubkeysCommand"; }
        std::string ToString() const override;
        Result<bool> Execute(Session &session) const override;

    private:
        std::string key_;
    };

    // 读取属性（expire / encrypt / mtime），没有属性时返回空表
    class GetAttrsCommand : public Command<StringMap> {
    public:
        explicit GetAttrsCommand(const std::string &key);

        std::string Name() const override { return "GetAttrsCommand"; }
        std::string ToString() const override;
        Result<StringMap> Execute(Session &session) const override;

    private:
        std::string key_;
    };

}// namespace Kdc::Commands
