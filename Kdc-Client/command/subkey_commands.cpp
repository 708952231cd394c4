#include "subkey_commands.hpp"
#include <fmt/ranges.h>

namespace Kdc::Commands {

    GetSubkeysCommand::GetSubkeysCommand(const std::string &key) : key_(key) {
        RequireNonEmpty(key_, "key");
    }

    std::string GetSubkeysCommand::ToString() const {
        return fmt::format("GetSubkeysCommand[key={}]", key_);
    }

    Result<StringList> GetSubkeysCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        auto subkeys = session.GetBackend().GetSubkeys(handle, key_);
        bool ok = subkeys.has_value();
        return finish(session, ok, ok ? std::move(*subkeys) : StringList());
    }

    SetSubkeysCommand::SetSubkeysCommand(const std::string &key, const StringList &subkeys)
        : key_(key), subkeys_(subkeys) {
        RequireNonEmpty(key_, "key");
        if (subkeys_.empty()) {
            throw InvalidArgument("subkeys should not be empty");
        }
        for (const auto &subkey: subkeys_) {
            RequireNonEmpty(subkey, "subkey");
        }
    }

    std::string SetSubkeysCommand::ToString() const {
        return fmt::format("SetSubkeysCommand[key={}, subkeys={}]", key_, subkeys_);
    }

    Result<bool> SetSubkeysCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().SetSubkeys(handle, key_, subkeys_);
        return finish(session, ok, ok);
    }

    AddSubkeyCommand::AddSubkeyCommand(const std::string &key, const std::string &subkey)
        : key_(key), subkey_(subkey) {
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(subkey_, "subkey");
    }

    std::string AddSubkeyCommand::ToString() const {
        return fmt::format("AddSubkeyCommand[key={}, subkey={}]", key_, subkey_);
    }

    Result<bool> AddSubkeyCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        Backend &backend = session.GetBackend();

        StringList subkeys;
        auto current = backend.GetSubkeys(handle, key_);
        if (current) {
            subkeys = std::move(*current);
        } else if (backend.GetResponseSubcode(handle) != ResponseSubcode::NoData) {
            // 读取失败（而不是没有子键），直接返回读取的响应码
            return finish(session, false, false);
        }

        subkeys.insert(subkeys.begin(), subkey_);
        bool ok = backend.SetSubkeys(handle, key_, subkeys);
        return finish(session, ok, ok);
    }

    RemoveSubkeyCommand::RemoveSubkeyCommand(const std::string &key, const std::string &subkey, bool recursive)
        : key_(key), subkey_(subkey), recursive_(recursive) {
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(subkey_, "subkey");
    }

    std::string RemoveSubkeyCommand::ToString() const {
        return fmt::format("RemoveSubkeyCommand[key={}, subkey={}, recursive={}]", key_, subkey_, recursive_);
    }

    Result<bool> RemoveSubkeyCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().RemoveSubkey(handle, key_, subkey_, recursive_);
        return finish(session, ok, ok);
    }

    ClearSubkeysCommand::ClearSubkeysCommand(const std::string &key) : key_(key) {
        RequireNonEmpty(key_, "key");
    }

    std::string ClearSubkeysCommand::ToString() const {
        return fmt::format("ClearSubkeysCommand[key={}]", key_);
    }

    Result<bool> ClearSubkeysCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().ClearSubkeys(handle, key_);
        return finish(session, ok, ok);
    }

    GetAttrsCommand::GetAttrsCommand(const std::string &key) : key_(key) {
        RequireNonEmpty(key_, "key");
    }

    std::string GetAttrsCommand::ToString() const {
        return fmt::format("GetAttrsCommand[key={}]", key_);
    }

    Result<StringMap> GetAttrsCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        auto attrs = session.GetBackend().GetAttrs(handle, key_);
        bool ok = attrs.has_value();
        return finish(session, ok, ok ? std::move(*attrs) : StringMap());
    }

}// namespace Kdc::Commands
