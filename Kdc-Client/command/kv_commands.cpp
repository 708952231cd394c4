#include "kv_commands.hpp"
#include <fmt/ranges.h>

namespace Kdc::Commands {

    GetCommand::GetCommand(const std::string &key, const std::string &pass)
        : key_(key), pass_(pass) {
        RequireNonEmpty(key_, "key");
    }

    std::string GetCommand::ToString() const {
        return fmt::format("GetCommand[key={}, pass={}]", key_, MaskPass(pass_));
    }

    Result<std::string> GetCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        auto value = session.GetBackend().GetValue(handle, key_, pass_);
        return finish(session, value.has_value(), value.value_or(""));
    }

    SetCommand::SetCommand(const std::string &key, const std::string &value, bool clear_subkeys,
                           const std::string &pass, std::chrono::seconds ttl)
        : key_(key), value_(value), clear_subkeys_(clear_subkeys), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(value_, "value");
        RequireNonNegative(ttl_);
    }

    std::string SetCommand::ToString() const {
        return fmt::format("SetCommand[key={}, value={}, clear_subkeys={}, pass={}, ttl={}s]",
                           key_, value_, clear_subkeys_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> SetCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().SetValue(handle, key_, value_, clear_subkeys_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    SetAllCommand::SetAllCommand(const std::string &key, const std::string &value, const StringList &subkeys,
                                 const std::string &pass, std::chrono::seconds ttl)
        : key_(key), value_(value), subkeys_(subkeys), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(value_, "value");
        for (const auto &subkey: subkeys_) {
            RequireNonEmpty(subkey, "subkey");
        }
        RequireNonNegative(ttl_);
    }

    std::string SetAllCommand::ToString() const {
        return fmt::format("SetAllCommand[key={}, value={}, subkeys={}, pass={}, ttl={}s]",
                           key_, value_, subkeys_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> SetAllCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().SetAll(handle, key_, value_, subkeys_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    RemoveCommand::RemoveCommand(const std::string &key, bool remove_subkeys)
        : key_(key), remove_subkeys_(remove_subkeys) {
        RequireNonEmpty(key_, "key");
    }

    std::string RemoveCommand::ToString() const {
        return fmt::format("RemoveCommand[key={}, remove_subkeys={}]", key_, remove_subkeys_);
    }

    Result<bool> RemoveCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().Remove(handle, key_, remove_subkeys_);
        return finish(session, ok, ok);
    }

    RenameCommand::RenameCommand(const std::string &key, const std::string &new_key, const std::string &parent_key,
                                 bool check_parent_attrs, const std::string &pass, std::chrono::seconds ttl)
        : key_(key), new_key_(new_key), parent_key_(parent_key), check_parent_attrs_(check_parent_attrs),
          pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(new_key_, "new key");
        RequireNonNegative(ttl_);
    }

    std::string RenameCommand::ToString() const {
        return fmt::format("RenameCommand[key={}, new_key={}, parent_key={}, check_parent_attrs={}, pass={}, ttl={}s]",
                           key_, new_key_, parent_key_, check_parent_attrs_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> RenameCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().Rename(handle, key_, new_key_, parent_key_, check_parent_attrs_, pass_, ttl_);
        return finish(session, ok, ok);
    }

}// namespace Kdc::Commands
