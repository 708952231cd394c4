#include "cas_commands.hpp"
#include <fmt/ranges.h>

namespace Kdc::Commands {

    CasInitCommand::CasInitCommand(const std::string &key, i8 value, const std::string &pass, std::chrono::seconds ttl)
        : CasInitCommand(key, Codec::ByteToBytes(value), pass, ttl) {}

    CasInitCommand::CasInitCommand(const std::string &key, i16 value, const std::string &pass, std::chrono::seconds ttl)
        : CasInitCommand(key, Codec::ShortToBytes(value), pass, ttl) {}

    CasInitCommand::CasInitCommand(const std::string &key, i32 value, const std::string &pass, std::chrono::seconds ttl)
        : CasInitCommand(key, Codec::IntToBytes(value), pass, ttl) {}

    CasInitCommand::CasInitCommand(const std::string &key, i64 value, const std::string &pass, std::chrono::seconds ttl)
        : CasInitCommand(key, Codec::LongToBytes(value), pass, ttl) {}

    CasInitCommand::CasInitCommand(const std::string &key, const Bytes &value, const std::string &pass,
                                   std::chrono::seconds ttl)
        : key_(key), value_(value), type_(Codec::DataTypeForWidth(value.size())), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        RequireNonNegative(ttl_);
    }

    std::string CasInitCommand::ToString() const {
        return fmt::format("CasInitCommand[key={}, type={}, value={}, pass={}, ttl={}s]",
                           key_, Codec::ToString(type_), value_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> CasInitCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().CasInit(handle, key_, value_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    CasGetCommand::CasGetCommand(const std::string &key, Codec::DataType type, const std::string &pass)
        : key_(key), type_(type), pass_(pass) {
        RequireNonEmpty(key_, "key");
        Codec::DataTypeForWidth(Codec::Width(type_));
    }

    std::string CasGetCommand::ToString() const {
        return fmt::format("CasGetCommand[key={}, type={}, pass={}]", key_, Codec::ToString(type_), MaskPass(pass_));
    }

    Result<Bytes> CasGetCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        auto value = session.GetBackend().CasGet(handle, key_, type_, pass_);
        bool ok = value.has_value();
        return finish(session, ok, ok ? std::move(*value) : Bytes());
    }

    CasSetCommand::CasSetCommand(const std::string &key, i8 old_value, i8 new_value,
                                 const std::string &pass, std::chrono::seconds ttl)
        : CasSetCommand(key, Codec::ByteToBytes(old_value), Codec::ByteToBytes(new_value), pass, ttl) {}

    CasSetCommand::CasSetCommand(const std::string &key, i16 old_value, i16 new_value,
                                 const std::string &pass, std::chrono::seconds ttl)
        : CasSetCommand(key, Codec::ShortToBytes(old_value), Codec::ShortToBytes(new_value), pass, ttl) {}

    CasSetCommand::CasSetCommand(const std::string &key, i32 old_value, i32 new_value,
                                 const std::string &pass, std::chrono::seconds ttl)
        : CasSetCommand(key, Codec::IntToBytes(old_value), Codec::IntToBytes(new_value), pass, ttl) {}

    CasSetCommand::CasSetCommand(const std::string &key, i64 old_value, i64 new_value,
                                 const std::string &pass, std::chrono::seconds ttl)
        : CasSetCommand(key, Codec::LongToBytes(old_value), Codec::LongToBytes(new_value), pass, ttl) {}

    CasSetCommand::CasSetCommand(const std::string &key, const Bytes &old_value, const Bytes &new_value,
                                 const std::string &pass, std::chrono::seconds ttl)
        : key_(key), old_value_(old_value), new_value_(new_value), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        Codec::DataTypeForWidth(old_value_.size());
        if (old_value_.size() != new_value_.size()) {
            throw InvalidArgument("old and new CAS values differ in width");
        }
        RequireNonNegative(ttl_);
    }

    std::string CasSetCommand::ToString() const {
        return fmt::format("CasSetCommand[key={}, old={}, new={}, pass={}, ttl={}s]",
                           key_, old_value_, new_value_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> CasSetCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().CasSet(handle, key_, old_value_, new_value_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    CasIncDecCommand::CasIncDecCommand(const std::string &key, bool increment, const std::string &pass,
                                       std::chrono::seconds ttl)
        : key_(key), increment_(increment), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(key_, "key");
        RequireNonNegative(ttl_);
    }

    std::string CasIncDecCommand::ToString() const {
        return fmt::format("CasIncDecCommand[key={}, increment={}, pass={}, ttl={}s]",
                           key_, increment_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> CasIncDecCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().CasIncDec(handle, key_, increment_, pass_, ttl_);
        return finish(session, ok, ok);
    }

}// namespace Kdc::Commands
