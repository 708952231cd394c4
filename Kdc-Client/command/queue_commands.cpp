#include "queue_commands.hpp"

namespace Kdc::Commands {

    namespace {
        size_t CheckedCount(long count) {
            if (count <= 0) {
                throw InvalidArgument("count should be positive: " + std::to_string(count));
            }
            return static_cast<size_t>(count);
        }
    }// namespace

    QueueAddCommand::QueueAddCommand(const std::string &prefix, const std::string &value,
                                     const std::string &pass, std::chrono::seconds ttl)
        : prefix_(prefix), value_(value), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(prefix_, "prefix");
        RequireNonEmpty(value_, "value");
        RequireNonNegative(ttl_);
    }

    std::string QueueAddCommand::ToString() const {
        return fmt::format("QueueAddCommand[prefix={}, value={}, pass={}, ttl={}s]",
                           prefix_, value_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> QueueAddCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().QueuePush(handle, prefix_, value_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    QueueRemoveCommand::QueueRemoveCommand(const std::string &prefix, long count, bool fifo,
                                           const std::string &pass, bool need_return_value)
        : prefix_(prefix), count_(CheckedCount(count)), fifo_(fifo), pass_(pass),
          need_return_value_(need_return_value) {
        RequireNonEmpty(prefix_, "prefix");
    }

    std::string QueueRemoveCommand::ToString() const {
        return fmt::format("QueueRemoveCommand[prefix={}, count={}, fifo={}, pass={}, need_return_value={}]",
                           prefix_, count_, fifo_, MaskPass(pass_), need_return_value_);
    }

    Result<StringList> QueueRemoveCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        Backend &backend = session.GetBackend();

        if (!need_return_value_) {
            bool ok = backend.QueueRemove(handle, prefix_, count_, fifo_, pass_);
            return finish(session, ok, StringList());
        }

        StringList values;
        bool ok = true;
        for (size_t i = 0; i < count_; ++i) {
            auto value = backend.QueuePop(handle, prefix_, fifo_, pass_);
            if (!value) {
                ok = false;
                break;
            }
            values.push_back(std::move(*value));
        }
        return finish(session, ok, std::move(values));
    }

    KeyQueueAddCommand::KeyQueueAddCommand(const std::string &prefix, const std::string &key,
                                           const std::string &value, const std::string &pass,
                                           std::chrono::seconds ttl)
        : prefix_(prefix), key_(key), value_(value), pass_(pass), ttl_(ttl) {
        RequireNonEmpty(prefix_, "prefix");
        RequireNonEmpty(key_, "key");
        RequireNonEmpty(value_, "value");
        RequireNonNegative(ttl_);
    }

    std::string KeyQueueAddCommand::ToString() const {
        return fmt::format("KeyQueueAddCommand[prefix={}, key={}, value={}, pass={}, ttl={}s]",
                           prefix_, key_, value_, MaskPass(pass_), ttl_.count());
    }

    Result<bool> KeyQueueAddCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        bool ok = session.GetBackend().KeyQueuePush(handle, prefix_, key_, value_, pass_, ttl_);
        return finish(session, ok, ok);
    }

    KeyQueueRemoveCommand::KeyQueueRemoveCommand(const std::string &prefix, long count, bool fifo,
                                                 const std::string &pass, bool need_return_value)
        : prefix_(prefix), count_(CheckedCount(count)), fifo_(fifo), pass_(pass),
          need_return_value_(need_return_value) {
        RequireNonEmpty(prefix_, "prefix");
    }

    std::string KeyQueueRemoveCommand::ToString() const {
        return fmt::format("KeyQueueRemoveCommand[prefix={}, count={}, fifo={}, pass={}, need_return_value={}]",
                           prefix_, count_, fifo_, MaskPass(pass_), need_return_value_);
    }

    Result<StringMap> KeyQueueRemoveCommand::Execute(Session &session) const {
        Handle handle = requireOpen(session);
        Backend &backend = session.GetBackend();

        if (!need_return_value_) {
            bool ok = backend.KeyQueueRemove(handle, prefix_, count_, fifo_, pass_);
            return finish(session, ok, StringMap());
        }

        StringMap pairs;
        bool ok = true;
        for (size_t i = 0; i < count_; ++i) {
            auto pair = backend.KeyQueuePop(handle, prefix_, fifo_, pass_);
            if (!pair) {
                ok = false;
                break;
            }
            pairs[pair->first] = std::move(pair->second);
        }
        return finish(session, ok, std::move(pairs));
    }

}// namespace Kdc::Commands
