#pragma once
#include "common/errors.hpp"
#include "result.hpp"
#include "session/Session.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <string>

namespace Kdc::Commands {

    // 命令参数的缺省值
    constexpr size_t kDefaultRemoveElementSize = 1;
    constexpr bool kDefaultIsFifo = true;
    constexpr bool kDefaultNeedReturnValue = true;
    constexpr bool kDefaultIsIncrement = true;
    constexpr bool kDefaultCheckParentAttrs = false;
    constexpr bool kDefaultRemoveRecursively = false;
    constexpr bool kDefaultIsClearSubkeys = false;
    constexpr bool kDefaultRemoveSubkeys = false;
    constexpr std::chrono::seconds kDefaultExpiration{0};// 0 表示不过期
    // 口令为空表示不使用口令
    inline const std::string kDefaultPass;

    // 命令基类
    class ICommand {
    public:
        virtual ~ICommand() = default;
        virtual std::string Name() const = 0;
        // 日志用的字段转储，口令会被遮掩
        virtual std::string ToString() const = 0;
    };

    // 带返回类型的命令：构造时校验参数，Execute 发出后端调用并读回响应码
    template<typename T>
    class Command : public ICommand {
    public:
        using ValueType = T;

        virtual Result<T> Execute(Session &session) const = 0;

    protected:
        // 会话未打开时抛出 InvalidArgument
        Handle requireOpen(const Session &session) const {
            if (!session.IsOpen()) {
                throw InvalidArgument(Name() + ": session is not open");
            }
            return session.GetHandle();
        }

        // 从同一个句柄读回响应码并打包结果
        Result<T> finish(Session &session, bool success, T value) const {
            Backend &backend = session.GetBackend();
            Handle handle = session.GetHandle();
            Result<T> result(Name(), success, std::move(value),
                             backend.GetResponseCode(handle), backend.GetResponseSubcode(handle));
            if (!success) {
                if (result.GetStatus() == Status::NotFound) {
                    KDC_LOG_WARN("{} found no data: {}", Name(), ToString());
                } else {
                    KDC_LOG_ERROR("{} failed: {} code={} subcode={}", Name(), ToString(),
                                  Kdc::ToString(result.GetCode()), Kdc::ToString(result.GetSubcode()));
                }
            }
            return result;
        }
    };

    // 参数校验工具
    inline void RequireNonEmpty(const std::string &value, const char *what) {
        if (value.empty()) {
            throw InvalidArgument(std::string(what) + " should not be empty");
        }
    }

    inline void RequireNonNegative(std::chrono::seconds ttl) {
        if (ttl.count() < 0) {
            throw InvalidArgument("expiration should not be negative: " + std::to_string(ttl.count()));
        }
    }

    inline std::string MaskPass(const std::string &pass) {
        return pass.empty() ? "" : "****";
    }

}// namespace Kdc::Commands
