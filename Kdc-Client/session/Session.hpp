#pragma once
#include "backend/Backend.hpp"
#include "config/ClusterConfig.h"
#include "core/macros.hpp"
#include "core/noncopyable.hpp"
#include <memory>
#include <optional>
#include <string>

namespace Kdc {

    /**
     * 与集群之间的一条连接，持有一个原生句柄。
     * 状态单向迁移：Unopened -> Open -> Closed。
     * 只允许移动，被移走的对象处于 Closed 状态；析构时自动关闭。
     * 不支持多个线程同时使用同一个 Session。
     */
    class KDC_API Session : private MoveOnly {
    public:
        enum class State {
            Unopened,
            Open,
            Closed
        };

        Session() = default;
        ~Session();

        Session(Session &&other) noexcept;
        Session &operator=(Session &&other) noexcept;

        // 打开会话（进程内串行化），句柄非正时抛出 ConnectionError
        static Session Open(const ClusterConfig &config);

        // 非 Open 状态抛出 SessionClosed
        Handle GetHandle() const;
        Backend &GetBackend() const;
        const ClusterConfig &GetConfig() const;

        bool IsOpen() const { return state_ == State::Open; }
        State GetState() const { return state_; }

        // 释放句柄，失败只记录日志；重复调用无副作用
        void Close();

        std::string ToString() const;

    private:
        Session(std::shared_ptr<Backend> backend, const ClusterConfig &config, Handle handle);

        void checkOpen() const;

        std::shared_ptr<Backend> backend_;
        std::optional<ClusterConfig> config_;
        Handle handle_ = kInvalidHandle;
        State state_ = State::Unopened;
    };

    std::string ToString(Session::State state);

}// namespace Kdc
