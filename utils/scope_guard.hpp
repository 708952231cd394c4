#pragma once

#include <core/noncopyable.hpp>
#include <functional>

namespace Kdc {

    // 作用域退出时执行回滚/清理动作，Dismiss 之后不再执行
    class ScopeGuard : private NonCopyable {
    public:
        explicit ScopeGuard(std::function<void()> on_exit_scope)
            : on_exit_scope_(std::move(on_exit_scope)), dismissed_(false) {}

        ~ScopeGuard() {
            if (!dismissed_ && on_exit_scope_) {
                on_exit_scope_();
            }
        }

        // 移动后由新对象负责执行
        ScopeGuard(ScopeGuard &&other) noexcept
            : on_exit_scope_(std::move(other.on_exit_scope_)), dismissed_(other.dismissed_) {
            other.dismissed_ = true;
        }

        ScopeGuard &operator=(ScopeGuard &&) = delete;

        void Dismiss() {
            dismissed_ = true;
        }

        [[nodiscard]] bool IsDismissed() const {
            return dismissed_;
        }

    private:
        std::function<void()> on_exit_scope_;
        bool dismissed_;
    };

    template<typename T>
    ScopeGuard MakeScopeGuard(T &&func) {
        return ScopeGuard(std::forward<T>(func));
    }

}// namespace Kdc
