#pragma once

namespace Kdc {

    // 禁止拷贝与移动（Logger、Library 这类进程级对象）
    class NonCopyable {
    protected:
        NonCopyable() = default;
        ~NonCopyable() = default;

        NonCopyable(const NonCopyable &) = delete;
        NonCopyable &operator=(const NonCopyable &) = delete;
    };

    // 只允许移动（持有连接句柄的 Session）
    class MoveOnly {
    protected:
        MoveOnly() = default;
        ~MoveOnly() = default;

        MoveOnly(MoveOnly &&) noexcept = default;
        MoveOnly &operator=(MoveOnly &&) noexcept = default;

        MoveOnly(const MoveOnly &) = delete;
        MoveOnly &operator=(const MoveOnly &) = delete;
    };

}// namespace Kdc
