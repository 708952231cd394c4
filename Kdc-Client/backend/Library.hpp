#pragma once
#include "Backend.hpp"
#include "core/singleton.hpp"
#include <memory>
#include <mutex>

namespace Kdc {

    /**
     * 进程级的原生库句柄表。
     * 首次 Acquire 时才创建默认的 MemoryBackend；Install 可替换为其他传输实现，
     * 已经打开的 Session 继续使用打开时拿到的 Backend。
     */
    class Library : public Singleton<Library> {
        friend class Singleton<Library>;

    public:
        ~Library() = default;

        std::shared_ptr<Backend> Acquire();
        void Install(std::shared_ptr<Backend> backend);
        // 显式释放，下一次 Acquire 重新初始化
        void Shutdown();
        bool IsLoaded() const;

    private:
        Library() = default;

        mutable std::mutex mutex_;
        std::shared_ptr<Backend> backend_;
    };

}// namespace Kdc
