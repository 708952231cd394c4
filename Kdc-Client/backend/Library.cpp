#include "Library.hpp"
#include "MemoryBackend.hpp"
#include "utils/logger.hpp"

namespace Kdc {

    std::shared_ptr<Backend> Library::Acquire() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!backend_) {
            backend_ = std::make_shared<MemoryBackend>();
            KDC_LOG_INFO("Native library initialized with in-process backend");
        }
        return backend_;
    }

    void Library::Install(std::shared_ptr<Backend> backend) {
        std::lock_guard<std::mutex> lock(mutex_);
        backend_ = std::move(backend);
        KDC_LOG_INFO("Native library backend {}", backend_ ? "installed" : "uninstalled");
    }

    void Library::Shutdown() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (backend_) {
            backend_.reset();
            KDC_LOG_INFO("Native library shut down");
        }
    }

    bool Library::IsLoaded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return backend_ != nullptr;
    }

}// namespace Kdc
