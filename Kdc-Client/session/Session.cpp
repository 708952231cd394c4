#include "Session.hpp"
#include "backend/Library.hpp"
#include "common/errors.hpp"
#include "utils/logger.hpp"
#include <mutex>

namespace Kdc {

    namespace {
        // 原生 open 调用不可重入，整个进程串行打开
        std::mutex g_open_mutex;
    }// namespace

    Session::Session(std::shared_ptr<Backend> backend, const ClusterConfig &config, Handle handle)
        : backend_(std::move(backend)), config_(config), handle_(handle), state_(State::Open) {}

    Session::~Session() {
        Close();
    }

    Session::Session(Session &&other) noexcept
        : MoveOnly(std::move(other)),
          backend_(std::move(other.backend_)),
          config_(std::move(other.config_)),
          handle_(other.handle_),
          state_(other.state_) {
        other.handle_ = kInvalidHandle;
        other.state_ = State::Closed;
    }

    Session &Session::operator=(Session &&other) noexcept {
        if (this != &other) {
            Close();
            backend_ = std::move(other.backend_);
            config_ = std::move(other.config_);
            handle_ = other.handle_;
            state_ = other.state_;
            other.handle_ = kInvalidHandle;
            other.state_ = State::Closed;
        }
        return *this;
    }

    Session Session::Open(const ClusterConfig &config) {
        std::lock_guard<std::mutex> lock(g_open_mutex);

        auto backend = Library::GetInstance().Acquire();
        Handle handle = backend->Open(config);
        if (handle <= kInvalidHandle) {
            KDC_LOG_ERROR("Failed to open session: {}", config.ToString());
            throw ConnectionError("failed to open session with " + config.GetPath() +
                                  " (handle " + std::to_string(handle) + ")");
        }
        KDC_LOG_DEBUG("Session opened, handle {}", handle);
        return Session(std::move(backend), config, handle);
    }

    void Session::checkOpen() const {
        if (state_ != State::Open) {
            throw SessionClosed("session is " + Kdc::ToString(state_));
        }
    }

    Handle Session::GetHandle() const {
        checkOpen();
        return handle_;
    }

    Backend &Session::GetBackend() const {
        checkOpen();
        return *backend_;
    }

    const ClusterConfig &Session::GetConfig() const {
        if (!config_) {
            throw SessionClosed("session has no configuration");
        }
        return *config_;
    }

    void Session::Close() {
        if (state_ != State::Open) {
            if (state_ == State::Closed && handle_ != kInvalidHandle) {
                KDC_LOG_DEBUG("Session handle {} already closed", handle_);
            }
            return;
        }
        state_ = State::Closed;
        try {
            if (!backend_->Close(handle_, config_->IsCleanup())) {
                KDC_LOG_ERROR("Failed to close session handle {}", handle_);
            } else {
                KDC_LOG_DEBUG("Session closed, handle {}", handle_);
            }
        } catch (const std::exception &e) {
            KDC_LOG_ERROR("Exception while closing session handle {}: {}", handle_, e.what());
        }
    }

    std::string Session::ToString() const {
        return fmt::format("Session[handle={}, state={}, config={}]",
                           handle_, Kdc::ToString(state_), config_ ? config_->ToString() : "none");
    }

    std::string ToString(Session::State state) {
        switch (state) {
            case Session::State::Unopened:
                return "UNOPENED";
            case Session::State::Open:
                return "OPEN";
            case Session::State::Closed:
                return "CLOSED";
        }
        return "UNKNOWN";
    }

}// namespace Kdc
