#include "Cluster.hpp"
#include "backend/Library.hpp"
#include "common/errors.hpp"
#include "utils/logger.hpp"
#include "utils/scope_guard.hpp"
#include <filesystem>
#include <vector>

namespace Kdc {

    namespace {
        const std::vector<NativeLayer> kAllLayers = {NativeLayer::Client, NativeLayer::Membership, NativeLayer::Storage};

        // 栈级别达到该层时才打开该层的日志
        NativeStackLogLevel EnablingStackLevel(NativeLayer layer) {
            switch (layer) {
                case NativeLayer::Client:
                    return NativeStackLogLevel::Client;
                case NativeLayer::Membership:
                    return NativeStackLogLevel::Membership;
                case NativeLayer::Storage:
                    return NativeStackLogLevel::Storage;
            }
            return NativeStackLogLevel::Storage;
        }

        // 存储层没有 dump 级别
        NativeLogLevel EffectiveLevel(NativeLayer layer, NativeLogLevel level) {
            if (layer == NativeLayer::Storage && level == NativeLogLevel::Dump) {
                return NativeLogLevel::Info;
            }
            return level;
        }
    }// namespace

    Cluster Cluster::Of(const std::string &path, u16 port, const std::string &cuk,
                        bool auto_rejoin, bool retry_rejoin_forever, bool cleanup) {
        return Cluster(ClusterConfig::Of(path, port, cuk, auto_rejoin, retry_rejoin_forever, cleanup));
    }

    Cluster::Cluster(const ClusterConfig &config) : config_(config) {
        if (config_.GetNativeLogFile()) {
            if (!SetNativeLogLevel(*config_.GetNativeLogFile(), config_.GetNativeStackLogLevel(),
                                   config_.GetNativeLogLevel())) {
                KDC_LOG_WARN("Native log settings from config were not applied: {}", config_.ToString());
            }
        }
    }

    std::optional<std::string> Cluster::Get(const std::string &key) const {
        auto result = Execute(Commands::GetCommand(key));
        switch (result.GetStatus()) {
            case Status::Ok:
                return result.GetValue();
            case Status::NotFound:
                return std::nullopt;
            case Status::Failed:
                break;
        }
        throw OperationError(result.GetCmd(), result.GetCode(), result.GetSubcode());
    }

    bool Cluster::Set(const std::string &key, const std::string &value) const {
        return Execute(Commands::SetCommand(key, value)).IsSuccess();
    }

    bool Cluster::Remove(const std::string &key) const {
        auto result = Execute(Commands::RemoveCommand(key));
        return result.GetStatus() != Status::Failed;
    }

    bool Cluster::SetSubkeys(const std::string &key, const StringList &subkeys) const {
        return Execute(Commands::SetSubkeysCommand(key, subkeys)).IsSuccess();
    }

    StringList Cluster::GetSubkeys(const std::string &key) const {
        auto result = Execute(Commands::GetSubkeysCommand(key));
        if (result.GetStatus() == Status::Failed) {
            throw OperationError(result.GetCmd(), result.GetCode(), result.GetSubcode());
        }
        return result.GetValue();
    }

    bool Cluster::ClearSubkeys(const std::string &key) const {
        return Execute(Commands::ClearSubkeysCommand(key)).IsSuccess();
    }

    bool Cluster::SetNativeLogLevel(const std::string &pathname, NativeStackLogLevel stack_level, NativeLogLevel level) {
        if (pathname.empty()) {
            throw InvalidArgument("native log file should not be empty");
        }
        const std::string abs_path = std::filesystem::absolute(pathname).lexically_normal().string();
        auto backend = Library::GetInstance().Acquire();

        std::vector<NativeLayer> applied;
        auto rollback = MakeScopeGuard([&]() {
            for (auto layer: applied) {
                if (!backend->UnsetDebugFile(layer)) {
                    KDC_LOG_ERROR("Failed to roll back {} debug file", Kdc::ToString(layer));
                }
            }
        });
        for (auto layer: kAllLayers) {
            if (!backend->SetDebugFile(layer, abs_path)) {
                KDC_LOG_ERROR("Failed to set {} debug file to {}", Kdc::ToString(layer), abs_path);
                return false;
            }
            applied.push_back(layer);
        }
        rollback.Dismiss();

        KDC_LOG_INFO("Old native log level: stack={} level={}",
                     Kdc::ToString(native_stack_log_level_), Kdc::ToString(native_log_level_));
        native_stack_log_level_ = stack_level;
        native_log_level_ = level;
        KDC_LOG_INFO("New native log level: stack={} level={}",
                     Kdc::ToString(native_stack_log_level_), Kdc::ToString(native_log_level_));

        applyNativeLogLevel(*backend);
        return true;
    }

    void Cluster::InitNativeLog() {
        auto backend = Library::GetInstance().Acquire();
        for (auto layer: kAllLayers) {
            if (!backend->UnsetDebugFile(layer)) {
                KDC_LOG_ERROR("Failed to unset {} debug file", Kdc::ToString(layer));
            }
        }
        native_stack_log_level_ = ClusterConfig::kDefaultNativeStackLogLevel;
        native_log_level_ = ClusterConfig::kDefaultNativeLogLevel;
        applyNativeLogLevel(*backend);
    }

    // 逐级打开：未达到的层设为 Silent，Silent 栈关闭全部层
    void Cluster::applyNativeLogLevel(Backend &backend) const {
        const bool stack_enabled = native_stack_log_level_ != NativeStackLogLevel::Silent;
        backend.SetComLog(stack_enabled && native_log_level_ != NativeLogLevel::Silent);

        for (auto layer: kAllLayers) {
            const bool enabled = stack_enabled &&
                                 static_cast<int>(native_stack_log_level_) >= static_cast<int>(EnablingStackLevel(layer));
            backend.SetDebugLevel(layer, enabled ? EffectiveLevel(layer, native_log_level_) : NativeLogLevel::Silent);
        }
    }

    std::string Cluster::ToString() const {
        return fmt::format("Cluster[config={}, native_stack_log_level={}, native_log_level={}]",
                           config_.ToString(), Kdc::ToString(native_stack_log_level_), Kdc::ToString(native_log_level_));
    }

}// namespace Kdc
