#pragma once
#include "command/commands.hpp"
#include "common/native_log.hpp"
#include "config/ClusterConfig.h"
#include "core/macros.hpp"
#include "session/Session.hpp"
#include <optional>
#include <string>

namespace Kdc {

    /**
     * 一次性调用的门面：每个操作打开一个新的 Session，执行一条命令，
     * 任何退出路径上都会关闭该 Session。
     * 同时负责把原生日志级别透传给后端。
     */
    class KDC_API Cluster {
    public:
        static Cluster Of(const std::string &path,
                          u16 port = ClusterConfig::kDefaultPort,
                          const std::string &cuk = "",
                          bool auto_rejoin = ClusterConfig::kDefaultAutoRejoin,
                          bool retry_rejoin_forever = ClusterConfig::kDefaultRetryRejoinForever,
                          bool cleanup = ClusterConfig::kDefaultCleanup);

        // 配置中带有原生日志文件时立即应用原生日志设置
        explicit Cluster(const ClusterConfig &config);

        const ClusterConfig &GetConfig() const { return config_; }

        // 未找到返回 nullopt，调用失败抛出 OperationError
        std::optional<std::string> Get(const std::string &key) const;
        bool Set(const std::string &key, const std::string &value) const;
        // 键本来就不存在也视为删除成功
        bool Remove(const std::string &key) const;
        bool SetSubkeys(const std::string &key, const StringList &subkeys) const;
        // 没有子键时返回空列表，调用失败抛出 OperationError
        StringList GetSubkeys(const std::string &key) const;
        bool ClearSubkeys(const std::string &key) const;

        // 在短生命周期的 Session 上执行任意命令
        template<typename T>
        Commands::Result<T> Execute(const Commands::Command<T> &command) const {
            Session session = Session::Open(config_);
            return command.Execute(session);
        }

        /**
         * 设置所有原生层的调试文件，再按栈级别逐级打开日志。
         * pathname 为空抛出 InvalidArgument；后端拒绝调试文件时返回 false 并撤销已设置的文件。
         */
        bool SetNativeLogLevel(const std::string &pathname, NativeStackLogLevel stack_level, NativeLogLevel level);
        // 取消调试文件并恢复缺省级别
        void InitNativeLog();

        NativeLogLevel GetNativeLogLevel() const { return native_log_level_; }
        NativeStackLogLevel GetNativeStackLogLevel() const { return native_stack_log_level_; }

        std::string ToString() const;

    private:
        void applyNativeLogLevel(Backend &backend) const;

        ClusterConfig config_;
        NativeLogLevel native_log_level_ = ClusterConfig::kDefaultNativeLogLevel;
        NativeStackLogLevel native_stack_log_level_ = ClusterConfig::kDefaultNativeStackLogLevel;
    };

}// namespace Kdc
