#pragma once
#include "common/native_log.hpp"
#include "core/types.hpp"
#include <optional>
#include <string>

namespace Kdc {

    /**
     * 集群连接配置：成员管理进程的配置文件、控制端口、CUK 以及重连/清理选项。
     * 构造后不可修改，Session 持有一份拷贝。
     */
    class ClusterConfig {
    public:
        static constexpr u16 kDefaultPort = 8031;
        static constexpr bool kDefaultAutoRejoin = true;
        static constexpr bool kDefaultRetryRejoinForever = true;
        static constexpr bool kDefaultCleanup = true;
        static constexpr NativeLogLevel kDefaultNativeLogLevel = NativeLogLevel::Error;
        static constexpr NativeStackLogLevel kDefaultNativeStackLogLevel = NativeStackLogLevel::Silent;

        /**
         * 校验并构造配置
         * - path 为空抛出 InvalidArgument
         * - 文件不存在抛出 ConnectionError
         * 保存的路径为绝对路径
         */
        static ClusterConfig Of(const std::string &path,
                                u16 port = kDefaultPort,
                                const std::string &cuk = "",
                                bool auto_rejoin = kDefaultAutoRejoin,
                                bool retry_rejoin_forever = kDefaultRetryRejoinForever,
                                bool cleanup = kDefaultCleanup);

        // 返回带原生日志设置的副本，log_file 为空表示不写原生日志
        ClusterConfig WithNativeLog(const std::string &log_file,
                                    NativeStackLogLevel stack_level,
                                    NativeLogLevel level) const;

        const std::string &GetPath() const { return path_; }
        u16 GetPort() const { return port_; }
        const std::string &GetCuk() const { return cuk_; }
        bool IsAutoRejoin() const { return auto_rejoin_; }
        bool IsRetryRejoinForever() const { return retry_rejoin_forever_; }
        bool IsCleanup() const { return cleanup_; }
        NativeLogLevel GetNativeLogLevel() const { return native_log_level_; }
        NativeStackLogLevel GetNativeStackLogLevel() const { return native_stack_log_level_; }
        const std::optional<std::string> &GetNativeLogFile() const { return native_log_file_; }

        std::string ToString() const;

    private:
        ClusterConfig() = default;

        std::string path_;
        u16 port_ = kDefaultPort;
        std::string cuk_;
        bool auto_rejoin_ = kDefaultAutoRejoin;
        bool retry_rejoin_forever_ = kDefaultRetryRejoinForever;
        bool cleanup_ = kDefaultCleanup;
        NativeLogLevel native_log_level_ = kDefaultNativeLogLevel;
        NativeStackLogLevel native_stack_log_level_ = kDefaultNativeStackLogLevel;
        std::optional<std::string> native_log_file_;
    };

}// namespace Kdc
