#pragma once
#include "common/native_log.hpp"
#include "utils/logger.hpp"
#include <cstdint>
#include <string>

namespace Kdc::apps {

    // 配置源接口（定义所有配置项的访问方式）
    class IConfigSource {
    public:
        virtual ~IConfigSource() = default;

        // 初始化配置（命令行解析/文件读取等）
        virtual bool initialize(int argc, char *argv[]) = 0;

        // 集群连接
        virtual std::string getClusterConfigPath() const = 0;
        virtual uint16_t getPort() const = 0;
        virtual std::string getCuk() const = 0;
        virtual bool getAutoRejoin() const = 0;
        virtual bool getRetryRejoinForever() const = 0;
        virtual bool getCleanup() const = 0;

        // 本地日志
        virtual Kdc::LogLevel getLogLevel() const = 0;
        virtual bool getEnableLoggingFile() const = 0;
        virtual std::string getLogDir() const = 0;

        // 原生日志
        virtual NativeLogLevel getNativeLogLevel() const = 0;
        virtual NativeStackLogLevel getNativeStackLogLevel() const = 0;
        virtual std::string getNativeLogFile() const = 0;

        virtual void setLogLevel(Kdc::LogLevel level) = 0;
    };

}// namespace Kdc::apps
