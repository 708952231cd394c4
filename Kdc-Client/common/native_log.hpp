#pragma once

#include <string>

namespace Kdc {

    // 原生库日志的严重级别
    enum class NativeLogLevel {
        Silent,
        Error,
        Warning,
        Info,
        Dump
    };

    /**
     * 原生日志栈级别，逐级包含：
     *   Comlog     -> 通信日志
     *   Client     -> 通信日志 + 客户端库
     *   Membership -> 通信日志 + 客户端库 + 成员管理进程
     *   Storage    -> 全部层（含存储库）
     * Silent 关闭所有层。
     */
    enum class NativeStackLogLevel {
        Silent,
        Comlog,
        Client,
        Membership,
        Storage
    };

    // 拥有独立调试文件和级别的原生层
    enum class NativeLayer {
        Client,
        Membership,
        Storage
    };

    std::string ToString(NativeLogLevel level);
    std::string ToString(NativeStackLogLevel level);
    std::string ToString(NativeLayer layer);

    // 无法识别时抛出 InvalidArgument
    NativeLogLevel ParseNativeLogLevel(const std::string &text);
    NativeStackLogLevel ParseNativeStackLogLevel(const std::string &text);

}// namespace Kdc
