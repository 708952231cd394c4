#pragma once

#include "response_code.hpp"
#include <stdexcept>
#include <string>

namespace Kdc {

    // 参数非法：构造命令时校验失败，或在未打开的会话上执行命令
    class InvalidArgument : public std::invalid_argument {
    public:
        using std::invalid_argument::invalid_argument;
    };

    // I/O 类错误：连接失败、配置文件不存在
    class ConnectionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // 在未打开或已关闭的会话上取句柄
    class SessionClosed : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    // 一次性读取操作失败（区别于"未找到"），只由 Cluster 抛出
    class OperationError : public std::runtime_error {
    public:
        OperationError(const std::string &cmd, ResponseCode code, ResponseSubcode subcode)
            : std::runtime_error(cmd + " failed: code=" + ToString(code) + ", subcode=" + ToString(subcode)),
              cmd_(cmd), code_(code), subcode_(subcode) {}

        const std::string &GetCmd() const { return cmd_; }
        ResponseCode GetCode() const { return code_; }
        ResponseSubcode GetSubcode() const { return subcode_; }

    private:
        std::string cmd_;
        ResponseCode code_;
        ResponseSubcode subcode_;
    };

}// namespace Kdc
