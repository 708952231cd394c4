#pragma once
#include "common/response_code.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <string>
#include <utility>

namespace Kdc::Commands {

    /**
     * 一次命令执行的结果，构造后不可修改。
     * 失败不会抛出异常，而是 IsSuccess() == false 并保留响应码，
     * GetStatus() 区分"未找到"与其他失败。
     */
    template<typename T>
    class Result {
    public:
        Result(std::string cmd, bool success, T value, ResponseCode code, ResponseSubcode subcode)
            : cmd_(std::move(cmd)), success_(success), value_(std::move(value)), code_(code), subcode_(subcode) {}

        const std::string &GetCmd() const { return cmd_; }
        bool IsSuccess() const { return success_; }
        const T &GetValue() const { return value_; }
        ResponseCode GetCode() const { return code_; }
        ResponseSubcode GetSubcode() const { return subcode_; }
        Status GetStatus() const { return StatusOf(success_, subcode_); }

        std::string ToString() const {
            return fmt::format("Result[cmd={}, success={}, value={}, code={}, subcode={}]",
                               cmd_, success_, value_, Kdc::ToString(code_), Kdc::ToString(subcode_));
        }

    private:
        std::string cmd_;
        bool success_;
        T value_;
        ResponseCode code_;
        ResponseSubcode subcode_;
    };

}// namespace Kdc::Commands
