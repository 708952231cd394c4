#pragma once

#include "core/types.hpp"
#include <string>

namespace Kdc {

    // 主响应码，每次后端调用之后都可以按句柄读回
    enum class ResponseCode : i64 {
        NoResponse = 0,
        Success = 1,
        Error = 2
    };

    // 次响应码，描述失败（或成功）的细节
    enum class ResponseSubcode : i64 {
        Nothing = 0,
        InvalidHandle,
        InvalidArgument,
        NoData,
        BadPassword,
        TypeMismatch,
        CasMismatch,
        ParentMismatch
    };

    // 由响应码推导出的三态结果：成功 / 未找到 / 失败
    enum class Status {
        Ok,
        NotFound,
        Failed
    };

    std::string ToString(ResponseCode code);
    std::string ToString(ResponseSubcode subcode);
    std::string ToString(Status status);

    Status StatusOf(bool success, ResponseSubcode subcode);

}// namespace Kdc
