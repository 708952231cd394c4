#include "response_code.hpp"

namespace Kdc {

    std::string ToString(ResponseCode code) {
        switch (code) {
            case ResponseCode::NoResponse:
                return "NO_RESPONSE";
            case ResponseCode::Success:
                return "SUCCESS";
            case ResponseCode::Error:
                return "ERROR";
        }
        return "UNKNOWN(" + std::to_string(static_cast<i64>(code)) + ")";
    }

    std::string ToString(ResponseSubcode subcode) {
        switch (subcode) {
            case ResponseSubcode::Nothing:
                return "NOTHING";
            case ResponseSubcode::InvalidHandle:
                return "INVALID_HANDLE";
            case ResponseSubcode::InvalidArgument:
                return "INVALID_ARGUMENT";
            case ResponseSubcode::NoData:
                return "NO_DATA";
            case ResponseSubcode::BadPassword:
                return "BAD_PASSWORD";
            case ResponseSubcode::TypeMismatch:
                return "TYPE_MISMATCH";
            case ResponseSubcode::CasMismatch:
                return "CAS_MISMATCH";
            case ResponseSubcode::ParentMismatch:
                return "PARENT_MISMATCH";
        }
        return "UNKNOWN(" + std::to_string(static_cast<i64>(subcode)) + ")";
    }

    std::string ToString(Status status) {
        switch (status) {
            case Status::Ok:
                return "OK";
            case Status::NotFound:
                return "NOT_FOUND";
            case Status::Failed:
                return "FAILED";
        }
        return "UNKNOWN";
    }

    Status StatusOf(bool success, ResponseSubcode subcode) {
        if (success) {
            return Status::Ok;
        }
        return subcode == ResponseSubcode::NoData ? Status::NotFound : Status::Failed;
    }

}// namespace Kdc
