#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace Kdc {

    using i8 = int8_t;
    using i16 = int16_t;
    using i32 = int32_t;
    using i64 = int64_t;

    using u8 = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;

    using String = std::string;
    template<typename T>
    using Vector = std::vector<T>;
    template<typename T>
    using UniquePtr = std::unique_ptr<T>;
    template<typename T>
    using SharedPtr = std::shared_ptr<T>;

    // CAS 单元与编解码使用的原始字节序列
    using Bytes = std::vector<u8>;
    using StringList = std::vector<std::string>;
    using StringMap = std::map<std::string, std::string>;

}// namespace Kdc
