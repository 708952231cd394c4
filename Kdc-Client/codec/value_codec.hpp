#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <string>
#include <type_traits>

namespace Kdc::Codec {

    // CAS 单元支持的整数宽度，枚举值即字节数
    enum class DataType {
        Byte = 1,
        Short = 2,
        Int = 4,
        Long = 8
    };

    size_t Width(DataType type);
    // 只接受 1/2/4/8，其余宽度抛出 InvalidArgument
    DataType DataTypeForWidth(size_t width);
    std::string ToString(DataType type);

    /**
     * 定长小端编码：最低有效字节在前，与主机字节序无关。
     * 解码时输入长度必须等于目标类型宽度，否则抛出 InvalidArgument。
     */
    Bytes ByteToBytes(i8 value);
    Bytes ShortToBytes(i16 value);
    Bytes IntToBytes(i32 value);
    Bytes LongToBytes(i64 value);

    i8 BytesToByte(const Bytes &bytes);
    i16 BytesToShort(const Bytes &bytes);
    i32 BytesToInt(const Bytes &bytes);
    i64 BytesToLong(const Bytes &bytes);

    // 按单元宽度解释为无符号数（用于回绕的自增/自减）
    u64 ToUnsigned(const Bytes &bytes);
    Bytes FromUnsigned(u64 value, DataType type);

    // 校验长度，失败时抛出 InvalidArgument
    void CheckWidth(const Bytes &bytes, size_t width);

    template<typename T>
    Bytes ToBytes(T value) {
        static_assert(std::is_integral_v<T>, "ToBytes requires an integral type");
        static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                      "ToBytes supports 1/2/4/8 byte integers only");
        using U = std::make_unsigned_t<T>;
        U bits = static_cast<U>(value);
        Bytes out(sizeof(T));
        for (size_t i = 0; i < sizeof(T); ++i) {
            out[i] = static_cast<u8>(bits & 0xFFu);
            if constexpr (sizeof(T) > 1) {
                bits = static_cast<U>(bits >> 8);
            }
        }
        return out;
    }

    template<typename T>
    T FromBytes(const Bytes &bytes) {
        static_assert(std::is_integral_v<T>, "FromBytes requires an integral type");
        static_assert(sizeof(T) == 1 || sizeof(T) == 2 || sizeof(T) == 4 || sizeof(T) == 8,
                      "FromBytes supports 1/2/4/8 byte integers only");
        CheckWidth(bytes, sizeof(T));
        using U = std::make_unsigned_t<T>;
        U bits = 0;
        for (size_t i = sizeof(T); i > 0; --i) {
            if constexpr (sizeof(T) > 1) {
                bits = static_cast<U>(bits << 8);
            }
            bits = static_cast<U>(bits | bytes[i - 1]);
        }
        return static_cast<T>(bits);
    }

}// namespace Kdc::Codec
