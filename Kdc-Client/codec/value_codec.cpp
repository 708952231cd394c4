#include "value_codec.hpp"
#include "common/errors.hpp"

namespace Kdc::Codec {

    size_t Width(DataType type) {
        return static_cast<size_t>(type);
    }

    DataType DataTypeForWidth(size_t width) {
        switch (width) {
            case 1:
                return DataType::Byte;
            case 2:
                return DataType::Short;
            case 4:
                return DataType::Int;
            case 8:
                return DataType::Long;
            default:
                throw InvalidArgument("unsupported CAS width: " + std::to_string(width));
        }
    }

    std::string ToString(DataType type) {
        switch (type) {
            case DataType::Byte:
                return "BYTE";
            case DataType::Short:
                return "SHORT";
            case DataType::Int:
                return "INT";
            case DataType::Long:
                return "LONG";
        }
        return "UNKNOWN";
    }

    void CheckWidth(const Bytes &bytes, size_t width) {
        if (bytes.size() != width) {
            throw InvalidArgument("expected " + std::to_string(width) + " bytes, got " + std::to_string(bytes.size()));
        }
    }

    Bytes ByteToBytes(i8 value) { return ToBytes<i8>(value); }
    Bytes ShortToBytes(i16 value) { return ToBytes<i16>(value); }
    Bytes IntToBytes(i32 value) { return ToBytes<i32>(value); }
    Bytes LongToBytes(i64 value) { return ToBytes<i64>(value); }

    i8 BytesToByte(const Bytes &bytes) { return FromBytes<i8>(bytes); }
    i16 BytesToShort(const Bytes &bytes) { return FromBytes<i16>(bytes); }
    i32 BytesToInt(const Bytes &bytes) { return FromBytes<i32>(bytes); }
    i64 BytesToLong(const Bytes &bytes) { return FromBytes<i64>(bytes); }

    u64 ToUnsigned(const Bytes &bytes) {
        DataTypeForWidth(bytes.size());
        u64 bits = 0;
        for (size_t i = bytes.size(); i > 0; --i) {
            bits = (bits << 8) | bytes[i - 1];
        }
        return bits;
    }

    Bytes FromUnsigned(u64 value, DataType type) {
        Bytes out(Width(type));
        for (auto &b: out) {
            b = static_cast<u8>(value & 0xFFu);
            value >>= 8;
        }
        return out;
    }

}// namespace Kdc::Codec
