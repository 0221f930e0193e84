#pragma once

#include "Modbus.Types.hpp"

#include <array>
#include <bit>
#include <cfloat>

namespace modbus {

/**
 * @brief 数据格式描述表项
 *
 * 整数格式的取值范围为 [minValue, maxExclusive)，上界用开区间表示，
 * 保证 int64/uint64 的上界在 double 中可精确表示（2^63、2^64）。
 * 浮点格式的取值范围为 [-maxFinite, maxFinite]。
 */
struct PrecisionTraits {
    Precision precision;
    size_t byteSize;
    bool isInteger;
    double minValue;
    double maxExclusive;
    double maxFinite;
    const char* minText;
    const char* maxText;
    uint64_t (*encode)(double value);
    double (*decode)(uint64_t bits);
};

namespace detail {

inline uint64_t encodeInt16(double v) { return static_cast<uint16_t>(static_cast<int16_t>(v)); }
inline uint64_t encodeUInt16(double v) { return static_cast<uint16_t>(v); }
inline uint64_t encodeInt32(double v) { return static_cast<uint32_t>(static_cast<int32_t>(v)); }
inline uint64_t encodeUInt32(double v) { return static_cast<uint32_t>(v); }
inline uint64_t encodeInt64(double v) { return static_cast<uint64_t>(static_cast<int64_t>(v)); }
inline uint64_t encodeUInt64(double v) { return static_cast<uint64_t>(v); }
inline uint64_t encodeSingle(double v) { return std::bit_cast<uint32_t>(static_cast<float>(v)); }
inline uint64_t encodeDouble(double v) { return std::bit_cast<uint64_t>(v); }

inline double decodeInt16(uint64_t b) { return static_cast<int16_t>(static_cast<uint16_t>(b)); }
inline double decodeUInt16(uint64_t b) { return static_cast<uint16_t>(b); }
inline double decodeInt32(uint64_t b) { return static_cast<int32_t>(static_cast<uint32_t>(b)); }
inline double decodeUInt32(uint64_t b) { return static_cast<uint32_t>(b); }
inline double decodeInt64(uint64_t b) { return static_cast<double>(static_cast<int64_t>(b)); }
inline double decodeUInt64(uint64_t b) { return static_cast<double>(b); }
inline double decodeSingle(uint64_t b) { return std::bit_cast<float>(static_cast<uint32_t>(b)); }
inline double decodeDouble(uint64_t b) { return std::bit_cast<double>(b); }

inline constexpr std::array<PrecisionTraits, 8> PRECISION_TABLE{{
    {Precision::Int16, 2, true, -32768.0, 32768.0, 0.0,
     "-32768", "32767", encodeInt16, decodeInt16},
    {Precision::UInt16, 2, true, 0.0, 65536.0, 0.0,
     "0", "65535", encodeUInt16, decodeUInt16},
    {Precision::Int32, 4, true, -2147483648.0, 2147483648.0, 0.0,
     "-2147483648", "2147483647", encodeInt32, decodeInt32},
    {Precision::UInt32, 4, true, 0.0, 4294967296.0, 0.0,
     "0", "4294967295", encodeUInt32, decodeUInt32},
    {Precision::Int64, 8, true, -9223372036854775808.0, 9223372036854775808.0, 0.0,
     "-9223372036854775808", "9223372036854775807", encodeInt64, decodeInt64},
    {Precision::UInt64, 8, true, 0.0, 18446744073709551616.0, 0.0,
     "0", "18446744073709551615", encodeUInt64, decodeUInt64},
    {Precision::Single, 4, false, 0.0, 0.0, FLT_MAX,
     "-3.4028e+38", "3.4028e+38", encodeSingle, decodeSingle},
    {Precision::Double, 8, false, 0.0, 0.0, DBL_MAX,
     "-1.7977e+308", "1.7977e+308", encodeDouble, decodeDouble},
}};

}  // namespace detail

/**
 * @brief 数据转换器
 *
 * 主机数值 ⇄ Modbus 16 位寄存器。
 * ByteOrder 决定每个寄存器内两个字节的顺序，WordOrder 决定多寄存器数值中寄存器的先后。
 * 以 uint32 0x11223344 为例，线上字节顺序：
 *   Byte=big,    Word=big:    11 22 33 44
 *   Byte=little, Word=big:    22 11 44 33
 *   Byte=big,    Word=little: 33 44 11 22
 *   Byte=little, Word=little: 44 33 22 11
 */
class DataConverter {
public:
    DataConverter() = default;
    DataConverter(Endian byteOrder, Endian wordOrder)
        : byteOrder_(byteOrder), wordOrder_(wordOrder) {}

    Endian byteOrder() const { return byteOrder_; }
    Endian wordOrder() const { return wordOrder_; }
    void setByteOrder(Endian order) { byteOrder_ = order; }
    void setWordOrder(Endian order) { wordOrder_ = order; }

    // ==================== 格式描述 ====================

    static const PrecisionTraits& traits(Precision precision) {
        for (const auto& t : detail::PRECISION_TABLE) {
            if (t.precision == precision) return t;
        }
        throw ValidationException("不支持的 precision: "
            + std::to_string(static_cast<int>(precision)), ErrorCodes::INVALID_PRECISION);
    }

    /** 数据格式占用字节数 */
    static size_t sizeOf(Precision precision) {
        return traits(precision).byteSize;
    }

    /** 数据格式占用寄存器数 */
    static int registerCount(Precision precision) {
        return static_cast<int>(sizeOf(precision) / 2);
    }

    // ==================== 写入编码 ====================

    /**
     * @brief 数值 → 寄存器字（按线上大端顺序序列化即为最终字节）
     * 调用方负责先校验取值范围
     */
    std::vector<uint16_t> convertWriteValues(const std::vector<double>& values, Precision precision) const {
        const auto& t = traits(precision);
        size_t wordsPerValue = t.byteSize / 2;

        std::vector<uint16_t> words;
        words.reserve(values.size() * wordsPerValue);

        for (double value : values) {
            uint64_t bits = t.encode(value);

            // 先按大端字序拆分（高位字在前）
            std::vector<uint16_t> valueWords(wordsPerValue);
            for (size_t i = 0; i < wordsPerValue; ++i) {
                size_t shift = 16 * (wordsPerValue - 1 - i);
                valueWords[i] = static_cast<uint16_t>((bits >> shift) & 0xFFFF);
            }
            if (wordOrder_ == Endian::Little) {
                std::reverse(valueWords.begin(), valueWords.end());
            }
            for (auto w : valueWords) {
                words.push_back(byteOrder_ == Endian::Little ? swapBytes(w) : w);
            }
        }
        return words;
    }

    // ==================== 读取解码 ====================

    /**
     * @brief 线上字节 → 数值（统一返回 double）
     */
    std::vector<double> convertReadValues(const std::vector<uint8_t>& bytes, Precision precision) const {
        const auto& t = traits(precision);
        if (bytes.size() % t.byteSize != 0) {
            throw TransportException("应答数据长度 " + std::to_string(bytes.size())
                + " 不是 " + precisionToString(precision) + " 宽度的整数倍",
                ErrorCodes::MALFORMED_RESPONSE);
        }

        size_t wordsPerValue = t.byteSize / 2;
        std::vector<double> values;
        values.reserve(bytes.size() / t.byteSize);

        for (size_t offset = 0; offset < bytes.size(); offset += t.byteSize) {
            std::vector<uint16_t> valueWords(wordsPerValue);
            for (size_t i = 0; i < wordsPerValue; ++i) {
                uint16_t w = static_cast<uint16_t>((bytes[offset + 2 * i] << 8) | bytes[offset + 2 * i + 1]);
                valueWords[i] = byteOrder_ == Endian::Little ? swapBytes(w) : w;
            }
            if (wordOrder_ == Endian::Little) {
                std::reverse(valueWords.begin(), valueWords.end());
            }

            uint64_t bits = 0;
            for (auto w : valueWords) {
                bits = (bits << 16) | w;
            }
            values.push_back(t.decode(bits));
        }
        return values;
    }

    // ==================== 位打包 ====================

    /**
     * @brief 线圈/离散输入位数据解包（每字节 8 位，低位在前）
     * @return 恰好 count 个 0/1，多余的填充位丢弃
     */
    static std::vector<double> unpackBits(const std::vector<uint8_t>& bytes, size_t count) {
        if (bytes.size() * 8 < count) {
            throw TransportException("位数据不足: 需要 " + std::to_string(count)
                + " 位，实际 " + std::to_string(bytes.size() * 8) + " 位",
                ErrorCodes::MALFORMED_RESPONSE);
        }
        std::vector<double> bits;
        bits.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            bits.push_back(((bytes[i / 8] >> (i % 8)) & 0x01) ? 1.0 : 0.0);
        }
        return bits;
    }

    /** 线圈值打包（unpackBits 的逆操作），非零视为 1 */
    static std::vector<uint8_t> packBits(const std::vector<double>& values) {
        std::vector<uint8_t> bytes((values.size() + 7) / 8, 0);
        for (size_t i = 0; i < values.size(); ++i) {
            if (values[i] != 0.0) {
                bytes[i / 8] |= static_cast<uint8_t>(1u << (i % 8));
            }
        }
        return bytes;
    }

private:
    Endian byteOrder_ = Endian::Big;
    Endian wordOrder_ = Endian::Big;

    static uint16_t swapBytes(uint16_t w) {
        return static_cast<uint16_t>((w << 8) | (w >> 8));
    }
};

}  // namespace modbus
