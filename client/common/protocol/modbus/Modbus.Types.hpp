#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "common/utils/StringUtils.hpp"

namespace modbus {

// ==================== 枚举类型 ====================

/** 目标区域 */
enum class Target {
    Coils,          // FC01 读 / FC05、FC15 写
    Inputs,         // FC02 读（只读）
    HoldingRegs,    // FC03 读 / FC06、FC16 写
    InputRegs       // FC04 读（只读）
};

/** 寄存器数据格式（决定占用寄存器数量与解释方式） */
enum class Precision {
    Int16,      // 1 register
    UInt16,     // 1 register
    Int32,      // 2 registers
    UInt32,     // 2 registers
    Int64,      // 4 registers
    UInt64,     // 4 registers
    Single,     // 2 registers, IEEE-754
    Double      // 4 registers, IEEE-754
};

/** 字节序 / 字序（避免使用 BIG_ENDIAN/LITTLE_ENDIAN，与 Linux <endian.h> 宏冲突） */
enum class Endian {
    Big,
    Little
};

/** Modbus 帧模式 */
enum class FrameMode {
    TCP,    // MBAP Header
    RTU     // SlaveAddr + PDU + CRC16
};

// ==================== 功能码常量 ====================

struct FuncCodes {
    static constexpr uint8_t READ_COILS = 0x01;
    static constexpr uint8_t READ_DISCRETE_INPUTS = 0x02;
    static constexpr uint8_t READ_HOLDING_REGISTERS = 0x03;
    static constexpr uint8_t READ_INPUT_REGISTERS = 0x04;
    static constexpr uint8_t WRITE_SINGLE_COIL = 0x05;
    static constexpr uint8_t WRITE_SINGLE_REGISTER = 0x06;
    static constexpr uint8_t WRITE_MULTIPLE_COILS = 0x0F;
    static constexpr uint8_t WRITE_MULTIPLE_REGISTERS = 0x10;
    static constexpr uint8_t MASK_WRITE_REGISTER = 0x16;
    static constexpr uint8_t READ_WRITE_MULTIPLE_REGISTERS = 0x17;

    /** 异常应答标志位 */
    static constexpr uint8_t EXCEPTION_BIT = 0x80;
    /** 去掉异常位的掩码 */
    static constexpr uint8_t ERROR_MASK = 0x7F;
};

// ==================== 协议范围 ====================

/** 闭区间 [min, max] */
struct CountRange {
    int min;
    int max;
};

/** Modbus Application Protocol V1.1b3 定义的数量范围 */
struct Limits {
    static constexpr CountRange DISCRETE_READ{1, 2000};
    static constexpr CountRange REGISTER_READ{1, 125};
    static constexpr CountRange DISCRETE_WRITE{1, 1968};
    static constexpr CountRange REGISTER_WRITE{1, 123};
    /** FC23 写入部分（请求 PDU 不超过 253 字节） */
    static constexpr CountRange READ_WRITE_WRITE{1, 121};
    static constexpr CountRange SERVER_ID{0, 247};

    /** 客户端地址从 1 开始，线上地址 = address - 1 */
    static constexpr int MIN_ADDRESS = 1;
    static constexpr int MAX_ADDRESS = 65536;

    static constexpr int DEFAULT_SERVER_ID = 1;
    static constexpr int DEFAULT_COUNT = 1;
    static constexpr int BROADCAST_SERVER_ID = 0;
};

// ==================== 帧结构 ====================

/**
 * @brief 已构建的请求帧（ADU）及其元数据
 * 重试时原样重发 frame
 */
struct RequestPacket {
    FrameMode mode = FrameMode::TCP;
    std::vector<uint8_t> frame;
    uint8_t serverId = 1;
    uint8_t functionCode = 0;
    uint16_t transactionId = 0;      // 仅 TCP 模式
    uint16_t address = 0;            // 线上地址（0 起）
    uint16_t quantity = 0;           // 位数或寄存器数
    size_t expectedByteCount = 0;    // 读应答期望的数据字节数（仅读类请求）
    std::vector<uint8_t> expectedEcho; // 写应答应回显的字段（FC05/06/15/16/22）
};

/** 解析后的 Modbus 应答 */
struct ModbusResponse {
    FrameMode mode = FrameMode::TCP;
    uint8_t slaveId = 0;
    uint8_t functionCode = 0;
    std::vector<uint8_t> data;       // 读应答为数据区，写应答为回显字段
    bool isException = false;
    uint8_t exceptionCode = 0;
    uint16_t transactionId = 0;      // 仅 TCP 模式
};

// ==================== 枚举解析函数 ====================

inline Target parseTarget(const std::string& str) {
    auto s = StringUtils::toLower(StringUtils::trim(str));
    if (s == "coils") return Target::Coils;
    if (s == "inputs") return Target::Inputs;
    if (s == "holdingregs") return Target::HoldingRegs;
    if (s == "inputregs") return Target::InputRegs;
    throw ValidationException("无效的 target: '" + str
        + "'（有效值: coils, inputs, holdingregs, inputregs）", ErrorCodes::INVALID_TARGET);
}

inline const char* targetToString(Target target) {
    switch (target) {
        case Target::Coils: return "coils";
        case Target::Inputs: return "inputs";
        case Target::HoldingRegs: return "holdingregs";
        case Target::InputRegs: return "inputregs";
    }
    return "unknown";
}

inline Precision parsePrecision(const std::string& str) {
    auto s = StringUtils::toLower(StringUtils::trim(str));
    if (s == "int16") return Precision::Int16;
    if (s == "uint16") return Precision::UInt16;
    if (s == "int32") return Precision::Int32;
    if (s == "uint32") return Precision::UInt32;
    if (s == "int64") return Precision::Int64;
    if (s == "uint64") return Precision::UInt64;
    if (s == "single") return Precision::Single;
    if (s == "double") return Precision::Double;
    throw ValidationException("无效的 precision: '" + str
        + "'（有效值: int16, uint16, int32, uint32, int64, uint64, single, double）",
        ErrorCodes::INVALID_PRECISION);
}

inline const char* precisionToString(Precision precision) {
    switch (precision) {
        case Precision::Int16: return "int16";
        case Precision::UInt16: return "uint16";
        case Precision::Int32: return "int32";
        case Precision::UInt32: return "uint32";
        case Precision::Int64: return "int64";
        case Precision::UInt64: return "uint64";
        case Precision::Single: return "single";
        case Precision::Double: return "double";
    }
    return "unknown";
}

inline Endian parseEndian(const std::string& str) {
    auto s = StringUtils::toLower(StringUtils::trim(str));
    if (s == Constants::ENDIAN_BIG) return Endian::Big;
    if (s == Constants::ENDIAN_LITTLE) return Endian::Little;
    throw ValidationException("无效的字节序: '" + str
        + "'（有效值: big-endian, little-endian）", ErrorCodes::INVALID_PROPERTY);
}

inline const char* endianToString(Endian endian) {
    return endian == Endian::Little ? Constants::ENDIAN_LITTLE : Constants::ENDIAN_BIG;
}

inline const char* frameModeToString(FrameMode mode) {
    return mode == FrameMode::RTU ? "RTU" : "TCP";
}

// ==================== 目标区域属性 ====================

/** 是否为位类型区域（线圈/离散输入） */
inline bool isBitTarget(Target target) {
    return target == Target::Coils || target == Target::Inputs;
}

/** 区域是否可写 */
inline bool isWritable(Target target) {
    return target == Target::Coils || target == Target::HoldingRegs;
}

/** 目标区域 → 读取功能码 */
inline uint8_t readFuncCode(Target target) {
    switch (target) {
        case Target::Coils: return FuncCodes::READ_COILS;
        case Target::Inputs: return FuncCodes::READ_DISCRETE_INPUTS;
        case Target::HoldingRegs: return FuncCodes::READ_HOLDING_REGISTERS;
        case Target::InputRegs: return FuncCodes::READ_INPUT_REGISTERS;
    }
    return FuncCodes::READ_HOLDING_REGISTERS;
}

/**
 * @brief 是否为读功能码（忽略异常位）
 * 只有 FC01-04 视为读；FC23 读写组合按写处理
 */
inline bool isReadFunction(uint8_t functionCode) {
    uint8_t fc = functionCode & FuncCodes::ERROR_MASK;
    return fc >= FuncCodes::READ_COILS && fc <= FuncCodes::READ_INPUT_REGISTERS;
}

/** 应答数据区是否带 ByteCount 字段（FC01-04、FC23） */
inline bool hasByteCount(uint8_t functionCode) {
    return isReadFunction(functionCode)
        || functionCode == FuncCodes::READ_WRITE_MULTIPLE_REGISTERS;
}

}  // namespace modbus
