#pragma once

#include "Modbus.Types.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace modbus {

/**
 * @brief Modbus 工具类
 * CRC16 计算、大端读写、应答帧解析、十六进制格式化
 */
class ModbusUtils {
public:
    /** 帧校验失败标记（CRC 不匹配或帧格式异常），调用方应丢弃缓冲区重新对齐 */
    static constexpr size_t FRAME_CORRUPT = SIZE_MAX;

    /** MBAP Header 长度（TransID + ProtocolID + Length + UnitID） */
    static constexpr size_t MBAP_HEADER_SIZE = 7;

    // ==================== CRC16 (Modbus RTU) ====================

    static uint16_t crc16(const uint8_t* data, size_t len) {
        uint16_t crc = 0xFFFF;
        for (size_t i = 0; i < len; ++i) {
            crc ^= data[i];
            for (int j = 0; j < 8; ++j) {
                if (crc & 0x0001) {
                    crc = (crc >> 1) ^ 0xA001;
                } else {
                    crc >>= 1;
                }
            }
        }
        return crc;
    }

    static uint16_t crc16(const std::vector<uint8_t>& data) {
        return crc16(data.data(), data.size());
    }

    /** 追加 CRC16（低字节在前） */
    static void appendCrc16(std::vector<uint8_t>& frame) {
        uint16_t crc = crc16(frame);
        frame.push_back(static_cast<uint8_t>(crc & 0xFF));
        frame.push_back(static_cast<uint8_t>((crc >> 8) & 0xFF));
    }

    // ==================== 大端读写 ====================

    static void writeUInt16BE(std::vector<uint8_t>& buf, uint16_t value) {
        buf.push_back(static_cast<uint8_t>(value >> 8));
        buf.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    static uint16_t readUInt16BE(const uint8_t* data) {
        return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
    }

    // ==================== 应答帧解析 ====================

    /**
     * @brief 解析 Modbus TCP 应答帧
     * @return 消耗的字节数（0 = 数据不足，FRAME_CORRUPT = 帧头非法）
     *
     * 正常读应答: [TransID(2)][ProtocolID(2)][Length(2)][UnitID(1)][FC(1)][ByteCount(1)][Data...]
     * 写应答:     [TransID(2)][ProtocolID(2)][Length(2)][UnitID(1)][FC(1)][Echo(4 或 6)]
     * 异常应答:   [TransID(2)][ProtocolID(2)][Length(2)][UnitID(1)][FC|0x80(1)][ExceptionCode(1)]
     */
    static size_t parseTcpResponse(const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        // MBAP Header = 7 bytes + at least FC(1) = 8 bytes minimum
        if (buffer.size() < MBAP_HEADER_SIZE + 1) return 0;

        uint16_t transId = readUInt16BE(&buffer[0]);
        uint16_t protoId = readUInt16BE(&buffer[2]);
        uint16_t length  = readUInt16BE(&buffer[4]);

        // Protocol ID 必须为 0，Length 必须合理（UnitID + PDU，最大 254）
        if (protoId != 0 || length < 2 || length > 254) return FRAME_CORRUPT;

        // Length 包含 UnitID 之后的全部字节
        size_t totalLen = 6 + length;
        if (buffer.size() < totalLen) return 0;

        out = ModbusResponse{};
        out.mode = FrameMode::TCP;
        out.transactionId = transId;
        out.slaveId = buffer[6];
        out.functionCode = buffer[7];

        // 异常应答
        if (out.functionCode & FuncCodes::EXCEPTION_BIT) {
            if (totalLen < 9) return FRAME_CORRUPT;
            out.isException = true;
            out.exceptionCode = buffer[8];
            return totalLen;
        }

        if (hasByteCount(out.functionCode)) {
            if (totalLen < 9) return FRAME_CORRUPT;
            uint8_t byteCount = buffer[8];
            if (totalLen != static_cast<size_t>(9 + byteCount)) return FRAME_CORRUPT;
            out.data.assign(buffer.begin() + 9, buffer.begin() + 9 + byteCount);
            return totalLen;
        }

        size_t echoLen = writeEchoLength(out.functionCode);
        if (echoLen == 0 || totalLen != 8 + echoLen) return FRAME_CORRUPT;
        out.data.assign(buffer.begin() + 8, buffer.begin() + 8 + echoLen);
        return totalLen;
    }

    /**
     * @brief 解析 Modbus RTU 应答帧
     * @return 消耗的字节数（0 = 数据不足，FRAME_CORRUPT = CRC 或帧格式错误）
     *
     * 正常读应答: [SlaveAddr(1)][FC(1)][ByteCount(1)][Data...][CRC16(2)]
     * 写应答:     [SlaveAddr(1)][FC(1)][Echo(4 或 6)][CRC16(2)]
     * 异常应答:   [SlaveAddr(1)][FC|0x80(1)][ExceptionCode(1)][CRC16(2)]
     */
    static size_t parseRtuResponse(const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        if (buffer.size() < 2) return 0;

        uint8_t fc = buffer[1];
        size_t frameLen = 0;

        if (fc & FuncCodes::EXCEPTION_BIT) {
            frameLen = 5;  // SlaveAddr + FC + ExcCode + CRC16
        } else if (hasByteCount(fc)) {
            if (buffer.size() < 3) return 0;
            uint8_t byteCount = buffer[2];
            // ByteCount 合理性检查（最大 250 字节）
            if (byteCount == 0 || byteCount > 250) return FRAME_CORRUPT;
            frameLen = 3 + byteCount + 2;
        } else {
            size_t echoLen = writeEchoLength(fc);
            if (echoLen == 0) return FRAME_CORRUPT;
            frameLen = 2 + echoLen + 2;
        }

        if (buffer.size() < frameLen) return 0;

        // CRC 校验（数据已足够，失败即损坏）
        uint16_t crcRecv = static_cast<uint16_t>(buffer[frameLen - 2])
                         | (static_cast<uint16_t>(buffer[frameLen - 1]) << 8);
        uint16_t crcCalc = crc16(buffer.data(), frameLen - 2);
        if (crcRecv != crcCalc) return FRAME_CORRUPT;

        out = ModbusResponse{};
        out.mode = FrameMode::RTU;
        out.slaveId = buffer[0];
        out.functionCode = fc;

        if (fc & FuncCodes::EXCEPTION_BIT) {
            out.isException = true;
            out.exceptionCode = buffer[2];
        } else if (hasByteCount(fc)) {
            out.data.assign(buffer.begin() + 3, buffer.begin() + 3 + buffer[2]);
        } else {
            out.data.assign(buffer.begin() + 2, buffer.begin() + static_cast<long>(frameLen - 2));
        }
        return frameLen;
    }

    /** 根据 FrameMode 选择解析方式 */
    static size_t parseResponse(FrameMode mode, const std::vector<uint8_t>& buffer, ModbusResponse& out) {
        if (mode == FrameMode::RTU) {
            return parseRtuResponse(buffer, out);
        }
        return parseTcpResponse(buffer, out);
    }

    // ==================== 工具函数 ====================

    static std::string toHexString(const std::vector<uint8_t>& data) {
        std::ostringstream oss;
        for (size_t i = 0; i < data.size(); ++i) {
            if (i > 0) oss << " ";
            oss << std::hex << std::uppercase << std::setw(2)
                << std::setfill('0') << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    /** 写类应答回显长度：FC05/06/15/16 回显 Addr+Value/Qty，FC22 回显 Addr+And+Or */
    static size_t writeEchoLength(uint8_t fc) {
        switch (fc) {
            case FuncCodes::WRITE_SINGLE_COIL:
            case FuncCodes::WRITE_SINGLE_REGISTER:
            case FuncCodes::WRITE_MULTIPLE_COILS:
            case FuncCodes::WRITE_MULTIPLE_REGISTERS:
                return 4;
            case FuncCodes::MASK_WRITE_REGISTER:
                return 6;
            default:
                return 0;
        }
    }
};

}  // namespace modbus
