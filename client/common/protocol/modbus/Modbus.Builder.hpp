#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Converter.hpp"

namespace modbus {

/**
 * @brief Modbus 请求帧构建器
 *
 * PDU 部分与帧模式无关，由基类构建；子类只负责封装 ADU：
 *   TCP: [MBAP(7)][PDU]
 *   RTU: [SlaveAddr(1)][PDU][CRC16(2)]
 *
 * 所有地址参数均为线上地址（0 起），调用方负责先完成参数校验。
 */
class PacketBuilder {
public:
    virtual ~PacketBuilder() = default;

    virtual FrameMode mode() const = 0;

    /**
     * @brief 读请求（FC01-04）
     * PDU: [FC][StartAddr(2)][Quantity(2)]
     */
    RequestPacket buildRead(uint8_t serverId, uint8_t functionCode, uint16_t address, uint16_t quantity) {
        std::vector<uint8_t> pdu;
        pdu.push_back(functionCode);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, quantity);

        auto packet = wrap(serverId, std::move(pdu));
        packet.functionCode = functionCode;
        packet.address = address;
        packet.quantity = quantity;
        packet.expectedByteCount = isBitRead(functionCode)
            ? (static_cast<size_t>(quantity) + 7) / 8
            : static_cast<size_t>(quantity) * 2;
        return packet;
    }

    /**
     * @brief 写单个线圈（FC05），ON = 0xFF00，OFF = 0x0000
     */
    RequestPacket buildWriteSingleCoil(uint8_t serverId, uint16_t address, bool on) {
        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::WRITE_SINGLE_COIL);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, on ? 0xFF00 : 0x0000);
        return finish(serverId, std::move(pdu), address, 1);
    }

    /**
     * @brief 写单个保持寄存器（FC06）
     */
    RequestPacket buildWriteSingleRegister(uint8_t serverId, uint16_t address, uint16_t value) {
        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::WRITE_SINGLE_REGISTER);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, value);
        return finish(serverId, std::move(pdu), address, 1);
    }

    /**
     * @brief 写多个线圈（FC15）
     * PDU: [FC][StartAddr(2)][Quantity(2)][ByteCount(1)][Bits...]，低位在前
     */
    RequestPacket buildWriteMultipleCoils(uint8_t serverId, uint16_t address, const std::vector<double>& bits) {
        auto packed = DataConverter::packBits(bits);
        auto quantity = static_cast<uint16_t>(bits.size());

        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::WRITE_MULTIPLE_COILS);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, quantity);
        pdu.push_back(static_cast<uint8_t>(packed.size()));
        pdu.insert(pdu.end(), packed.begin(), packed.end());
        return finish(serverId, std::move(pdu), address, quantity);
    }

    /**
     * @brief 写多个保持寄存器（FC16）
     * PDU: [FC][StartAddr(2)][Quantity(2)][ByteCount(1)][Registers...]
     */
    RequestPacket buildWriteMultipleRegisters(uint8_t serverId, uint16_t address, const std::vector<uint16_t>& words) {
        auto quantity = static_cast<uint16_t>(words.size());

        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::WRITE_MULTIPLE_REGISTERS);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, quantity);
        pdu.push_back(static_cast<uint8_t>(words.size() * 2));
        for (auto w : words) {
            ModbusUtils::writeUInt16BE(pdu, w);
        }
        return finish(serverId, std::move(pdu), address, quantity);
    }

    /**
     * @brief 掩码写寄存器（FC22）
     * 从站计算: (current AND andMask) OR (orMask AND NOT andMask)
     */
    RequestPacket buildMaskWrite(uint8_t serverId, uint16_t address, uint16_t andMask, uint16_t orMask) {
        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::MASK_WRITE_REGISTER);
        ModbusUtils::writeUInt16BE(pdu, address);
        ModbusUtils::writeUInt16BE(pdu, andMask);
        ModbusUtils::writeUInt16BE(pdu, orMask);
        return finish(serverId, std::move(pdu), address, 1);
    }

    /**
     * @brief 读写多个寄存器（FC23），从站先写后读
     * PDU: [FC][ReadAddr(2)][ReadQty(2)][WriteAddr(2)][WriteQty(2)][ByteCount(1)][Registers...]
     */
    RequestPacket buildWriteRead(uint8_t serverId,
                                 uint16_t writeAddress, const std::vector<uint16_t>& words,
                                 uint16_t readAddress, uint16_t readQuantity) {
        std::vector<uint8_t> pdu;
        pdu.push_back(FuncCodes::READ_WRITE_MULTIPLE_REGISTERS);
        ModbusUtils::writeUInt16BE(pdu, readAddress);
        ModbusUtils::writeUInt16BE(pdu, readQuantity);
        ModbusUtils::writeUInt16BE(pdu, writeAddress);
        ModbusUtils::writeUInt16BE(pdu, static_cast<uint16_t>(words.size()));
        pdu.push_back(static_cast<uint8_t>(words.size() * 2));
        for (auto w : words) {
            ModbusUtils::writeUInt16BE(pdu, w);
        }

        auto packet = finish(serverId, std::move(pdu), readAddress, readQuantity);
        packet.expectedByteCount = static_cast<size_t>(readQuantity) * 2;
        return packet;
    }

    /** 按帧模式创建构建器 */
    static std::unique_ptr<PacketBuilder> create(FrameMode mode);

protected:
    /** PDU → ADU，填充 frame/mode/serverId/transactionId */
    virtual RequestPacket wrap(uint8_t serverId, std::vector<uint8_t> pdu) = 0;

private:
    RequestPacket finish(uint8_t serverId, std::vector<uint8_t> pdu, uint16_t address, uint16_t quantity) {
        uint8_t fc = pdu.front();
        std::vector<uint8_t> echo;
        if (!hasByteCount(fc)) {
            // FC22 回显地址 + 两个掩码，其余回显地址 + 数量/值
            size_t echoLen = fc == FuncCodes::MASK_WRITE_REGISTER ? 6 : 4;
            echo.assign(pdu.begin() + 1, pdu.begin() + 1 + static_cast<long>(echoLen));
        }
        auto packet = wrap(serverId, std::move(pdu));
        packet.functionCode = fc;
        packet.expectedEcho = std::move(echo);
        packet.address = address;
        packet.quantity = quantity;
        return packet;
    }

    static bool isBitRead(uint8_t functionCode) {
        return functionCode == FuncCodes::READ_COILS || functionCode == FuncCodes::READ_DISCRETE_INPUTS;
    }
};

/**
 * @brief Modbus TCP 构建器
 * MBAP: [TransID(2)][ProtocolID=0(2)][Length(2)][UnitID(1)]，Length = UnitID + PDU
 * 每构建一帧事务号加 1（65535 后回绕到 0）
 */
class TcpPacketBuilder : public PacketBuilder {
public:
    FrameMode mode() const override { return FrameMode::TCP; }

    uint16_t lastTransactionId() const { return transactionId_; }

protected:
    RequestPacket wrap(uint8_t serverId, std::vector<uint8_t> pdu) override {
        ++transactionId_;

        RequestPacket packet;
        packet.mode = FrameMode::TCP;
        packet.serverId = serverId;
        packet.transactionId = transactionId_;

        packet.frame.reserve(ModbusUtils::MBAP_HEADER_SIZE + pdu.size());
        ModbusUtils::writeUInt16BE(packet.frame, transactionId_);
        ModbusUtils::writeUInt16BE(packet.frame, 0x0000);
        ModbusUtils::writeUInt16BE(packet.frame, static_cast<uint16_t>(pdu.size() + 1));
        packet.frame.push_back(serverId);
        packet.frame.insert(packet.frame.end(), pdu.begin(), pdu.end());
        return packet;
    }

private:
    uint16_t transactionId_ = 0;
};

/**
 * @brief Modbus RTU 构建器
 * [SlaveAddr(1)][PDU][CRC16(2)]，CRC 低字节在前
 */
class RtuPacketBuilder : public PacketBuilder {
public:
    FrameMode mode() const override { return FrameMode::RTU; }

protected:
    RequestPacket wrap(uint8_t serverId, std::vector<uint8_t> pdu) override {
        RequestPacket packet;
        packet.mode = FrameMode::RTU;
        packet.serverId = serverId;

        packet.frame.reserve(pdu.size() + 3);
        packet.frame.push_back(serverId);
        packet.frame.insert(packet.frame.end(), pdu.begin(), pdu.end());
        ModbusUtils::appendCrc16(packet.frame);
        return packet;
    }
};

inline std::unique_ptr<PacketBuilder> PacketBuilder::create(FrameMode mode) {
    if (mode == FrameMode::RTU) {
        return std::make_unique<RtuPacketBuilder>();
    }
    return std::make_unique<TcpPacketBuilder>();
}

}  // namespace modbus
