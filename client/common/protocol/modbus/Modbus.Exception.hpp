#pragma once

#include "Modbus.Types.hpp"

namespace modbus {

/**
 * @brief 从站异常类别
 *
 * 异常码 2、4 的含义取决于请求方向（读 / 写），由请求功能码区分
 */
enum class ServerErrorKind {
    IllegalFunction,        // 01
    IllegalReadAddress,     // 02 + 读请求
    IllegalWriteAddress,    // 02 + 写请求
    IllegalDataValue,       // 03
    ServerReadFailure,      // 04 + 读请求
    ServerWriteFailure,     // 04 + 写请求
    ServerBusy,             // 06
    Unknown
};

inline const char* serverErrorKindToString(ServerErrorKind kind) {
    switch (kind) {
        case ServerErrorKind::IllegalFunction:     return "IllegalFunction";
        case ServerErrorKind::IllegalReadAddress:  return "IllegalReadAddress";
        case ServerErrorKind::IllegalWriteAddress: return "IllegalWriteAddress";
        case ServerErrorKind::IllegalDataValue:    return "IllegalDataValue";
        case ServerErrorKind::ServerReadFailure:   return "ServerReadFailure";
        case ServerErrorKind::ServerWriteFailure:  return "ServerWriteFailure";
        case ServerErrorKind::ServerBusy:          return "ServerBusy";
        case ServerErrorKind::Unknown:             return "Unknown";
    }
    return "Unknown";
}

/**
 * @brief 异常码 → 类别
 * @param functionCode 应答功能码（可带异常位），用于区分读写方向
 */
inline ServerErrorKind classifyServerError(uint8_t exceptionCode, uint8_t functionCode) {
    bool isRead = isReadFunction(functionCode);
    switch (exceptionCode) {
        case 0x01: return ServerErrorKind::IllegalFunction;
        case 0x02: return isRead ? ServerErrorKind::IllegalReadAddress : ServerErrorKind::IllegalWriteAddress;
        case 0x03: return ServerErrorKind::IllegalDataValue;
        case 0x04: return isRead ? ServerErrorKind::ServerReadFailure : ServerErrorKind::ServerWriteFailure;
        case 0x06: return ServerErrorKind::ServerBusy;
        default:   return ServerErrorKind::Unknown;
    }
}

inline std::string serverErrorMessage(ServerErrorKind kind, uint8_t exceptionCode) {
    switch (kind) {
        case ServerErrorKind::IllegalFunction:     return "从站不支持该功能码";
        case ServerErrorKind::IllegalReadAddress:  return "读取地址范围非法";
        case ServerErrorKind::IllegalWriteAddress: return "写入地址范围非法";
        case ServerErrorKind::IllegalDataValue:    return "请求数据值非法";
        case ServerErrorKind::ServerReadFailure:   return "从站读取失败";
        case ServerErrorKind::ServerWriteFailure:  return "从站写入失败";
        case ServerErrorKind::ServerBusy:          return "从站忙";
        case ServerErrorKind::Unknown:             break;
    }
    return "未知从站异常（异常码 " + std::to_string(exceptionCode) + "）";
}

}  // namespace modbus

/**
 * @brief 从站异常应答（FC | 0x80），不重试
 * 错误码 = SERVER_EXCEPTION_BASE + 异常码
 */
class ServerException : public AppException {
public:
    ServerException(modbus::ServerErrorKind kind, uint8_t functionCode, uint8_t exceptionCode)
        : AppException(ErrorCodes::SERVER_EXCEPTION_BASE + exceptionCode,
                       modbus::serverErrorMessage(kind, exceptionCode)
                           + "（FC=" + std::to_string(functionCode & modbus::FuncCodes::ERROR_MASK) + "）"),
          kind_(kind), functionCode_(functionCode), exceptionCode_(exceptionCode) {}

    modbus::ServerErrorKind kind() const { return kind_; }
    uint8_t functionCode() const { return functionCode_; }
    uint8_t exceptionCode() const { return exceptionCode_; }

private:
    modbus::ServerErrorKind kind_;
    uint8_t functionCode_;
    uint8_t exceptionCode_;
};

namespace modbus {

/** 异常应答 → ServerException */
inline ServerException translateServerError(uint8_t exceptionCode, uint8_t functionCode) {
    return ServerException(classifyServerError(exceptionCode, functionCode), functionCode, exceptionCode);
}

}  // namespace modbus
