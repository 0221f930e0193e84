#pragma once

/**
 * @brief 统一错误码定义
 *
 * 错误码规则：
 * - 1xxx: 参数校验错误（在任何 I/O 之前抛出）
 * - 3xxx: Modbus 从站异常应答（3000 + 异常码）
 * - 4xxx: 应答超时
 * - 5xxx: 传输层错误
 */
namespace ErrorCodes {

// ==================== 参数校验 (1xxx) ====================

/** 通用参数错误 */
inline constexpr int VALIDATION_FAILED = 1001;

/** 目标区域不合法或不支持该操作 */
inline constexpr int INVALID_TARGET = 1002;

/** 地址不合法 */
inline constexpr int INVALID_ADDRESS = 1003;

/** 数量超出协议范围 */
inline constexpr int INVALID_COUNT = 1004;

/** 从站地址超出范围 */
inline constexpr int INVALID_SERVER_ID = 1005;

/** 数据类型（precision）不支持 */
inline constexpr int INVALID_PRECISION = 1006;

/** 写入值类型或范围不合法 */
inline constexpr int INVALID_VALUE = 1007;

/** 掩码超出 uint16 范围 */
inline constexpr int INVALID_MASK = 1008;

/** count 与 precision 个数不一致 */
inline constexpr int PRECISION_COUNT_MISMATCH = 1009;

/** 属性值不合法（Timeout、NumRetries、字节序等） */
inline constexpr int INVALID_PROPERTY = 1010;

// ==================== 从站异常 (3xxx) ====================

/** 从站异常基数，实际错误码 = SERVER_EXCEPTION_BASE + 异常码 */
inline constexpr int SERVER_EXCEPTION_BASE = 3000;

// ==================== 超时 (4xxx) ====================

/** 重试耗尽后仍无应答 */
inline constexpr int RESPONSE_TIMEOUT = 4001;

// ==================== 传输层 (5xxx) ====================

/** 传输层读写失败（连接断开、I/O 错误） */
inline constexpr int TRANSPORT_ERROR = 5001;

/** 传输层未打开或打开失败 */
inline constexpr int TRANSPORT_NOT_OPEN = 5002;

/** 应答帧与请求不匹配（功能码、字节数） */
inline constexpr int MALFORMED_RESPONSE = 5003;

}  // namespace ErrorCodes
