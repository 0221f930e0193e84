#pragma once

/**
 * @brief 全局常量定义
 *
 * 集中管理项目中的魔法数字，提高可维护性和可读性
 */
namespace Constants {

// ==================== 日志相关 ====================

/** 日志文件名前缀 */
inline constexpr const char* LOG_FILE_PREFIX = "modbus-client_";

/** 单个日志文件大小上限（字节）- 100MB */
inline constexpr uint64_t LOG_FILE_SIZE_LIMIT = 100 * 1024 * 1024;

/** 默认日志目录 */
inline constexpr const char* DEFAULT_LOG_DIR = "./logs";

// ==================== 传输类型 ====================

/** Modbus TCP */
inline constexpr const char* TRANSPORT_TCPIP = "tcpip";

/** Modbus RTU（串口） */
inline constexpr const char* TRANSPORT_SERIALRTU = "serialrtu";

// ==================== 传输默认值 ====================

/** Modbus TCP 默认端口 */
inline constexpr uint16_t DEFAULT_TCP_PORT = 502;

/** 串口默认波特率 */
inline constexpr int DEFAULT_BAUD_RATE = 9600;

/** 串口默认数据位 */
inline constexpr int DEFAULT_DATA_BITS = 8;

/** 串口默认停止位 */
inline constexpr int DEFAULT_STOP_BITS = 1;

/** 串口默认校验 */
inline constexpr const char* DEFAULT_PARITY = "none";

// ==================== 事务相关 ====================

/** 默认应答超时（秒） */
inline constexpr double DEFAULT_TIMEOUT_SEC = 10.0;

/** 最小应答超时（秒）- 2ms */
inline constexpr double MIN_TIMEOUT_SEC = 0.002;

/** 最大应答超时（秒）- 1 天，保证换算成毫秒后截止时间不溢出 */
inline constexpr double MAX_TIMEOUT_SEC = 86400.0;

/** 默认超时重试次数 */
inline constexpr int DEFAULT_NUM_RETRIES = 1;

/** 接收缓冲区上限（字节），超过则清空重新对齐 */
inline constexpr size_t MAX_RX_BUFFER_SIZE = 1024;

// ==================== 字节序名称 ====================

inline constexpr const char* ENDIAN_BIG = "big-endian";
inline constexpr const char* ENDIAN_LITTLE = "little-endian";

}  // namespace Constants
