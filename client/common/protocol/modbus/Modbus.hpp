#pragma once

/**
 * @brief Modbus 客户端协议模块
 *
 * 包含:
 * - Modbus.Types.hpp       - 类型定义、常量、枚举
 * - Modbus.Utils.hpp       - CRC16、大端读写、应答帧解析
 * - Modbus.Exception.hpp   - 从站异常应答分类
 * - Modbus.Converter.hpp   - 数值与寄存器之间的转换
 * - Modbus.Builder.hpp     - TCP / RTU 请求帧构建
 * - Modbus.Transaction.hpp - 发送、等待、校验、超时重试
 * - Modbus.Client.hpp      - 对外接口：read / write / writeRead / maskWrite
 */

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Exception.hpp"
#include "Modbus.Converter.hpp"
#include "Modbus.Builder.hpp"
#include "Modbus.Transaction.hpp"
#include "Modbus.Client.hpp"
