#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Converter.hpp"
#include "Modbus.Builder.hpp"
#include "Modbus.Transaction.hpp"
#include "common/transport/Transport.hpp"
#include "common/transport/TcpTransport.hpp"
#include "common/transport/SerialTransport.hpp"
#include "common/utils/ConfigManager.hpp"

namespace modbus {

/**
 * @brief Modbus 客户端（主站）
 *
 * 对外提供 read / write / writeRead / maskWrite。
 * 参数校验在任何 I/O 之前完成；除校验错误外，所有失败都会先清空传输层缓冲再向上抛出。
 *
 * 地址从 1 开始（线上地址 = address - 1）。
 * 非线程安全：多线程共享同一客户端时由调用方加锁。
 */
class ModbusClient {
public:
    /**
     * @brief 使用外部传输构造
     * 不修改外部传输的 Timeout，options.timeout 被忽略
     */
    explicit ModbusClient(std::shared_ptr<Transport> transport, const ModbusConfig& options = {})
        : transport_(std::move(transport)),
          builder_(PacketBuilder::create(transport_->frameMode())),
          converter_(options.byteOrder, options.wordOrder),
          engine_(transport_, session_) {
        engine_.setNumRetries(options.numRetries);
    }

    ModbusClient(const ModbusClient&) = delete;
    ModbusClient& operator=(const ModbusClient&) = delete;

    /**
     * @brief 按配置创建传输、设置 Timeout 并打开
     */
    static std::unique_ptr<ModbusClient> create(const AppConfig& config) {
        std::shared_ptr<Transport> transport;
        if (config.transport.type == Constants::TRANSPORT_SERIALRTU) {
            transport = std::make_shared<SerialTransport>(config.transport.serial);
        } else if (config.transport.type == Constants::TRANSPORT_TCPIP) {
            transport = std::make_shared<TcpTransport>(config.transport.address, config.transport.port);
        } else {
            throw ValidationException("不支持的传输类型: " + config.transport.type, ErrorCodes::INVALID_PROPERTY);
        }

        transport->setTimeout(config.modbus.timeout);
        transport->open();
        LOG_INFO << "[Modbus] Client ready on " << transport->describe()
                 << " (timeout=" << config.modbus.timeout << "s, retries=" << config.modbus.numRetries << ")";

        return std::make_unique<ModbusClient>(std::move(transport), config.modbus);
    }

    // ==================== 读 ====================

    /**
     * @brief 读取连续的线圈 / 离散输入 / 寄存器
     * @param count 逻辑值个数（寄存器区按 precision 宽度换算寄存器数）
     * @param precision 仅寄存器区可用，默认 uint16
     */
    std::vector<double> read(Target target, int address, int count = Limits::DEFAULT_COUNT,
                             int serverId = Limits::DEFAULT_SERVER_ID,
                             std::optional<Precision> precision = std::nullopt) {
        return guarded("read", [&]() {
            validateServerId(serverId, false);

            if (isBitTarget(target)) {
                rejectBitPrecision(target, precision);
                validateCount(count, 1, Limits::DISCRETE_READ, "count");
                validateAddress(address, count);

                auto packet = builder_->buildRead(static_cast<uint8_t>(serverId), readFuncCode(target),
                                                  wireAddress(address), static_cast<uint16_t>(count));
                auto bytes = engine_.executeRead(packet);
                return DataConverter::unpackBits(bytes, static_cast<size_t>(count));
            }

            auto p = precision.value_or(Precision::UInt16);
            int words = DataConverter::registerCount(p);
            validateCount(count, words, Limits::REGISTER_READ, "count");
            int quantity = count * words;
            validateAddress(address, quantity);

            auto packet = builder_->buildRead(static_cast<uint8_t>(serverId), readFuncCode(target),
                                              wireAddress(address), static_cast<uint16_t>(quantity));
            auto bytes = engine_.executeRead(packet);
            return converter_.convertReadValues(bytes, p);
        });
    }

    /**
     * @brief 一次事务读取多段不同格式的连续寄存器
     * counts[i] 个 precisions[i] 值依次排列，结果按请求顺序拼接
     */
    std::vector<double> read(Target target, int address, const std::vector<int>& counts,
                             int serverId, const std::vector<Precision>& precisions) {
        return guarded("read", [&]() {
            validateServerId(serverId, false);
            if (isBitTarget(target)) {
                throw ValidationException(std::string("多格式读取仅支持寄存器区，实际: ") + targetToString(target),
                                          ErrorCodes::INVALID_TARGET);
            }
            if (counts.size() != precisions.size()) {
                throw ValidationException("count 个数 (" + std::to_string(counts.size())
                    + ") 与 precision 个数 (" + std::to_string(precisions.size()) + ") 不一致",
                    ErrorCodes::PRECISION_COUNT_MISMATCH);
            }
            if (counts.empty()) {
                throw ValidationException("count 不能为空", ErrorCodes::INVALID_COUNT);
            }

            long long quantity = 0;
            for (size_t i = 0; i < counts.size(); ++i) {
                if (counts[i] < 0) {
                    throw ValidationException("count 不能为负数: " + std::to_string(counts[i]),
                                              ErrorCodes::INVALID_COUNT);
                }
                quantity += static_cast<long long>(counts[i]) * DataConverter::registerCount(precisions[i]);
            }
            if (quantity < Limits::REGISTER_READ.min || quantity > Limits::REGISTER_READ.max) {
                throw ValidationException("读取寄存器总数 " + std::to_string(quantity) + " 超出范围 "
                    + rangeText(Limits::REGISTER_READ), ErrorCodes::INVALID_COUNT);
            }
            validateAddress(address, static_cast<int>(quantity));

            auto packet = builder_->buildRead(static_cast<uint8_t>(serverId), readFuncCode(target),
                                              wireAddress(address), static_cast<uint16_t>(quantity));
            auto bytes = engine_.executeRead(packet);

            std::vector<double> values;
            size_t offset = 0;
            for (size_t i = 0; i < counts.size(); ++i) {
                size_t segmentSize = DataConverter::sizeOf(precisions[i]) * static_cast<size_t>(counts[i]);
                std::vector<uint8_t> segment(bytes.begin() + static_cast<long>(offset),
                                             bytes.begin() + static_cast<long>(offset + segmentSize));
                auto decoded = converter_.convertReadValues(segment, precisions[i]);
                values.insert(values.end(), decoded.begin(), decoded.end());
                offset += segmentSize;
            }
            return values;
        });
    }

    // ==================== 写 ====================

    /**
     * @brief 写线圈或保持寄存器
     *
     * 线圈: 单值 FC05，多值 FC15，取值只能是 0/1
     * 寄存器: 单个单寄存器值 FC06，其余 FC16
     * serverId = 0 为广播，发送后不等待应答
     */
    void write(Target target, int address, const std::vector<double>& values,
               int serverId = Limits::DEFAULT_SERVER_ID,
               std::optional<Precision> precision = std::nullopt) {
        guarded("write", [&]() {
            validateServerId(serverId, true);
            if (!isWritable(target)) {
                throw ValidationException(std::string("目标区域不可写: ") + targetToString(target)
                    + "（仅 coils、holdingregs 可写）", ErrorCodes::INVALID_TARGET);
            }
            validateValues(values);
            auto sid = static_cast<uint8_t>(serverId);

            if (target == Target::Coils) {
                rejectBitPrecision(target, precision);
                validateCount(static_cast<int>(values.size()), 1, Limits::DISCRETE_WRITE, "values");
                for (double v : values) {
                    if (v != 0.0 && v != 1.0) {
                        throw ValidationException("线圈值只能是 0 或 1，实际: " + formatValue(v),
                                                  ErrorCodes::INVALID_VALUE);
                    }
                }
                validateAddress(address, static_cast<int>(values.size()));

                auto packet = values.size() == 1
                    ? builder_->buildWriteSingleCoil(sid, wireAddress(address), values.front() == 1.0)
                    : builder_->buildWriteMultipleCoils(sid, wireAddress(address), values);
                engine_.executeWrite(packet);
                return;
            }

            auto p = precision.value_or(Precision::UInt16);
            int words = DataConverter::registerCount(p);
            validateCount(static_cast<int>(values.size()), words, Limits::REGISTER_WRITE, "values");
            validateWriteValues(values, p);
            validateAddress(address, static_cast<int>(values.size()) * words);

            auto registers = converter_.convertWriteValues(values, p);
            auto packet = registers.size() == 1
                ? builder_->buildWriteSingleRegister(sid, wireAddress(address), registers.front())
                : builder_->buildWriteMultipleRegisters(sid, wireAddress(address), registers);
            engine_.executeWrite(packet);
        });
    }

    /**
     * @brief 读写多个寄存器（FC23），从站先写后读，读写范围可重叠
     */
    std::vector<double> writeRead(int writeAddress, const std::vector<double>& values,
                                  Precision writePrecision,
                                  int readAddress, int readCount, Precision readPrecision,
                                  int serverId = Limits::DEFAULT_SERVER_ID) {
        return guarded("writeRead", [&]() {
            validateServerId(serverId, false);
            validateValues(values);

            int writeWords = DataConverter::registerCount(writePrecision);
            validateCount(static_cast<int>(values.size()), writeWords, Limits::READ_WRITE_WRITE, "values");
            validateWriteValues(values, writePrecision);
            validateAddress(writeAddress, static_cast<int>(values.size()) * writeWords);

            int readWords = DataConverter::registerCount(readPrecision);
            validateCount(readCount, readWords, Limits::REGISTER_READ, "readCount");
            int readQuantity = readCount * readWords;
            validateAddress(readAddress, readQuantity);

            auto registers = converter_.convertWriteValues(values, writePrecision);
            auto packet = builder_->buildWriteRead(static_cast<uint8_t>(serverId),
                                                   wireAddress(writeAddress), registers,
                                                   wireAddress(readAddress), static_cast<uint16_t>(readQuantity));
            auto bytes = engine_.executeRead(packet);
            return converter_.convertReadValues(bytes, readPrecision);
        });
    }

    /** 读写均为 uint16 */
    std::vector<double> writeRead(int writeAddress, const std::vector<double>& values,
                                  int readAddress, int readCount,
                                  int serverId = Limits::DEFAULT_SERVER_ID) {
        return writeRead(writeAddress, values, Precision::UInt16,
                         readAddress, readCount, Precision::UInt16, serverId);
    }

    /**
     * @brief 掩码写保持寄存器（FC22）
     * 从站计算: (current AND andMask) OR (orMask AND NOT andMask)
     */
    void maskWrite(int address, long long andMask, long long orMask,
                   int serverId = Limits::DEFAULT_SERVER_ID) {
        guarded("maskWrite", [&]() {
            validateServerId(serverId, true);
            validateAddress(address, 1);
            validateMask(andMask, "andMask");
            validateMask(orMask, "orMask");

            auto packet = builder_->buildMaskWrite(static_cast<uint8_t>(serverId), wireAddress(address),
                                                   static_cast<uint16_t>(andMask), static_cast<uint16_t>(orMask));
            engine_.executeMaskWrite(packet);
        });
    }

    // ==================== 属性 ====================

    int numRetries() const { return engine_.numRetries(); }
    void setNumRetries(int numRetries) { engine_.setNumRetries(numRetries); }

    Endian byteOrder() const { return converter_.byteOrder(); }
    void setByteOrder(Endian order) { converter_.setByteOrder(order); }
    void setByteOrder(const std::string& order) { converter_.setByteOrder(parseEndian(order)); }

    Endian wordOrder() const { return converter_.wordOrder(); }
    void setWordOrder(Endian order) { converter_.setWordOrder(order); }
    void setWordOrder(const std::string& order) { converter_.setWordOrder(parseEndian(order)); }

    double timeout() const { return transport_->timeout(); }

    /** 修改 Timeout 同时重置重试计数 */
    void setTimeout(double seconds) {
        transport_->setTimeout(seconds);
        session_.retryCount = 0;
    }

    int retryCount() const { return session_.retryCount; }
    TransactionState transactionState() const { return session_.state; }

    Transport& transport() { return *transport_; }

private:
    std::shared_ptr<Transport> transport_;
    std::unique_ptr<PacketBuilder> builder_;
    DataConverter converter_;
    Session session_;
    TransactionEngine engine_;

    /**
     * @brief 公共入口包装：校验错误直接抛出；其余失败先清空传输缓冲再抛出
     */
    template <typename Fn>
    auto guarded(const char* operation, Fn&& fn) -> decltype(fn()) {
        try {
            return fn();
        } catch (const ValidationException& e) {
            LOG_DEBUG << "[Modbus] " << operation << " rejected: " << e.what();
            throw;
        } catch (const std::exception& e) {
            LOG_ERROR << "[Modbus] " << operation << " failed on " << transport_->describe() << ": " << e.what();
            flushQuietly();
            throw;
        }
    }

    void flushQuietly() {
        try {
            transport_->flush();
        } catch (const std::exception& e) {
            LOG_WARN << "[Modbus] Flush after failure also failed: " << e.what();
        }
    }

    // ─── 参数校验 ──────────────────────────────────────────────

    static uint16_t wireAddress(int address) {
        return static_cast<uint16_t>(address - 1);
    }

    static std::string rangeText(const CountRange& range) {
        return "[" + std::to_string(range.min) + ", " + std::to_string(range.max) + "]";
    }

    static std::string formatValue(double v) {
        std::ostringstream oss;
        oss << std::setprecision(17) << v;
        return oss.str();
    }

    static void validateServerId(int serverId, bool allowBroadcast) {
        if (serverId < Limits::SERVER_ID.min || serverId > Limits::SERVER_ID.max) {
            throw ValidationException("serverId 超出范围: " + std::to_string(serverId)
                + "（有效范围: " + rangeText(Limits::SERVER_ID) + "）", ErrorCodes::INVALID_SERVER_ID);
        }
        if (serverId == Limits::BROADCAST_SERVER_ID && !allowBroadcast) {
            throw ValidationException("广播地址 0 只能用于写操作（读操作没有应答）",
                                      ErrorCodes::INVALID_SERVER_ID);
        }
    }

    /**
     * @brief 起始地址 1..65536，且 address + quantity - 1 不超过 65536
     */
    static void validateAddress(int address, int quantity) {
        if (address < Limits::MIN_ADDRESS || address > Limits::MAX_ADDRESS) {
            throw ValidationException("地址超出范围: " + std::to_string(address)
                + "（有效范围: [" + std::to_string(Limits::MIN_ADDRESS) + ", "
                + std::to_string(Limits::MAX_ADDRESS) + "]）", ErrorCodes::INVALID_ADDRESS);
        }
        if (static_cast<long long>(address) + quantity - 1 > Limits::MAX_ADDRESS) {
            throw ValidationException("地址范围越界: 起始 " + std::to_string(address)
                + "，数量 " + std::to_string(quantity), ErrorCodes::INVALID_ADDRESS);
        }
    }

    /**
     * @brief 单一格式数量校验
     * 寄存器区上限按格式宽度折算: maxCount = floor(range.max / wordsPerValue)
     */
    static void validateCount(int count, int wordsPerValue, const CountRange& range, const char* name) {
        int maxCount = range.max / wordsPerValue;
        if (count < range.min || count > maxCount) {
            throw ValidationException(std::string(name) + " 超出范围: " + std::to_string(count)
                + "（有效范围: [" + std::to_string(range.min) + ", " + std::to_string(maxCount) + "]）",
                ErrorCodes::INVALID_COUNT);
        }
    }

    static void rejectBitPrecision(Target target, const std::optional<Precision>& precision) {
        if (precision) {
            throw ValidationException(std::string("precision 仅适用于寄存器区，") + targetToString(target)
                + " 不支持", ErrorCodes::INVALID_PRECISION);
        }
    }

    static void validateValues(const std::vector<double>& values) {
        if (values.empty()) {
            throw ValidationException("写入值不能为空", ErrorCodes::INVALID_VALUE);
        }
        for (double v : values) {
            if (!std::isfinite(v)) {
                throw ValidationException("写入值必须是有限数值", ErrorCodes::INVALID_VALUE);
            }
        }
    }

    /**
     * @brief 按格式校验写入值
     * 整数格式拒绝小数与越界值，浮点格式拒绝超出可表示范围的值
     */
    static void validateWriteValues(const std::vector<double>& values, Precision precision) {
        const auto& t = DataConverter::traits(precision);
        for (double v : values) {
            if (t.isInteger) {
                if (std::floor(v) != v) {
                    throw ValidationException(std::string("'") + precisionToString(precision)
                        + "' 格式不接受小数: " + formatValue(v), ErrorCodes::INVALID_VALUE);
                }
                if (v < t.minValue || v >= t.maxExclusive) {
                    throw ValidationException("写入值 " + formatValue(v) + " 超出范围 ["
                        + t.minText + ", " + t.maxText + "]", ErrorCodes::INVALID_VALUE);
                }
            } else if (v < -t.maxFinite || v > t.maxFinite) {
                throw ValidationException("写入值 " + formatValue(v) + " 超出范围 ["
                    + t.minText + ", " + t.maxText + "]", ErrorCodes::INVALID_VALUE);
            }
        }
    }

    static void validateMask(long long mask, const char* name) {
        if (mask < 0 || mask > 0xFFFF) {
            throw ValidationException(std::string(name) + " 超出范围: " + std::to_string(mask)
                + "（有效范围: [0, 65535]）", ErrorCodes::INVALID_MASK);
        }
    }
};

}  // namespace modbus
