#pragma once

#include "common/utils/AppException.hpp"
#include "common/utils/Constants.hpp"
#include "common/protocol/modbus/Modbus.Types.hpp"

/**
 * @brief 字节流传输层接口
 *
 * 同步阻塞语义：
 * - receive(wait) 返回已到达的字节；仅当 wait 内没有任何数据时返回空
 * - flush() 丢弃所有已缓冲的收发数据
 * - prepareForRetry() 在超时重发前调用，默认无操作
 *
 * 打开失败或 I/O 错误抛出 TransportException
 */
class Transport {
public:
    virtual ~Transport() = default;

    virtual void open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    virtual void send(const std::vector<uint8_t>& bytes) = 0;
    virtual std::vector<uint8_t> receive(std::chrono::milliseconds wait) = 0;
    virtual void flush() = 0;
    virtual void prepareForRetry() {}

    /** 该传输承载的 Modbus 帧格式 */
    virtual modbus::FrameMode frameMode() const = 0;

    /** 用于日志的链路描述，如 "tcp 192.168.1.10:502" */
    virtual std::string describe() const = 0;

    double timeout() const { return timeoutSec_; }

    void setTimeout(double seconds) {
        if (!std::isfinite(seconds) || seconds < Constants::MIN_TIMEOUT_SEC || seconds > Constants::MAX_TIMEOUT_SEC) {
            throw ValidationException("Timeout 必须在 [" + std::to_string(Constants::MIN_TIMEOUT_SEC) + ", "
                + std::to_string(Constants::MAX_TIMEOUT_SEC) + "] 秒之间，实际: " + std::to_string(seconds),
                ErrorCodes::INVALID_PROPERTY);
        }
        timeoutSec_ = seconds;
    }

    std::chrono::milliseconds timeoutMs() const {
        return std::chrono::milliseconds(static_cast<int64_t>(std::ceil(timeoutSec_ * 1000.0)));
    }

protected:
    double timeoutSec_ = Constants::DEFAULT_TIMEOUT_SEC;
};
