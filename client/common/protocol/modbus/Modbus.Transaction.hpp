#pragma once

#include "Modbus.Types.hpp"
#include "Modbus.Utils.hpp"
#include "Modbus.Exception.hpp"
#include "common/transport/Transport.hpp"

namespace modbus {

/**
 * @brief 事务状态
 *
 * 状态转换表：
 *   Idle →[send]→ Sent →[wait]→ AwaitingResponse →[response]→ Completed
 *   AwaitingResponse →[timeout]→ Retrying →[send]→ Sent
 *   AwaitingResponse →[exhausted / serverError / transportError]→ Failed
 *   Sent →[broadcast]→ Completed
 */
enum class TransactionState {
    Idle,
    Sent,
    AwaitingResponse,
    Completed,
    Retrying,
    Failed
};

inline const char* transactionStateToString(TransactionState state) {
    switch (state) {
        case TransactionState::Idle:             return "idle";
        case TransactionState::Sent:             return "sent";
        case TransactionState::AwaitingResponse: return "awaiting";
        case TransactionState::Completed:        return "completed";
        case TransactionState::Retrying:         return "retrying";
        case TransactionState::Failed:           return "failed";
    }
    return "idle";
}

/**
 * @brief 客户端会话状态
 * 由 ModbusClient 持有，事务引擎只通过引用修改
 */
struct Session {
    int retryCount = 0;
    TransactionState state = TransactionState::Idle;

    void transition(TransactionState newState, const char* event) {
        if (state != newState) {
            LOG_DEBUG << "TxFSM: " << transactionStateToString(state)
                      << " →[" << event << "]→ " << transactionStateToString(newState);
            state = newState;
        }
    }
};

/**
 * @brief Modbus 事务引擎
 *
 * 发送 → 等待完整应答 → 校验 → 超时重试。
 * 超时后若 retryCount < NumRetries 则清空缓冲、prepareForRetry、原帧重发；
 * 否则清空缓冲、计数归零并抛出 TimeoutException。
 * 从站异常应答立即抛出 ServerException，不重试。
 */
class TransactionEngine {
public:
    TransactionEngine(std::shared_ptr<Transport> transport, Session& session)
        : transport_(std::move(transport)), session_(session) {}

    int numRetries() const { return numRetries_; }

    void setNumRetries(int numRetries) {
        if (numRetries < 1) {
            throw ValidationException("NumRetries 必须为正整数，实际: " + std::to_string(numRetries),
                                      ErrorCodes::INVALID_PROPERTY);
        }
        numRetries_ = numRetries;
    }

    /**
     * @brief 读类事务（FC01-04、FC23）
     * @return 应答数据区（不含 ByteCount）
     */
    std::vector<uint8_t> executeRead(const RequestPacket& packet) {
        auto response = transact(packet);
        return std::move(response.data);
    }

    /** 写类事务（FC05/06/15/16），广播时发送后即返回 */
    void executeWrite(const RequestPacket& packet) {
        transact(packet);
    }

    /** 掩码写事务（FC22），广播时发送后即返回 */
    void executeMaskWrite(const RequestPacket& packet) {
        transact(packet);
    }

private:
    std::shared_ptr<Transport> transport_;
    Session& session_;
    int numRetries_ = Constants::DEFAULT_NUM_RETRIES;

    ModbusResponse transact(const RequestPacket& packet) {
        session_.retryCount = 0;
        session_.transition(TransactionState::Idle, "begin");

        try {
            // 丢弃上一次事务残留的输入
            transport_->flush();

            while (true) {
                transport_->send(packet.frame);
                session_.transition(TransactionState::Sent, "send");
                LOG_DEBUG << "[Modbus] TX " << frameModeToString(packet.mode)
                          << " slave=" << static_cast<int>(packet.serverId)
                          << " fc=" << static_cast<int>(packet.functionCode)
                          << ": " << ModbusUtils::toHexString(packet.frame);

                if (packet.serverId == Limits::BROADCAST_SERVER_ID) {
                    session_.transition(TransactionState::Completed, "broadcast");
                    return ModbusResponse{};
                }

                session_.transition(TransactionState::AwaitingResponse, "wait");
                auto response = awaitResponse(packet);
                if (response) {
                    session_.retryCount = 0;
                    session_.transition(TransactionState::Completed, "response");
                    return std::move(*response);
                }

                transport_->flush();

                if (session_.retryCount >= numRetries_) {
                    session_.retryCount = 0;
                    session_.transition(TransactionState::Failed, "exhausted");
                    LOG_WARN << "[Modbus] No response from slave " << static_cast<int>(packet.serverId)
                             << " fc=" << static_cast<int>(packet.functionCode)
                             << " after " << numRetries_ << " retries";
                    throw TimeoutException("从站 " + std::to_string(packet.serverId)
                        + " 应答超时（FC=" + std::to_string(packet.functionCode)
                        + "，已重试 " + std::to_string(numRetries_) + " 次）");
                }

                session_.transition(TransactionState::Retrying, "timeout");
                transport_->prepareForRetry();
                ++session_.retryCount;
                LOG_WARN << "[Modbus] Timeout waiting for slave " << static_cast<int>(packet.serverId)
                         << ", retry " << session_.retryCount << "/" << numRetries_;
            }
        } catch (const TimeoutException&) {
            throw;
        } catch (const std::exception&) {
            session_.retryCount = 0;
            session_.transition(TransactionState::Failed, "error");
            throw;
        }
    }

    /**
     * @brief 在一个 Timeout 内收集字节直到解析出匹配的应答
     * @return 匹配的应答；超时返回 nullopt
     *
     * CRC 错误、事务号或从站地址不匹配的帧直接丢弃，继续等待
     */
    std::optional<ModbusResponse> awaitResponse(const RequestPacket& packet) {
        std::vector<uint8_t> buffer;
        auto deadline = std::chrono::steady_clock::now() + transport_->timeoutMs();

        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) return std::nullopt;

            auto chunk = transport_->receive(remaining);
            if (chunk.empty()) return std::nullopt;
            buffer.insert(buffer.end(), chunk.begin(), chunk.end());

            if (buffer.size() > Constants::MAX_RX_BUFFER_SIZE) {
                LOG_WARN << "[Modbus] RX buffer overflow (" << buffer.size() << "B), discarding";
                buffer.clear();
                continue;
            }

            while (!buffer.empty()) {
                ModbusResponse response;
                size_t consumed = ModbusUtils::parseResponse(packet.mode, buffer, response);
                if (consumed == 0) break;

                if (consumed == ModbusUtils::FRAME_CORRUPT) {
                    LOG_WARN << "[Modbus] Discarding corrupt frame: " << ModbusUtils::toHexString(buffer);
                    buffer.clear();
                    break;
                }

                std::vector<uint8_t> raw(buffer.begin(), buffer.begin() + static_cast<long>(consumed));
                buffer.erase(buffer.begin(), buffer.begin() + static_cast<long>(consumed));
                LOG_DEBUG << "[Modbus] RX " << frameModeToString(packet.mode)
                          << ": " << ModbusUtils::toHexString(raw);

                if (!matches(packet, response)) {
                    LOG_WARN << "[Modbus] Discarding unrelated frame (slave="
                             << static_cast<int>(response.slaveId)
                             << ", tid=" << response.transactionId << ")";
                    continue;
                }

                validate(packet, response);
                return response;
            }
        }
    }

    /** 应答是否属于当前请求（从站地址，TCP 还需事务号一致） */
    static bool matches(const RequestPacket& packet, const ModbusResponse& response) {
        if (response.slaveId != packet.serverId) return false;
        if (packet.mode == FrameMode::TCP && response.transactionId != packet.transactionId) return false;
        return true;
    }

    /**
     * @brief 校验匹配的应答
     * 异常应答 → ServerException；功能码或数据长度不符 → TransportException
     */
    static void validate(const RequestPacket& packet, const ModbusResponse& response) {
        uint8_t fc = response.functionCode & FuncCodes::ERROR_MASK;
        if (fc != packet.functionCode) {
            throw TransportException("应答功能码不匹配: 期望 " + std::to_string(packet.functionCode)
                + "，实际 " + std::to_string(fc), ErrorCodes::MALFORMED_RESPONSE);
        }

        if (response.isException) {
            LOG_WARN << "[Modbus] Exception response from slave " << static_cast<int>(response.slaveId)
                     << ": fc=0x" << std::hex << static_cast<int>(response.functionCode)
                     << " code=" << std::dec << static_cast<int>(response.exceptionCode);
            throw translateServerError(response.exceptionCode, response.functionCode);
        }

        if (hasByteCount(response.functionCode)) {
            if (response.data.size() != packet.expectedByteCount) {
                throw TransportException("应答数据长度不匹配: 期望 " + std::to_string(packet.expectedByteCount)
                    + " 字节，实际 " + std::to_string(response.data.size()) + " 字节",
                    ErrorCodes::MALFORMED_RESPONSE);
            }
            return;
        }

        // 写应答须原样回显请求字段
        if (response.data != packet.expectedEcho) {
            throw TransportException("写应答回显不匹配: 期望 " + ModbusUtils::toHexString(packet.expectedEcho)
                + "，实际 " + ModbusUtils::toHexString(response.data), ErrorCodes::MALFORMED_RESPONSE);
        }
    }
};

}  // namespace modbus
