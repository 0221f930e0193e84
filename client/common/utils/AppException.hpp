#pragma once

#include "ErrorCodes.hpp"

/**
 * @brief 应用异常基类
 *
 * 所有对外抛出的错误都派生自此类，按错误码区分类别：
 * 1xxx 校验、3xxx 从站异常、4xxx 超时、5xxx 传输层
 */
class AppException : public std::exception {
private:
    int code_;
    std::string message_;

public:
    AppException(int code, std::string message)
        : code_(code), message_(std::move(message)) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    int getCode() const { return code_; }
    const std::string& getMessage() const { return message_; }
};

/**
 * @brief 参数校验失败
 * 在任何 I/O 之前抛出，不触碰传输层状态
 */
class ValidationException : public AppException {
public:
    explicit ValidationException(const std::string& message = "参数校验失败",
                                 int code = ErrorCodes::VALIDATION_FAILED)
        : AppException(code, message) {}
};

/**
 * @brief 应答超时（重试次数耗尽）
 */
class TimeoutException : public AppException {
public:
    explicit TimeoutException(const std::string& message = "等待从站应答超时")
        : AppException(ErrorCodes::RESPONSE_TIMEOUT, message) {}
};

/**
 * @brief 传输层错误（连接断开、I/O 错误、应答帧异常）
 */
class TransportException : public AppException {
public:
    explicit TransportException(const std::string& message = "传输层错误",
                                int code = ErrorCodes::TRANSPORT_ERROR)
        : AppException(code, message) {}
};
