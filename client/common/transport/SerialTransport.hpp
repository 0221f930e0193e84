#pragma once

#include "Transport.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

/**
 * @brief 串口参数
 */
struct SerialSettings {
    std::string port;
    int baudRate = Constants::DEFAULT_BAUD_RATE;
    int dataBits = Constants::DEFAULT_DATA_BITS;
    std::string parity = Constants::DEFAULT_PARITY;   // none / even / odd
    int stopBits = Constants::DEFAULT_STOP_BITS;
};

/**
 * @brief Modbus RTU 串口传输（POSIX termios）
 *
 * 原始模式、非阻塞打开，VMIN = VTIME = 0，由 poll 负责等待
 */
class SerialTransport : public Transport {
public:
    explicit SerialTransport(SerialSettings settings) : settings_(std::move(settings)) {}

    ~SerialTransport() override {
        close();
    }

    SerialTransport(const SerialTransport&) = delete;
    SerialTransport& operator=(const SerialTransport&) = delete;

    void open() override {
        if (fd_ >= 0) return;

        speed_t speed = baudRateCode(settings_.baudRate);

        int fd = ::open(settings_.port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd < 0) {
            throw TransportException("打开串口失败: " + settings_.port + ": " + std::strerror(errno),
                                     ErrorCodes::TRANSPORT_NOT_OPEN);
        }

        struct termios tty;
        std::memset(&tty, 0, sizeof(tty));
        if (tcgetattr(fd, &tty) != 0) {
            int err = errno;
            ::close(fd);
            throw TransportException("读取串口属性失败: " + settings_.port + ": " + std::strerror(err),
                                     ErrorCodes::TRANSPORT_NOT_OPEN);
        }

        cfmakeraw(&tty);
        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);

        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~CRTSCTS;

        tty.c_cflag &= ~CSIZE;
        switch (settings_.dataBits) {
            case 5: tty.c_cflag |= CS5; break;
            case 6: tty.c_cflag |= CS6; break;
            case 7: tty.c_cflag |= CS7; break;
            default: tty.c_cflag |= CS8; break;
        }

        if (settings_.stopBits == 2) {
            tty.c_cflag |= CSTOPB;
        } else {
            tty.c_cflag &= ~CSTOPB;
        }

        tty.c_cflag &= ~(PARENB | PARODD);
        if (settings_.parity == "even") {
            tty.c_cflag |= PARENB;
        } else if (settings_.parity == "odd") {
            tty.c_cflag |= PARENB | PARODD;
        }

        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (tcsetattr(fd, TCSANOW, &tty) != 0) {
            int err = errno;
            ::close(fd);
            throw TransportException("设置串口属性失败: " + settings_.port + ": " + std::strerror(err),
                                     ErrorCodes::TRANSPORT_NOT_OPEN);
        }

        tcflush(fd, TCIOFLUSH);
        fd_ = fd;
        LOG_INFO << "[Serial] Opened " << describe();
    }

    void close() override {
        if (fd_ < 0) return;
        ::close(fd_);
        fd_ = -1;
        LOG_INFO << "[Serial] Closed " << settings_.port;
    }

    bool isOpen() const override { return fd_ >= 0; }

    void send(const std::vector<uint8_t>& bytes) override {
        ensureOpen();

        size_t written = 0;
        auto deadline = std::chrono::steady_clock::now() + timeoutMs();
        while (written < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
            if (n > 0) {
                written += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                throw TransportException("串口写入失败: " + std::string(std::strerror(errno)));
            }
            if (waitFor(POLLOUT, deadline) == 0) {
                throw TransportException("串口写入超时: " + settings_.port);
            }
        }
        // 等待发送完成，RS485 半双工需要在应答前让出总线
        while (tcdrain(fd_) < 0) {
            if (errno != EINTR) {
                throw TransportException("串口发送排空失败: " + settings_.port + ": " + std::strerror(errno));
            }
        }
    }

    std::vector<uint8_t> receive(std::chrono::milliseconds wait) override {
        ensureOpen();

        auto deadline = std::chrono::steady_clock::now() + wait;
        if (waitFor(POLLIN, deadline) == 0) {
            return {};
        }

        std::vector<uint8_t> data;
        uint8_t buf[256];
        while (true) {
            ssize_t n = ::read(fd_, buf, sizeof(buf));
            if (n > 0) {
                data.insert(data.end(), buf, buf + n);
                continue;
            }
            if (n < 0 && errno == EINTR) continue;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
                throw TransportException("串口读取失败: " + std::string(std::strerror(errno)));
            }
            break;
        }
        return data;
    }

    void flush() override {
        if (fd_ >= 0) {
            tcflush(fd_, TCIOFLUSH);
        }
    }

    modbus::FrameMode frameMode() const override { return modbus::FrameMode::RTU; }

    std::string describe() const override {
        std::ostringstream oss;
        oss << "serial " << settings_.port << " " << settings_.baudRate << " "
            << settings_.dataBits << (settings_.parity == "even" ? "E" : settings_.parity == "odd" ? "O" : "N")
            << settings_.stopBits;
        return oss.str();
    }

    /** 波特率数值 → termios 常量 */
    static speed_t baudRateCode(int baudRate) {
        switch (baudRate) {
            case 1200: return B1200;
            case 2400: return B2400;
            case 4800: return B4800;
            case 9600: return B9600;
            case 19200: return B19200;
            case 38400: return B38400;
            case 57600: return B57600;
            case 115200: return B115200;
            case 230400: return B230400;
            default:
                throw ValidationException("不支持的波特率: " + std::to_string(baudRate),
                                          ErrorCodes::INVALID_PROPERTY);
        }
    }

private:
    SerialSettings settings_;
    int fd_ = -1;

    void ensureOpen() const {
        if (fd_ < 0) {
            throw TransportException("串口未打开: " + settings_.port, ErrorCodes::TRANSPORT_NOT_OPEN);
        }
    }

    /** @return poll 就绪数（0 = 超时） */
    int waitFor(short events, std::chrono::steady_clock::time_point deadline) const {
        while (true) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining < 0) remaining = 0;

            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = events;
            int rc = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (rc < 0) {
                if (errno == EINTR) continue;
                throw TransportException("串口 poll 失败: " + std::string(std::strerror(errno)));
            }
            if (rc > 0 && (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))) {
                throw TransportException("串口异常: " + settings_.port);
            }
            return rc;
        }
    }
};
