#pragma once

#include "Transport.hpp"

/**
 * @brief Modbus TCP 传输（trantor TcpClient）
 *
 * socket 运行在私有的 EventLoopThread 上，回调把收到的字节放入队列，
 * 调用线程通过条件变量阻塞等待，对外保持同步语义。
 *
 * address 可以是 IP 或主机名，主机名在 open() 时经 trantor::Resolver 解析一次。
 * 连接断开后不自动重连：收不到应答即表现为超时，
 * 由事务层的 prepareForRetry() 或下一次 send() 重新建立连接。
 */
class TcpTransport : public Transport {
public:
    using TcpClient = trantor::TcpClient;
    using TcpConnectionPtr = trantor::TcpConnectionPtr;
    using MsgBuffer = trantor::MsgBuffer;
    using InetAddress = trantor::InetAddress;

    TcpTransport(std::string host, uint16_t port)
        : host_(std::move(host)), port_(port) {}

    ~TcpTransport() override {
        close();
    }

    TcpTransport(const TcpTransport&) = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    void open() override {
        if (!loopThread_) {
            loopThread_ = std::make_unique<trantor::EventLoopThread>("ModbusTcpLoop");
            loopThread_->run();
        }
        if (!remote_) {
            remote_ = resolve();
        }
        connect();
    }

    void close() override {
        if (!loopThread_) return;

        releaseClient();
        resolver_.reset();
        loopThread_.reset();

        std::lock_guard<std::mutex> lock(mutex_);
        rxBuffer_.clear();
        LOG_INFO << "[Tcp] Closed " << host_ << ":" << port_;
    }

    bool isOpen() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    void send(const std::vector<uint8_t>& bytes) override {
        if (!loopThread_) {
            throw TransportException("TCP 传输未打开: " + host_ + ":" + std::to_string(port_),
                                     ErrorCodes::TRANSPORT_NOT_OPEN);
        }

        TcpConnectionPtr conn;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            conn = conn_;
        }
        if (!conn || !conn->connected()) {
            LOG_WARN << "[Tcp] Connection to " << host_ << ":" << port_ << " lost, reconnecting before send";
            connect();
            std::lock_guard<std::mutex> lock(mutex_);
            conn = conn_;
        }
        if (!conn) {
            throw TransportException("TCP 连接已断开: " + host_ + ":" + std::to_string(port_));
        }

        conn->send(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
        LOG_TRACE << "[Tcp] Sent " << bytes.size() << "B to " << host_ << ":" << port_;
    }

    std::vector<uint8_t> receive(std::chrono::milliseconds wait) override {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, wait, [this]() { return !rxBuffer_.empty(); });

        std::vector<uint8_t> data;
        data.swap(rxBuffer_);
        return data;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!rxBuffer_.empty()) {
            LOG_DEBUG << "[Tcp] Discarded " << rxBuffer_.size() << "B of buffered input";
            rxBuffer_.clear();
        }
    }

    /** 超时重发前：连接已断开则重新连接 */
    void prepareForRetry() override {
        bool connected;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected = connected_;
        }
        if (!connected && loopThread_) {
            LOG_WARN << "[Tcp] Reconnecting to " << host_ << ":" << port_ << " before retry";
            connect();
        }
    }

    modbus::FrameMode frameMode() const override { return modbus::FrameMode::TCP; }

    std::string describe() const override {
        return "tcp " + host_ + ":" + std::to_string(port_);
    }

private:
    std::string host_;
    uint16_t port_;

    std::unique_ptr<trantor::EventLoopThread> loopThread_;
    std::shared_ptr<TcpClient> client_;
    std::shared_ptr<trantor::Resolver> resolver_;
    std::optional<InetAddress> remote_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    TcpConnectionPtr conn_;
    std::vector<uint8_t> rxBuffer_;
    bool connected_ = false;
    bool connectFailed_ = false;

    /**
     * @brief 解析 host_，最长等待一个 Timeout
     * 无法解析抛出 TransportException(TRANSPORT_NOT_OPEN)
     */
    InetAddress resolve() {
        if (!resolver_) {
            resolver_ = trantor::Resolver::newResolver(loopThread_->getLoop());
        }

        // 超时后回调仍可能触发，promise 由回调共同持有
        auto resolved = std::make_shared<std::promise<InetAddress>>();
        auto future = resolved->get_future();
        resolver_->resolve(host_, [resolved](const InetAddress& addr) {
            resolved->set_value(addr);
        });

        if (future.wait_for(timeoutMs()) != std::future_status::ready) {
            throw TransportException("解析主机名超时: " + host_, ErrorCodes::TRANSPORT_NOT_OPEN);
        }
        auto addr = future.get();
        if (addr.isUnspecified()) {
            throw TransportException("无法解析主机名: " + host_, ErrorCodes::TRANSPORT_NOT_OPEN);
        }

        LOG_DEBUG << "[Tcp] Resolved " << host_ << " -> " << addr.toIp();
        return InetAddress(addr.toIp(), port_, addr.isIpV6());
    }

    /**
     * @brief 建立连接，最长等待一个 Timeout
     * 失败抛出 TransportException(TRANSPORT_NOT_OPEN)
     */
    void connect() {
        releaseClient();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            connectFailed_ = false;
            rxBuffer_.clear();
        }

        auto* loop = loopThread_->getLoop();
        std::promise<std::shared_ptr<TcpClient>> created;
        auto createdFuture = created.get_future();

        loop->runInLoop([this, loop, &created]() {
            auto client = std::make_shared<TcpClient>(loop, *remote_, "ModbusTcpClient");

            client->setConnectionCallback([this](const TcpConnectionPtr& conn) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (conn->connected()) {
                    LOG_INFO << "[Tcp] Connected to " << conn->peerAddr().toIpPort();
                    conn_ = conn;
                    connected_ = true;
                } else {
                    LOG_WARN << "[Tcp] Disconnected from " << host_ << ":" << port_;
                    conn_.reset();
                    connected_ = false;
                }
                cv_.notify_all();
            });

            client->setMessageCallback([this](const TcpConnectionPtr&, MsgBuffer* buf) {
                std::lock_guard<std::mutex> lock(mutex_);
                const auto* begin = reinterpret_cast<const uint8_t*>(buf->peek());
                rxBuffer_.insert(rxBuffer_.end(), begin, begin + buf->readableBytes());
                LOG_TRACE << "[Tcp] Recv " << buf->readableBytes() << "B";
                buf->retrieveAll();
                cv_.notify_all();
            });

            client->setConnectionErrorCallback([this]() {
                std::lock_guard<std::mutex> lock(mutex_);
                LOG_WARN << "[Tcp] Connection to " << host_ << ":" << port_ << " failed";
                connectFailed_ = true;
                cv_.notify_all();
            });

            client->connect();
            created.set_value(client);
        });

        client_ = createdFuture.get();
        LOG_INFO << "[Tcp] Connecting to " << host_ << ":" << port_;

        std::unique_lock<std::mutex> lock(mutex_);
        bool done = cv_.wait_for(lock, timeoutMs(), [this]() { return connected_ || connectFailed_; });
        if (!done || !connected_) {
            lock.unlock();
            releaseClient();
            throw TransportException("连接 " + host_ + ":" + std::to_string(port_)
                + (done ? " 被拒绝" : " 超时"), ErrorCodes::TRANSPORT_NOT_OPEN);
        }
    }

    /** 在事件循环线程内断开并销毁 TcpClient */
    void releaseClient() {
        if (!client_ || !loopThread_) {
            client_.reset();
            return;
        }

        std::promise<void> released;
        auto releasedFuture = released.get_future();
        loopThread_->getLoop()->runInLoop([client = std::move(client_), &released]() mutable {
            client->disconnect();
            client.reset();
            released.set_value();
        });
        releasedFuture.wait();

        std::lock_guard<std::mutex> lock(mutex_);
        conn_.reset();
        connected_ = false;
    }
};
