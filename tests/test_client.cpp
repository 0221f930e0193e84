#include <catch2/catch.hpp>

#include "common/protocol/modbus/Modbus.Client.hpp"
#include "MockTransport.hpp"

using namespace modbus;

using Bytes = std::vector<uint8_t>;

class ClientFixture {
public:
    std::shared_ptr<MockTransport> transport;
    ModbusClient client;

    ClientFixture()
        : transport(std::make_shared<MockTransport>(FrameMode::TCP)),
          client(transport) {}

    /** 校验失败：错误码符合预期且没有任何 I/O */
    template <typename Fn>
    void requireRejected(Fn&& fn, int expectedCode) {
        try {
            fn();
            FAIL("expected ValidationException");
        } catch (const ValidationException& e) {
            INFO(e.what());
            REQUIRE(e.getCode() == expectedCode);
        }
        REQUIRE(transport->sent.empty());
        REQUIRE(transport->flushCount == 0);
    }
};

// ==================== 协议场景 ====================

TEST_CASE_METHOD(ClientFixture, "write four coils at 8289", "[client][scenario]") {
    transport->responder = mock::echo(FrameMode::TCP);

    client.write(Target::Coils, 8289, {1, 1, 0, 1});

    REQUIRE(transport->lastPdu() == Bytes{0x0F, 0x20, 0x60, 0x00, 0x04, 0x01, 0x0B});
    REQUIRE(client.transactionState() == TransactionState::Completed);
}

TEST_CASE_METHOD(ClientFixture, "read one holding register at 9", "[client][scenario]") {
    transport->responder = mock::always(FrameMode::TCP, {0x03, 0x02, 0x12, 0x34});

    auto values = client.read(Target::HoldingRegs, 9);

    REQUIRE(transport->lastPdu() == Bytes{0x03, 0x00, 0x08, 0x00, 0x01});
    REQUIRE(values == std::vector<double>{0x1234});
}

TEST_CASE_METHOD(ClientFixture, "mask write register 20", "[client][scenario]") {
    transport->responder = mock::echo(FrameMode::TCP);

    client.maskWrite(20, 48, 1);

    REQUIRE(transport->lastPdu() == Bytes{0x16, 0x00, 0x13, 0x00, 0x30, 0x00, 0x01});
}

TEST_CASE_METHOD(ClientFixture, "reading coils unpacks exactly count bits", "[client]") {
    transport->responder = mock::always(FrameMode::TCP, {0x01, 0x02, 0xCD, 0x01});

    auto values = client.read(Target::Coils, 20, 10);

    REQUIRE(transport->lastPdu() == Bytes{0x01, 0x00, 0x13, 0x00, 0x0A});
    REQUIRE(values == std::vector<double>{1, 0, 1, 1, 0, 0, 1, 1, 1, 0});
}

TEST_CASE_METHOD(ClientFixture, "precision scales the register quantity", "[client]") {
    transport->responder = mock::always(FrameMode::TCP, {0x04, 0x08, 0x00, 0x00, 0x00, 0x01, 0xFF, 0xFF, 0xFF, 0xFF});

    auto values = client.read(Target::InputRegs, 1, 2, 1, Precision::Int32);

    REQUIRE(transport->lastPdu() == Bytes{0x04, 0x00, 0x00, 0x00, 0x04});
    REQUIRE(values == std::vector<double>{1, -1});
}

TEST_CASE_METHOD(ClientFixture, "multi-segment read concatenates in request order", "[client]") {
    transport->responder = mock::always(FrameMode::TCP,
        {0x03, 0x0A, 0x00, 0x2A, 0xFF, 0xFF, 0xFF, 0xFE, 0x3F, 0x80, 0x00, 0x00});

    auto values = client.read(Target::HoldingRegs, 1, std::vector<int>{1, 1, 1}, 1,
                              {Precision::UInt16, Precision::Int32, Precision::Single});

    REQUIRE(transport->lastPdu() == Bytes{0x03, 0x00, 0x00, 0x00, 0x05});
    REQUIRE(values == std::vector<double>{42, -2, 1.0});
}

TEST_CASE_METHOD(ClientFixture, "function code selection for writes", "[client]") {
    transport->responder = mock::echo(FrameMode::TCP);

    SECTION("single coil") {
        client.write(Target::Coils, 1, {1});
        REQUIRE(transport->lastPdu() == Bytes{0x05, 0x00, 0x00, 0xFF, 0x00});
    }
    SECTION("single 16-bit register") {
        client.write(Target::HoldingRegs, 2, {513});
        REQUIRE(transport->lastPdu() == Bytes{0x06, 0x00, 0x01, 0x02, 0x01});
    }
    SECTION("single value spanning two registers") {
        client.write(Target::HoldingRegs, 2, {-2}, 1, Precision::Int32);
        REQUIRE(transport->lastPdu() == Bytes{0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0xFF, 0xFF, 0xFF, 0xFE});
    }
    SECTION("several registers") {
        client.write(Target::HoldingRegs, 2, {1, 2});
        REQUIRE(transport->lastPdu() == Bytes{0x10, 0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x01, 0x00, 0x02});
    }
}

TEST_CASE_METHOD(ClientFixture, "write then read accepts 121 registers", "[client]") {
    transport->responder = mock::always(FrameMode::TCP, {0x17, 0x02, 0x00, 0x01});

    auto values = client.writeRead(1, std::vector<double>(121, 1.0), 1, 1);

    REQUIRE(values == std::vector<double>{1});
    auto pdu = transport->lastPdu();
    REQUIRE(pdu.size() == 10 + 121 * 2);
    REQUIRE(pdu.size() <= 253);
    REQUIRE(pdu[9] == 242);
}

TEST_CASE_METHOD(ClientFixture, "write then read in one transaction", "[client]") {
    transport->responder = mock::always(FrameMode::TCP, {0x17, 0x04, 0x00, 0x0A, 0x00, 0x0B});

    auto values = client.writeRead(15, {0xFF, 0xFF, 0xFF}, 4, 2);

    REQUIRE(transport->lastPdu() == Bytes{0x17, 0x00, 0x03, 0x00, 0x02, 0x00, 0x0E, 0x00, 0x03, 0x06,
                                          0x00, 0xFF, 0x00, 0xFF, 0x00, 0xFF});
    REQUIRE(values == std::vector<double>{10, 11});
}

TEST_CASE_METHOD(ClientFixture, "byte order applies to written registers", "[client]") {
    transport->responder = mock::echo(FrameMode::TCP);
    client.setByteOrder("little-endian");
    REQUIRE(client.byteOrder() == Endian::Little);

    client.write(Target::HoldingRegs, 1, {0x1234});
    REQUIRE(transport->lastPdu() == Bytes{0x06, 0x00, 0x00, 0x34, 0x12});
}

TEST_CASE_METHOD(ClientFixture, "repeated reads of unchanged state agree", "[client]") {
    transport->responder = mock::always(FrameMode::TCP, {0x03, 0x04, 0x40, 0x49, 0x0F, 0xDB});

    auto first = client.read(Target::HoldingRegs, 100, 1, 1, Precision::Single);
    auto second = client.read(Target::HoldingRegs, 100, 1, 1, Precision::Single);
    REQUIRE(first == second);
    REQUIRE(first.front() == Approx(3.14159274));
}

TEST_CASE_METHOD(ClientFixture, "broadcast", "[client][broadcast]") {
    transport->responder = mock::silent();

    SECTION("writes are sent without waiting") {
        client.write(Target::HoldingRegs, 1, {7}, 0);
        client.maskWrite(1, 0xFF00, 0x0001, 0);
        REQUIRE(transport->sent.size() == 2);
        REQUIRE(transport->receiveCount == 0);
    }
    SECTION("reads are rejected") {
        requireRejected([&]() { client.read(Target::HoldingRegs, 1, 1, 0); }, ErrorCodes::INVALID_SERVER_ID);
        requireRejected([&]() { client.writeRead(1, {1}, 1, 1, 0); }, ErrorCodes::INVALID_SERVER_ID);
    }
}

// ==================== 失败处理 ====================

TEST_CASE_METHOD(ClientFixture, "server errors flush and keep their classification", "[client][errors]") {
    transport->responder = mock::always(FrameMode::TCP, {0x83, 0x02});

    REQUIRE_THROWS_AS(client.read(Target::HoldingRegs, 1), ServerException);
    // 发送前一次 + 失败后一次
    REQUIRE(transport->flushCount == 2);
    REQUIRE(client.retryCount() == 0);
}

TEST_CASE_METHOD(ClientFixture, "timeouts surface after the retries", "[client][errors]") {
    transport->responder = mock::silent();
    client.setNumRetries(2);

    REQUIRE_THROWS_AS(client.read(Target::HoldingRegs, 1), TimeoutException);
    REQUIRE(transport->sent.size() == 3);
    REQUIRE(client.retryCount() == 0);
    REQUIRE(client.transactionState() == TransactionState::Failed);
}

// ==================== 参数校验 ====================

TEST_CASE_METHOD(ClientFixture, "count bounds per target and precision", "[client][validation]") {
    SECTION("registers") {
        requireRejected([&]() { client.read(Target::HoldingRegs, 1, 0); }, ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.read(Target::HoldingRegs, 1, 126); }, ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.read(Target::InputRegs, 1, 63, 1, Precision::Int32); },
                        ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.read(Target::InputRegs, 1, 32, 1, Precision::Double); },
                        ErrorCodes::INVALID_COUNT);
    }
    SECTION("bits") {
        requireRejected([&]() { client.read(Target::Coils, 1, 2001); }, ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.write(Target::Coils, 1, std::vector<double>(1969, 1.0)); },
                        ErrorCodes::INVALID_COUNT);
    }
    SECTION("register writes") {
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, std::vector<double>(124, 1.0)); },
                        ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, std::vector<double>(31, 1.0), 1,
                                             Precision::UInt64); },
                        ErrorCodes::INVALID_COUNT);
    }
    SECTION("multi-segment totals") {
        requireRejected([&]() {
            client.read(Target::HoldingRegs, 1, std::vector<int>{100, 13}, 1, {Precision::UInt16, Precision::Int32});
        }, ErrorCodes::INVALID_COUNT);
        requireRejected([&]() {
            client.read(Target::HoldingRegs, 1, std::vector<int>{1, 2}, 1, {Precision::UInt16});
        }, ErrorCodes::PRECISION_COUNT_MISMATCH);
    }
}

TEST_CASE_METHOD(ClientFixture, "largest valid counts are sent", "[client][validation]") {
    transport->responder = mock::silent();
    client.setNumRetries(1);

    REQUIRE_THROWS_AS(client.read(Target::InputRegs, 1, 62, 1, Precision::Int32), TimeoutException);
    REQUIRE(transport->lastPdu() == Bytes{0x04, 0x00, 0x00, 0x00, 0x7C});
}

TEST_CASE_METHOD(ClientFixture, "argument validation", "[client][validation]") {
    SECTION("server id") {
        requireRejected([&]() { client.read(Target::Coils, 1, 1, 248); }, ErrorCodes::INVALID_SERVER_ID);
        requireRejected([&]() { client.maskWrite(1, 0, 0, -1); }, ErrorCodes::INVALID_SERVER_ID);
    }
    SECTION("address") {
        requireRejected([&]() { client.read(Target::Coils, 0); }, ErrorCodes::INVALID_ADDRESS);
        requireRejected([&]() { client.read(Target::Coils, 65537); }, ErrorCodes::INVALID_ADDRESS);
        requireRejected([&]() { client.read(Target::HoldingRegs, 65536, 2); }, ErrorCodes::INVALID_ADDRESS);
    }
    SECTION("precision on a bit target") {
        requireRejected([&]() { client.read(Target::Inputs, 1, 1, 1, Precision::UInt16); },
                        ErrorCodes::INVALID_PRECISION);
    }
    SECTION("read-only targets") {
        requireRejected([&]() { client.write(Target::Inputs, 1, {1}); }, ErrorCodes::INVALID_TARGET);
        requireRejected([&]() { client.write(Target::InputRegs, 1, {1}); }, ErrorCodes::INVALID_TARGET);
    }
    SECTION("coil values") {
        requireRejected([&]() { client.write(Target::Coils, 1, {2}); }, ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::Coils, 1, {1, 0.5}); }, ErrorCodes::INVALID_VALUE);
    }
    SECTION("register values") {
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {}); }, ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {1.5}); }, ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {65536}); }, ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {-1}); }, ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {32768}, 1, Precision::Int16); },
                        ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {9223372036854775808.0}, 1, Precision::Int64); },
                        ErrorCodes::INVALID_VALUE);
        requireRejected([&]() { client.write(Target::HoldingRegs, 1, {1.0e39}, 1, Precision::Single); },
                        ErrorCodes::INVALID_VALUE);
        requireRejected([&]() {
            client.write(Target::HoldingRegs, 1, {std::numeric_limits<double>::infinity()}, 1, Precision::Double);
        }, ErrorCodes::INVALID_VALUE);
    }
    SECTION("masks") {
        requireRejected([&]() { client.maskWrite(1, 65536, 0); }, ErrorCodes::INVALID_MASK);
        requireRejected([&]() { client.maskWrite(1, 0, -1); }, ErrorCodes::INVALID_MASK);
    }
    SECTION("write then read ranges are independent") {
        // FC23 写入上限 121，比 FC16 少两个寄存器
        requireRejected([&]() { client.writeRead(1, std::vector<double>(122, 1.0), 1, 1); },
                        ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.writeRead(1, std::vector<double>(61, 1.0), Precision::Int32,
                                                 1, 1, Precision::UInt16); },
                        ErrorCodes::INVALID_COUNT);
        requireRejected([&]() { client.writeRead(1, {1}, 1, 126); }, ErrorCodes::INVALID_COUNT);
    }
}

// ==================== 属性 ====================

TEST_CASE_METHOD(ClientFixture, "client properties", "[client][properties]") {
    REQUIRE(client.numRetries() == 1);
    REQUIRE(client.wordOrder() == Endian::Big);

    REQUIRE_THROWS_AS(client.setNumRetries(0), ValidationException);
    REQUIRE_THROWS_AS(client.setTimeout(0.001), ValidationException);
    REQUIRE_THROWS_AS(client.setTimeout(Constants::MAX_TIMEOUT_SEC + 1), ValidationException);
    REQUIRE_THROWS_AS(client.setTimeout(1e300), ValidationException);
    REQUIRE_THROWS_AS(client.setTimeout(std::numeric_limits<double>::infinity()), ValidationException);
    REQUIRE_THROWS_AS(client.setWordOrder("middle-endian"), ValidationException);

    client.setTimeout(0.5);
    REQUIRE(client.timeout() == Approx(0.5));
    REQUIRE(client.retryCount() == 0);

    client.setTimeout(Constants::MAX_TIMEOUT_SEC);
    REQUIRE(client.transport().timeoutMs() == std::chrono::milliseconds(86400000));

    client.setWordOrder(Endian::Little);
    REQUIRE(client.wordOrder() == Endian::Little);
}

TEST_CASE("an injected transport keeps its own timeout", "[client][properties]") {
    auto transport = std::make_shared<MockTransport>();
    transport->setTimeout(0.25);

    ModbusConfig options;
    options.timeout = 3;
    options.numRetries = 4;
    ModbusClient client(transport, options);

    REQUIRE(client.timeout() == Approx(0.25));
    REQUIRE(client.numRetries() == 4);
}

TEST_CASE("RTU client frames requests with a CRC", "[client][rtu]") {
    auto transport = std::make_shared<MockTransport>(FrameMode::RTU);
    transport->responder = mock::always(FrameMode::RTU, {0x03, 0x02, 0x00, 0x63});
    ModbusClient client(transport);

    auto values = client.read(Target::HoldingRegs, 1, 1, 17);
    REQUIRE(values == std::vector<double>{99});

    const auto& frame = transport->sent.back();
    REQUIRE(frame.size() == 8);
    REQUIRE(frame.front() == 17);
    REQUIRE(ModbusUtils::crc16(frame.data(), frame.size() - 2)
            == static_cast<uint16_t>(frame[6] | (frame[7] << 8)));
}
