#include <catch2/catch.hpp>

#include "common/utils/ConfigManager.hpp"

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream iss(text);
    REQUIRE(Json::parseFromStream(builder, iss, &root, &errs));
    return root;
}

struct Result {
    AppConfig config;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

Result apply(const std::string& text) {
    Result r;
    r.config = ConfigManager::fromJson(parse(text), r.errors, r.warnings);
    return r;
}

bool mentions(const std::vector<std::string>& messages, const std::string& needle) {
    return std::any_of(messages.begin(), messages.end(),
                       [&needle](const std::string& m) { return m.find(needle) != std::string::npos; });
}

}  // namespace

TEST_CASE("TCP configuration", "[config]") {
    auto r = apply(R"({
        "log_level": "debug",
        "console_log": true,
        "transport": { "type": "tcpip", "address": "192.168.1.10", "port": 1502 },
        "modbus": { "timeout": 2.5, "num_retries": 3, "byte_order": "little-endian" }
    })");

    REQUIRE(r.errors.empty());
    REQUIRE(r.warnings.empty());
    REQUIRE(r.config.logLevel == "DEBUG");
    REQUIRE(r.config.consoleLog);
    REQUIRE(r.config.transport.type == Constants::TRANSPORT_TCPIP);
    REQUIRE(r.config.transport.address == "192.168.1.10");
    REQUIRE(r.config.transport.port == 1502);
    REQUIRE(r.config.modbus.timeout == Approx(2.5));
    REQUIRE(r.config.modbus.numRetries == 3);
    REQUIRE(r.config.modbus.byteOrder == modbus::Endian::Little);
    REQUIRE(r.config.modbus.wordOrder == modbus::Endian::Big);
}

TEST_CASE("serial configuration", "[config]") {
    auto r = apply(R"({
        "transport": {
            "type": "SerialRTU", "serial_port": "/dev/ttyUSB0",
            "baud_rate": 19200, "data_bits": 8, "parity": "Even", "stop_bits": 1
        }
    })");

    REQUIRE(r.errors.empty());
    REQUIRE(r.config.transport.type == Constants::TRANSPORT_SERIALRTU);
    REQUIRE(r.config.transport.serial.port == "/dev/ttyUSB0");
    REQUIRE(r.config.transport.serial.baudRate == 19200);
    REQUIRE(r.config.transport.serial.parity == "even");
    REQUIRE(r.config.modbus.timeout == Approx(Constants::DEFAULT_TIMEOUT_SEC));
    REQUIRE(r.config.modbus.numRetries == Constants::DEFAULT_NUM_RETRIES);
}

TEST_CASE("defaults apply when optional sections are absent", "[config]") {
    auto r = apply(R"({ "transport": { "type": "tcpip", "address": "plc.local" } })");

    REQUIRE(r.errors.empty());
    REQUIRE(r.config.transport.port == Constants::DEFAULT_TCP_PORT);
    REQUIRE(r.config.logLevel == "INFO");
    REQUIRE(r.config.logDir == Constants::DEFAULT_LOG_DIR);
}

TEST_CASE("invalid configurations collect every error", "[config]") {
    SECTION("missing transport") {
        auto r = apply(R"({ "log_level": "INFO" })");
        REQUIRE(mentions(r.errors, "[transport]"));
    }
    SECTION("unsupported transport type") {
        auto r = apply(R"({ "transport": { "type": "udp" } })");
        REQUIRE(mentions(r.errors, "udp"));
    }
    SECTION("tcp without address and with a bad port") {
        auto r = apply(R"({ "transport": { "type": "tcpip", "port": 70000 } })");
        REQUIRE(r.errors.size() == 2);
        REQUIRE(mentions(r.errors, "address"));
        REQUIRE(mentions(r.errors, "70000"));
    }
    SECTION("serial line settings") {
        auto r = apply(R"({ "transport": {
            "type": "serialrtu", "serial_port": "/dev/ttyS0",
            "baud_rate": 12345, "data_bits": 9, "parity": "mark", "stop_bits": 3
        } })");
        REQUIRE(r.errors.size() == 4);
    }
    SECTION("protocol parameters") {
        auto r = apply(R"({
            "transport": { "type": "tcpip", "address": "10.0.0.1" },
            "modbus": { "timeout": 0.001, "num_retries": 0, "word_order": "middle" }
        })");
        REQUIRE(r.errors.size() == 3);
        REQUIRE(mentions(r.errors, "timeout"));
        REQUIRE(mentions(r.errors, "num_retries"));
        REQUIRE(mentions(r.errors, "word_order"));
        // 出错字段保持默认值
        REQUIRE(r.config.modbus.numRetries == Constants::DEFAULT_NUM_RETRIES);
    }
    SECTION("timeout above one day") {
        auto r = apply(R"({
            "transport": { "type": "tcpip", "address": "10.0.0.1" },
            "modbus": { "timeout": 1e300 }
        })");
        REQUIRE(r.errors.size() == 1);
        REQUIRE(mentions(r.errors, "timeout"));
        REQUIRE(r.config.modbus.timeout == Approx(Constants::DEFAULT_TIMEOUT_SEC));
    }
    SECTION("log level") {
        auto r = apply(R"({ "log_level": "verbose", "transport": { "type": "tcpip", "address": "h" } })");
        REQUIRE(mentions(r.errors, "[log_level]"));
    }
}

TEST_CASE("unknown keys only warn", "[config]") {
    auto r = apply(R"({
        "transport": { "type": "tcpip", "address": "h", "baud_rate": 9600 },
        "modbus": { "retries": 2 },
        "extra": 1
    })");

    REQUIRE(r.errors.empty());
    REQUIRE(r.warnings.size() == 3);
    REQUIRE(mentions(r.warnings, "transport.baud_rate"));
    REQUIRE(mentions(r.warnings, "modbus.retries"));
    REQUIRE(mentions(r.warnings, "'extra'"));
}

TEST_CASE("loading from text", "[config]") {
    SECTION("valid") {
        auto config = ConfigManager::loadFromString(R"({ "transport": { "type": "tcpip", "address": "h" } })");
        REQUIRE(config.has_value());
        REQUIRE(config->transport.address == "h");
    }
    SECTION("malformed JSON") {
        REQUIRE_FALSE(ConfigManager::loadFromString(R"({ "transport": )").has_value());
    }
    SECTION("root must be an object") {
        REQUIRE_FALSE(ConfigManager::loadFromString("[1, 2]").has_value());
    }
    SECTION("validation errors reject the whole file") {
        REQUIRE_FALSE(ConfigManager::loadFromString(R"({ "transport": { "type": "tcpip" } })").has_value());
    }
}

TEST_CASE("explicit config path must exist", "[config]") {
    REQUIRE_FALSE(ConfigManager::load(std::string("/nonexistent/modbus-config.json")).has_value());
}

TEST_CASE("log level names", "[config][logger]") {
    REQUIRE(LoggerManager::parseLogLevel("warn") == trantor::Logger::kWarn);
    REQUIRE(LoggerManager::parseLogLevel(" TRACE ") == trantor::Logger::kTrace);
    REQUIRE_FALSE(LoggerManager::parseLogLevel("loud").has_value());
}
