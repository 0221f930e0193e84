#include <catch2/catch.hpp>

#include "cli/Cli.Commands.hpp"
#include "MockTransport.hpp"

using namespace cli;

using Bytes = std::vector<uint8_t>;

TEST_CASE("global options", "[cli]") {
    SECTION("config path in both spellings") {
        const char* argv1[] = {"modbus-cli", "--config", "a.json", "read", "coils", "1"};
        auto o1 = parseOptions(6, const_cast<char**>(argv1));
        REQUIRE(o1.configPath == std::optional<std::string>("a.json"));
        REQUIRE(o1.args == std::vector<std::string>{"read", "coils", "1"});

        const char* argv2[] = {"modbus-cli", "read", "--config=b.json", "coils", "1"};
        auto o2 = parseOptions(5, const_cast<char**>(argv2));
        REQUIRE(o2.configPath == std::optional<std::string>("b.json"));
        REQUIRE(o2.args.size() == 3);
    }
    SECTION("help") {
        const char* argv[] = {"modbus-cli", "-h"};
        REQUIRE(parseOptions(2, const_cast<char**>(argv)).showHelp);
    }
    SECTION("config without a path") {
        const char* argv[] = {"modbus-cli", "-c"};
        REQUIRE_THROWS_AS(parseOptions(2, const_cast<char**>(argv)), ValidationException);
    }
}

TEST_CASE("read command", "[cli]") {
    SECTION("defaults") {
        auto cmd = parseCommand({"read", "HoldingRegs", "9"});
        REQUIRE(cmd.kind == CommandKind::Read);
        REQUIRE(cmd.target == Target::HoldingRegs);
        REQUIRE(cmd.address == 9);
        REQUIRE(cmd.counts == std::vector<int>{1});
        REQUIRE(cmd.serverId == 1);
        REQUIRE(cmd.precisions.empty());
        REQUIRE_FALSE(cmd.multiSegment);
    }
    SECTION("all arguments") {
        auto cmd = parseCommand({"read", "inputregs", "0x10", "4", "17", "int32"});
        REQUIRE(cmd.address == 16);
        REQUIRE(cmd.counts == std::vector<int>{4});
        REQUIRE(cmd.serverId == 17);
        REQUIRE(cmd.precisions == std::vector<Precision>{Precision::Int32});
        REQUIRE_FALSE(cmd.multiSegment);
    }
    SECTION("comma lists select a multi-segment read") {
        auto cmd = parseCommand({"read", "holdingregs", "1", "1,2", "1", "uint16,single"});
        REQUIRE(cmd.counts == std::vector<int>{1, 2});
        REQUIRE(cmd.precisions == std::vector<Precision>{Precision::UInt16, Precision::Single});
        REQUIRE(cmd.multiSegment);
    }
}

TEST_CASE("write, writeread and maskwrite commands", "[cli]") {
    auto write = parseCommand({"write", "coils", "8289", "1,1,0,1"});
    REQUIRE(write.kind == CommandKind::Write);
    REQUIRE(write.values == std::vector<double>{1, 1, 0, 1});

    auto wr = parseCommand({"writeread", "15", "255,255", "uint16", "4", "6", "int16", "3"});
    REQUIRE(wr.kind == CommandKind::WriteRead);
    REQUIRE(wr.address == 15);
    REQUIRE(wr.readAddress == 4);
    REQUIRE(wr.readCount == 6);
    REQUIRE(wr.readPrecision == Precision::Int16);
    REQUIRE(wr.serverId == 3);

    auto mw = parseCommand({"maskwrite", "20", "0xF2", "0x25"});
    REQUIRE(mw.kind == CommandKind::MaskWrite);
    REQUIRE(mw.andMask == 0xF2);
    REQUIRE(mw.orMask == 0x25);
}

TEST_CASE("malformed commands", "[cli]") {
    REQUIRE_THROWS_AS(parseCommand({}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"erase", "coils", "1"}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"read", "coils"}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"read", "registers", "1"}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"read", "coils", "1.5"}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"write", "coils", "1", "1,x"}), ValidationException);
    REQUIRE_THROWS_AS(parseCommand({"read", "holdingregs", "1", "1", "1", "float"}), ValidationException);
}

TEST_CASE("commands run against a client", "[cli]") {
    auto transport = std::make_shared<MockTransport>();
    modbus::ModbusClient client(transport);

    SECTION("single precision applies to every segment") {
        transport->responder = mock::always(modbus::FrameMode::TCP,
            {0x03, 0x08, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02});
        auto values = execute(client, parseCommand({"read", "holdingregs", "1", "1,1", "1", "uint32"}));
        REQUIRE(values == std::vector<double>{1, 2});
        REQUIRE(transport->lastPdu() == Bytes{0x03, 0x00, 0x00, 0x00, 0x04});
    }
    SECTION("writes return nothing") {
        transport->responder = mock::echo(modbus::FrameMode::TCP);
        REQUIRE(execute(client, parseCommand({"write", "holdingregs", "1", "7"})).empty());
        REQUIRE(execute(client, parseCommand({"maskwrite", "1", "0", "0"})).empty());
    }
}

TEST_CASE("value formatting", "[cli]") {
    REQUIRE(formatValue(42) == "42");
    REQUIRE(formatValue(-1) == "-1");
    REQUIRE(formatValue(0.5) == "0.5");
}
