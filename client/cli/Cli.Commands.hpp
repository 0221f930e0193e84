#pragma once

#include "common/protocol/modbus/Modbus.Client.hpp"

namespace cli {

using modbus::Precision;
using modbus::Target;

/** 命令行子命令 */
enum class CommandKind {
    Read,
    Write,
    WriteRead,
    MaskWrite
};

/**
 * @brief 解析后的子命令参数
 */
struct Command {
    CommandKind kind = CommandKind::Read;
    Target target = Target::HoldingRegs;
    int address = 0;
    int serverId = modbus::Limits::DEFAULT_SERVER_ID;

    // read
    std::vector<int> counts{modbus::Limits::DEFAULT_COUNT};
    std::vector<Precision> precisions;
    bool multiSegment = false;

    // write / writeread
    std::vector<double> values;
    Precision writePrecision = Precision::UInt16;

    // writeread
    int readAddress = 0;
    int readCount = 0;
    Precision readPrecision = Precision::UInt16;

    // maskwrite
    long long andMask = 0;
    long long orMask = 0;
};

/** 全局选项 + 子命令参数 */
struct Options {
    std::optional<std::string> configPath;
    bool showHelp = false;
    std::vector<std::string> args;
};

inline const char* USAGE =
    "用法: modbus-cli [--config <file>] <command> ...\n"
    "\n"
    "命令:\n"
    "  read <target> <address> [count] [serverId] [precision]\n"
    "      target: coils | inputs | holdingregs | inputregs\n"
    "      count 与 precision 可用逗号分隔，一次读取多段不同格式的寄存器\n"
    "  write <target> <address> <v1,v2,...> [serverId] [precision]\n"
    "  writeread <writeAddress> <v1,v2,...> <writePrecision> <readAddress> <readCount> <readPrecision> [serverId]\n"
    "  maskwrite <address> <andMask> <orMask> [serverId]\n"
    "\n"
    "precision: int16 | uint16 | int32 | uint32 | int64 | uint64 | single | double\n";

/**
 * @brief 解析全局选项，剩余参数原样保留给子命令
 */
inline Options parseOptions(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                throw ValidationException("--config 缺少文件路径");
            }
            options.configPath = argv[++i];
        } else if (arg.starts_with("--config=")) {
            options.configPath = arg.substr(9);
        } else {
            options.args.push_back(arg);
        }
    }
    return options;
}

namespace detail {

inline int toInt(const std::string& text, const char* name) {
    auto v = StringUtils::parseInt(text);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
        throw ValidationException(std::string(name) + " 必须是整数: '" + text + "'");
    }
    return static_cast<int>(*v);
}

inline long long toLong(const std::string& text, const char* name) {
    auto v = StringUtils::parseInt(text);
    if (!v) {
        throw ValidationException(std::string(name) + " 必须是整数: '" + text + "'");
    }
    return *v;
}

inline std::vector<double> toValues(const std::string& text) {
    auto v = StringUtils::parseDoubleList(text);
    if (!v) {
        throw ValidationException("写入值格式错误: '" + text + "'（示例: 1,2,3）", ErrorCodes::INVALID_VALUE);
    }
    return *v;
}

inline void requireArgs(const std::vector<std::string>& args, size_t min, size_t max, const char* command) {
    // args[0] 为子命令本身
    if (args.size() < min + 1 || args.size() > max + 1) {
        throw ValidationException(std::string(command) + " 参数个数错误\n" + USAGE);
    }
}

}  // namespace detail

/**
 * @brief 子命令参数 → Command
 * 参数格式错误抛出 ValidationException
 */
inline Command parseCommand(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw ValidationException(std::string("缺少命令\n") + USAGE);
    }

    Command cmd;
    auto name = StringUtils::toLower(args[0]);

    if (name == "read") {
        detail::requireArgs(args, 2, 5, "read");
        cmd.kind = CommandKind::Read;
        cmd.target = modbus::parseTarget(args[1]);
        cmd.address = detail::toInt(args[2], "address");

        if (args.size() > 3) {
            cmd.counts.clear();
            for (const auto& token : StringUtils::split(args[3], ',')) {
                cmd.counts.push_back(detail::toInt(token, "count"));
            }
            if (cmd.counts.empty()) {
                throw ValidationException("count 不能为空", ErrorCodes::INVALID_COUNT);
            }
        }
        if (args.size() > 4) {
            cmd.serverId = detail::toInt(args[4], "serverId");
        }
        if (args.size() > 5) {
            for (const auto& token : StringUtils::split(args[5], ',')) {
                cmd.precisions.push_back(modbus::parsePrecision(token));
            }
        }
        cmd.multiSegment = cmd.counts.size() > 1 || cmd.precisions.size() > 1;
        return cmd;
    }

    if (name == "write") {
        detail::requireArgs(args, 3, 5, "write");
        cmd.kind = CommandKind::Write;
        cmd.target = modbus::parseTarget(args[1]);
        cmd.address = detail::toInt(args[2], "address");
        cmd.values = detail::toValues(args[3]);
        if (args.size() > 4) {
            cmd.serverId = detail::toInt(args[4], "serverId");
        }
        if (args.size() > 5) {
            cmd.precisions.push_back(modbus::parsePrecision(args[5]));
        }
        return cmd;
    }

    if (name == "writeread") {
        detail::requireArgs(args, 6, 7, "writeread");
        cmd.kind = CommandKind::WriteRead;
        cmd.address = detail::toInt(args[1], "writeAddress");
        cmd.values = detail::toValues(args[2]);
        cmd.writePrecision = modbus::parsePrecision(args[3]);
        cmd.readAddress = detail::toInt(args[4], "readAddress");
        cmd.readCount = detail::toInt(args[5], "readCount");
        cmd.readPrecision = modbus::parsePrecision(args[6]);
        if (args.size() > 7) {
            cmd.serverId = detail::toInt(args[7], "serverId");
        }
        return cmd;
    }

    if (name == "maskwrite") {
        detail::requireArgs(args, 3, 4, "maskwrite");
        cmd.kind = CommandKind::MaskWrite;
        cmd.address = detail::toInt(args[1], "address");
        cmd.andMask = detail::toLong(args[2], "andMask");
        cmd.orMask = detail::toLong(args[3], "orMask");
        if (args.size() > 4) {
            cmd.serverId = detail::toInt(args[4], "serverId");
        }
        return cmd;
    }

    throw ValidationException("未知命令: '" + args[0] + "'\n" + USAGE);
}

/**
 * @brief 执行子命令
 * @return 读到的值；写类命令返回空
 */
inline std::vector<double> execute(modbus::ModbusClient& client, const Command& cmd) {
    switch (cmd.kind) {
        case CommandKind::Read: {
            if (cmd.multiSegment) {
                // 只给一个 precision 时应用到每一段
                auto precisions = cmd.precisions;
                if (precisions.empty()) {
                    precisions.assign(cmd.counts.size(), Precision::UInt16);
                } else if (precisions.size() == 1 && cmd.counts.size() > 1) {
                    precisions.assign(cmd.counts.size(), cmd.precisions.front());
                }
                return client.read(cmd.target, cmd.address, cmd.counts, cmd.serverId, precisions);
            }
            std::optional<Precision> precision;
            if (!cmd.precisions.empty()) precision = cmd.precisions.front();
            return client.read(cmd.target, cmd.address, cmd.counts.front(), cmd.serverId, precision);
        }
        case CommandKind::Write: {
            std::optional<Precision> precision;
            if (!cmd.precisions.empty()) precision = cmd.precisions.front();
            client.write(cmd.target, cmd.address, cmd.values, cmd.serverId, precision);
            return {};
        }
        case CommandKind::WriteRead:
            return client.writeRead(cmd.address, cmd.values, cmd.writePrecision,
                                    cmd.readAddress, cmd.readCount, cmd.readPrecision, cmd.serverId);
        case CommandKind::MaskWrite:
            client.maskWrite(cmd.address, cmd.andMask, cmd.orMask, cmd.serverId);
            return {};
    }
    return {};
}

/** 结果值格式化：整数不带小数点，浮点保留完整精度 */
inline std::string formatValue(double value) {
    std::ostringstream oss;
    if (std::floor(value) == value && std::fabs(value) < 1e18) {
        oss << static_cast<long long>(value);
    } else {
        oss << std::setprecision(17) << value;
    }
    return oss.str();
}

}  // namespace cli
