// Utils
#include "common/utils/LoggerManager.hpp"
#include "common/utils/ConfigManager.hpp"

// Protocol
#include "common/protocol/modbus/Modbus.hpp"

// CLI
#include "cli/Cli.Commands.hpp"

// ─── 错误输出 ──────────────────────────────────────────

/**
 * @brief 输出错误到控制台和日志
 */
void printError(const std::string& title, const std::string& detail,
                const std::vector<std::string>& hints = {}) {
    std::string border(60, '=');
    std::cerr << "\n" << border << "\n";
    std::cerr << " [ERROR] " << title << "\n";
    std::cerr << std::string(60, '-') << "\n";
    std::cerr << "  " << detail << "\n";
    if (!hints.empty()) {
        std::cerr << "\n  请检查:\n";
        for (const auto& hint : hints) {
            std::cerr << "    - " << hint << "\n";
        }
    }
    std::cerr << border << "\n" << std::endl;

    LOG_ERROR << "[Cli] " << title << ": " << detail;
}

/**
 * @brief 根据错误类别返回排查提示
 */
std::vector<std::string> getErrorHints(const AppException& e) {
    int code = e.getCode();
    if (code == ErrorCodes::TRANSPORT_NOT_OPEN) {
        return {
            "config 中 transport 的地址/端口或串口设备是否正确",
            "从站设备是否上电并可达",
            "串口设备是否被其他程序占用、当前用户是否有读写权限",
        };
    }
    if (code == ErrorCodes::RESPONSE_TIMEOUT) {
        return {
            "serverId 是否与从站地址一致",
            "串口波特率、校验、停止位是否与从站一致",
            "modbus.timeout 是否过短",
        };
    }
    if (code > ErrorCodes::SERVER_EXCEPTION_BASE && code < ErrorCodes::RESPONSE_TIMEOUT) {
        return {
            "从站是否支持该功能码",
            "地址与数量是否在从站的寄存器映射范围内",
        };
    }
    return {};
}

/**
 * @brief 错误类别 → 进程退出码
 */
int exitCodeFor(const AppException& e) {
    int code = e.getCode();
    if (code < 2000) return 2;                                   // 参数校验
    if (code < ErrorCodes::RESPONSE_TIMEOUT) return 3;           // 从站异常
    if (code < ErrorCodes::TRANSPORT_ERROR) return 4;            // 超时
    return 5;                                                    // 传输层
}

int main(int argc, char* argv[]) {
    // 1. 解析命令行
    cli::Options options;
    cli::Command command;
    try {
        options = cli::parseOptions(argc, argv);
        if (options.showHelp || options.args.empty()) {
            std::cout << cli::USAGE;
            return options.showHelp ? 0 : 2;
        }
        command = cli::parseCommand(options.args);
    } catch (const AppException& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    // 2. 初始化日志系统（配置加载前先写默认目录，记录配置错误）
    LoggerManager::initialize(Constants::DEFAULT_LOG_DIR);

    // 3. 加载并验证配置文件（失败时 ConfigManager 已输出详细错误）
    auto config = ConfigManager::load(options.configPath);
    if (!config) {
        std::cerr << "modbus-cli aborted due to configuration errors." << std::endl;
        return 1;
    }

    // 4. 应用日志配置
    LoggerManager::initialize(config->logDir, config->consoleLog);
    LoggerManager::setLogLevel(config->logLevel);

    // 5. 建立连接并执行命令
    int exitCode = 0;
    try {
        auto client = modbus::ModbusClient::create(*config);
        auto values = cli::execute(*client, command);
        for (double v : values) {
            std::cout << cli::formatValue(v) << "\n";
        }
        std::cout.flush();
    } catch (const AppException& e) {
        printError("命令执行失败 (" + std::to_string(e.getCode()) + ")", e.what(), getErrorHints(e));
        exitCode = exitCodeFor(e);
    } catch (const std::exception& e) {
        printError("命令执行失败", e.what());
        exitCode = 1;
    }

    // 6. 关闭日志（flush 剩余数据）
    LoggerManager::close();
    return exitCode;
}
