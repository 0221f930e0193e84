#pragma once

#include "Constants.hpp"
#include "StringUtils.hpp"
#include "LoggerManager.hpp"
#include "common/protocol/modbus/Modbus.Types.hpp"
#include "common/transport/SerialTransport.hpp"

namespace fs = std::filesystem;

/** 传输层配置 */
struct TransportConfig {
    std::string type = Constants::TRANSPORT_TCPIP;
    std::string address;
    uint16_t port = Constants::DEFAULT_TCP_PORT;
    SerialSettings serial;
};

/** 客户端协议参数 */
struct ModbusConfig {
    double timeout = Constants::DEFAULT_TIMEOUT_SEC;
    int numRetries = Constants::DEFAULT_NUM_RETRIES;
    modbus::Endian byteOrder = modbus::Endian::Big;
    modbus::Endian wordOrder = modbus::Endian::Big;
};

/** 完整应用配置 */
struct AppConfig {
    std::string logLevel = "INFO";
    bool consoleLog = false;
    std::string logDir = Constants::DEFAULT_LOG_DIR;
    TransportConfig transport;
    ModbusConfig modbus;
};

/**
 * @brief 配置管理器 - 负责加载、验证和解析应用配置
 *
 * 启动时检查配置文件的完整性和正确性：
 * - JSON 语法检查
 * - 传输类型及其必填字段（tcpip: address；serialrtu: serial_port）
 * - 端口、波特率、数据位、校验、停止位合法性
 * - 超时、重试次数、字节序合法性
 * - 未知字段警告
 */
class ConfigManager {
public:
    /**
     * @brief 加载并验证配置文件
     * @param explicitPath 命令行指定的路径，未指定时按默认位置查找
     * @return 解析后的配置；失败时已输出详细错误信息到 stderr 和日志
     */
    static std::optional<AppConfig> load(const std::optional<std::string>& explicitPath = std::nullopt) {
        // 1. 查找配置文件
        auto configPath = explicitPath ? checkExplicitPath(*explicitPath) : findConfigFile();
        if (!configPath) {
            return std::nullopt;
        }

        // 2. 解析 JSON
        std::ifstream ifs(*configPath);
        if (!ifs) {
            printErrors("无法打开配置文件: " + *configPath, {"请检查文件是否存在及读取权限"});
            return std::nullopt;
        }
        Json::Value root;
        if (!parseJson(ifs, *configPath, root)) {
            return std::nullopt;
        }

        // 3. 验证并提取配置
        auto config = validateAndApply(root, *configPath);
        if (config) {
            LOG_INFO << "[Config] Loaded from: " << *configPath;
        }
        return config;
    }

    /**
     * @brief 从 JSON 文本加载（用于内嵌配置）
     */
    static std::optional<AppConfig> loadFromString(const std::string& text, const std::string& source = "<string>") {
        std::istringstream iss(text);
        Json::Value root;
        if (!parseJson(iss, source, root)) {
            return std::nullopt;
        }
        return validateAndApply(root, source);
    }

    /**
     * @brief JSON → AppConfig，收集全部错误与警告
     * 有错误时返回值中对应字段保持默认值
     */
    static AppConfig fromJson(const Json::Value& root,
                              std::vector<std::string>& errors,
                              std::vector<std::string>& warnings) {
        AppConfig config;

        warnUnknownKeys(root, {"log_level", "console_log", "log_dir", "transport", "modbus"}, "", warnings);
        applyLogging(root, config, errors);
        applyTransport(root, config.transport, errors, warnings);
        applyModbus(root, config.modbus, errors, warnings);

        return config;
    }

private:
    // ─── 配置文件查找 ───────────────────────────────────────────

    static std::optional<std::string> checkExplicitPath(const std::string& path) {
        if (fs::exists(path)) {
            return path;
        }
        printErrors("配置文件不存在: " + path, {"请检查 --config 参数指定的路径"});
        return std::nullopt;
    }

    static std::optional<std::string> findConfigFile() {
        static const std::vector<std::string> paths = {
            "./config/config.local.json",
            "../config/config.local.json",
            "./config/config.json",
            "../config/config.json",
            "config.json"
        };

        for (const auto& path : paths) {
            if (fs::exists(path)) {
                return path;
            }
        }

        std::vector<std::string> hints = {"请在以下位置之一创建配置文件:"};
        for (const auto& p : paths) {
            hints.push_back("  - " + p);
        }
        hints.emplace_back("可参考 config/config.example.json");
        printErrors("未找到配置文件", hints);
        return std::nullopt;
    }

    // ─── JSON 解析 ──────────────────────────────────────────────

    static bool parseJson(std::istream& is, const std::string& source, Json::Value& root) {
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, is, &root, &errs)) {
            printErrors("JSON 解析失败: " + source, {
                errs,
                "请检查 JSON 语法（缺少逗号、引号不匹配、尾部逗号等）"
            });
            return false;
        }

        if (!root.isObject()) {
            printErrors("JSON 格式错误: " + source, {"配置文件根节点必须是 JSON 对象"});
            return false;
        }

        return true;
    }

    static std::optional<AppConfig> validateAndApply(const Json::Value& root, const std::string& source) {
        std::vector<std::string> errors;
        std::vector<std::string> warnings;

        auto config = fromJson(root, errors, warnings);

        // 先输出警告（不阻断启动）
        if (!warnings.empty()) {
            printWarnings("配置警告 (" + source + ")", warnings);
        }

        // 有错误则中断启动
        if (!errors.empty()) {
            printErrors("配置验证失败: " + source, errors);
            return std::nullopt;
        }

        return config;
    }

    // ─── 分节解析 ──────────────────────────────────────────────

    static void applyLogging(const Json::Value& root, AppConfig& config, std::vector<std::string>& errors) {
        if (root.isMember("log_level")) {
            if (!root["log_level"].isString() || !LoggerManager::parseLogLevel(root["log_level"].asString())) {
                errors.emplace_back("[log_level] 无效的日志级别（有效值: TRACE, DEBUG, INFO, WARN, ERROR, FATAL）");
            } else {
                config.logLevel = StringUtils::toUpper(root["log_level"].asString());
            }
        }

        if (root.isMember("console_log")) {
            if (!root["console_log"].isBool()) {
                errors.emplace_back("[console_log] 必须是布尔值");
            } else {
                config.consoleLog = root["console_log"].asBool();
            }
        }

        if (root.isMember("log_dir")) {
            if (!root["log_dir"].isString() || root["log_dir"].asString().empty()) {
                errors.emplace_back("[log_dir] 必须是非空字符串");
            } else {
                config.logDir = root["log_dir"].asString();
            }
        }
    }

    static void applyTransport(const Json::Value& root, TransportConfig& transport,
                               std::vector<std::string>& errors,
                               std::vector<std::string>& warnings) {
        if (!root.isMember("transport") || !root["transport"].isObject()) {
            errors.emplace_back("[transport] 缺少传输层配置");
            return;
        }

        const auto& node = root["transport"];
        const std::string prefix = "[transport] ";

        if (!node.isMember("type") || !node["type"].isString()) {
            errors.push_back(prefix + "缺少 type 字段（tcpip 或 serialrtu）");
            return;
        }

        transport.type = StringUtils::toLower(node["type"].asString());

        if (transport.type == Constants::TRANSPORT_TCPIP) {
            warnUnknownKeys(node, {"type", "address", "port"}, "transport.", warnings);

            if (!node.isMember("address") || !node["address"].isString() ||
                node["address"].asString().empty()) {
                errors.push_back(prefix + "缺少 address 字段");
            } else {
                transport.address = node["address"].asString();
            }

            if (node.isMember("port")) {
                if (validatePort(node, prefix, errors)) {
                    transport.port = static_cast<uint16_t>(node["port"].asInt());
                }
            }
            return;
        }

        if (transport.type == Constants::TRANSPORT_SERIALRTU) {
            warnUnknownKeys(node, {"type", "serial_port", "baud_rate", "data_bits", "parity", "stop_bits"},
                            "transport.", warnings);

            auto& serial = transport.serial;
            if (!node.isMember("serial_port") || !node["serial_port"].isString() ||
                node["serial_port"].asString().empty()) {
                errors.push_back(prefix + "缺少 serial_port 字段");
            } else {
                serial.port = node["serial_port"].asString();
            }

            if (node.isMember("baud_rate")) {
                if (!node["baud_rate"].isInt()) {
                    errors.push_back(prefix + "baud_rate 必须是整数");
                } else {
                    try {
                        SerialTransport::baudRateCode(node["baud_rate"].asInt());
                        serial.baudRate = node["baud_rate"].asInt();
                    } catch (const ValidationException& e) {
                        errors.push_back(prefix + e.getMessage());
                    }
                }
            }

            if (node.isMember("data_bits")) {
                int bits = node["data_bits"].isInt() ? node["data_bits"].asInt() : 0;
                if (bits < 5 || bits > 8) {
                    errors.push_back(prefix + "data_bits 值无效（有效范围: 5-8）");
                } else {
                    serial.dataBits = bits;
                }
            }

            if (node.isMember("parity")) {
                auto parity = node["parity"].isString() ? StringUtils::toLower(node["parity"].asString()) : "";
                if (parity != "none" && parity != "even" && parity != "odd") {
                    errors.push_back(prefix + "parity 值无效（有效值: none, even, odd）");
                } else {
                    serial.parity = parity;
                }
            }

            if (node.isMember("stop_bits")) {
                int bits = node["stop_bits"].isInt() ? node["stop_bits"].asInt() : 0;
                if (bits != 1 && bits != 2) {
                    errors.push_back(prefix + "stop_bits 值无效（有效值: 1, 2）");
                } else {
                    serial.stopBits = bits;
                }
            }
            return;
        }

        errors.push_back(prefix + "type 值无效: '" + node["type"].asString()
            + "'（有效值: " + Constants::TRANSPORT_TCPIP + ", " + Constants::TRANSPORT_SERIALRTU + "）");
    }

    static void applyModbus(const Json::Value& root, ModbusConfig& modbusConfig,
                            std::vector<std::string>& errors,
                            std::vector<std::string>& warnings) {
        if (!root.isMember("modbus")) return;
        if (!root["modbus"].isObject()) {
            errors.emplace_back("[modbus] 必须是 JSON 对象");
            return;
        }

        const auto& node = root["modbus"];
        const std::string prefix = "[modbus] ";
        warnUnknownKeys(node, {"timeout", "num_retries", "byte_order", "word_order"}, "modbus.", warnings);

        if (node.isMember("timeout")) {
            if (!node["timeout"].isNumeric() || node["timeout"].asDouble() < Constants::MIN_TIMEOUT_SEC
                || node["timeout"].asDouble() > Constants::MAX_TIMEOUT_SEC) {
                errors.push_back(prefix + "timeout 必须在 [" + std::to_string(Constants::MIN_TIMEOUT_SEC) + ", "
                    + std::to_string(Constants::MAX_TIMEOUT_SEC) + "] 秒之间");
            } else {
                modbusConfig.timeout = node["timeout"].asDouble();
            }
        }

        if (node.isMember("num_retries")) {
            if (!node["num_retries"].isInt() || node["num_retries"].asInt() < 1) {
                errors.push_back(prefix + "num_retries 必须是正整数");
            } else {
                modbusConfig.numRetries = node["num_retries"].asInt();
            }
        }

        for (const char* field : {"byte_order", "word_order"}) {
            if (!node.isMember(field)) continue;
            try {
                if (!node[field].isString()) {
                    throw ValidationException(std::string(field) + " 必须是字符串");
                }
                auto endian = modbus::parseEndian(node[field].asString());
                if (std::string(field) == "byte_order") {
                    modbusConfig.byteOrder = endian;
                } else {
                    modbusConfig.wordOrder = endian;
                }
            } catch (const ValidationException& e) {
                errors.push_back(prefix + field + ": " + e.getMessage());
            }
        }
    }

    // ─── 工具方法 ──────────────────────────────────────────────

    static bool validatePort(const Json::Value& obj, const std::string& prefix,
                             std::vector<std::string>& errors) {
        if (!obj["port"].isInt()) {
            errors.push_back(prefix + "port 必须是整数");
            return false;
        }
        int port = obj["port"].asInt();
        if (port < 1 || port > 65535) {
            errors.push_back(prefix + "port 值无效: " +
                std::to_string(port) + "（有效范围: 1-65535）");
            return false;
        }
        return true;
    }

    static void warnUnknownKeys(const Json::Value& obj, std::initializer_list<const char*> known,
                                const std::string& path, std::vector<std::string>& warnings) {
        for (const auto& key : obj.getMemberNames()) {
            bool found = std::any_of(known.begin(), known.end(),
                                     [&key](const char* k) { return key == k; });
            if (!found) {
                warnings.push_back("未知配置项 '" + path + key + "' 将被忽略");
            }
        }
    }

    static void printErrors(const std::string& title, const std::vector<std::string>& messages) {
        std::string border(60, '=');
        std::cerr << "\n" << border << "\n";
        std::cerr << " [ERROR] " << title << "\n";
        std::cerr << std::string(60, '-') << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_ERROR << "[Config] " << msg;
        }
        std::cerr << border << "\n" << std::endl;
    }

    static void printWarnings(const std::string& title, const std::vector<std::string>& messages) {
        std::cerr << "\n" << std::string(60, '-') << "\n";
        std::cerr << " [WARN] " << title << "\n";
        for (const auto& msg : messages) {
            std::cerr << "  " << msg << "\n";
            LOG_WARN << "[Config] " << msg;
        }
        std::cerr << std::string(60, '-') << "\n" << std::endl;
    }
};
