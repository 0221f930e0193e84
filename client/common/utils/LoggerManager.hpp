#pragma once

#include "Constants.hpp"
#include "StringUtils.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - trantor::AsyncFileLogger 异步写盘
 *
 * 每次运行一个文件: <logDir>/modbus-client_<启动时间>.log，
 * 单文件超过 LOG_FILE_SIZE_LIMIT 由 trantor 自动滚动。
 * console_log 打开时同一行同时写到 stderr。
 */
class LoggerManager {
public:
    /**
     * @brief 去掉 trantor 附加的 " - file.hpp:line" 尾巴
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string line(msg, len);
        auto pos = line.rfind(" - ");
        if (pos == std::string::npos) return line;

        auto source = line.substr(pos + 3);
        if (source.find(".hpp:") == std::string::npos && source.find(".cpp:") == std::string::npos) {
            return line;
        }
        return line.substr(0, pos) + "\n";
    }

    /**
     * @brief 初始化（可重复调用，例如读取配置后切换目录）
     * @param logDir 日志目录，不存在时创建
     * @param consoleEcho 是否同时输出到 stderr
     */
    static void initialize(const std::string& logDir, bool consoleEcho = false) {
        fs::create_directories(logDir);

        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(Constants::LOG_FILE_PREFIX + startTime(), ".log", logDir + "/");
        logger->setFileSizeLimit(Constants::LOG_FILE_SIZE_LIMIT);
        logger->startLogging();

        std::unique_ptr<trantor::AsyncFileLogger> previous;
        {
            std::lock_guard lock(mutex_);
            previous = std::exchange(fileLogger_, std::move(logger));
            consoleEcho_ = consoleEcho;
        }

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(write, flush);
    }

    /**
     * @brief 文本级别 → trantor 级别
     * @return 无法识别时返回 nullopt
     */
    static std::optional<trantor::Logger::LogLevel> parseLogLevel(const std::string& level) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"TRACE", trantor::Logger::kTrace},
            {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},
            {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError},
            {"FATAL", trantor::Logger::kFatal},
        };
        auto it = levels.find(StringUtils::toUpper(StringUtils::trim(level)));
        if (it == levels.end()) return std::nullopt;
        return it->second;
    }

    /** 无法识别的级别保持当前级别 */
    static void setLogLevel(const std::string& level) {
        if (auto parsed = parseLogLevel(level)) {
            trantor::Logger::setLogLevel(*parsed);
        } else {
            LOG_WARN << "[Logger] Unknown log level '" << level << "', keeping current level";
        }
    }

    /** 退出前调用，析构时写完缓冲 */
    static void close() {
        std::unique_ptr<trantor::AsyncFileLogger> logger;
        {
            std::lock_guard lock(mutex_);
            logger = std::move(fileLogger_);
        }
    }

private:
    static inline std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static inline std::mutex mutex_;
    static inline bool consoleEcho_ = false;

    static std::string startTime() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
        localtime_r(&now, &tm);
        char buf[20];
        std::strftime(buf, sizeof(buf), "%Y%m%d-%H%M%S", &tm);
        return buf;
    }

    static void write(const char* msg, const uint64_t len) {
        auto line = formatLogMessage(msg, len);
        std::lock_guard lock(mutex_);
        if (consoleEcho_) {
            std::cerr << line;
        }
        if (fileLogger_) {
            fileLogger_->output(line.c_str(), line.size());
        }
    }

    static void flush() {
        std::lock_guard lock(mutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
    }
};
