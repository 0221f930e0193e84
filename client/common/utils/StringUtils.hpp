#pragma once

/**
 * @brief 字符串工具类
 */
class StringUtils {
public:
    static std::string trim(const std::string& str) {
        auto start = std::find_if_not(str.begin(), str.end(), [](unsigned char ch) {
            return std::isspace(ch);
        });
        auto end = std::find_if_not(str.rbegin(), str.rend(), [](unsigned char ch) {
            return std::isspace(ch);
        }).base();

        return (start < end) ? std::string(start, end) : std::string();
    }

    /** 按分隔符拆分，去掉每段首尾空白并丢弃空段 */
    static std::vector<std::string> split(const std::string& str, char delimiter) {
        std::vector<std::string> tokens;
        std::stringstream ss(str);
        std::string token;

        while (std::getline(ss, token, delimiter)) {
            token = trim(token);
            if (!token.empty()) {
                tokens.push_back(token);
            }
        }

        return tokens;
    }

    static std::string toLower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    static std::string toUpper(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                       [](unsigned char c) { return std::toupper(c); });
        return result;
    }

    /**
     * @brief 严格解析浮点数（整个字符串必须是数字）
     */
    static std::optional<double> parseDouble(const std::string& str) {
        std::string s = trim(str);
        if (s.empty()) return std::nullopt;

        // 支持 0x 前缀的十六进制整数（掩码常用）
        if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
            auto v = parseHex(s.substr(2));
            if (!v) return std::nullopt;
            return static_cast<double>(*v);
        }

        size_t pos = 0;
        double value = 0.0;
        try {
            value = std::stod(s, &pos);
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (pos != s.size()) return std::nullopt;
        return value;
    }

    /**
     * @brief 严格解析整数（不接受小数）
     */
    static std::optional<long long> parseInt(const std::string& str) {
        auto v = parseDouble(str);
        if (!v || !std::isfinite(*v) || std::floor(*v) != *v) return std::nullopt;
        if (*v < -9007199254740992.0 || *v > 9007199254740992.0) return std::nullopt;
        return static_cast<long long>(*v);
    }

    /**
     * @brief 解析逗号分隔的数值列表，如 "1,2.5,-3"
     */
    static std::optional<std::vector<double>> parseDoubleList(const std::string& str) {
        std::vector<double> values;
        for (const auto& token : split(str, ',')) {
            auto v = parseDouble(token);
            if (!v) return std::nullopt;
            values.push_back(*v);
        }
        if (values.empty()) return std::nullopt;
        return values;
    }

private:
    static std::optional<unsigned long long> parseHex(const std::string& hex) {
        if (hex.empty() || hex.size() > 16) return std::nullopt;
        unsigned long long value = 0;
        for (char c : hex) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
            value = value * 16 + static_cast<unsigned long long>(
                std::isdigit(static_cast<unsigned char>(c))
                    ? c - '0'
                    : std::tolower(static_cast<unsigned char>(c)) - 'a' + 10);
        }
        return value;
    }
};
