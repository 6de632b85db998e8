#pragma once

/**
 * @brief 配置与实体 key 解析用的字符串工具
 */
class StringUtils {
public:
    static std::string trim(std::string_view str) {
        constexpr std::string_view blanks = " \t\r\n\f\v";
        auto first = str.find_first_not_of(blanks);
        if (first == std::string_view::npos) return {};
        auto last = str.find_last_not_of(blanks);
        return std::string(str.substr(first, last - first + 1));
    }

    /**
     * @brief 按分隔符切分，丢弃空片段（"a..b" → {"a", "b"}）
     */
    static std::vector<std::string> split(std::string_view str, char delimiter) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (start <= str.size()) {
            auto end = str.find(delimiter, start);
            if (end == std::string_view::npos) end = str.size();
            if (end > start) parts.emplace_back(str.substr(start, end - start));
            start = end + 1;
        }
        return parts;
    }

    static std::string toLower(std::string_view str) {
        std::string result(str);
        for (auto& c : result) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return result;
    }

    /**
     * @brief 十进制整数，整串都必须是数字（允许负号）
     */
    static std::optional<int> parseInt(std::string_view str) {
        if (str.empty()) return std::nullopt;
        int value = 0;
        auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec != std::errc() || ptr != str.data() + str.size()) return std::nullopt;
        return value;
    }
};
