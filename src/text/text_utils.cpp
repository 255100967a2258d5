#include "internal/text/text_utils.hpp"

#include <cctype>
#include <climits>

#include <optional>
#include <string>
#include <vector>

namespace dict {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        int char_len = 1;
        unsigned char c = str[i];

        // Determine UTF-8 character length
        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;  // 2-byte UTF-8
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;  // 3-byte UTF-8 (kana)
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;  // 4-byte UTF-8
        }

        if (i + char_len <= str.length()) {
            result.push_back(str.substr(i, char_len));
        }
        i += char_len;
    }
    return result;
}

size_t countMora(const std::string& reading) {
    // 拗音 (ャュョ) 也按一拍计
    return splitUtf8(reading).size();
}

// =============================================================================
// 字段处理
// =============================================================================

std::vector<std::string> splitFields(const std::string& str, char delim) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(delim, start);
        if (pos == std::string::npos) {
            fields.push_back(str.substr(start));
            break;
        }
        fields.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return fields;
}

std::optional<int> parseInteger(const std::string& str) {
    size_t i = 0;
    while (i < str.size() && std::isspace(static_cast<unsigned char>(str[i]))) {
        i++;
    }

    bool negative = false;
    if (i < str.size() && (str[i] == '+' || str[i] == '-')) {
        negative = str[i] == '-';
        i++;
    }

    long long value = 0;
    size_t digits = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
        value = value * 10 + (str[i] - '0');
        if (value > INT_MAX) {
            return std::nullopt;
        }
        i++;
        digits++;
    }

    if (digits == 0) {
        return std::nullopt;
    }
    return static_cast<int>(negative ? -value : value);
}

}  // namespace text
}  // namespace dict
