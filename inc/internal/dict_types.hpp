#ifndef DICT_TYPES_HPP
#define DICT_TYPES_HPP

#include <cstdint>

#include <optional>
#include <string>
#include <vector>

namespace dict {

// =============================================================================
// Dictionary Format (词典格式)
// =============================================================================

enum class DictFormat {
    AUTO,           // 根据文件后缀推断
    BINARY,         // user.dic 二进制格式 (Windows)
    TEXT,           // user.json 文本格式 (macOS / Linux)
};

inline const char* dictFormatToString(DictFormat format) {
    switch (format) {
        case DictFormat::AUTO:   return "auto";
        case DictFormat::BINARY: return "binary";
        case DictFormat::TEXT:   return "text";
        default:                 return "unknown";
    }
}

// =============================================================================
// Comparison Policy (条目比较策略)
// =============================================================================
//
// The binary layout never stores a surface form, so entries in a binary store
// are identified by their reading.
//

enum class ComparisonPolicy {
    BY_SURFACE_FORM,
    BY_PRONUNCIATION,
};

inline ComparisonPolicy comparisonPolicyFor(DictFormat format) {
    switch (format) {
        case DictFormat::BINARY:
            return ComparisonPolicy::BY_PRONUNCIATION;
        case DictFormat::TEXT:
        case DictFormat::AUTO:
            return ComparisonPolicy::BY_SURFACE_FORM;
    }
    return ComparisonPolicy::BY_SURFACE_FORM;
}

inline const char* comparisonPolicyToString(ComparisonPolicy policy) {
    switch (policy) {
        case ComparisonPolicy::BY_SURFACE_FORM:  return "surface";
        case ComparisonPolicy::BY_PRONUNCIATION: return "pronunciation";
    }
    return "unknown";
}

// =============================================================================
// Error Code (错误码)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 输入错误 (1xx)
    INVALID_CONFIG = 100,
    INVALID_ENTRY = 101,

    // 文件错误 (2xx)
    FILE_READ_ERROR = 200,
    FILE_WRITE_ERROR = 201,

    // 内部错误 (4xx)
    INTERNAL_ERROR = 400,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:               return "OK";
        case ErrorCode::INVALID_CONFIG:   return "INVALID_CONFIG";
        case ErrorCode::INVALID_ENTRY:    return "INVALID_ENTRY";
        case ErrorCode::FILE_READ_ERROR:  return "FILE_READ_ERROR";
        case ErrorCode::FILE_WRITE_ERROR: return "FILE_WRITE_ERROR";
        case ErrorCode::INTERNAL_ERROR:   return "INTERNAL_ERROR";
        default:                          return "UNKNOWN";
    }
}

// =============================================================================
// Error Info (错误信息)
// =============================================================================

struct ErrorInfo {
    ErrorCode code;
    std::string message;
    std::string detail;  // 详细信息(解析诊断)

    bool isOk() const { return code == ErrorCode::OK; }

    std::string toString() const {
        std::string s = std::string(errorCodeToString(code)) + ": " + message;
        if (!detail.empty()) {
            s += " (" + detail + ")";
        }
        return s;
    }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

// =============================================================================
// Dictionary Entry (词典条目)
// =============================================================================

constexpr const char* DEFAULT_PART_OF_SPEECH = "Japanese_Futsuu_meishi";
constexpr int DEFAULT_PRIORITY = 5;
constexpr int DEFAULT_ACCENT_TYPE = 0;
constexpr const char* DEFAULT_LANGUAGE = "ja";

struct DictionaryEntry {
    std::string surface_form;                   // 替换对象文本 (仅文本格式保存)
    std::string pronunciation;                  // 读音 (片假名)
    std::optional<std::string> part_of_speech;  // 词性
    std::optional<int> priority;                // 优先级
    std::optional<int> accent_type;             // 声调类型
    std::optional<std::string> language;        // 语言

    // 便捷方法: 生效的语言 (未设置或为空时为 "ja")
    std::string effectiveLanguage() const {
        if (!language || language->empty()) {
            return DEFAULT_LANGUAGE;
        }
        return *language;
    }

    bool operator==(const DictionaryEntry& other) const {
        return surface_form == other.surface_form &&
            pronunciation == other.pronunciation &&
            part_of_speech == other.part_of_speech &&
            priority == other.priority &&
            accent_type == other.accent_type &&
            language == other.language;
    }

    bool operator!=(const DictionaryEntry& other) const {
        return !(*this == other);
    }
};

/// @brief Fill every unset optional field with its default value
/// @param entry Partially populated entry
/// @return Fully populated copy
inline DictionaryEntry applyDefaults(const DictionaryEntry& entry) {
    DictionaryEntry result = entry;
    if (!result.part_of_speech) result.part_of_speech = DEFAULT_PART_OF_SPEECH;
    if (!result.priority) result.priority = DEFAULT_PRIORITY;
    if (!result.accent_type) result.accent_type = DEFAULT_ACCENT_TYPE;
    if (!result.language) result.language = DEFAULT_LANGUAGE;
    return result;
}

/// @brief Comparison key of an entry under the given policy
inline const std::string& comparisonKey(const DictionaryEntry& entry, ComparisonPolicy policy) {
    switch (policy) {
        case ComparisonPolicy::BY_PRONUNCIATION:
            return entry.pronunciation;
        case ComparisonPolicy::BY_SURFACE_FORM:
            break;
    }
    return entry.surface_form;
}

using EntryList = std::vector<DictionaryEntry>;

}  // namespace dict

#endif  // DICT_TYPES_HPP
