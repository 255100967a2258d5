#ifndef TEXT_UTILS_HPP
#define TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串处理、字段切分、整数解析等功能。
 */

#include <optional>
#include <string>
#include <vector>

namespace dict {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 */
std::vector<std::string> splitUtf8(const std::string& str);

/**
 * @brief 估算读音的拍数 (按字符计数)
 * @param reading 片假名读音
 * @return UTF-8 字符数
 */
size_t countMora(const std::string& reading);

// =============================================================================
// 字段处理
// =============================================================================

/**
 * @brief 按分隔符切分字符串，保留空字段
 * @param str 输入字符串
 * @param delim 分隔符
 * @return 字段列表 (空串返回一个空字段)
 */
std::vector<std::string> splitFields(const std::string& str, char delim);

/**
 * @brief 解析十进制整数 (允许前导空白和符号，忽略尾部非数字)
 * @param str 输入字符串
 * @return 解析结果，没有数字时返回 std::nullopt
 */
std::optional<int> parseInteger(const std::string& str);

}  // namespace text
}  // namespace dict

#endif  // TEXT_UTILS_HPP
