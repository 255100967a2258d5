#ifndef DICT_CONFIG_HPP
#define DICT_CONFIG_HPP

#include <cstdlib>

#include <string>

#include "dict_types.hpp"

namespace dict {

// =============================================================================
// Dict Config (词典配置 - 内部使用)
// =============================================================================

struct DictConfig {
    // -------------------------------------------------------------------------
    // 词典文件
    // -------------------------------------------------------------------------

    std::string dictionary_path;            ///< 词典文件路径，空则按平台解析
    DictFormat format = DictFormat::AUTO;   ///< 文件格式，AUTO 按后缀推断

    // -------------------------------------------------------------------------
    // 日志
    // -------------------------------------------------------------------------

    bool verbose = false;                   ///< 输出详细日志

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置 (平台默认路径)
    static DictConfig Default() {
        return DictConfig();
    }

    /// @brief 创建指定路径的配置
    /// @param path 词典文件路径
    static DictConfig AtPath(const std::string& path) {
        DictConfig config;
        config.dictionary_path = path;
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    DictConfig withFormat(DictFormat fmt) const {
        auto c = *this;
        c.format = fmt;
        return c;
    }

    DictConfig withVerbose(bool v) const {
        auto c = *this;
        c.verbose = v;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 获取展开后的词典路径
    /// @return 展开 ~ 后的路径，未设置时返回空字符串
    std::string getExpandedPath() const {
        if (dictionary_path.empty()) {
            return "";
        }
        // 展开 ~ 到 HOME 目录
        if (dictionary_path[0] == '~') {
            const char* home = getenv("HOME");
            if (home) {
                return std::string(home) + dictionary_path.substr(1);
            }
        }
        return dictionary_path;
    }

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (!dictionary_path.empty() && dictionary_path.back() == '/') {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Dictionary path names a directory", dictionary_path);
        }
        return ErrorInfo::ok();
    }
};

}  // namespace dict

#endif  // DICT_CONFIG_HPP
