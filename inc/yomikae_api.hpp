#ifndef YOMIKAE_API_HPP
#define YOMIKAE_API_HPP

/**
 * Yomikae - VOICEPEAK 读音词典 SDK
 *
 * 管理语音合成引擎的用户词典 (表记 → 读音)，统一处理 Windows 的 user.dic
 * 二进制格式和 macOS / Linux 的 user.json 文本格式。
 *
 * 使用示例 1 - 默认路径:
 *
 *   Yomikae::PronunciationDictionary dict;
 *   Yomikae::DictionaryEntry entry;
 *   entry.surface_form = "MCP";
 *   entry.pronunciation = "エムシーピー";
 *   if (!dict.AddEntry(entry)) {
 *       std::cerr << dict.GetLastError() << std::endl;
 *   }
 *
 * 使用示例 2 - 指定路径:
 *
 *   auto config = Yomikae::DictConfig::AtPath("/tmp/user.dic");
 *   Yomikae::PronunciationDictionary dict(config);
 *   auto matches = dict.FindEntry("エムシーピー");
 *
 * 注意: 二进制格式不保存表记，条目以读音识别，读出的表记等于读音。
 */

#include <memory>
#include <string>
#include <vector>

namespace Yomikae {

// =============================================================================
// DictFormat - 词典格式
// =============================================================================

enum class DictFormat {
    AUTO,    ///< 按文件后缀推断 (.dic 为二进制)
    BINARY,  ///< user.dic 二进制格式
    TEXT,    ///< user.json 文本格式
};

// =============================================================================
// DictionaryEntry - 词典条目
// =============================================================================

struct DictionaryEntry {
    std::string surface_form;                            ///< 表记 (替换对象)
    std::string pronunciation;                           ///< 读音 (片假名)
    std::string part_of_speech = "Japanese_Futsuu_meishi";  ///< 词性
    int priority = 5;                                    ///< 优先级
    int accent_type = 0;                                 ///< 声调类型
    std::string language = "ja";                         ///< 语言
};

// =============================================================================
// DictConfig - 词典配置
// =============================================================================

struct DictConfig {
    std::string dictionary_path;            ///< 词典路径，空则按平台解析
    DictFormat format = DictFormat::AUTO;   ///< 文件格式
    bool verbose = false;                   ///< 输出详细日志

    /// @brief 创建默认配置
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

    // 链式配置
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
};

// =============================================================================
// PronunciationDictionary - 读音词典
// =============================================================================

class PronunciationDictionary {
public:
    /// @brief 打开词典 (文件不存在时视为空词典)
    /// @param config 配置对象
    explicit PronunciationDictionary(const DictConfig& config = DictConfig());

    ~PronunciationDictionary();

    // 禁止拷贝
    PronunciationDictionary(const PronunciationDictionary&) = delete;
    PronunciationDictionary& operator=(const PronunciationDictionary&) = delete;

    // =========================================================================
    // 条目操作
    // =========================================================================

    /// @brief 添加条目，键和语言相同的条目会被原位替换
    /// @param entry 条目
    /// @return 是否成功
    bool AddEntry(const DictionaryEntry& entry);

    /// @brief 删除条目
    /// @param key 表记 (二进制格式为读音)
    /// @param language 语言
    /// @return 是否删除了条目; 出错时返回 false 且 HasError() 为 true
    bool RemoveEntry(const std::string& key, const std::string& language = "ja");

    /// @brief 查找条目 (不区分语言)
    /// @param key 表记 (二进制格式为读音)
    /// @return 匹配的条目，可能为空
    std::vector<DictionaryEntry> FindEntry(const std::string& key);

    /// @brief 列出全部条目
    std::vector<DictionaryEntry> ListEntries();

    /// @brief 清空词典
    /// @return 是否成功
    bool Clear();

    // =========================================================================
    // 辅助方法
    // =========================================================================

    /// @brief 检查词典是否已打开
    bool IsInitialized() const;

    /// @brief 获取词典文件路径
    std::string GetPath() const;

    /// @brief 是否为二进制格式
    bool IsBinaryFormat() const;

    /// @brief 最近一次调用是否出错
    bool HasError() const;

    /// @brief 获取最近一次错误码 (如 "FILE_READ_ERROR", 成功为 "OK")
    std::string GetLastErrorCode() const;

    /// @brief 获取最近一次错误信息
    std::string GetLastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Yomikae

#endif  // YOMIKAE_API_HPP
