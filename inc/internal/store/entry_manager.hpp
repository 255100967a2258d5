#ifndef ENTRY_MANAGER_HPP
#define ENTRY_MANAGER_HPP

#include <string>

#include "internal/dict_types.hpp"
#include "internal/store/dictionary_store.hpp"

namespace dict {

// =============================================================================
// EntryManager - 条目增删查
// =============================================================================
//
// Read-modify-write over the whole entry set of one DictionaryStore.
// Entries are identified by (comparison key, language); the comparison key is
// the surface form for text stores and the pronunciation for binary stores.
//

class EntryManager {
public:
    /// @param store Store to operate on (must outlive the manager)
    explicit EntryManager(DictionaryStore& store);
    ~EntryManager() = default;

    /// @brief Insert an entry or replace the one with the same key and language
    /// @param entry New entry; unset fields take their defaults
    /// @return 错误信息
    /// @note A replaced entry keeps its position in the file
    ErrorInfo add(const DictionaryEntry& entry);

    /// @brief Remove entries matching a key and language
    /// @param key Comparison key
    /// @param language Language code
    /// @param removed [out] Whether anything was removed
    /// @return 错误信息
    ErrorInfo remove(const std::string& key, const std::string& language, bool& removed);

    /// @brief Remove Japanese entries matching a key
    ErrorInfo remove(const std::string& key, bool& removed) {
        return remove(key, DEFAULT_LANGUAGE, removed);
    }

    /// @brief Find entries whose comparison key equals key (any language)
    /// @param key Comparison key
    /// @param results [out] Matches in file order, possibly empty
    /// @return 错误信息
    ErrorInfo find(const std::string& key, EntryList& results) const;

    /// @brief Read every entry
    ErrorInfo list(EntryList& entries) const;

    /// @brief Remove every entry
    ErrorInfo clear();

    ComparisonPolicy getComparisonPolicy() const { return store_.getComparisonPolicy(); }

private:
    DictionaryStore& store_;

    ErrorInfo validate(const DictionaryEntry& entry) const;
};

}  // namespace dict

#endif  // ENTRY_MANAGER_HPP
