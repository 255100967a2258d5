#include "internal/store/entry_manager.hpp"

#include <algorithm>
#include <iostream>
#include <iterator>
#include <string>

namespace dict {

namespace {

// 二进制格式不保存语言, 读出的条目一律为 ja
std::string keyLanguage(const std::string& language, ComparisonPolicy policy) {
    switch (policy) {
        case ComparisonPolicy::BY_PRONUNCIATION:
            return DEFAULT_LANGUAGE;
        case ComparisonPolicy::BY_SURFACE_FORM:
            break;
    }
    return language.empty() ? std::string(DEFAULT_LANGUAGE) : language;
}

bool matches(const DictionaryEntry& entry, ComparisonPolicy policy,
             const std::string& key, const std::string& language) {
    return comparisonKey(entry, policy) == key &&
        keyLanguage(entry.effectiveLanguage(), policy) == language;
}

}  // namespace

EntryManager::EntryManager(DictionaryStore& store)
    : store_(store) {
}

ErrorInfo EntryManager::validate(const DictionaryEntry& entry) const {
    if (entry.pronunciation.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_ENTRY, "Pronunciation must not be empty");
    }

    switch (store_.getComparisonPolicy()) {
        case ComparisonPolicy::BY_SURFACE_FORM:
            if (entry.surface_form.empty()) {
                return ErrorInfo::error(ErrorCode::INVALID_ENTRY, "Surface form must not be empty");
            }
            break;
        case ComparisonPolicy::BY_PRONUNCIATION:
            // 二进制格式以逗号分隔字段, 以 NUL 结束记录
            if (entry.pronunciation.find_first_of(std::string(",\0", 2)) != std::string::npos) {
                return ErrorInfo::error(ErrorCode::INVALID_ENTRY,
                    "Pronunciation must not contain ',' or NUL in a binary dictionary",
                    entry.pronunciation);
            }
            break;
    }
    return ErrorInfo::ok();
}

// =============================================================================
// add / remove
// =============================================================================

ErrorInfo EntryManager::add(const DictionaryEntry& entry) {
    auto err = validate(entry);
    if (!err.isOk()) {
        return err;
    }

    EntryList entries;
    err = store_.readAll(entries);
    if (!err.isOk()) {
        return err;
    }

    const auto policy = store_.getComparisonPolicy();
    const std::string& key = comparisonKey(entry, policy);
    const std::string language = keyLanguage(entry.effectiveLanguage(), policy);

    auto it = std::find_if(entries.begin(), entries.end(),
        [&](const DictionaryEntry& e) { return matches(e, policy, key, language); });

    if (it != entries.end()) {
        *it = applyDefaults(entry);
    } else {
        entries.push_back(applyDefaults(entry));
    }

    return store_.writeAll(entries);
}

ErrorInfo EntryManager::remove(const std::string& key, const std::string& language, bool& removed) {
    removed = false;

    EntryList entries;
    auto err = store_.readAll(entries);
    if (!err.isOk()) {
        return err;
    }

    const auto policy = store_.getComparisonPolicy();
    const std::string lang = keyLanguage(language, policy);
    const size_t initial_size = entries.size();

    entries.erase(std::remove_if(entries.begin(), entries.end(),
        [&](const DictionaryEntry& e) { return matches(e, policy, key, lang); }),
        entries.end());

    if (entries.size() == initial_size) {
        return ErrorInfo::ok();
    }

    err = store_.writeAll(entries);
    if (!err.isOk()) {
        return err;
    }

    removed = true;
    return ErrorInfo::ok();
}

// =============================================================================
// find / list / clear
// =============================================================================

ErrorInfo EntryManager::find(const std::string& key, EntryList& results) const {
    results.clear();

    EntryList entries;
    auto err = store_.readAll(entries);
    if (!err.isOk()) {
        return err;
    }

    const auto policy = store_.getComparisonPolicy();
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(results),
        [&](const DictionaryEntry& e) { return comparisonKey(e, policy) == key; });
    return ErrorInfo::ok();
}

ErrorInfo EntryManager::list(EntryList& entries) const {
    return store_.readAll(entries);
}

ErrorInfo EntryManager::clear() {
    auto err = store_.writeAll({});
    if (err.isOk() && store_.isVerbose()) {
        std::cout << "[EntryManager] Cleared dictionary: " << store_.getPath() << std::endl;
    }
    return err;
}

}  // namespace dict
