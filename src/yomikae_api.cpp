#include "yomikae_api.hpp"

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/dict_config.hpp"
#include "internal/dict_types.hpp"
#include "internal/store/dictionary_store.hpp"
#include "internal/store/entry_manager.hpp"

namespace Yomikae {

// 转换 Yomikae::DictFormat 到 dict::DictFormat
static dict::DictFormat convertFormat(DictFormat format) {
    switch (format) {
        case DictFormat::BINARY:
            return dict::DictFormat::BINARY;
        case DictFormat::TEXT:
            return dict::DictFormat::TEXT;
        default:
            return dict::DictFormat::AUTO;
    }
}

static dict::DictionaryEntry toInternal(const DictionaryEntry& entry) {
    dict::DictionaryEntry result;
    result.surface_form = entry.surface_form;
    result.pronunciation = entry.pronunciation;
    result.part_of_speech = entry.part_of_speech;
    result.priority = entry.priority;
    result.accent_type = entry.accent_type;
    result.language = entry.language;
    return result;
}

static DictionaryEntry toPublic(const dict::DictionaryEntry& raw) {
    dict::DictionaryEntry entry = dict::applyDefaults(raw);
    DictionaryEntry result;
    result.surface_form = entry.surface_form;
    result.pronunciation = entry.pronunciation;
    result.part_of_speech = *entry.part_of_speech;
    result.priority = *entry.priority;
    result.accent_type = *entry.accent_type;
    result.language = *entry.language;
    return result;
}

static std::vector<DictionaryEntry> toPublic(const dict::EntryList& entries) {
    std::vector<DictionaryEntry> result;
    result.reserve(entries.size());
    for (const auto& e : entries) {
        result.push_back(toPublic(e));
    }
    return result;
}

// =============================================================================
// PronunciationDictionary 实现
// =============================================================================

struct PronunciationDictionary::Impl {
    std::unique_ptr<dict::DictionaryStore> store;
    std::unique_ptr<dict::EntryManager> manager;
    dict::ErrorInfo last_error = dict::ErrorInfo::ok();

    bool init(const DictConfig& cfg) {
        // 转换配置
        dict::DictConfig internal_config;
        internal_config.dictionary_path = cfg.dictionary_path;
        internal_config.format = convertFormat(cfg.format);
        internal_config.verbose = cfg.verbose;

        auto error = dict::DictionaryStore::open(internal_config, store);
        if (!error.isOk()) {
            std::cerr << "Failed to open dictionary: " << error.toString() << std::endl;
            last_error = error;
            return false;
        }

        manager = std::make_unique<dict::EntryManager>(*store);
        return true;
    }

    bool ready() {
        if (!manager) {
            // 保留打开失败时的错误
            if (last_error.isOk()) {
                last_error = dict::ErrorInfo::error(dict::ErrorCode::INTERNAL_ERROR,
                    "Dictionary not initialized");
            }
            return false;
        }
        last_error = dict::ErrorInfo::ok();
        return true;
    }

    bool record(const dict::ErrorInfo& error) {
        last_error = error;
        return error.isOk();
    }
};

PronunciationDictionary::PronunciationDictionary(const DictConfig& config)
    : impl_(std::make_unique<Impl>()) {
    impl_->init(config);
}

PronunciationDictionary::~PronunciationDictionary() = default;

bool PronunciationDictionary::AddEntry(const DictionaryEntry& entry) {
    if (!impl_->ready()) {
        return false;
    }
    return impl_->record(impl_->manager->add(toInternal(entry)));
}

bool PronunciationDictionary::RemoveEntry(const std::string& key, const std::string& language) {
    if (!impl_->ready()) {
        return false;
    }
    bool removed = false;
    if (!impl_->record(impl_->manager->remove(key, language, removed))) {
        return false;
    }
    return removed;
}

std::vector<DictionaryEntry> PronunciationDictionary::FindEntry(const std::string& key) {
    if (!impl_->ready()) {
        return {};
    }
    dict::EntryList results;
    if (!impl_->record(impl_->manager->find(key, results))) {
        return {};
    }
    return toPublic(results);
}

std::vector<DictionaryEntry> PronunciationDictionary::ListEntries() {
    if (!impl_->ready()) {
        return {};
    }
    dict::EntryList entries;
    if (!impl_->record(impl_->manager->list(entries))) {
        return {};
    }
    return toPublic(entries);
}

bool PronunciationDictionary::Clear() {
    if (!impl_->ready()) {
        return false;
    }
    return impl_->record(impl_->manager->clear());
}

bool PronunciationDictionary::IsInitialized() const {
    return impl_->manager != nullptr;
}

std::string PronunciationDictionary::GetPath() const {
    if (impl_->store) {
        return impl_->store->getPath();
    }
    return "";
}

bool PronunciationDictionary::IsBinaryFormat() const {
    return impl_->store && impl_->store->getFormat() == dict::DictFormat::BINARY;
}

bool PronunciationDictionary::HasError() const {
    return !impl_->last_error.isOk();
}

std::string PronunciationDictionary::GetLastErrorCode() const {
    return dict::errorCodeToString(impl_->last_error.code);
}

std::string PronunciationDictionary::GetLastError() const {
    if (impl_->last_error.isOk()) {
        return "";
    }
    return impl_->last_error.toString();
}

}  // namespace Yomikae
