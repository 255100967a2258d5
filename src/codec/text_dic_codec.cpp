#include "internal/codec/text_dic_codec.hpp"

#include <nlohmann/json.hpp>

#include <climits>
#include <cstdint>

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dict {

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {

std::string elementError(size_t index, const std::string& what) {
    return "Entry " + std::to_string(index) + ": " + what;
}

std::string requireString(const json& item, const char* key, size_t index) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) {
        throw TextFormatError(elementError(index,
            std::string("missing or non-string \"") + key + "\""));
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& item, const char* key, size_t index) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw TextFormatError(elementError(index, std::string("\"") + key + "\" must be a string"));
    }
    return it->get<std::string>();
}

std::optional<int> optionalInt(const json& item, const char* key, size_t index) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        throw TextFormatError(elementError(index, std::string("\"") + key + "\" must be an integer"));
    }
    // 超出 int 范围的整数 (含大于 int64 的无符号数) 视为错误
    if (it->is_number_unsigned() && it->get<uint64_t>() > static_cast<uint64_t>(INT_MAX)) {
        throw TextFormatError(elementError(index, std::string("\"") + key + "\" is out of range"));
    }
    int64_t value = it->get<int64_t>();
    if (value < INT_MIN || value > INT_MAX) {
        throw TextFormatError(elementError(index, std::string("\"") + key + "\" is out of range"));
    }
    return static_cast<int>(value);
}

}  // namespace

// =============================================================================
// Decode
// =============================================================================

EntryList decodeTextDic(const std::string& document) {
    json data;
    try {
        data = json::parse(document);
    } catch (const json::parse_error& e) {
        throw TextFormatError(std::string("Invalid JSON: ") + e.what());
    }

    if (!data.is_array()) {
        throw TextFormatError("Dictionary root must be an array");
    }

    EntryList entries;
    entries.reserve(data.size());
    for (size_t i = 0; i < data.size(); ++i) {
        const auto& item = data[i];
        if (!item.is_object()) {
            throw TextFormatError(elementError(i, "not an object"));
        }

        DictionaryEntry entry;
        entry.surface_form = requireString(item, "sur", i);
        entry.pronunciation = requireString(item, "pron", i);
        entry.part_of_speech = optionalString(item, "pos", i);
        entry.priority = optionalInt(item, "priority", i);
        entry.accent_type = optionalInt(item, "accentType", i);
        entry.language = optionalString(item, "lang", i);
        entries.push_back(std::move(entry));
    }

    return entries;
}

// =============================================================================
// Encode
// =============================================================================

std::string encodeTextDic(const EntryList& entries) {
    ordered_json data = ordered_json::array();
    for (const auto& raw : entries) {
        DictionaryEntry entry = applyDefaults(raw);

        ordered_json item;
        item["sur"] = entry.surface_form;
        item["pron"] = entry.pronunciation;
        item["pos"] = *entry.part_of_speech;
        item["priority"] = *entry.priority;
        item["accentType"] = *entry.accent_type;
        item["lang"] = *entry.language;
        data.push_back(std::move(item));
    }
    return data.dump(2);
}

// =============================================================================
// TextDicCodec
// =============================================================================

EntryList TextDicCodec::decode(const std::vector<uint8_t>& bytes) const {
    return decodeTextDic(std::string(bytes.begin(), bytes.end()));
}

std::vector<uint8_t> TextDicCodec::encode(const EntryList& entries) const {
    std::string document = encodeTextDic(entries);
    return std::vector<uint8_t>(document.begin(), document.end());
}

}  // namespace dict
