#include "internal/codec/binary_dic_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/text_utils.hpp"

namespace dict {

using namespace binary_layout;

namespace {

// =============================================================================
// Little-endian helpers
// =============================================================================
//
// Reads past the end of the buffer yield zero bytes and writes past the end
// are dropped: from entry 1 on, a metadata record can extend beyond the
// string table.
//

uint8_t byteAt(const std::vector<uint8_t>& buf, size_t offset) {
    return offset < buf.size() ? buf[offset] : 0;
}

uint16_t readU16(const std::vector<uint8_t>& buf, size_t offset) {
    return static_cast<uint16_t>(byteAt(buf, offset) | (byteAt(buf, offset + 1) << 8));
}

int16_t readI16(const std::vector<uint8_t>& buf, size_t offset) {
    return static_cast<int16_t>(readU16(buf, offset));
}

uint32_t readU32(const std::vector<uint8_t>& buf, size_t offset) {
    return static_cast<uint32_t>(byteAt(buf, offset)) |
        (static_cast<uint32_t>(byteAt(buf, offset + 1)) << 8) |
        (static_cast<uint32_t>(byteAt(buf, offset + 2)) << 16) |
        (static_cast<uint32_t>(byteAt(buf, offset + 3)) << 24);
}

void putByte(std::vector<uint8_t>& buf, size_t offset, uint8_t value) {
    if (offset < buf.size()) {
        buf[offset] = value;
    }
}

void writeU16(std::vector<uint8_t>& buf, size_t offset, uint16_t value) {
    putByte(buf, offset, static_cast<uint8_t>(value & 0xFF));
    putByte(buf, offset + 1, static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeI16(std::vector<uint8_t>& buf, size_t offset, int16_t value) {
    writeU16(buf, offset, static_cast<uint16_t>(value));
}

void writeU32(std::vector<uint8_t>& buf, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        putByte(buf, offset + i, static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

template <size_t N>
void writeOpaqueWords(std::vector<uint8_t>& buf, const OpaqueWord (&words)[N]) {
    for (const auto& word : words) {
        writeU32(buf, word.offset, word.value);
    }
}

std::string hexDump(const std::vector<uint8_t>& buf, size_t offset, size_t length) {
    std::string out;
    char tmp[4];
    for (size_t i = 0; i < length; ++i) {
        std::snprintf(tmp, sizeof(tmp), "%02x", byteAt(buf, offset + i));
        if (!out.empty()) out += ' ';
        out += tmp;
    }
    return out;
}

// =============================================================================
// Header
// =============================================================================

void validateHeader(const std::vector<uint8_t>& bytes) {
    if (bytes.size() < STRING_DATA_OFFSET) {
        throw DicFormatError("Truncated dictionary: " + std::to_string(bytes.size()) +
            " bytes, expected at least " + std::to_string(STRING_DATA_OFFSET));
    }

    if (!std::equal(std::begin(MAGIC), std::end(MAGIC), bytes.begin())) {
        throw DicFormatError("Bad magic signature: " + hexDump(bytes, 0, sizeof(MAGIC)));
    }

    std::string charset(bytes.begin() + CHARSET_OFFSET,
        bytes.begin() + CHARSET_OFFSET + CHARSET_SIZE);
    if (charset != CHARSET) {
        throw DicFormatError("Unsupported charset tag at 0x28: " +
            hexDump(bytes, CHARSET_OFFSET, CHARSET_SIZE));
    }

    uint32_t version = readU32(bytes, VERSION_OFFSET);
    if (version != VERSION) {
        std::cerr << "[BinaryDic] Unexpected dictionary version " << version
            << ", reading as version " << VERSION << std::endl;
    }
}

void writeHeader(std::vector<uint8_t>& buffer, uint32_t entry_count) {
    std::copy(std::begin(MAGIC), std::end(MAGIC), buffer.begin());
    writeU32(buffer, VERSION_OFFSET, VERSION);
    writeU32(buffer, ENTRY_COUNT_OFFSET, entry_count);
    writeOpaqueWords(buffer, HEADER_WORDS);

    for (size_t i = 0; i < CHARSET_SIZE; ++i) {
        buffer[CHARSET_OFFSET + i] = static_cast<uint8_t>(CHARSET[i]);
    }

    writeOpaqueWords(buffer, TOKENIZER_WORDS);
    writeOpaqueWords(buffer, DOUBLE_ARRAY_WORDS);
}

}  // namespace

// =============================================================================
// Decode
// =============================================================================

std::vector<BinaryDicRecord> decodeBinaryDic(const std::vector<uint8_t>& bytes) {
    validateHeader(bytes);

    uint32_t entry_count = readU32(bytes, ENTRY_COUNT_OFFSET);

    std::vector<BinaryDicRecord> records;
    size_t string_offset = STRING_DATA_OFFSET;

    for (uint32_t i = 0; i < entry_count; ++i) {
        auto begin = bytes.begin() + static_cast<std::ptrdiff_t>(string_offset);
        auto nul = std::find(begin, bytes.end(), static_cast<uint8_t>(0));
        if (nul == bytes.end()) {
            throw MalformedRecordError(i, std::string(begin, bytes.end()),
                "null terminator not found");
        }

        std::string entry_str(begin, nul);
        string_offset = static_cast<size_t>(nul - bytes.begin()) + 1;

        size_t meta = ENTRY_METADATA_OFFSET + i * ENTRY_METADATA_SIZE;
        BinaryDicRecord record;
        record.left_id = readU16(bytes, meta);
        record.right_id = readU16(bytes, meta + 2);
        record.cost = readI16(bytes, meta + 6);

        // Only entry 0's metadata lies outside the string table
        if (meta + ENTRY_METADATA_SIZE <= STRING_DATA_OFFSET) {
            if (readU16(bytes, meta + 16) != record.left_id ||
                readU16(bytes, meta + 18) != record.right_id ||
                readI16(bytes, meta + 22) != record.cost) {
                throw MalformedRecordError(i, hexDump(bytes, meta, ENTRY_METADATA_SIZE),
                    "duplicate metadata does not match");
            }
        }

        // "品詞,詳細品詞,読み,アクセント,*,*,優先度"
        auto parts = text::splitFields(entry_str, ',');
        if (parts.size() < MIN_FIELDS) {
            throw MalformedRecordError(i, entry_str,
                "invalid format, expected " + std::to_string(MIN_FIELDS) +
                " fields but found " + std::to_string(parts.size()));
        }

        auto priority = text::parseInteger(parts[6]);
        if (!priority) {
            throw MalformedRecordError(i, entry_str, "invalid priority");
        }

        record.part_of_speech = parts[0];
        record.part_of_speech_detail = parts[1];
        record.reading = parts[2];
        record.accent_pattern = parts[3];
        record.priority = *priority;
        records.push_back(std::move(record));
    }

    return records;
}

// =============================================================================
// Encode
// =============================================================================

std::string formatRecordString(const BinaryDicRecord& record) {
    return record.part_of_speech + "," + record.part_of_speech_detail + "," +
        record.reading + "," + record.accent_pattern + ",*,*," +
        std::to_string(record.priority);
}

std::vector<uint8_t> encodeBinaryDic(const std::vector<BinaryDicRecord>& records) {
    // String sizes are needed before the metadata table is written
    std::vector<std::string> strings;
    strings.reserve(records.size());
    size_t total_string_size = 0;
    for (const auto& record : records) {
        strings.push_back(formatRecordString(record));
        total_string_size += strings.back().size() + 1;
    }

    std::vector<uint8_t> buffer(STRING_DATA_OFFSET + total_string_size, 0);

    writeHeader(buffer, static_cast<uint32_t>(records.size()));

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& record = records[i];
        size_t offset = ENTRY_METADATA_OFFSET + i * ENTRY_METADATA_SIZE;

        writeU16(buffer, offset, record.left_id);
        writeU16(buffer, offset + 2, record.right_id);
        writeU16(buffer, offset + 4, RECORD_DISCRIMINATOR);
        writeI16(buffer, offset + 6, record.cost);
        writeU32(buffer, offset + 8, static_cast<uint32_t>(strings[i].size()));

        writeU16(buffer, offset + 16, record.left_id);
        writeU16(buffer, offset + 18, record.right_id);
        writeU16(buffer, offset + 20, RECORD_DISCRIMINATOR);
        writeI16(buffer, offset + 22, record.cost);
        writeU32(buffer, offset + 24, 0);
    }

    size_t string_offset = STRING_DATA_OFFSET;
    for (const auto& s : strings) {
        std::copy(s.begin(), s.end(), buffer.begin() + static_cast<std::ptrdiff_t>(string_offset));
        buffer[string_offset + s.size()] = 0;
        string_offset += s.size() + 1;
    }

    return buffer;
}

// =============================================================================
// Entry mapping
// =============================================================================

std::string generateAccentPattern(const std::string& reading) {
    size_t mora_count = text::countMora(reading);
    return std::string(mora_count, 'H') + "@0";
}

BinaryDicRecord toBinaryRecord(const DictionaryEntry& entry) {
    BinaryDicRecord record;
    record.left_id = DEFAULT_LEFT_ID;
    record.right_id = DEFAULT_RIGHT_ID;
    record.cost = DEFAULT_COST;
    record.part_of_speech = DEFAULT_POS;
    record.part_of_speech_detail = DEFAULT_POS_DETAIL;
    record.reading = entry.pronunciation;
    record.accent_pattern = generateAccentPattern(entry.pronunciation);
    record.priority = entry.priority.value_or(DEFAULT_PRIORITY);
    return record;
}

DictionaryEntry toDictionaryEntry(const BinaryDicRecord& record) {
    DictionaryEntry entry;
    entry.surface_form = record.reading;
    entry.pronunciation = record.reading;
    entry.part_of_speech = DEFAULT_PART_OF_SPEECH;
    entry.priority = record.priority;
    entry.accent_type = 0;
    entry.language = DEFAULT_LANGUAGE;
    return entry;
}

// =============================================================================
// BinaryDicCodec
// =============================================================================

EntryList BinaryDicCodec::decode(const std::vector<uint8_t>& bytes) const {
    auto records = decodeBinaryDic(bytes);

    EntryList entries;
    entries.reserve(records.size());
    for (const auto& record : records) {
        entries.push_back(toDictionaryEntry(record));
    }
    return entries;
}

std::vector<uint8_t> BinaryDicCodec::encode(const EntryList& entries) const {
    std::vector<BinaryDicRecord> records;
    records.reserve(entries.size());
    for (const auto& entry : entries) {
        records.push_back(toBinaryRecord(entry));
    }
    return encodeBinaryDic(records);
}

}  // namespace dict
