#ifndef BINARY_DIC_CODEC_HPP
#define BINARY_DIC_CODEC_HPP

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

#include "internal/codec/dic_codec.hpp"
#include "internal/dict_types.hpp"

namespace dict {

// =============================================================================
// BinaryDicCodec - user.dic binary dictionary codec
// =============================================================================
//
// File layout (all integers little-endian):
//
//   0x000  header (magic, version, entry count, ..., charset "utf-8" at 0x28)
//   0x030  reserved tokenizer / double-array region, opaque
//   0xc30  metadata table, 32 bytes per entry
//   0xc50  string table, one NUL-terminated CSV record per entry:
//          "pos,posDetail,reading,accent,*,*,priority"
//
// The metadata table and the string table overlap from entry 1 on. Strings are
// written last, so only the metadata of entry 0 survives in a file.
//

struct BinaryDicRecord {
    uint16_t left_id = 0;           // 左文脈ID
    uint16_t right_id = 0;          // 右文脈ID
    int16_t cost = 0;               // 生起コスト
    std::string part_of_speech;     // 品詞
    std::string part_of_speech_detail;  // 品詞細分類
    std::string reading;            // 読み
    std::string accent_pattern;     // e.g. "HHHH@0"
    int priority = DEFAULT_PRIORITY;

    bool operator==(const BinaryDicRecord& other) const {
        return left_id == other.left_id && right_id == other.right_id &&
            cost == other.cost && part_of_speech == other.part_of_speech &&
            part_of_speech_detail == other.part_of_speech_detail &&
            reading == other.reading && accent_pattern == other.accent_pattern &&
            priority == other.priority;
    }
};

namespace binary_layout {

constexpr size_t VERSION_OFFSET = 0x08;
constexpr size_t ENTRY_COUNT_OFFSET = 0x0c;
constexpr size_t CHARSET_OFFSET = 0x28;
constexpr size_t ENTRY_METADATA_OFFSET = 0xc30;
constexpr size_t ENTRY_METADATA_SIZE = 32;
constexpr size_t STRING_DATA_OFFSET = 0xc50;

constexpr uint32_t VERSION = 1;
constexpr uint16_t RECORD_DISCRIMINATOR = 1;
constexpr const char* CHARSET = "utf-8";
constexpr size_t CHARSET_SIZE = 5;
constexpr size_t MIN_FIELDS = 7;

constexpr uint8_t MAGIC[8] = {0xc0, 0x83, 0x71, 0xef, 0x66, 0x00, 0x00, 0x00};

// Values observed in files written by the engine. Their meaning is unknown;
// they are reproduced verbatim.
struct OpaqueWord {
    size_t offset;
    uint32_t value;
};

constexpr OpaqueWord HEADER_WORDS[] = {
    {0x10, 15626},
    {0x14, 15388},
    {0x18, 3048},
    {0x1c, 32},
    {0x20, 103},
    {0x24, 0},
};

constexpr OpaqueWord TOKENIZER_WORDS[] = {
    {0x270, 2},
    {0x274, 1},
    {0x2a0, static_cast<uint32_t>(-258)},
    {0x2a4, 75},
    {0x2a8, 75},
    {0x2ac, 2},
    {0x308, 4},
    {0x30c, 1},
    {0x310, 3},
    {0x314, 4},
};

constexpr OpaqueWord DOUBLE_ARRAY_WORDS[] = {
    {0x400, 18},
    {0x404, 20},
    {0x408, 7},
    {0x40c, 18},
    {0x410, 20},
    {0x414, 3},
    {0x418, 123},
    {0x41c, 7},
    {0x420, static_cast<uint32_t>(-258)},
    {0x424, 123},
};

// Fixed values used when converting a DictionaryEntry to a record.
constexpr uint16_t DEFAULT_LEFT_ID = 9683;
constexpr uint16_t DEFAULT_RIGHT_ID = 13557;
constexpr int16_t DEFAULT_COST = -5000;
constexpr const char* DEFAULT_POS = "名詞";
constexpr const char* DEFAULT_POS_DETAIL = "普通名詞";

}  // namespace binary_layout

// -----------------------------------------------------------------------------
// Byte-level codec
// -----------------------------------------------------------------------------

/// @brief Decode a user.dic image
/// @param bytes Whole file contents
/// @return Records in file order
/// @throws DicFormatError if the header is truncated or does not match
/// @throws MalformedRecordError if a string record is unterminated or short
std::vector<BinaryDicRecord> decodeBinaryDic(const std::vector<uint8_t>& bytes);

/// @brief Encode records into a user.dic image
std::vector<uint8_t> encodeBinaryDic(const std::vector<BinaryDicRecord>& records);

/// @brief Format the string-table record of one entry (without terminator)
std::string formatRecordString(const BinaryDicRecord& record);

// -----------------------------------------------------------------------------
// Entry mapping (lossy)
// -----------------------------------------------------------------------------

/// @brief Flat all-high accent pattern sized by the reading's mora count
std::string generateAccentPattern(const std::string& reading);

/// @brief DictionaryEntry -> record. Drops surface form and accent type.
BinaryDicRecord toBinaryRecord(const DictionaryEntry& entry);

/// @brief Record -> DictionaryEntry. Surface form becomes the reading.
DictionaryEntry toDictionaryEntry(const BinaryDicRecord& record);

// -----------------------------------------------------------------------------
// IDicCodec adapter
// -----------------------------------------------------------------------------

class BinaryDicCodec : public IDicCodec {
public:
    BinaryDicCodec() = default;
    ~BinaryDicCodec() override = default;

    DictFormat getFormat() const override { return DictFormat::BINARY; }
    std::string getName() const override { return "BinaryDic"; }

    EntryList decode(const std::vector<uint8_t>& bytes) const override;
    std::vector<uint8_t> encode(const EntryList& entries) const override;
};

}  // namespace dict

#endif  // BINARY_DIC_CODEC_HPP
