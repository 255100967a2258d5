#ifndef DIC_CODEC_HPP
#define DIC_CODEC_HPP

#include <cstdint>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/dict_types.hpp"

namespace dict {

// =============================================================================
// Codec Errors (编解码错误)
// =============================================================================

class DicCodecError : public std::runtime_error {
public:
    explicit DicCodecError(const std::string& what) : std::runtime_error(what) {}
};

/// Header or overall file shape does not match the binary layout.
class DicFormatError : public DicCodecError {
public:
    explicit DicFormatError(const std::string& what) : DicCodecError(what) {}
};

/// A single binary string record is unterminated or has too few fields.
class MalformedRecordError : public DicCodecError {
public:
    MalformedRecordError(size_t record_index, const std::string& raw, const std::string& reason)
        : DicCodecError("Entry " + std::to_string(record_index) + ": " + reason + ": " + raw)
        , record_index_(record_index)
        , raw_(raw) {}

    size_t recordIndex() const { return record_index_; }
    const std::string& raw() const { return raw_; }

private:
    size_t record_index_;
    std::string raw_;
};

/// The structured-text document is not a valid entry array.
class TextFormatError : public DicCodecError {
public:
    explicit TextFormatError(const std::string& what) : DicCodecError(what) {}
};

// =============================================================================
// Dictionary Codec Interface (词典编解码接口)
// =============================================================================
//
// Every on-disk dictionary format implements this interface.
// DictionaryStore only talks to codecs through it.
//
// Implemented codecs:
// - BinaryDicCodec: user.dic (lossy, keyed by reading)
// - TextDicCodec:   user.json (lossless, keyed by surface form)
//

class IDicCodec {
public:
    virtual ~IDicCodec() = default;

    /// @brief Codec format
    virtual DictFormat getFormat() const = 0;

    /// @brief Codec name (for logging)
    virtual std::string getName() const = 0;

    /// @brief Key used to decide whether two entries are the same
    virtual ComparisonPolicy getComparisonPolicy() const {
        return comparisonPolicyFor(getFormat());
    }

    /// @brief Decode a whole file
    /// @param bytes File contents
    /// @return Entries in file order
    /// @throws DicCodecError on malformed input
    virtual EntryList decode(const std::vector<uint8_t>& bytes) const = 0;

    /// @brief Encode a whole entry set
    /// @param entries Entries in order
    /// @return File contents
    virtual std::vector<uint8_t> encode(const EntryList& entries) const = 0;
};

// =============================================================================
// Codec Factory (编解码器工厂)
// =============================================================================

class DicCodecFactory {
public:
    /// @brief Binary dictionary file suffix
    static constexpr const char* BINARY_SUFFIX = ".dic";

    /// @brief 创建编解码器实例
    /// @param format 词典格式 (AUTO 视为 TEXT)
    /// @return 编解码器实例
    static std::unique_ptr<IDicCodec> create(DictFormat format);

    /// @brief 根据文件后缀推断格式
    /// @param path 词典文件路径
    /// @return BINARY 若后缀为 .dic, 否则 TEXT
    static DictFormat inferFormat(const std::string& path);
};

}  // namespace dict

#endif  // DIC_CODEC_HPP
