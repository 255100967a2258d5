#ifndef TEXT_DIC_CODEC_HPP
#define TEXT_DIC_CODEC_HPP

#include <cstdint>

#include <string>
#include <vector>

#include "internal/codec/dic_codec.hpp"
#include "internal/dict_types.hpp"

namespace dict {

// =============================================================================
// TextDicCodec - user.json dictionary codec
// =============================================================================
//
// JSON array of {"sur", "pron", "pos"?, "priority"?, "accentType"?, "lang"?}.
// Decoding keeps absent fields unset; encoding writes every field with
// defaults applied, in a fixed key order, indented by two spaces.
//

/// @brief Parse a JSON document into entries
/// @throws TextFormatError if the document is not an entry array
EntryList decodeTextDic(const std::string& document);

/// @brief Serialize entries with defaults applied
std::string encodeTextDic(const EntryList& entries);

class TextDicCodec : public IDicCodec {
public:
    TextDicCodec() = default;
    ~TextDicCodec() override = default;

    DictFormat getFormat() const override { return DictFormat::TEXT; }
    std::string getName() const override { return "TextDic"; }

    EntryList decode(const std::vector<uint8_t>& bytes) const override;
    std::vector<uint8_t> encode(const EntryList& entries) const override;
};

}  // namespace dict

#endif  // TEXT_DIC_CODEC_HPP
