#include "internal/codec/dic_codec.hpp"

#include <cstring>

#include <memory>
#include <string>

#include "internal/codec/binary_dic_codec.hpp"
#include "internal/codec/text_dic_codec.hpp"

namespace dict {

// =============================================================================
// DicCodecFactory 实现
// =============================================================================

std::unique_ptr<IDicCodec> DicCodecFactory::create(DictFormat format) {
    switch (format) {
        case DictFormat::BINARY:
            return std::make_unique<BinaryDicCodec>();

        case DictFormat::TEXT:
        case DictFormat::AUTO:
            return std::make_unique<TextDicCodec>();

        default:
            return nullptr;
    }
}

DictFormat DicCodecFactory::inferFormat(const std::string& path) {
    const size_t suffix_len = std::strlen(BINARY_SUFFIX);
    if (path.size() >= suffix_len &&
        path.compare(path.size() - suffix_len, suffix_len, BINARY_SUFFIX) == 0) {
        return DictFormat::BINARY;
    }
    return DictFormat::TEXT;
}

}  // namespace dict
