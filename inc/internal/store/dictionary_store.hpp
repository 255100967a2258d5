#ifndef DICTIONARY_STORE_HPP
#define DICTIONARY_STORE_HPP

#include <memory>
#include <string>

#include "internal/codec/dic_codec.hpp"
#include "internal/dict_config.hpp"
#include "internal/dict_types.hpp"

namespace dict {

// =============================================================================
// DictionaryStore - whole-file access to one dictionary
// =============================================================================
//
// Holds a resolved path and the codec for its format. Every call reads or
// writes the entire file; there is no locking, so concurrent writers race and
// the last write wins.
//

class DictionaryStore {
public:
    /// @param path Resolved dictionary file path
    /// @param codec Codec for the file's format (must not be null)
    /// @param verbose Log successful reads and writes
    DictionaryStore(std::string path, std::unique_ptr<IDicCodec> codec, bool verbose = false);
    ~DictionaryStore() = default;

    DictionaryStore(const DictionaryStore&) = delete;
    DictionaryStore& operator=(const DictionaryStore&) = delete;

    /// @brief Resolve the path of a configuration and pick its codec
    /// @param config Configuration (format AUTO infers from the path suffix)
    /// @param store [out] Opened store
    /// @return 错误信息
    static ErrorInfo open(const DictConfig& config, std::unique_ptr<DictionaryStore>& store);

    /// @brief Read every entry
    /// @param entries [out] Entries in file order, empty if the file is absent
    /// @return FILE_READ_ERROR on I/O or decode failure
    ErrorInfo readAll(EntryList& entries) const;

    /// @brief Replace the file with the given entries
    /// @return FILE_WRITE_ERROR on I/O failure
    ErrorInfo writeAll(const EntryList& entries) const;

    const std::string& getPath() const { return path_; }
    DictFormat getFormat() const { return codec_->getFormat(); }
    ComparisonPolicy getComparisonPolicy() const { return policy_; }
    std::string getCodecName() const { return codec_->getName(); }
    bool isVerbose() const { return verbose_; }

private:
    std::string path_;
    std::unique_ptr<IDicCodec> codec_;
    ComparisonPolicy policy_;
    bool verbose_;

    bool ensureParentDirectory(std::string& error) const;
};

}  // namespace dict

#endif  // DICTIONARY_STORE_HPP
