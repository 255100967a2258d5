#include "internal/store/dictionary_store.hpp"

#include <cstdint>

#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/store/dictionary_path.hpp"

namespace fs = std::filesystem;

namespace dict {

DictionaryStore::DictionaryStore(std::string path, std::unique_ptr<IDicCodec> codec, bool verbose)
    : path_(std::move(path))
    , codec_(std::move(codec))
    , policy_(codec_->getComparisonPolicy())
    , verbose_(verbose) {
}

ErrorInfo DictionaryStore::open(const DictConfig& config, std::unique_ptr<DictionaryStore>& store) {
    auto err = config.validate();
    if (!err.isOk()) {
        return err;
    }

    std::string path = resolveDictionaryPath(config);
    DictFormat format = config.format == DictFormat::AUTO
        ? DicCodecFactory::inferFormat(path)
        : config.format;

    auto codec = DicCodecFactory::create(format);
    if (!codec) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
            std::string("No codec for format: ") + dictFormatToString(format));
    }

    if (config.verbose) {
        std::cout << "[DictionaryStore] Using " << codec->getName()
            << " dictionary: " << path
            << " (key: " << comparisonPolicyToString(codec->getComparisonPolicy()) << ")"
            << std::endl;
    }

    store = std::make_unique<DictionaryStore>(path, std::move(codec), config.verbose);
    return ErrorInfo::ok();
}

bool DictionaryStore::ensureParentDirectory(std::string& error) const {
    fs::path parent = fs::path(path_).parent_path();
    if (parent.empty()) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        error = "Failed to create directory " + parent.string() + ": " + ec.message();
        return false;
    }
    return true;
}

// =============================================================================
// Read
// =============================================================================

ErrorInfo DictionaryStore::readAll(EntryList& entries) const {
    entries.clear();

    std::string dir_error;
    if (!ensureParentDirectory(dir_error)) {
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to read dictionary: " + path_, dir_error);
    }

    std::error_code ec;
    auto status = fs::status(path_, ec);
    if (status.type() == fs::file_type::not_found) {
        // 文件不存在视为空词典
        return ErrorInfo::ok();
    }
    if (ec) {
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to read dictionary: " + path_, ec.message());
    }
    if (fs::is_directory(status)) {
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to read dictionary: " + path_, "path is a directory");
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to open dictionary: " + path_);
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to read dictionary: " + path_, "I/O error");
    }

    try {
        entries = codec_->decode(bytes);
    } catch (const DicCodecError& e) {
        std::cerr << "[DictionaryStore] Failed to parse " << path_ << ": " << e.what() << std::endl;
        return ErrorInfo::error(ErrorCode::FILE_READ_ERROR,
            "Failed to read dictionary: " + path_, e.what());
    }

    if (verbose_) {
        std::cout << "[DictionaryStore] Read " << entries.size() << " entries from "
            << path_ << std::endl;
    }
    return ErrorInfo::ok();
}

// =============================================================================
// Write
// =============================================================================

ErrorInfo DictionaryStore::writeAll(const EntryList& entries) const {
    std::string dir_error;
    if (!ensureParentDirectory(dir_error)) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to write dictionary: " + path_, dir_error);
    }

    std::vector<uint8_t> bytes;
    try {
        bytes = codec_->encode(entries);
    } catch (const std::exception& e) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to encode dictionary: " + path_, e.what());
    }

    std::ofstream file(path_, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to open file for writing: " + path_);
    }

    file.write(reinterpret_cast<const char*>(bytes.data()),
        static_cast<std::streamsize>(bytes.size()));
    file.close();
    if (!file) {
        return ErrorInfo::error(ErrorCode::FILE_WRITE_ERROR,
            "Failed to write dictionary: " + path_, "I/O error");
    }

    if (verbose_) {
        std::cout << "[DictionaryStore] Wrote " << entries.size() << " entries ("
            << bytes.size() << " bytes) to " << path_ << std::endl;
    }
    return ErrorInfo::ok();
}

}  // namespace dict
