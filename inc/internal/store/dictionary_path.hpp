#ifndef DICTIONARY_PATH_HPP
#define DICTIONARY_PATH_HPP

#include <string>

#include "internal/dict_config.hpp"

namespace dict {

// =============================================================================
// Dictionary Path Resolution (词典路径解析)
// =============================================================================
//
// Resolution order:
// 1. DictConfig::dictionary_path (with ~ expanded)
// 2. $YOMIKAE_DICT_PATH
// 3. Platform default of the VOICEPEAK user dictionary
//

enum class Platform {
    WINDOWS,
    MACOS,
    LINUX,
};

/// Environment variable overriding the platform default path
constexpr const char* DICT_PATH_ENV = "YOMIKAE_DICT_PATH";

/// @brief Platform this binary was built for
Platform currentPlatform();

/// @brief Default user dictionary path on a platform
/// @param platform Target platform
/// @return user.dic on Windows, user.json elsewhere
std::string platformDictionaryPath(Platform platform);

/// @brief Resolve the dictionary path for a configuration
std::string resolveDictionaryPath(const DictConfig& config);

}  // namespace dict

#endif  // DICTIONARY_PATH_HPP
