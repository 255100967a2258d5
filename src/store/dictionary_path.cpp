#include "internal/store/dictionary_path.hpp"

#include <cstdlib>

#include <string>

namespace dict {

namespace {

std::string homeDir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    const char* profile = std::getenv("USERPROFILE");
    if (profile && *profile) {
        return profile;
    }
    return ".";
}

}  // namespace

Platform currentPlatform() {
#if defined(_WIN32)
    return Platform::WINDOWS;
#elif defined(__APPLE__)
    return Platform::MACOS;
#else
    return Platform::LINUX;
#endif
}

std::string platformDictionaryPath(Platform platform) {
    switch (platform) {
        case Platform::WINDOWS: {
            const char* appdata = std::getenv("APPDATA");
            std::string base = (appdata && *appdata)
                ? std::string(appdata)
                : homeDir() + "\\AppData\\Roaming";
            return base + "\\Dreamtonics\\Voicepeak\\dic\\user.dic";
        }
        case Platform::MACOS:
            return homeDir() + "/Library/Application Support/Dreamtonics/Voicepeak/dic/user.json";
        case Platform::LINUX:
            return homeDir() + "/.config/Dreamtonics/Voicepeak/dic/user.json";
    }
    return homeDir() + "/.config/Dreamtonics/Voicepeak/dic/user.json";
}

std::string resolveDictionaryPath(const DictConfig& config) {
    std::string path = config.getExpandedPath();
    if (!path.empty()) {
        return path;
    }

    const char* env_path = std::getenv(DICT_PATH_ENV);
    if (env_path && *env_path) {
        return DictConfig::AtPath(env_path).getExpandedPath();
    }

    return platformDictionaryPath(currentPlatform());
}

}  // namespace dict
