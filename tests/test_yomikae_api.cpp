#undef NDEBUG

#include <cassert>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <string>

#include "yomikae_api.hpp"

namespace fs = std::filesystem;

namespace {

const fs::path kTestDir = fs::temp_directory_path() / "yomikae_test_api";

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

Yomikae::DictionaryEntry makeEntry(const std::string& sur, const std::string& pron) {
    Yomikae::DictionaryEntry e;
    e.surface_form = sur;
    e.pronunciation = pron;
    return e;
}

}  // namespace

void test_text_dictionary() {
    auto path = (kTestDir / "user.json").string();
    Yomikae::PronunciationDictionary dict(Yomikae::DictConfig::AtPath(path));
    assert(dict.IsInitialized());
    assert(dict.GetPath() == path);
    assert(!dict.IsBinaryFormat());
    assert(dict.ListEntries().empty());
    assert(!dict.HasError());

    auto entry = makeEntry("MCP", "エムシーピー");
    entry.priority = 7;
    assert(dict.AddEntry(entry));

    auto found = dict.FindEntry("MCP");
    assert(found.size() == 1);
    assert(found[0].pronunciation == "エムシーピー");
    assert(found[0].priority == 7);
    assert(found[0].part_of_speech == "Japanese_Futsuu_meishi");

    assert(!dict.RemoveEntry("XYZ"));
    assert(!dict.HasError());
    assert(dict.RemoveEntry("MCP"));
    assert(dict.ListEntries().empty());
    test_passed("text dictionary");
}

void test_binary_dictionary() {
    auto path = (kTestDir / "user.dic").string();
    Yomikae::PronunciationDictionary dict(Yomikae::DictConfig::AtPath(path));
    assert(dict.IsBinaryFormat());

    assert(dict.AddEntry(makeEntry("東京", "トウキョウ")));
    auto entries = dict.ListEntries();
    assert(entries.size() == 1);
    assert(entries[0].surface_form == "トウキョウ");
    assert(entries[0].accent_type == 0);

    assert(!dict.RemoveEntry("東京"));
    assert(dict.RemoveEntry("トウキョウ"));
    test_passed("binary dictionary");
}

void test_explicit_format() {
    auto path = (kTestDir / "custom.data").string();
    auto config = Yomikae::DictConfig::AtPath(path).withFormat(Yomikae::DictFormat::BINARY);
    Yomikae::PronunciationDictionary dict(config);
    assert(dict.IsBinaryFormat());
    assert(dict.AddEntry(makeEntry("a", "エー")));
    assert(fs::file_size(path) > 0xc50);
    test_passed("explicit format");
}

void test_errors() {
    auto path = (kTestDir / "errors.json").string();
    Yomikae::PronunciationDictionary dict(Yomikae::DictConfig::AtPath(path));

    assert(!dict.AddEntry(makeEntry("", "エー")));
    assert(dict.HasError());
    assert(dict.GetLastErrorCode() == "INVALID_ENTRY");

    assert(dict.AddEntry(makeEntry("a", "エー")));
    assert(!dict.HasError());
    assert(dict.GetLastErrorCode() == "OK");

    {
        std::ofstream out(path);
        out << "{ broken";
    }
    assert(dict.ListEntries().empty());
    assert(dict.HasError());
    assert(dict.GetLastErrorCode() == "FILE_READ_ERROR");
    assert(!dict.RemoveEntry("a"));
    assert(dict.HasError());
    assert(!dict.GetLastError().empty());
    test_passed("errors");
}

void test_invalid_config() {
    Yomikae::PronunciationDictionary dict(Yomikae::DictConfig::AtPath("/tmp/yomikae_dir/"));
    assert(!dict.IsInitialized());
    assert(dict.GetPath().empty());
    assert(!dict.AddEntry(makeEntry("a", "エー")));
    assert(dict.GetLastErrorCode() == "INVALID_CONFIG");
    test_passed("invalid config");
}

int main() {
    std::cout << "=== PronunciationDictionary Tests ===" << std::endl;
    fs::remove_all(kTestDir);
    fs::create_directories(kTestDir);

    test_text_dictionary();
    test_binary_dictionary();
    test_explicit_format();
    test_errors();
    test_invalid_config();

    fs::remove_all(kTestDir);
    std::cout << "All tests passed." << std::endl;
    return 0;
}
