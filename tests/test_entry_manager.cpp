#undef NDEBUG

#include <cassert>
#include <filesystem>  // NOLINT(build/c++17)
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "internal/dict_config.hpp"
#include "internal/store/dictionary_store.hpp"
#include "internal/store/entry_manager.hpp"

namespace fs = std::filesystem;
using namespace dict;

namespace {

const fs::path kTestDir = fs::temp_directory_path() / "yomikae_test_manager";

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

std::unique_ptr<DictionaryStore> freshStore(const std::string& name, bool verbose = false) {
    fs::path path = kTestDir / name;
    fs::remove(path);
    std::unique_ptr<DictionaryStore> store;
    auto err = DictionaryStore::open(DictConfig::AtPath(path.string()).withVerbose(verbose), store);
    assert(err.isOk());
    return store;
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

DictionaryEntry makeEntry(const std::string& sur, const std::string& pron) {
    DictionaryEntry e;
    e.surface_form = sur;
    e.pronunciation = pron;
    return e;
}

EntryList listAll(EntryManager& manager) {
    EntryList entries;
    assert(manager.list(entries).isOk());
    return entries;
}

// 捕获 std::cout 输出
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }
    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* old_;
};

}  // namespace

void test_add_applies_defaults() {
    auto store = freshStore("defaults.json");
    EntryManager manager(*store);

    assert(manager.add(makeEntry("MCP", "エムシーピー")).isOk());
    auto entries = listAll(manager);
    assert(entries.size() == 1);
    assert(*entries[0].part_of_speech == "Japanese_Futsuu_meishi");
    assert(*entries[0].priority == 5);
    assert(*entries[0].accent_type == 0);
    assert(*entries[0].language == "ja");
    test_passed("add applies defaults");
}

void test_upsert_idempotent() {
    auto store = freshStore("idempotent.json");
    EntryManager manager(*store);

    auto entry = makeEntry("MCP", "エムシーピー");
    assert(manager.add(entry).isOk());
    std::string first = readFile(store->getPath());
    assert(manager.add(entry).isOk());
    assert(readFile(store->getPath()) == first);
    assert(listAll(manager).size() == 1);
    test_passed("upsert idempotent");
}

void test_upsert_by_surface_form() {
    auto store = freshStore("upsert.json");
    EntryManager manager(*store);

    assert(manager.add(makeEntry("A", "エー")).isOk());
    assert(manager.add(makeEntry("MCP", "エムシーピー")).isOk());
    assert(manager.add(makeEntry("B", "ビー")).isOk());
    assert(manager.add(makeEntry("MCP", "エムシーピーツー")).isOk());

    auto entries = listAll(manager);
    assert(entries.size() == 3);
    assert(entries[0].surface_form == "A");
    assert(entries[1].surface_form == "MCP");
    assert(entries[1].pronunciation == "エムシーピーツー");
    assert(entries[2].surface_form == "B");
    test_passed("upsert by surface form keeps position");
}

void test_upsert_by_pronunciation() {
    auto store = freshStore("upsert.dic");
    EntryManager manager(*store);
    assert(manager.getComparisonPolicy() == ComparisonPolicy::BY_PRONUNCIATION);

    assert(manager.add(makeEntry("MCP", "エムシーピー")).isOk());
    assert(manager.add(makeEntry("MCP", "エムシーピーツー")).isOk());
    assert(listAll(manager).size() == 2);

    auto same_reading = makeEntry("other", "エムシーピー");
    same_reading.priority = 9;
    assert(manager.add(same_reading).isOk());

    auto entries = listAll(manager);
    assert(entries.size() == 2);
    assert(entries[0].pronunciation == "エムシーピー");
    assert(*entries[0].priority == 9);
    test_passed("upsert by pronunciation");
}

void test_languages_are_separate() {
    auto store = freshStore("lang.json");
    EntryManager manager(*store);

    auto ja = makeEntry("MCP", "エムシーピー");
    auto en = makeEntry("MCP", "エムシーピー");
    en.language = "en";
    assert(manager.add(ja).isOk());
    assert(manager.add(en).isOk());
    assert(listAll(manager).size() == 2);

    EntryList found;
    assert(manager.find("MCP", found).isOk());
    assert(found.size() == 2);

    bool removed = false;
    assert(manager.remove("MCP", "en", removed).isOk());
    assert(removed);
    auto entries = listAll(manager);
    assert(entries.size() == 1);
    assert(*entries[0].language == "ja");

    // 空语言视为 ja
    assert(manager.remove("MCP", "", removed).isOk());
    assert(removed);
    assert(listAll(manager).empty());
    test_passed("languages are separate");
}

void test_binary_store_ignores_language() {
    auto store = freshStore("lang.dic");
    EntryManager manager(*store);

    auto en = makeEntry("MCP", "エムシーピー");
    en.language = "en";
    for (int i = 0; i < 3; ++i) {
        assert(manager.add(en).isOk());
    }
    auto entries = listAll(manager);
    assert(entries.size() == 1);
    assert(*entries[0].language == "ja");

    // 同一读音的 ja 条目替换已有记录
    auto ja = makeEntry("MCP", "エムシーピー");
    ja.priority = 8;
    assert(manager.add(ja).isOk());
    entries = listAll(manager);
    assert(entries.size() == 1);
    assert(*entries[0].priority == 8);

    bool removed = false;
    assert(manager.remove("エムシーピー", "en", removed).isOk());
    assert(removed);
    assert(listAll(manager).empty());

    assert(manager.add(en).isOk());
    assert(manager.remove("エムシーピー", removed).isOk());
    assert(removed);
    assert(listAll(manager).empty());
    test_passed("binary store ignores language");
}

void test_remove_absent_key() {
    auto store = freshStore("remove.json");
    EntryManager manager(*store);

    bool removed = true;
    assert(manager.remove("MCP", removed).isOk());
    assert(!removed);
    assert(!fs::exists(store->getPath()));

    assert(manager.add(makeEntry("MCP", "エムシーピー")).isOk());
    std::string before = readFile(store->getPath());
    assert(manager.remove("XYZ", removed).isOk());
    assert(!removed);
    assert(readFile(store->getPath()) == before);

    assert(manager.remove("MCP", removed).isOk());
    assert(removed);
    assert(listAll(manager).empty());
    test_passed("remove absent key");
}

void test_find() {
    auto store = freshStore("find.json");
    EntryManager manager(*store);
    assert(manager.add(makeEntry("MCP", "エムシーピー")).isOk());
    assert(manager.add(makeEntry("東京", "トウキョウ")).isOk());

    EntryList found;
    assert(manager.find("東京", found).isOk());
    assert(found.size() == 1);
    assert(found[0].pronunciation == "トウキョウ");

    assert(manager.find("大阪", found).isOk());
    assert(found.empty());

    // 文本格式按表记匹配
    assert(manager.find("トウキョウ", found).isOk());
    assert(found.empty());
    test_passed("find");
}

void test_find_in_binary_store() {
    auto store = freshStore("find.dic");
    EntryManager manager(*store);
    assert(manager.add(makeEntry("東京", "トウキョウ")).isOk());

    EntryList found;
    assert(manager.find("東京", found).isOk());
    assert(found.empty());
    assert(manager.find("トウキョウ", found).isOk());
    assert(found.size() == 1);
    assert(found[0].surface_form == "トウキョウ");
    test_passed("find in binary store");
}

void test_clear() {
    for (const char* name : {"clear.json", "clear.dic"}) {
        auto store = freshStore(name);
        EntryManager manager(*store);
        assert(manager.add(makeEntry("A", "エー")).isOk());
        assert(manager.add(makeEntry("B", "ビー")).isOk());
        assert(manager.clear().isOk());
        assert(fs::exists(store->getPath()));
        assert(listAll(manager).empty());
    }
    test_passed("clear");
}

void test_clear_logging() {
    {
        auto store = freshStore("quiet.json");
        EntryManager manager(*store);
        CoutCapture capture;
        assert(manager.clear().isOk());
        assert(capture.str().empty());
    }
    {
        CoutCapture capture;
        auto store = freshStore("loud.dic", true);
        EntryManager manager(*store);
        assert(manager.clear().isOk());
        std::string out = capture.str();
        assert(out.find("(key: pronunciation)") != std::string::npos);
        assert(out.find("[EntryManager] Cleared dictionary") != std::string::npos);
    }
    test_passed("clear logging");
}

void test_invalid_entries() {
    auto text_store = freshStore("invalid.json");
    EntryManager text(*text_store);
    assert(text.add(makeEntry("", "エー")).code == ErrorCode::INVALID_ENTRY);
    assert(text.add(makeEntry("A", "")).code == ErrorCode::INVALID_ENTRY);
    assert(text.add(makeEntry("A", "エー,ビー")).isOk());

    auto binary_store = freshStore("invalid.dic");
    EntryManager binary(*binary_store);
    assert(binary.add(makeEntry("", "エー")).isOk());
    assert(binary.add(makeEntry("A", "エー,ビー")).code == ErrorCode::INVALID_ENTRY);
    assert(binary.add(makeEntry("A", std::string("エー\0", 7))).code == ErrorCode::INVALID_ENTRY);
    assert(listAll(binary).size() == 1);
    test_passed("invalid entries");
}

void test_malformed_store_is_untouched() {
    auto store = freshStore("malformed.json");
    {
        std::ofstream out(store->getPath());
        out << "not json";
    }

    EntryManager manager(*store);
    auto err = manager.add(makeEntry("A", "エー"));
    assert(err.code == ErrorCode::FILE_READ_ERROR);
    assert(readFile(store->getPath()) == "not json");

    bool removed = true;
    assert(manager.remove("A", removed).code == ErrorCode::FILE_READ_ERROR);
    assert(!removed);
    test_passed("malformed store is untouched");
}

int main() {
    std::cout << "=== EntryManager Tests ===" << std::endl;
    fs::remove_all(kTestDir);
    fs::create_directories(kTestDir);

    test_add_applies_defaults();
    test_upsert_idempotent();
    test_upsert_by_surface_form();
    test_upsert_by_pronunciation();
    test_languages_are_separate();
    test_binary_store_ignores_language();
    test_remove_absent_key();
    test_find();
    test_find_in_binary_store();
    test_clear();
    test_clear_logging();
    test_invalid_entries();
    test_malformed_store_is_untouched();

    fs::remove_all(kTestDir);
    std::cout << "All tests passed." << std::endl;
    return 0;
}
