#undef NDEBUG

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/text/text_utils.hpp"

using namespace dict::text;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

}  // namespace

void test_split_utf8() {
    auto chars = splitUtf8("aカ漢é");
    assert(chars.size() == 4);
    assert(chars[0] == "a");
    assert(chars[1] == "カ");
    assert(chars[2] == "漢");
    assert(chars[3] == "é");
    assert(splitUtf8("").empty());
    test_passed("splitUtf8");
}

void test_count_mora() {
    assert(countMora("") == 0);
    assert(countMora("トウキョウ") == 5);
    assert(countMora("エムシーピー") == 6);
    test_passed("countMora");
}

void test_split_fields() {
    auto fields = splitFields("a,,b,", ',');
    assert(fields.size() == 4);
    assert(fields[0] == "a");
    assert(fields[1].empty());
    assert(fields[2] == "b");
    assert(fields[3].empty());

    assert(splitFields("", ',').size() == 1);
    assert(splitFields("名詞,普通名詞,ア,H@0,*,*,5", ',').size() == 7);
    test_passed("splitFields");
}

void test_parse_integer() {
    assert(*parseInteger("5") == 5);
    assert(*parseInteger("-12") == -12);
    assert(*parseInteger(" +7") == 7);
    assert(*parseInteger("10abc") == 10);
    assert(!parseInteger(""));
    assert(!parseInteger("abc"));
    assert(!parseInteger("-"));
    assert(!parseInteger("99999999999"));
    test_passed("parseInteger");
}

int main() {
    std::cout << "=== TextUtils Tests ===" << std::endl;

    test_split_utf8();
    test_count_mora();
    test_split_fields();
    test_parse_integer();

    std::cout << "All tests passed." << std::endl;
    return 0;
}
