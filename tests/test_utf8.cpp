#include "minitest.hpp"
#include "util/Utf8.hpp"

#include <string>

using namespace combre::util;

TEST(utf8_decode_ascii_and_multibyte) {
    char32_t cp = 0;
    ASSERT_EQ(decode_utf8("a", 1, &cp), 1);
    ASSERT_EQ(cp, U'a');
    ASSERT_EQ(decode_utf8("\xC3\xA9", 2, &cp), 2);
    ASSERT_EQ(cp, (char32_t)0xE9);
    ASSERT_EQ(decode_utf8("\xE4\xB8\x96", 3, &cp), 3);
    ASSERT_EQ(cp, (char32_t)0x4E16);
    ASSERT_EQ(decode_utf8("\xF0\x9F\x98\x80", 4, &cp), 4);
    ASSERT_EQ(cp, (char32_t)0x1F600);
}

TEST(utf8_decode_rejects_malformed) {
    char32_t cp = 0;
    ASSERT_EQ(decode_utf8("\xC0\x80", 2, &cp), 0);          // overlong NUL
    ASSERT_EQ(decode_utf8("\xED\xA0\x80", 3, &cp), 0);      // surrogate
    ASSERT_EQ(decode_utf8("\xF4\x90\x80\x80", 4, &cp), 0);  // above U+10FFFF
    ASSERT_EQ(decode_utf8("\xC3", 1, &cp), 0);              // truncated
    ASSERT_EQ(decode_utf8("\xC3\x41", 2, &cp), 0);          // bad continuation
    ASSERT_EQ(decode_utf8("\x80", 1, &cp), 0);              // stray continuation
}

TEST(utf8_scalar_values) {
    ASSERT_TRUE(is_scalar_value(0));
    ASSERT_TRUE(is_scalar_value(0xD7FF));
    ASSERT_FALSE(is_scalar_value(0xD800));
    ASSERT_FALSE(is_scalar_value(0xDFFF));
    ASSERT_TRUE(is_scalar_value(0xE000));
    ASSERT_TRUE(is_scalar_value(0x10FFFF));
    ASSERT_FALSE(is_scalar_value(0x110000));
}

TEST(utf8_cursor_replaces_bad_bytes) {
    Utf8Cursor cur("a\xFF\xC3\xA9\xC3");
    std::u32string got;
    while (!cur.done()) got.push_back(cur.next());
    ASSERT_TRUE(got == std::u32string(U"a\uFFFD\u00E9\uFFFD"));
}

TEST(utf8_string_roundtrip) {
    std::u32string cps;
    ASSERT_TRUE(decode_utf8_string("caf\xC3\xA9 \xE4\xB8\x96", cps));
    ASSERT_EQ(cps.size(), 6u);
    ASSERT_EQ(to_utf8(cps), std::string("caf\xC3\xA9 \xE4\xB8\x96"));
    ASSERT_FALSE(decode_utf8_string("ok\xFF", cps));
}
