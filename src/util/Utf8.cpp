#include "util/Utf8.hpp"

namespace combre::util {

int decode_utf8(const char* s, size_t len, char32_t* cp) {
    if (len == 0) return 0;
    auto c = (uint8_t)s[0];
    if (c < 0x80) { *cp = c; return 1; }

    int n;
    char32_t v;
    char32_t min;
    if ((c & 0xE0) == 0xC0)      { n = 2; v = c & 0x1F; min = 0x80; }
    else if ((c & 0xF0) == 0xE0) { n = 3; v = c & 0x0F; min = 0x800; }
    else if ((c & 0xF8) == 0xF0) { n = 4; v = c & 0x07; min = 0x10000; }
    else return 0;
    if (len < (size_t)n) return 0;

    for (int i = 1; i < n; ++i) {
        auto b = (uint8_t)s[i];
        if ((b & 0xC0) != 0x80) return 0;
        v = (v << 6) | (b & 0x3F);
    }
    // Overlong forms, surrogates and values past U+10FFFF are all malformed.
    if (v < min || !is_scalar_value(v)) return 0;
    *cp = v;
    return n;
}

int encode_utf8(char32_t cp, uint8_t out[4]) {
    if (cp < 0x80)    { out[0] = (uint8_t)cp; return 1; }
    if (cp < 0x800)   { out[0] = 0xC0 | (cp >> 6); out[1] = 0x80 | (cp & 0x3F); return 2; }
    if (cp < 0x10000) { out[0] = 0xE0 | (cp >> 12); out[1] = 0x80 | ((cp >> 6) & 0x3F);
                        out[2] = 0x80 | (cp & 0x3F); return 3; }
    out[0] = 0xF0 | (cp >> 18); out[1] = 0x80 | ((cp >> 12) & 0x3F);
    out[2] = 0x80 | ((cp >> 6) & 0x3F); out[3] = 0x80 | (cp & 0x3F);
    return 4;
}

bool decode_utf8_string(std::string_view in, std::u32string& out) {
    out.clear();
    out.reserve(in.size());
    const char* p = in.data();
    const char* end = p + in.size();
    while (p < end) {
        char32_t cp;
        int n = decode_utf8(p, (size_t)(end - p), &cp);
        if (n == 0) return false;
        out.push_back(cp);
        p += n;
    }
    return true;
}

std::string to_utf8(std::u32string_view in) {
    std::string out;
    out.reserve(in.size());
    uint8_t buf[4];
    for (char32_t cp : in) {
        if (!is_scalar_value(cp)) cp = REPLACEMENT_CHAR;
        int n = encode_utf8(cp, buf);
        out.append(reinterpret_cast<const char*>(buf), (size_t)n);
    }
    return out;
}

char32_t Utf8Cursor::next() {
    char32_t cp;
    int n = decode_utf8(s_.data() + pos_, s_.size() - pos_, &cp);
    if (n == 0) {
        ++pos_;
        return REPLACEMENT_CHAR;
    }
    pos_ += (size_t)n;
    return cp;
}

} // namespace combre::util
