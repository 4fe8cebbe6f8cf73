#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace combre::util {

inline constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

// Unicode scalar value: any code point except the surrogate block.
[[nodiscard]] constexpr bool is_scalar_value(char32_t cp) {
    return cp < 0xD800 || (cp > 0xDFFF && cp <= 0x10FFFF);
}

// Decode one UTF-8 scalar value from s. Returns bytes consumed (0 on error).
int decode_utf8(const char* s, size_t len, char32_t* cp);

// Encode one scalar value to UTF-8 bytes. Returns byte count.
int encode_utf8(char32_t cp, uint8_t out[4]);

// Decode a whole string. Returns false on the first malformed sequence.
bool decode_utf8_string(std::string_view in, std::u32string& out);

std::string to_utf8(std::u32string_view in);

// Walks the scalar values of a UTF-8 string. A byte that does not start a
// well-formed sequence yields U+FFFD and consumes exactly that byte.
class Utf8Cursor {
public:
    explicit Utf8Cursor(std::string_view s) : s_(s) {}

    [[nodiscard]] bool done() const { return pos_ >= s_.size(); }
    [[nodiscard]] size_t offset() const { return pos_; }

    char32_t next();

private:
    std::string_view s_;
    size_t pos_{0};
};

} // namespace combre::util
