#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace diffreview {

// Number of bytes in the UTF-8 sequence introduced by `lead`. Continuation bytes and
// invalid lead bytes count as a single byte so that malformed input still advances.
std::size_t
utf8_sequence_length(unsigned char lead);

inline bool
utf8_is_continuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

// Byte offset of the code point following the one that starts at `pos`. Never returns
// a position inside a multi-byte sequence, and never goes past `s.size()`.
std::size_t
utf8_next(std::string_view s, std::size_t pos);

// Strict check: no overlong forms, surrogates or code points past U+10FFFF.
bool
utf8_is_valid(std::string_view s);

// Display columns taken by the code point starting at `pos`: `tab_width` for a tab,
// 0 for C0 controls and DEL, 1 for everything else.
int64_t
utf8_unit_width(std::string_view s, std::size_t pos, int64_t tab_width);

// Display columns of s[start, end).
int64_t
display_width(std::string_view s, std::size_t start, std::size_t end, int64_t tab_width);

int64_t
display_width(std::string_view s, int64_t tab_width);

}  // namespace diffreview
