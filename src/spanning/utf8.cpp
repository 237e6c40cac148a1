#include "utf8.hpp"

namespace chipper {
namespace utf8 {

namespace {

bool is_continuation(uint8_t b) {
    return (b & 0xc0) == 0x80;
}

// Bytes of the well-formed sequence starting at pos, or 0 (Unicode table 3-7)
size_t well_formed_length(std::string_view text, size_t pos) {
    auto b0 = static_cast<uint8_t>(text[pos]);
    size_t remaining = text.size() - pos;

    if (b0 < 0x80) return 1;
    if (b0 < 0xc2 || b0 > 0xf4) return 0;

    size_t len = sequence_length(b0);
    if (remaining < len) return 0;

    auto b1 = static_cast<uint8_t>(text[pos + 1]);
    uint8_t lo = 0x80;
    uint8_t hi = 0xbf;
    if (b0 == 0xe0) lo = 0xa0;          // overlong
    else if (b0 == 0xed) hi = 0x9f;     // surrogates
    else if (b0 == 0xf0) lo = 0x90;     // overlong
    else if (b0 == 0xf4) hi = 0x8f;     // > U+10FFFF
    if (b1 < lo || b1 > hi) return 0;

    for (size_t i = 2; i < len; ++i) {
        if (!is_continuation(static_cast<uint8_t>(text[pos + i]))) return 0;
    }
    return len;
}

} // namespace

size_t valid_prefix(std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = well_formed_length(text, pos);
        if (len == 0) break;
        pos += len;
    }
    return pos;
}

} // namespace utf8
} // namespace chipper
