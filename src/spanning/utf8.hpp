#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace chipper {
namespace utf8 {

// Length of the longest well-formed UTF-8 prefix of text
size_t valid_prefix(std::string_view text);

// Sequence length implied by a lead byte (1 for invalid leads)
inline size_t sequence_length(uint8_t lead) {
    if (lead < 0x80) return 1;
    if (lead >= 0xf0) return 4;
    if (lead >= 0xe0) return 3;
    if (lead >= 0xc0) return 2;
    return 1;
}

// Decode the code point at pos. text must be well-formed at pos.
inline uint32_t decode(std::string_view text, size_t pos, size_t* length) {
    auto b0 = static_cast<uint8_t>(text[pos]);
    size_t len = sequence_length(b0);
    *length = len;

    switch (len) {
        case 1:
            return b0;
        case 2:
            return ((b0 & 0x1fu) << 6) | (static_cast<uint8_t>(text[pos + 1]) & 0x3fu);
        case 3:
            return ((b0 & 0x0fu) << 12) |
                   ((static_cast<uint8_t>(text[pos + 1]) & 0x3fu) << 6) |
                   (static_cast<uint8_t>(text[pos + 2]) & 0x3fu);
        default:
            return ((b0 & 0x07u) << 18) |
                   ((static_cast<uint8_t>(text[pos + 1]) & 0x3fu) << 12) |
                   ((static_cast<uint8_t>(text[pos + 2]) & 0x3fu) << 6) |
                   (static_cast<uint8_t>(text[pos + 3]) & 0x3fu);
    }
}

} // namespace utf8
} // namespace chipper
