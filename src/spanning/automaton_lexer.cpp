#include "automaton_lexer.hpp"
#include "utf8.hpp"

#include <unicode/uchar.h>

#include <array>

namespace chipper {

namespace {

using CharClass = AutomatonLexer::CharClass;

constexpr std::array<uint8_t, 128> build_ascii_classes() {
    std::array<uint8_t, 128> table{};
    for (int c = 0; c < 128; ++c) {
        uint8_t cls = AutomatonLexer::kOther;
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
            cls = AutomatonLexer::kLetter;
        } else if (c >= '0' && c <= '9') {
            cls = AutomatonLexer::kNumber;
        } else if (c == '\r' || c == '\n') {
            cls = AutomatonLexer::kNewline;
        } else if (c == ' ') {
            cls = AutomatonLexer::kSpace;
        } else if (c == '\t' || c == '\v' || c == '\f') {
            cls = AutomatonLexer::kWhitespace;
        } else if (c == '\'') {
            cls = AutomatonLexer::kApostrophe;
        }
        table[c] = cls;
    }
    return table;
}

constexpr std::array<uint8_t, 128> kAsciiClasses = build_ascii_classes();

inline bool is_whitespace(CharClass cls) {
    return cls == AutomatonLexer::kNewline || cls == AutomatonLexer::kSpace || cls == AutomatonLexer::kWhitespace;
}

// Not whitespace, letter or number
inline bool is_other(CharClass cls) {
    return cls == AutomatonLexer::kOther || cls == AutomatonLexer::kApostrophe;
}

} // namespace

AutomatonLexer::CharClass AutomatonLexer::classify(uint32_t cp) {
    if (cp < 0x80) {
        return static_cast<CharClass>(kAsciiClasses[cp]);
    }

    auto c = static_cast<UChar32>(cp);
    if (u_isUWhiteSpace(c)) return kWhitespace;

    uint32_t mask = U_GET_GC_MASK(c);
    if (mask & U_GC_L_MASK) return kLetter;
    if (mask & U_GC_N_MASK) return kNumber;
    return kOther;
}

bool AutomatonLexer::for_each_match(std::string_view segment, const MatchVisitor& visit) const {
    std::vector<Unit> units;
    units.reserve(segment.size() + 1);

    for (size_t pos = 0; pos < segment.size();) {
        size_t len = 0;
        uint32_t cp = utf8::decode(segment, pos, &len);
        CharClass cls = classify(cp);

        char lower = 0;
        if (cls == kLetter && cp < 0x80) {
            lower = static_cast<char>(cp | 0x20);
        }
        units.push_back(Unit{pos, cls, lower});
        pos += len;
    }
    units.push_back(Unit{segment.size(), kEnd, 0});

    size_t count = units.size() - 1;
    size_t i = 0;
    while (i < count) {
        size_t j = scan(units, i);
        if (!visit(units[i].offset, units[j].offset)) {
            return false;
        }
        i = j;
    }
    return true;
}

size_t AutomatonLexer::scan(const std::vector<Unit>& units, size_t i) {
    const size_t count = units.size() - 1;
    const CharClass first = units[i].cls;

    // 's 'd 'm 't 'll 've 're, either case
    if (first == kApostrophe) {
        char c1 = units[i + 1].lower;
        if (c1 == 's' || c1 == 'd' || c1 == 'm' || c1 == 't') {
            return i + 2;
        }
        if (c1 != 0 && i + 2 < count) {
            char c2 = units[i + 2].lower;
            if ((c1 == 'l' && c2 == 'l') || (c1 == 'v' && c2 == 'e') || (c1 == 'r' && c2 == 'e')) {
                return i + 3;
            }
        }
    }

    // Letters with at most one leading non-letter, non-digit, non-newline
    {
        size_t j = i;
        if (first != kNewline && first != kLetter && first != kNumber) {
            ++j;
        }
        if (units[j].cls == kLetter) {
            while (units[j].cls == kLetter) ++j;
            return j;
        }
    }

    // Up to three digits
    if (first == kNumber) {
        size_t j = i;
        while (j < i + 3 && units[j].cls == kNumber) ++j;
        return j;
    }

    // Punctuation run, optional leading space, trailing newlines
    {
        size_t j = i;
        if (first == kSpace && is_other(units[i + 1].cls)) {
            ++j;
        }
        if (is_other(units[j].cls)) {
            while (is_other(units[j].cls)) ++j;
            while (units[j].cls == kNewline) ++j;
            return j;
        }
    }

    // Whitespace run [i, end)
    size_t end = i;
    size_t last_newline = count;
    while (is_whitespace(units[end].cls)) {
        if (units[end].cls == kNewline) last_newline = end;
        ++end;
    }

    if (end == count) return end;                   // trailing whitespace
    if (last_newline != count) return last_newline + 1;
    if (end - i >= 2) return end - 1;               // leave one for the next word
    return i + 1;
}

} // namespace chipper
