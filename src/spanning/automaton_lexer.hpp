#pragma once

#include "spanner.hpp"

#include <cstdint>
#include <vector>

namespace chipper {

/**
 * AutomatonLexer - Hand-compiled scanner for the built-in word pattern
 *
 * Classifies each code point once (table lookup for ASCII, ICU character
 * properties above) and walks the class sequence with the same rule order as
 * kWordPattern. Produces spans byte-identical to PatternLexer without
 * backtracking.
 */
class AutomatonLexer : public WordLexer {
public:
    enum CharClass : uint8_t {
        kLetter,
        kNumber,
        kNewline,       // \r \n
        kSpace,         // U+0020
        kWhitespace,    // Any other White_Space code point
        kApostrophe,
        kOther,
        kEnd            // Sentinel past the last code point
    };

    chipper_spanner_type_t type() const override { return CHIPPER_SPANNER_AUTOMATON; }
    std::string name() const override { return "automaton"; }

    bool for_each_match(std::string_view segment, const MatchVisitor& visit) const override;

    static CharClass classify(uint32_t cp);

private:
    struct Unit {
        size_t offset;
        CharClass cls;
        char lower;     // Lowercase ASCII letter, 0 otherwise
    };

    // End index (in units) of the match starting at unit i. Always > i.
    static size_t scan(const std::vector<Unit>& units, size_t i);
};

} // namespace chipper
