#pragma once

#include "spanner.hpp"

#include <unicode/regex.h>

#include <memory>
#include <string>

namespace chipper {

// Built-in word pattern (ICU syntax). Contractions, letter runs with one
// optional leading non-letter, digit groups of up to three, punctuation runs
// with an optional leading space, then whitespace handling that leaves the
// last space of a run for the following word.
extern const char* const kWordPattern;

/**
 * PatternLexer - Word lexer backed by an ICU regular expression
 *
 * The compiled pattern is shared; each call creates its own matcher.
 */
class PatternLexer : public WordLexer {
public:
    // Throws ConfigError (CHIPPER_ERROR_PATTERN_INVALID) if the pattern does not compile
    explicit PatternLexer(const std::string& pattern = kWordPattern);
    ~PatternLexer() override;

    chipper_spanner_type_t type() const override { return CHIPPER_SPANNER_PATTERN; }
    std::string name() const override { return "pattern"; }

    bool for_each_match(std::string_view segment, const MatchVisitor& visit) const override;

    const std::string& pattern() const { return pattern_; }

private:
    std::string pattern_;
    std::unique_ptr<icu::RegexPattern> regex_;
};

} // namespace chipper
