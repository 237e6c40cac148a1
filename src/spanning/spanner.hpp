#pragma once

#include <chipper/chipper_types.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chipper {

enum class SpanKind : uint8_t {
    Word,       // Matched by the word lexer
    Gap,        // Not covered by the word lexer, or malformed trailing bytes
    Special     // Literal special token
};

// Byte range [begin, end) of the source text
struct Span {
    size_t begin;
    size_t end;
    SpanKind kind;

    size_t size() const { return end - begin; }
    bool operator==(const Span& other) const {
        return begin == other.begin && end == other.end && kind == other.kind;
    }
    bool operator!=(const Span& other) const { return !(*this == other); }
};

// Return false to stop the walk
using SpanVisitor = std::function<bool(const Span&)>;
using MatchVisitor = std::function<bool(size_t start, size_t end)>;

/**
 * WordLexer - Splits well-formed UTF-8 text into word matches
 *
 * Implementations: PatternLexer (ICU regex), AutomatonLexer (precompiled
 * scanner). Both implement the same rule set and must agree byte for byte.
 * Lexers hold no per-call state and are safe to share between threads.
 */
class WordLexer {
public:
    virtual ~WordLexer() = default;

    virtual chipper_spanner_type_t type() const = 0;
    virtual std::string name() const = 0;

    // Visit non-empty matches left to right, offsets relative to segment.
    // Returns false if the visitor stopped the walk.
    virtual bool for_each_match(std::string_view segment, const MatchVisitor& visit) const = 0;
};

/**
 * Create a word lexer by type
 *
 * @param type     Lexer implementation
 * @param pattern  Custom pattern, or nullptr for the built-in rule set.
 *                 Only the pattern lexer accepts a custom pattern.
 */
std::unique_ptr<WordLexer> create_word_lexer(chipper_spanner_type_t type, const char* pattern = nullptr);

/**
 * TextSpanner - Partitions text into independently encodable spans
 *
 * Spans cover the input exactly and in order. Special tokens are cut out
 * first (leftmost occurrence, longest at that position); the text between
 * them goes through the word lexer as independent segments. Bytes past the
 * longest well-formed UTF-8 prefix form one trailing Gap span, or raise
 * SpanningError in strict mode.
 */
class TextSpanner {
public:
    TextSpanner(std::unique_ptr<WordLexer> lexer, const std::vector<std::string>& specials, bool strict);

    TextSpanner(const TextSpanner&) = delete;
    TextSpanner& operator=(const TextSpanner&) = delete;

    chipper_spanner_type_t type() const { return lexer_->type(); }
    bool strict() const { return strict_; }

    // Walk spans lazily. Returns false if the visitor stopped the walk.
    bool for_each_span(std::string_view text, const SpanVisitor& visit) const;

    // Collect all spans
    std::vector<Span> split(std::string_view text) const;

    // Rewrite text keeping only Word and Special spans
    std::string remove_gaps(std::string_view text) const;

private:
    bool for_each_word(std::string_view segment, size_t offset, const SpanVisitor& visit) const;
    bool next_special(std::string_view text, size_t from, size_t* start, size_t* end) const;

    std::unique_ptr<WordLexer> lexer_;
    bool strict_;

    // Special tokens by first byte, longest first
    std::array<std::vector<std::string>, 256> specials_;
    bool has_specials_ = false;
};

} // namespace chipper
