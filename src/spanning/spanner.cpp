#include "spanner.hpp"
#include "utf8.hpp"
#include "pattern_lexer.hpp"
#include "automaton_lexer.hpp"
#include "../core/errors.hpp"

#include <algorithm>

namespace chipper {

namespace {

bool is_continuation(std::string_view text, size_t pos) {
    return pos < text.size() && (static_cast<uint8_t>(text[pos]) & 0xc0) == 0x80;
}

} // namespace

std::unique_ptr<WordLexer> create_word_lexer(chipper_spanner_type_t type, const char* pattern) {
    switch (type) {
        case CHIPPER_SPANNER_PATTERN:
            if (pattern != nullptr) {
                return std::make_unique<PatternLexer>(pattern);
            }
            return std::make_unique<PatternLexer>();
        case CHIPPER_SPANNER_AUTOMATON:
            if (pattern != nullptr) {
                throw ConfigError("The automaton spanner only implements the built-in word pattern");
            }
            return std::make_unique<AutomatonLexer>();
        default:
            throw ConfigError("Unknown spanner type " + std::to_string(static_cast<int>(type)));
    }
}

TextSpanner::TextSpanner(std::unique_ptr<WordLexer> lexer, const std::vector<std::string>& specials, bool strict)
    : lexer_(std::move(lexer)), strict_(strict) {
    if (!lexer_) {
        throw ConfigError("Spanner requires a word lexer");
    }

    for (const auto& special : specials) {
        if (special.empty()) continue;
        specials_[static_cast<uint8_t>(special[0])].push_back(special);
        has_specials_ = true;
    }
    for (auto& bucket : specials_) {
        std::stable_sort(bucket.begin(), bucket.end(),
                         [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
    }
}

bool TextSpanner::for_each_span(std::string_view text, const SpanVisitor& visit) const {
    size_t valid = utf8::valid_prefix(text);
    if (valid < text.size() && strict_) {
        throw SpanningError("Malformed UTF-8 sequence at byte offset " + std::to_string(valid), valid);
    }

    std::string_view body = text.substr(0, valid);
    size_t offset = 0;
    size_t start = 0;
    size_t end = 0;

    while (next_special(body, offset, &start, &end)) {
        if (!for_each_word(body.substr(offset, start - offset), offset, visit)) return false;
        if (!visit(Span{start, end, SpanKind::Special})) return false;
        offset = end;
    }
    if (!for_each_word(body.substr(offset), offset, visit)) return false;

    if (valid < text.size()) {
        return visit(Span{valid, text.size(), SpanKind::Gap});
    }
    return true;
}

bool TextSpanner::for_each_word(std::string_view segment, size_t offset, const SpanVisitor& visit) const {
    if (segment.empty()) return true;

    size_t last = 0;
    bool running = lexer_->for_each_match(segment, [&](size_t start, size_t end) {
        if (last < start && !visit(Span{offset + last, offset + start, SpanKind::Gap})) {
            return false;
        }
        last = end;
        return visit(Span{offset + start, offset + end, SpanKind::Word});
    });

    if (!running) return false;
    if (last < segment.size()) {
        return visit(Span{offset + last, offset + segment.size(), SpanKind::Gap});
    }
    return true;
}

bool TextSpanner::next_special(std::string_view text, size_t from, size_t* start, size_t* end) const {
    if (!has_specials_) return false;

    for (size_t pos = from; pos < text.size(); ++pos) {
        const auto& bucket = specials_[static_cast<uint8_t>(text[pos])];
        if (bucket.empty() || is_continuation(text, pos)) continue;

        for (const auto& special : bucket) {
            if (text.compare(pos, special.size(), special) != 0) continue;
            // Never cut inside a code point
            if (is_continuation(text, pos + special.size())) continue;
            *start = pos;
            *end = pos + special.size();
            return true;
        }
    }
    return false;
}

std::vector<Span> TextSpanner::split(std::string_view text) const {
    std::vector<Span> spans;
    for_each_span(text, [&spans](const Span& span) {
        spans.push_back(span);
        return true;
    });
    return spans;
}

std::string TextSpanner::remove_gaps(std::string_view text) const {
    std::string result;
    result.reserve(text.size());
    for_each_span(text, [&](const Span& span) {
        if (span.kind != SpanKind::Gap) {
            result.append(text.data() + span.begin, span.size());
        }
        return true;
    });
    return result;
}

} // namespace chipper
