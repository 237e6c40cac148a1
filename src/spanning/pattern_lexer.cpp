#include "pattern_lexer.hpp"
#include "utf8.hpp"
#include "../core/errors.hpp"
#include "../util/logger.hpp"

#include <unicode/parseerr.h>
#include <unicode/unistr.h>

#include <vector>

namespace chipper {

const char* const kWordPattern =
    R"PAT('(?:[sdmtSDMT]|[lL][lL]|[vV][eE]|[rR][eE]))PAT"
    R"PAT(|[^\r\n\p{L}\p{N}]?+\p{L}++)PAT"
    R"PAT(|\p{N}{1,3}+)PAT"
    R"PAT(| ?[^\p{White_Space}\p{L}\p{N}]++[\r\n]*+)PAT"
    R"PAT(|\p{White_Space}++\z)PAT"
    R"PAT(|\p{White_Space}*[\r\n])PAT"
    R"PAT(|\p{White_Space}+(?!\P{White_Space}))PAT"
    R"PAT(|\p{White_Space})PAT";

PatternLexer::PatternLexer(const std::string& pattern) : pattern_(pattern) {
    UParseError parse_error{};
    UErrorCode status = U_ZERO_ERROR;
    regex_.reset(icu::RegexPattern::compile(icu::UnicodeString::fromUTF8(pattern_), 0, parse_error, status));

    if (U_FAILURE(status) || !regex_) {
        throw ConfigError("Invalid word pattern at offset " + std::to_string(parse_error.offset) + ": " +
                          u_errorName(status), CHIPPER_ERROR_PATTERN_INVALID);
    }

    create_logger("Tokenizer")->debug("Compiled word pattern ({} bytes)", pattern_.size());
}

PatternLexer::~PatternLexer() = default;

bool PatternLexer::for_each_match(std::string_view segment, const MatchVisitor& visit) const {
    icu::UnicodeString input = icu::UnicodeString::fromUTF8(
        icu::StringPiece(segment.data(), static_cast<int32_t>(segment.size())));

    // UTF-16 index -> byte offset. Both halves of a surrogate pair map to the
    // lead byte; matches never start or end between them.
    std::vector<size_t> offsets;
    offsets.reserve(static_cast<size_t>(input.length()) + 1);
    for (size_t pos = 0; pos < segment.size();) {
        size_t len = utf8::sequence_length(static_cast<uint8_t>(segment[pos]));
        offsets.push_back(pos);
        if (len == 4) {
            offsets.push_back(pos);
        }
        pos += len;
    }
    offsets.push_back(segment.size());

    UErrorCode status = U_ZERO_ERROR;
    std::unique_ptr<icu::RegexMatcher> matcher(regex_->matcher(input, status));
    if (U_FAILURE(status)) {
        throw Error(CHIPPER_ERROR_OPERATION_FAILED, std::string("Failed to create matcher: ") + u_errorName(status));
    }

    while (matcher->find(status) && U_SUCCESS(status)) {
        int32_t start = matcher->start(status);
        int32_t end = matcher->end(status);
        if (U_FAILURE(status)) break;
        if (start == end) continue;

        if (!visit(offsets[static_cast<size_t>(start)], offsets[static_cast<size_t>(end)])) {
            return false;
        }
    }

    if (U_FAILURE(status)) {
        throw Error(CHIPPER_ERROR_OPERATION_FAILED, std::string("Pattern match failed: ") + u_errorName(status));
    }
    return true;
}

} // namespace chipper
