#pragma once

#include "../core/vocabulary.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chipper {

/**
 * tiktoken rank files
 *
 * One token per line: "<base64 bytes> <rank>". The rank doubles as the token
 * id and merges are derived from the token bytes (Vocabulary::from_ranked_tokens).
 * Blank lines are ignored.
 *
 * Throws Error(CHIPPER_ERROR_FILE_INVALID) naming the offending line, and
 * VocabularyError if the resulting table is inconsistent.
 */
std::shared_ptr<const Vocabulary> parse_tiktoken_vocab(std::string_view text,
                                                       std::vector<SpecialToken> specials = {});

// Read and parse a rank file. Throws Error(CHIPPER_ERROR_FILE_NOT_FOUND / FILE_READ).
std::shared_ptr<const Vocabulary> load_tiktoken_vocab(const std::string& path,
                                                      std::vector<SpecialToken> specials = {});

// Standard alphabet, '=' padding required for incomplete groups
bool base64_decode(std::string_view encoded, std::string* out);

} // namespace chipper
