#pragma once

#include "vocabulary.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chipper {

/**
 * Decoder - Token ids back to bytes
 *
 * Concatenates the bytes of every id, specials included. Throws
 * UnknownTokenError for the first id the vocabulary does not know.
 */
class Decoder {
public:
    explicit Decoder(std::shared_ptr<const Vocabulary> vocab) : vocab_(std::move(vocab)) {}

    std::string decode(const chipper_token_t* tokens, size_t num_tokens) const;
    std::string decode(const std::vector<chipper_token_t>& tokens) const {
        return decode(tokens.data(), tokens.size());
    }

    // Decoded size in bytes, without building the string
    size_t decoded_length(const chipper_token_t* tokens, size_t num_tokens) const;

private:
    const std::string& lookup(chipper_token_t token, size_t position) const;

    std::shared_ptr<const Vocabulary> vocab_;
};

} // namespace chipper
