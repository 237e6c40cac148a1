#include "decoder.hpp"
#include "errors.hpp"

namespace chipper {

const std::string& Decoder::lookup(chipper_token_t token, size_t position) const {
    const std::string* bytes = vocab_->bytes_of(token);
    if (bytes == nullptr) {
        throw UnknownTokenError("Unknown token id " + std::to_string(token) + " at position " +
                                std::to_string(position), token);
    }
    return *bytes;
}

std::string Decoder::decode(const chipper_token_t* tokens, size_t num_tokens) const {
    std::string result;
    result.reserve(decoded_length(tokens, num_tokens));
    for (size_t i = 0; i < num_tokens; ++i) {
        result += lookup(tokens[i], i);
    }
    return result;
}

size_t Decoder::decoded_length(const chipper_token_t* tokens, size_t num_tokens) const {
    size_t length = 0;
    for (size_t i = 0; i < num_tokens; ++i) {
        length += lookup(tokens[i], i).size();
    }
    return length;
}

} // namespace chipper
