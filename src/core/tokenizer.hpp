#pragma once

#include "batch_driver.hpp"
#include "decoder.hpp"
#include "vocabulary.hpp"
#include "../compute/worker_pool.hpp"
#include "../merge/merge_strategy.hpp"
#include "../spanning/spanner.hpp"
#include "../util/logger.hpp"
#include <chipper/chipper_types.h>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace chipper {

/**
 * Tokenizer - Byte-level BPE encode/decode over one vocabulary
 *
 * Owns the spanner, the merge strategy, the decoder and the batch driver
 * selected by the config. Encoding and decoding are const and may run from
 * any number of threads at once.
 */
class Tokenizer {
public:
    // Throws ConfigError for an invalid config, Error(CHIPPER_ERROR_VOCAB_EMPTY) for an empty vocabulary
    Tokenizer(std::shared_ptr<const Vocabulary> vocab, const chipper_tokenizer_config_t& config);
    ~Tokenizer();

    Tokenizer(const Tokenizer&) = delete;
    Tokenizer& operator=(const Tokenizer&) = delete;

    // Encode text to tokens. Throws SpanningError (strict mode) or UnknownTokenError.
    std::vector<chipper_token_t> encode(std::string_view text) const;

    // Append the tokens of text to out
    void encode_into(std::string_view text, std::vector<chipper_token_t>& out) const;

    // Decode tokens to bytes. Throws UnknownTokenError.
    std::string decode(const std::vector<chipper_token_t>& tokens) const;
    std::string decode(const chipper_token_t* tokens, size_t num_tokens) const;

    // Non-throwing variants for per-input error handling
    EncodeOutcome try_encode(std::string_view text) const;
    std::vector<EncodeOutcome> try_encode_batch(const std::vector<std::string_view>& inputs,
                                                const chipper_batch_config_t& config) const;

    // Accessors
    const Vocabulary& vocab() const { return *vocab_; }
    const std::shared_ptr<const Vocabulary>& vocab_ptr() const { return vocab_; }
    const TextSpanner& spanner() const { return *spanner_; }
    const MergeStrategy& merge_strategy() const { return *merge_; }
    const Decoder& decoder() const { return decoder_; }
    const chipper_tokenizer_config_t& config() const { return config_; }
    int num_threads() const { return config_.num_threads; }

private:
    std::shared_ptr<const Vocabulary> vocab_;
    chipper_tokenizer_config_t config_;
    std::string word_pattern_;

    std::unique_ptr<TextSpanner> spanner_;
    std::unique_ptr<WorkerPool> rank_pool_;     // parallel rank strategy only
    std::unique_ptr<MergeStrategy> merge_;
    Decoder decoder_;
    std::unique_ptr<BatchDriver> batch_;

    Logger logger_;
};

} // namespace chipper
