#include "tokenizer.hpp"
#include "errors.hpp"

namespace chipper {

Tokenizer::Tokenizer(std::shared_ptr<const Vocabulary> vocab, const chipper_tokenizer_config_t& config)
    : vocab_(std::move(vocab)), config_(config), decoder_(vocab_), logger_(create_logger("Tokenizer")) {
    if (config_.verbose) {
        set_verbose_logging(true);
    }

    if (!vocab_) {
        throw ConfigError("Tokenizer requires a vocabulary", CHIPPER_ERROR_INVALID_ARGUMENT);
    }
    if (vocab_->empty()) {
        throw Error(CHIPPER_ERROR_VOCAB_EMPTY, "Tokenizer requires a non-empty vocabulary");
    }

    config_.num_threads = WorkerPool::resolve_thread_count(config_.num_threads);

    // Keep our own copy of the pattern; the caller's buffer may not outlive us
    if (config_.word_pattern != nullptr) {
        word_pattern_ = config_.word_pattern;
        config_.word_pattern = word_pattern_.c_str();
    }

    std::vector<std::string> specials;
    specials.reserve(vocab_->specials().size());
    for (const auto& special : vocab_->specials()) {
        specials.push_back(special.bytes);
    }
    spanner_ = std::make_unique<TextSpanner>(create_word_lexer(config_.spanner, config_.word_pattern),
                                             specials, config_.strict_spanning);

    if (config_.merge_strategy == CHIPPER_MERGE_PARALLEL_RANK) {
        rank_pool_ = std::make_unique<WorkerPool>(config_.num_threads);
    }
    merge_ = create_merge_strategy(config_.merge_strategy, rank_pool_.get());

    batch_ = std::make_unique<BatchDriver>(
        [this](std::string_view text) { return encode(text); }, config_.num_threads);

    if (!vocab_->covers_all_bytes()) {
        logger_->warn("Vocabulary does not cover all 256 byte values; some inputs will not encode");
    }
    logger_->info("Tokenizer ready: {} tokens, {} merges, spanner={}, merge={}, threads={}",
                  vocab_->size(), vocab_->merge_count(), chipper_spanner_name(config_.spanner),
                  merge_->name(), config_.num_threads);
}

Tokenizer::~Tokenizer() = default;

void Tokenizer::encode_into(std::string_view text, std::vector<chipper_token_t>& out) const {
    spanner_->for_each_span(text, [&](const Span& span) {
        std::string_view bytes = text.substr(span.begin, span.size());

        if (span.kind == SpanKind::Special) {
            auto id = vocab_->special_id_of(bytes);
            if (!id) {
                throw Error(CHIPPER_ERROR_INVALID_STATE, "Spanner emitted an unregistered special token");
            }
            out.push_back(*id);
            return true;
        }

        // Whole span is already a token
        if (auto id = vocab_->id_of(bytes)) {
            out.push_back(*id);
            return true;
        }

        merge_->encode_span(*vocab_, bytes, out);
        return true;
    });
}

std::vector<chipper_token_t> Tokenizer::encode(std::string_view text) const {
    std::vector<chipper_token_t> tokens;
    tokens.reserve(text.size() / 3 + 1);
    encode_into(text, tokens);
    return tokens;
}

std::string Tokenizer::decode(const std::vector<chipper_token_t>& tokens) const {
    return decoder_.decode(tokens);
}

std::string Tokenizer::decode(const chipper_token_t* tokens, size_t num_tokens) const {
    return decoder_.decode(tokens, num_tokens);
}

EncodeOutcome Tokenizer::try_encode(std::string_view text) const {
    return BatchDriver::capture([this](std::string_view input) { return encode(input); }, text);
}

std::vector<EncodeOutcome> Tokenizer::try_encode_batch(const std::vector<std::string_view>& inputs,
                                                       const chipper_batch_config_t& config) const {
    return batch_->run(inputs, config);
}

} // namespace chipper
