/**
 * Chipper - C ABI Wrapper
 *
 * This file implements the public C API defined in chipper.h
 * by wrapping the internal C++ implementation.
 */

#include <chipper/chipper.h>
#include <chipper/chipper_types.h>
#include <chipper/chipper_error.h>

#include "core/errors.hpp"
#include "core/tokenizer.hpp"
#include "core/vocabulary.hpp"
#include "format/tiktoken_parser.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

// Vocabulary handles share ownership with every tokenizer built from them
struct chipper_vocab {
    std::shared_ptr<const chipper::Vocabulary> vocab;
};

// Thread-local error state
static thread_local chipper_error_t g_last_error = CHIPPER_SUCCESS;
static thread_local char g_last_error_msg[256] = {0};

namespace {

void set_error_from(const chipper::Error& e) {
    chipper_set_error(e.code(), e.what());
}

std::vector<chipper::SpecialToken> to_specials(const chipper_token_entry_t* specials, size_t num_specials) {
    std::vector<chipper::SpecialToken> result;
    result.reserve(num_specials);
    for (size_t i = 0; i < num_specials; ++i) {
        if (specials[i].bytes == nullptr && specials[i].len > 0) {
            throw chipper::Error(CHIPPER_ERROR_INVALID_ARGUMENT, "Special token with NULL bytes");
        }
        result.push_back({std::string(specials[i].bytes, specials[i].len), specials[i].id});
    }
    return result;
}

std::vector<chipper::TokenEntry> to_tokens(const chipper_token_entry_t* tokens, size_t num_tokens) {
    std::vector<chipper::TokenEntry> result;
    result.reserve(num_tokens);
    for (size_t i = 0; i < num_tokens; ++i) {
        if (tokens[i].bytes == nullptr && tokens[i].len > 0) {
            throw chipper::Error(CHIPPER_ERROR_INVALID_ARGUMENT, "Token with NULL bytes");
        }
        result.push_back({std::string(tokens[i].bytes, tokens[i].len), tokens[i].id});
    }
    return result;
}

chipper_vocab_t* wrap_vocab(std::shared_ptr<const chipper::Vocabulary> vocab) {
    auto* handle = new chipper_vocab;
    handle->vocab = std::move(vocab);
    return handle;
}

} // namespace

extern "C" {

// ============================================================================
// Error handling
// ============================================================================

const char* chipper_error_string(chipper_error_t error) {
    switch (error) {
        case CHIPPER_SUCCESS: return "Success";
        case CHIPPER_ERROR_UNKNOWN: return "Unknown error";
        case CHIPPER_ERROR_INVALID_ARGUMENT: return "Invalid argument";
        case CHIPPER_ERROR_OUT_OF_MEMORY: return "Out of memory";
        case CHIPPER_ERROR_INVALID_STATE: return "Invalid state";
        case CHIPPER_ERROR_OPERATION_FAILED: return "Operation failed";
        case CHIPPER_ERROR_BUFFER_TOO_SMALL: return "Buffer too small";
        case CHIPPER_ERROR_FILE_NOT_FOUND: return "File not found";
        case CHIPPER_ERROR_FILE_READ: return "File read error";
        case CHIPPER_ERROR_FILE_INVALID: return "Invalid file";
        case CHIPPER_ERROR_VOCAB_INVALID: return "Invalid vocabulary";
        case CHIPPER_ERROR_VOCAB_EMPTY: return "Empty vocabulary";
        case CHIPPER_ERROR_CONFIG_INVALID: return "Invalid configuration";
        case CHIPPER_ERROR_PATTERN_INVALID: return "Invalid word pattern";
        case CHIPPER_ERROR_SPANNING_FAILED: return "Spanning failed";
        case CHIPPER_ERROR_UNKNOWN_TOKEN: return "Unknown token";
        case CHIPPER_ERROR_CANCELLED: return "Operation cancelled";
        default: return "Unknown error code";
    }
}

chipper_error_t chipper_get_last_error(void) {
    return g_last_error;
}

const char* chipper_get_last_error_message(void) {
    return g_last_error_msg;
}

void chipper_set_error(chipper_error_t error, const char* message) {
    g_last_error = error;
    if (message) {
        strncpy(g_last_error_msg, message, sizeof(g_last_error_msg) - 1);
        g_last_error_msg[sizeof(g_last_error_msg) - 1] = '\0';
    } else {
        g_last_error_msg[0] = '\0';
    }
}

void chipper_clear_error(void) {
    g_last_error = CHIPPER_SUCCESS;
    g_last_error_msg[0] = '\0';
}

// ============================================================================
// Version
// ============================================================================

void chipper_get_version(int* major, int* minor, int* patch) {
    if (major) *major = CHIPPER_VERSION_MAJOR;
    if (minor) *minor = CHIPPER_VERSION_MINOR;
    if (patch) *patch = CHIPPER_VERSION_PATCH;
}

const char* chipper_get_version_string(void) {
    static char version_string[32] = {0};
    if (version_string[0] == '\0') {
        snprintf(version_string, sizeof(version_string),
                 "%d.%d.%d", CHIPPER_VERSION_MAJOR, CHIPPER_VERSION_MINOR, CHIPPER_VERSION_PATCH);
    }
    return version_string;
}

// ============================================================================
// Utility functions
// ============================================================================

const char* chipper_spanner_name(chipper_spanner_type_t spanner) {
    switch (spanner) {
        case CHIPPER_SPANNER_PATTERN: return "pattern";
        case CHIPPER_SPANNER_AUTOMATON: return "automaton";
        default: return "unknown";
    }
}

const char* chipper_merge_strategy_name(chipper_merge_strategy_t strategy) {
    switch (strategy) {
        case CHIPPER_MERGE_LINEAR_RESCAN: return "linear_rescan";
        case CHIPPER_MERGE_PARALLEL_RANK: return "parallel_rank";
        case CHIPPER_MERGE_HEAP_AND_LIST: return "heap_and_list";
        default: return "unknown";
    }
}

void chipper_free(void* ptr) {
    free(ptr);
}

// ============================================================================
// Vocabulary
// ============================================================================

chipper_vocab_t* chipper_vocab_create(const chipper_token_entry_t* tokens, size_t num_tokens,
                                      const chipper_merge_entry_t* merges, size_t num_merges,
                                      const chipper_token_entry_t* specials, size_t num_specials) {
    chipper_clear_error();

    if ((!tokens && num_tokens > 0) || (!merges && num_merges > 0) || (!specials && num_specials > 0)) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return nullptr;
    }

    try {
        std::vector<chipper::MergeEntry> merge_list;
        merge_list.reserve(num_merges);
        for (size_t i = 0; i < num_merges; ++i) {
            merge_list.push_back({merges[i].left, merges[i].right, merges[i].merged, merges[i].rank});
        }

        auto vocab = std::make_shared<const chipper::Vocabulary>(
            to_tokens(tokens, num_tokens), std::move(merge_list), to_specials(specials, num_specials));
        return wrap_vocab(std::move(vocab));
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return nullptr;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return nullptr;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return nullptr;
    }
}

chipper_vocab_t* chipper_vocab_create_ranked(const chipper_token_entry_t* tokens, size_t num_tokens,
                                             const chipper_token_entry_t* specials, size_t num_specials) {
    chipper_clear_error();

    if ((!tokens && num_tokens > 0) || (!specials && num_specials > 0)) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return nullptr;
    }

    try {
        return wrap_vocab(chipper::Vocabulary::from_ranked_tokens(to_tokens(tokens, num_tokens),
                                                                  to_specials(specials, num_specials)));
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return nullptr;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return nullptr;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return nullptr;
    }
}

chipper_vocab_t* chipper_vocab_load_tiktoken(const char* path,
                                             const chipper_token_entry_t* specials, size_t num_specials) {
    chipper_clear_error();

    if (!path || (!specials && num_specials > 0)) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return nullptr;
    }

    try {
        return wrap_vocab(chipper::load_tiktoken_vocab(path, to_specials(specials, num_specials)));
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return nullptr;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return nullptr;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_FILE_READ, e.what());
        return nullptr;
    }
}

void chipper_vocab_destroy(chipper_vocab_t* vocab) {
    delete vocab;
}

size_t chipper_vocab_size(const chipper_vocab_t* vocab) {
    if (!vocab) return 0;
    return vocab->vocab->size();
}

// ============================================================================
// Tokenizer
// ============================================================================

chipper_tokenizer_t* chipper_tokenizer_create(const chipper_vocab_t* vocab,
                                              const chipper_tokenizer_config_t* config) {
    chipper_clear_error();

    if (!vocab) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Vocabulary is NULL");
        return nullptr;
    }

    chipper_tokenizer_config_t cfg = config ? *config : chipper_tokenizer_config_default();

    try {
        auto* tokenizer = new chipper::Tokenizer(vocab->vocab, cfg);
        return reinterpret_cast<chipper_tokenizer_t*>(tokenizer);
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return nullptr;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return nullptr;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return nullptr;
    }
}

void chipper_tokenizer_destroy(chipper_tokenizer_t* tokenizer) {
    delete reinterpret_cast<chipper::Tokenizer*>(tokenizer);
}

int chipper_encode(chipper_tokenizer_t* tokenizer, const char* text, size_t len,
                   chipper_token_t* tokens, size_t max_tokens) {
    chipper_clear_error();

    if (!tokenizer || (!text && len > 0)) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return -1;
    }

    try {
        auto* t = reinterpret_cast<chipper::Tokenizer*>(tokenizer);
        auto result = t->encode(std::string_view(text ? text : "", len));

        if (!tokens) {
            return static_cast<int>(result.size());
        }
        if (result.size() > max_tokens) {
            chipper_set_error(CHIPPER_ERROR_BUFFER_TOO_SMALL,
                              ("Need room for " + std::to_string(result.size()) + " tokens").c_str());
            return -1;
        }

        std::copy(result.begin(), result.end(), tokens);
        return static_cast<int>(result.size());
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return -1;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return -1;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return -1;
    }
}

int chipper_decode(chipper_tokenizer_t* tokenizer, const chipper_token_t* tokens, size_t num_tokens,
                   char* text, size_t max_len) {
    chipper_clear_error();

    if (!tokenizer || (!tokens && num_tokens > 0)) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return -1;
    }

    try {
        auto* t = reinterpret_cast<chipper::Tokenizer*>(tokenizer);
        std::string result = t->decode(tokens, num_tokens);

        if (!text) {
            return static_cast<int>(result.size());
        }
        if (result.size() + 1 > max_len) {
            chipper_set_error(CHIPPER_ERROR_BUFFER_TOO_SMALL,
                              ("Need room for " + std::to_string(result.size() + 1) + " bytes").c_str());
            return -1;
        }

        memcpy(text, result.data(), result.size());
        text[result.size()] = '\0';
        return static_cast<int>(result.size());
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return -1;
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return -1;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return -1;
    }
}

chipper_error_t chipper_encode_batch(chipper_tokenizer_t* tokenizer, const char* const* texts,
                                     const size_t* lengths, size_t count,
                                     const chipper_batch_config_t* config, chipper_batch_item_t* items) {
    chipper_clear_error();

    if (!tokenizer || (count > 0 && (!texts || !lengths || !items))) {
        chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT, "Invalid argument");
        return CHIPPER_ERROR_INVALID_ARGUMENT;
    }
    for (size_t i = 0; i < count; ++i) {
        if (!texts[i] && lengths[i] > 0) {
            chipper_set_error(CHIPPER_ERROR_INVALID_ARGUMENT,
                              ("Input " + std::to_string(i) + " is NULL").c_str());
            return CHIPPER_ERROR_INVALID_ARGUMENT;
        }
    }

    chipper_batch_config_t cfg = config ? *config : chipper_batch_config_default();

    try {
        auto* t = reinterpret_cast<chipper::Tokenizer*>(tokenizer);

        std::vector<std::string_view> inputs;
        inputs.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            inputs.emplace_back(texts[i] ? texts[i] : "", lengths[i]);
        }

        auto outcomes = t->try_encode_batch(inputs, cfg);

        for (size_t i = 0; i < count; ++i) {
            items[i].error = outcomes[i].error;
            items[i].tokens = nullptr;
            items[i].num_tokens = 0;
        }
        for (size_t i = 0; i < count; ++i) {
            if (!outcomes[i].ok()) continue;

            const auto& result = outcomes[i].tokens;
            if (!result.empty()) {
                auto* buffer = static_cast<chipper_token_t*>(malloc(result.size() * sizeof(chipper_token_t)));
                if (!buffer) {
                    chipper_batch_result_free(items, count);
                    chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
                    return CHIPPER_ERROR_OUT_OF_MEMORY;
                }
                std::copy(result.begin(), result.end(), buffer);
                items[i].tokens = buffer;
            }
            items[i].num_tokens = result.size();
        }
        return CHIPPER_SUCCESS;
    } catch (const chipper::Error& e) {
        set_error_from(e);
        return e.code();
    } catch (const std::bad_alloc&) {
        chipper_set_error(CHIPPER_ERROR_OUT_OF_MEMORY, "Out of memory");
        return CHIPPER_ERROR_OUT_OF_MEMORY;
    } catch (const std::exception& e) {
        chipper_set_error(CHIPPER_ERROR_UNKNOWN, e.what());
        return CHIPPER_ERROR_UNKNOWN;
    }
}

void chipper_batch_result_free(chipper_batch_item_t* items, size_t count) {
    if (!items) return;
    for (size_t i = 0; i < count; ++i) {
        free(items[i].tokens);
        items[i].tokens = nullptr;
        items[i].num_tokens = 0;
    }
}

} // extern "C"
