#ifndef CHIPPER_H
#define CHIPPER_H

#include "chipper_types.h"
#include "chipper_error.h"

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Chipper - Byte-level BPE tokenizer
 *
 * Splits text into spans, merges the bytes of each span by rank and maps
 * token ids back to bytes. Vocabularies are immutable and may be shared by
 * any number of tokenizers and threads.
 *
 * Basic usage:
 *   chipper_vocab_t* vocab = chipper_vocab_load_tiktoken("cl100k_base.tiktoken", NULL, 0);
 *   chipper_tokenizer_t* tok = chipper_tokenizer_create(vocab, NULL);
 *
 *   chipper_token_t tokens[256];
 *   int n = chipper_encode(tok, "hello world", 11, tokens, 256);
 *
 *   char text[256];
 *   chipper_decode(tok, tokens, n, text, sizeof(text));
 *
 *   chipper_tokenizer_destroy(tok);
 *   chipper_vocab_destroy(vocab);
 */

/* ============================================================================
 * Version
 * ============================================================================ */

/* Get version numbers */
CHIPPER_API void chipper_get_version(int* major, int* minor, int* patch);

/* Get version string (e.g., "0.1.0") */
CHIPPER_API const char* chipper_get_version_string(void);

/* ============================================================================
 * Vocabulary
 * ============================================================================ */

/*
 * Create a vocabulary from explicit tokens and merge rules.
 *
 * @param tokens        Normal tokens
 * @param num_tokens    Number of tokens
 * @param merges        Merge rules (may be NULL if num_merges is 0)
 * @param num_merges    Number of merge rules
 * @param specials      Special tokens (may be NULL if num_specials is 0)
 * @param num_specials  Number of special tokens
 * @return              Vocabulary handle, or NULL on error
 */
CHIPPER_API chipper_vocab_t* chipper_vocab_create(
    const chipper_token_entry_t* tokens, size_t num_tokens,
    const chipper_merge_entry_t* merges, size_t num_merges,
    const chipper_token_entry_t* specials, size_t num_specials
);

/*
 * Create a vocabulary where each token's rank is its id and merges are
 * derived from the token bytes (tiktoken convention).
 *
 * @return  Vocabulary handle, or NULL on error
 */
CHIPPER_API chipper_vocab_t* chipper_vocab_create_ranked(
    const chipper_token_entry_t* tokens, size_t num_tokens,
    const chipper_token_entry_t* specials, size_t num_specials
);

/*
 * Load a tiktoken rank file ("<base64> <rank>" per line).
 *
 * @param path          Path to the rank file
 * @param specials      Special tokens (may be NULL if num_specials is 0)
 * @param num_specials  Number of special tokens
 * @return              Vocabulary handle, or NULL on error
 */
CHIPPER_API chipper_vocab_t* chipper_vocab_load_tiktoken(
    const char* path,
    const chipper_token_entry_t* specials, size_t num_specials
);

/*
 * Release a vocabulary handle. Tokenizers created from it keep their own
 * reference.
 *
 * @param vocab  Vocabulary to destroy (may be NULL)
 */
CHIPPER_API void chipper_vocab_destroy(chipper_vocab_t* vocab);

/* Number of tokens, special tokens included */
CHIPPER_API size_t chipper_vocab_size(const chipper_vocab_t* vocab);

/* ============================================================================
 * Tokenizer
 * ============================================================================ */

/*
 * Create a tokenizer over a vocabulary.
 *
 * @param vocab   Vocabulary handle (must not be empty)
 * @param config  Tokenizer configuration, or NULL for defaults
 * @return        Tokenizer handle, or NULL on error
 */
CHIPPER_API chipper_tokenizer_t* chipper_tokenizer_create(
    const chipper_vocab_t* vocab,
    const chipper_tokenizer_config_t* config
);

/*
 * Destroy a tokenizer.
 *
 * @param tokenizer  Tokenizer to destroy (may be NULL)
 */
CHIPPER_API void chipper_tokenizer_destroy(chipper_tokenizer_t* tokenizer);

/*
 * Encode text to tokens.
 *
 * @param tokenizer   Tokenizer handle
 * @param text        Input bytes (need not be NUL-terminated)
 * @param len         Input length in bytes
 * @param tokens      Output buffer, or NULL to query the required count
 * @param max_tokens  Output buffer capacity
 * @return            Number of tokens, or -1 on error
 *                    (CHIPPER_ERROR_BUFFER_TOO_SMALL if max_tokens is too small)
 */
CHIPPER_API int chipper_encode(
    chipper_tokenizer_t* tokenizer,
    const char* text, size_t len,
    chipper_token_t* tokens, size_t max_tokens
);

/*
 * Decode tokens to bytes. The output is NUL-terminated; decoded text may
 * itself contain NUL bytes, so use the returned length.
 *
 * @param tokenizer   Tokenizer handle
 * @param tokens      Token ids
 * @param num_tokens  Number of tokens
 * @param text        Output buffer, or NULL to query the required length
 * @param max_len     Output buffer size, including the terminator
 * @return            Number of bytes (excluding the terminator), or -1 on error
 */
CHIPPER_API int chipper_decode(
    chipper_tokenizer_t* tokenizer,
    const chipper_token_t* tokens, size_t num_tokens,
    char* text, size_t max_len
);

/*
 * Encode many inputs in parallel. Outcomes land in items[i] for texts[i].
 * A failing input only fails its own item; check items[i].error.
 *
 * @param tokenizer  Tokenizer handle
 * @param texts      Input pointers
 * @param lengths    Input lengths in bytes
 * @param count      Number of inputs
 * @param config     Batch configuration, or NULL for defaults
 * @param items      Output array of count items; release with chipper_batch_result_free
 * @return           CHIPPER_SUCCESS unless the call itself is invalid
 */
CHIPPER_API chipper_error_t chipper_encode_batch(
    chipper_tokenizer_t* tokenizer,
    const char* const* texts, const size_t* lengths, size_t count,
    const chipper_batch_config_t* config,
    chipper_batch_item_t* items
);

/* Free the token arrays of a batch result */
CHIPPER_API void chipper_batch_result_free(chipper_batch_item_t* items, size_t count);

/* Free memory allocated by chipper */
CHIPPER_API void chipper_free(void* ptr);

#ifdef __cplusplus
}
#endif

#endif /* CHIPPER_H */
