#ifndef CHIPPER_TYPES_H
#define CHIPPER_TYPES_H

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Version info */
#define CHIPPER_VERSION_MAJOR 0
#define CHIPPER_VERSION_MINOR 1
#define CHIPPER_VERSION_PATCH 0

/* Export macros */
#ifdef _WIN32
    #ifdef CHIPPER_BUILD_SHARED
        #define CHIPPER_API __declspec(dllexport)
    #else
        #define CHIPPER_API __declspec(dllimport)
    #endif
#else
    #define CHIPPER_API __attribute__((visibility("default")))
#endif

/* Token id type */
typedef uint32_t chipper_token_t;

/* Pre-tokenizer (spanner) implementations */
typedef enum chipper_spanner_type {
    CHIPPER_SPANNER_PATTERN = 0,    /* ICU regular expression */
    CHIPPER_SPANNER_AUTOMATON = 1,  /* Precompiled single-pass scanner */
    CHIPPER_SPANNER_COUNT
} chipper_spanner_type_t;

/* Merge strategies (identical output, different cost) */
typedef enum chipper_merge_strategy {
    CHIPPER_MERGE_LINEAR_RESCAN = 0,    /* Full rescan per merge, O(n^2) */
    CHIPPER_MERGE_PARALLEL_RANK = 1,    /* Rescan with ranks computed on a worker pool */
    CHIPPER_MERGE_HEAP_AND_LIST = 2,    /* Min-heap + index-linked list, O(n log n) */
    CHIPPER_MERGE_COUNT
} chipper_merge_strategy_t;

/* Opaque types */
typedef struct chipper_vocab chipper_vocab_t;
typedef struct chipper_tokenizer chipper_tokenizer_t;

/* One normal token: literal bytes and id */
typedef struct chipper_token_entry {
    const char* bytes;
    size_t len;
    chipper_token_t id;
} chipper_token_entry_t;

/* One merge rule: (left, right) -> merged, ordered by rank */
typedef struct chipper_merge_entry {
    chipper_token_t left;
    chipper_token_t right;
    chipper_token_t merged;
    uint32_t rank;
} chipper_merge_entry_t;

/* Tokenizer configuration */
typedef struct chipper_tokenizer_config {
    chipper_spanner_type_t spanner;             /* Span splitter */
    chipper_merge_strategy_t merge_strategy;    /* Merge engine */
    int num_threads;                            /* Worker threads (0 = auto) */
    bool strict_spanning;                       /* Reject malformed UTF-8 */
    const char* word_pattern;                   /* Custom pattern (NULL = built-in, pattern spanner only) */
    bool verbose;                               /* Enable verbose logging */
} chipper_tokenizer_config_t;

/* Cancellation check, called between batch items. Return true to stop. */
typedef bool (*chipper_cancel_callback_t)(void* user_data);

/* Batch configuration */
typedef struct chipper_batch_config {
    chipper_cancel_callback_t cancel;   /* May be NULL */
    void* user_data;                    /* Passed to cancel */
} chipper_batch_config_t;

/* Per-input batch outcome */
typedef struct chipper_batch_item {
    int error;                  /* chipper_error_t (0 = success) */
    chipper_token_t* tokens;    /* Owned by the result, NULL on error */
    size_t num_tokens;
} chipper_batch_item_t;

/* Helper functions for default configs */
static inline chipper_tokenizer_config_t chipper_tokenizer_config_default(void) {
    chipper_tokenizer_config_t config = {
        .spanner = CHIPPER_SPANNER_AUTOMATON,
        .merge_strategy = CHIPPER_MERGE_HEAP_AND_LIST,
        .num_threads = 0,
        .strict_spanning = false,
        .word_pattern = NULL,
        .verbose = false
    };
    return config;
}

static inline chipper_batch_config_t chipper_batch_config_default(void) {
    chipper_batch_config_t config = {
        .cancel = NULL,
        .user_data = NULL
    };
    return config;
}

/* Utility functions */
CHIPPER_API const char* chipper_spanner_name(chipper_spanner_type_t spanner);
CHIPPER_API const char* chipper_merge_strategy_name(chipper_merge_strategy_t strategy);

#ifdef __cplusplus
}
#endif

#endif /* CHIPPER_TYPES_H */
