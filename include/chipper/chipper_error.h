#ifndef CHIPPER_ERROR_H
#define CHIPPER_ERROR_H

#include "chipper_types.h"

#ifdef __cplusplus
extern "C" {
#endif

/* Error codes */
typedef enum chipper_error {
    CHIPPER_SUCCESS = 0,

    /* General errors (1-99) */
    CHIPPER_ERROR_UNKNOWN = 1,
    CHIPPER_ERROR_INVALID_ARGUMENT = 2,
    CHIPPER_ERROR_OUT_OF_MEMORY = 3,
    CHIPPER_ERROR_INVALID_STATE = 5,
    CHIPPER_ERROR_OPERATION_FAILED = 6,
    CHIPPER_ERROR_BUFFER_TOO_SMALL = 7,

    /* File/IO errors (100-199) */
    CHIPPER_ERROR_FILE_NOT_FOUND = 100,
    CHIPPER_ERROR_FILE_READ = 101,
    CHIPPER_ERROR_FILE_INVALID = 103,

    /* Vocabulary errors (200-299) */
    CHIPPER_ERROR_VOCAB_INVALID = 200,
    CHIPPER_ERROR_VOCAB_EMPTY = 201,

    /* Configuration errors (300-399) */
    CHIPPER_ERROR_CONFIG_INVALID = 300,
    CHIPPER_ERROR_PATTERN_INVALID = 301,

    /* Tokenization errors (400-499) */
    CHIPPER_ERROR_SPANNING_FAILED = 400,
    CHIPPER_ERROR_UNKNOWN_TOKEN = 401,
    CHIPPER_ERROR_CANCELLED = 403
} chipper_error_t;

/* Get human-readable error string */
CHIPPER_API const char* chipper_error_string(chipper_error_t error);

/* Thread-local last error */
CHIPPER_API chipper_error_t chipper_get_last_error(void);
CHIPPER_API const char* chipper_get_last_error_message(void);

/* Set error (internal use) */
CHIPPER_API void chipper_set_error(chipper_error_t error, const char* message);
CHIPPER_API void chipper_clear_error(void);

#ifdef __cplusplus
}
#endif

#endif /* CHIPPER_ERROR_H */
