#pragma once

#include <chipper/chipper_error.h>
#include <chipper/chipper_types.h>

#include <stdexcept>
#include <string>

namespace chipper {

/**
 * Error - Base of all exceptions thrown by the tokenizer core
 *
 * Carries the C error code the ABI layer reports for it.
 */
class Error : public std::runtime_error {
public:
    Error(chipper_error_t code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    chipper_error_t code() const { return code_; }

private:
    chipper_error_t code_;
};

// Malformed or inconsistent rank table. Raised at construction only.
class VocabularyError : public Error {
public:
    explicit VocabularyError(const std::string& message)
        : Error(CHIPPER_ERROR_VOCAB_INVALID, message) {}
};

// Malformed input under strict spanning.
class SpanningError : public Error {
public:
    SpanningError(const std::string& message, size_t offset)
        : Error(CHIPPER_ERROR_SPANNING_FAILED, message), offset_(offset) {}

    size_t offset() const { return offset_; }

private:
    size_t offset_;
};

// Token id (or elementary byte) with no vocabulary entry.
class UnknownTokenError : public Error {
public:
    UnknownTokenError(const std::string& message, chipper_token_t token)
        : Error(CHIPPER_ERROR_UNKNOWN_TOKEN, message), token_(token) {}

    chipper_token_t token() const { return token_; }

private:
    chipper_token_t token_;
};

// Invalid tokenizer configuration.
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message, chipper_error_t code = CHIPPER_ERROR_CONFIG_INVALID)
        : Error(code, message) {}
};

} // namespace chipper
