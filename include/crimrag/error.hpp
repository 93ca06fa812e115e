/**
 * Error handling for crimrag.
 *
 * Components throw exceptions derived from CrimragException. The pipeline
 * converts them into PipelineError values on its state object, so nothing
 * above Pipeline::run ever sees an exception for a per-query failure.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace crimrag {

enum class ErrorCode {
    SUCCESS = 0,

    // Caller errors
    INPUT_ERROR = 100,
    CONFIG_ERROR = 101,

    // Backend availability
    INDEX_UNAVAILABLE = 200,
    GENERATION_ERROR = 201,
    RERANK_FAILURE = 202,

    // Outcomes
    EMPTY_RESULT = 300,
    FORMAT_ERROR = 301,
    CANCELLED = 302,

    IO_ERROR = 400,
    INTERNAL_ERROR = 999
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INPUT_ERROR: return "InputError";
        case ErrorCode::CONFIG_ERROR: return "ConfigError";
        case ErrorCode::INDEX_UNAVAILABLE: return "IndexUnavailable";
        case ErrorCode::GENERATION_ERROR: return "GenerationError";
        case ErrorCode::RERANK_FAILURE: return "RerankFailure";
        case ErrorCode::EMPTY_RESULT: return "EmptyResult";
        case ErrorCode::FORMAT_ERROR: return "FormatError";
        case ErrorCode::CANCELLED: return "Cancelled";
        case ErrorCode::IO_ERROR: return "IOError";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
    }
    return "Unknown";
}

/**
 * Base exception: an error code, a message, the operation it came from and
 * an optional hint for the operator.
 */
class CrimragException : public std::runtime_error {
public:
    CrimragException(ErrorCode code, const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : std::runtime_error(message),
          code_(code),
          context_(context),
          suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

    std::string full_message() const {
        std::string msg = std::string("[") + error_code_name(code_) + "] " + what();
        if (!context_.empty()) {
            msg += " (in " + context_ + ")";
        }
        if (!suggestion_.empty()) {
            msg += "\n  Suggestion: " + suggestion_;
        }
        return msg;
    }

private:
    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

class InputError : public CrimragException {
public:
    explicit InputError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::INPUT_ERROR, message, context) {}
};

class ConfigError : public CrimragException {
public:
    explicit ConfigError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::CONFIG_ERROR, message, context,
                           "Check the configuration file and CRIMRAG_* environment variables") {}
};

class IndexUnavailableError : public CrimragException {
public:
    explicit IndexUnavailableError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::INDEX_UNAVAILABLE, message, context,
                           "Check that the vector index service is running") {}
};

enum class GenerationErrorKind {
    RATE_LIMITED,
    TIMEOUT,
    MALFORMED,
    UNAVAILABLE
};

inline const char* generation_error_kind_name(GenerationErrorKind kind) noexcept {
    switch (kind) {
        case GenerationErrorKind::RATE_LIMITED: return "RateLimited";
        case GenerationErrorKind::TIMEOUT: return "Timeout";
        case GenerationErrorKind::MALFORMED: return "Malformed";
        case GenerationErrorKind::UNAVAILABLE: return "Unavailable";
    }
    return "Unknown";
}

class GenerationError : public CrimragException {
public:
    GenerationError(GenerationErrorKind kind, const std::string& message,
                    const std::string& context = "")
        : CrimragException(ErrorCode::GENERATION_ERROR, message, context),
          kind_(kind) {}

    GenerationErrorKind kind() const noexcept { return kind_; }

private:
    GenerationErrorKind kind_;
};

class ScoringError : public CrimragException {
public:
    explicit ScoringError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::RERANK_FAILURE, message, context) {}
};

class FormatError : public CrimragException {
public:
    explicit FormatError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::FORMAT_ERROR, message, context) {}
};

class CancelledError : public CrimragException {
public:
    explicit CancelledError(const std::string& context = "")
        : CrimragException(ErrorCode::CANCELLED, "query cancelled", context) {}
};

class IOError : public CrimragException {
public:
    explicit IOError(const std::string& message, const std::string& context = "")
        : CrimragException(ErrorCode::IO_ERROR, message, context) {}
};

} // namespace crimrag

#define CRIMRAG_THROW(ExceptionType, message) \
    throw ExceptionType((message), __func__)

#define CRIMRAG_CHECK_ARGUMENT(condition, message)          \
    do {                                                     \
        if (!(condition)) {                                  \
            throw ::crimrag::InputError((message), __func__); \
        }                                                    \
    } while (0)
