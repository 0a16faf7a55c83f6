#pragma once

#include <stdexcept>
#include <string>

namespace curdecomp {

/**
 * Structured error reporting for the CUR library.
 * Every exception carries an ErrorCode, the function it was raised in and
 * an optional suggestion for the caller.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    INVALID_CONFIGURATION = 2,

    // Mathematical errors
    NUMERICAL_ERROR = 200,
    RANK_DEFICIENT = 201,
    SINGULAR_MATRIX = 202,

    // I/O errors
    FILE_NOT_FOUND = 300,
    PARSE_ERROR = 301
};

class CurException : public std::runtime_error {
public:
    explicit CurException(ErrorCode code, const std::string& message,
                          const std::string& context = "",
                          const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "CUR error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
class InvalidArgumentError : public CurException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : CurException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

/**
 * Caller asked for something the current mode cannot answer,
 * e.g. a decomposition of a non-symmetric matrix without a row count.
 */
class UsageError : public CurException {
public:
    explicit UsageError(const std::string& message,
                        const std::string& context = "",
                        const std::string& suggestion = "")
        : CurException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

/**
 * Selection strategy and parameters do not fit together
 * (PCovR without properties or mixing weight, unknown strategy name, ...).
 */
class ConfigurationError : public CurException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : CurException(ErrorCode::INVALID_CONFIGURATION, message, context, suggestion) {}
};

class NumericalError : public CurException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : CurException(ErrorCode::NUMERICAL_ERROR, message, context, suggestion) {}
};

/**
 * No eigenvalue of the feature covariance survived the regularization floor.
 * PCovR selection recovers from this by returning the indices chosen so far.
 */
class RankDeficiencyError : public CurException {
public:
    explicit RankDeficiencyError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : CurException(ErrorCode::RANK_DEFICIENT, message, context, suggestion) {}
};

/**
 * Deflation met a column with zero norm.
 */
class NumericalSingularityError : public CurException {
public:
    explicit NumericalSingularityError(const std::string& message,
                                       const std::string& context = "",
                                       const std::string& suggestion = "")
        : CurException(ErrorCode::SINGULAR_MATRIX, message, context, suggestion) {}
};

class IOError : public CurException {
public:
    explicit IOError(ErrorCode code, const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : CurException(code, message, context, suggestion) {}
};

// Error handling utilities
class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw CurException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }

    static void check_config(bool condition, const std::string& message,
                             const std::string& context = "",
                             const std::string& suggestion = "") {
        if (!condition) {
            throw ConfigurationError(message, context, suggestion);
        }
    }
};

// Macros for common error checking
#define CURDECOMP_CHECK(condition, code, message) \
    curdecomp::ErrorHandler::check_condition(condition, code, message, __func__)

#define CURDECOMP_CHECK_ARGUMENT(condition, message) \
    curdecomp::ErrorHandler::check_argument(condition, message, __func__)

#define CURDECOMP_CHECK_CONFIG(condition, message, suggestion) \
    curdecomp::ErrorHandler::check_config(condition, message, __func__, suggestion)

#define CURDECOMP_THROW_USAGE(message) \
    throw curdecomp::UsageError(message, __func__)

} // namespace curdecomp
