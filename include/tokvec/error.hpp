#pragma once

#include <stdexcept>
#include <string>

namespace tokvec {

/**
 * Structured error reporting for vocabulary, training and model loading.
 * Every exception carries a code, the function it was raised from and an
 * optional recovery suggestion.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Artifact errors
    MALFORMED_ARTIFACT = 100,

    // Mathematical errors
    NUMERICAL_ERROR = 200,

    // I/O errors
    FILE_NOT_FOUND = 300,
    WRITE_FAILED = 302
};

class TokvecException : public std::runtime_error {
public:
    explicit TokvecException(ErrorCode code, const std::string& message,
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
        std::string result = "tokvec error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
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
class InvalidArgumentError : public TokvecException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : TokvecException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Raised when a persisted vocabulary or model fails structural validation
class MalformedArtifactError : public TokvecException {
public:
    explicit MalformedArtifactError(const std::string& message,
                                    const std::string& context = "",
                                    const std::string& suggestion = "")
        : TokvecException(ErrorCode::MALFORMED_ARTIFACT, message, context, suggestion) {}
};

class NumericalError : public TokvecException {
public:
    explicit NumericalError(const std::string& message,
                            const std::string& context = "",
                            const std::string& suggestion = "")
        : TokvecException(ErrorCode::NUMERICAL_ERROR, message, context, suggestion) {}
};

class IOError : public TokvecException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : TokvecException(ErrorCode::FILE_NOT_FOUND, message, context, suggestion) {}
};

class ErrorHandler {
public:
    static void check_condition(bool condition, ErrorCode code,
                                const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "") {
        if (!condition) {
            throw TokvecException(code, message, context, suggestion);
        }
    }

    static void check_argument(bool condition, const std::string& message,
                               const std::string& context = "") {
        if (!condition) {
            throw InvalidArgumentError(message, context);
        }
    }
};

// Macros for common error checking
#define TOKVEC_CHECK(condition, code, message) \
    tokvec::ErrorHandler::check_condition(condition, code, message, __func__)

#define TOKVEC_CHECK_ARGUMENT(condition, message) \
    tokvec::ErrorHandler::check_argument(condition, message, __func__)

} // namespace tokvec
