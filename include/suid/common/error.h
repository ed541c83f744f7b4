// =============================================================================
// swiss-uid - Error Handling Framework
// =============================================================================
// Error handling for the swiss-uid library and the suid tool.
//
// This module provides:
// - ErrorCode enum matching CLI exit codes
// - SuidException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
//   with makeError and unwrapOrThrow
// - Error context and message support
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: I/O error (file not found, read failure)
// - 3..8: UID rejected (see ErrorCode)
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes: PascalCase
// - Functions: camelCase
// - Constants: kConstant
// =============================================================================

#ifndef SUID_COMMON_ERROR_H
#define SUID_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace suid {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
/// @note These values are used as process exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error.
    kUsageError = 1,

    /// @brief I/O error.
    /// @note Input file not found or unreadable.
    kIOError = 2,

    /// @brief Missing or unknown register prefix (expected CHE or ADM).
    kInvalidPrefix = 3,

    /// @brief Wrong digit count, non-digit characters or misplaced separators.
    kMalformedDigits = 4,

    /// @brief The first payload digit is 0.
    kLeadingZero = 5,

    /// @brief The payload has no valid check digit (remainder sentinel).
    kNoValidCheckDigit = 6,

    /// @brief The supplied check digit disagrees with the computed one.
    kCheckDigitMismatch = 7,

    /// @brief Trailing text that is neither HR nor MWST.
    kInvalidSuffix = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
/// @param code The error code.
/// @return Integer exit code suitable for process exit.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(code);
}

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kUsageError:
            return "usage error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kInvalidPrefix:
            return "invalid prefix";
        case ErrorCode::kMalformedDigits:
            return "malformed digits";
        case ErrorCode::kLeadingZero:
            return "leading zero";
        case ErrorCode::kNoValidCheckDigit:
            return "no valid check digit";
        case ErrorCode::kCheckDigitMismatch:
            return "check digit mismatch";
        case ErrorCode::kInvalidSuffix:
            return "invalid suffix";
    }
    return "unknown error";
}

/// @brief Check if an error code is a check digit rejection of a UID.
[[nodiscard]] constexpr bool isChecksumError(ErrorCode code) noexcept {
    return code == ErrorCode::kNoValidCheckDigit || code == ErrorCode::kCheckDigitMismatch;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
/// @note Provides detailed information about where and why an error occurred.
struct ErrorContext {
    /// @brief The input text that was rejected (if applicable).
    std::string input;

    /// @brief One-based line number for batch input (if applicable).
    std::optional<std::uint64_t> lineNumber;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with the offending input.
    explicit ErrorContext(std::string text,
                          std::source_location loc = std::source_location::current())
        : input(std::move(text)), location(loc) {}

    /// @brief Set the line number.
    /// @return Reference to this for method chaining.
    ErrorContext& withLine(std::uint64_t line) {
        lineNumber = line;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all swiss-uid errors.
/// @note Provides error code, message, and optional context.
class SuidException : public std::exception {
public:
    /// @brief Construct with error code and message.
    SuidException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    SuidException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~SuidException() override = default;

    SuidException(const SuidException&) = default;
    SuidException(SuidException&&) noexcept = default;
    SuidException& operator=(const SuidException&) = default;
    SuidException& operator=(SuidException&&) noexcept = default;

    /// @brief Get the error message including category and context.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    /// @brief Check if this exception has context information.
    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for usage and argument errors (exit code 1).
class UsageError : public SuidException {
public:
    explicit UsageError(std::string message)
        : SuidException(ErrorCode::kUsageError, std::move(message)) {}
};

/// @brief Exception for I/O errors (exit code 2).
/// @note Thrown by the tool when an input list cannot be opened or read.
class IOError : public SuidException {
public:
    explicit IOError(std::string message)
        : SuidException(ErrorCode::kIOError, std::move(message)) {}

    /// @brief Construct with the system error appended to the message.
    IOError(std::string message, std::error_code ec)
        : SuidException(ErrorCode::kIOError, formatWithSystemError(message, ec)) {}

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);
};

/// @brief Exception for structurally rejected UIDs.
/// @note Covers kInvalidPrefix, kMalformedDigits, kLeadingZero and kInvalidSuffix.
class FormatError : public SuidException {
public:
    /// @brief Construct with a specific structural error code.
    FormatError(ErrorCode code, std::string message)
        : SuidException(code, std::move(message)) {}

    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : SuidException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for check digit rejections.
/// @note Covers kNoValidCheckDigit and kCheckDigitMismatch.
class ChecksumError : public SuidException {
public:
    /// @brief Construct with a specific checksum error code.
    ChecksumError(ErrorCode code, std::string message)
        : SuidException(code, std::move(message)) {}

    ChecksumError(ErrorCode code, std::string message, ErrorContext context)
        : SuidException(code, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Throw the exception type matching the code.
    [[noreturn]] void throwException() const;

    friend bool operator==(const Error&, const Error&) = default;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
/// @tparam T The success value type.
/// @tparam E The error type (defaults to Error).
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Convert a Result to an exception if it contains an error.
/// @throws SuidException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

}  // namespace suid

#endif  // SUID_COMMON_ERROR_H
