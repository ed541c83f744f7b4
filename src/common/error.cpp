// =============================================================================
// swiss-uid - Error Handling Framework Implementation
// =============================================================================
// Implementation of error handling utilities and exception classes.
// =============================================================================

#include "suid/common/error.h"

#include <format>
#include <sstream>

namespace suid {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!input.empty()) {
        oss << "input: '" << input << "'";
        hasContent = true;
    }

    if (lineNumber.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "line: " << *lineNumber;
        hasContent = true;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// SuidException Implementation
// =============================================================================

void SuidException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

// =============================================================================
// IOError Implementation
// =============================================================================

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return std::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kInvalidPrefix:
        case ErrorCode::kMalformedDigits:
        case ErrorCode::kLeadingZero:
        case ErrorCode::kInvalidSuffix:
            throw FormatError(code_, message_);
        case ErrorCode::kNoValidCheckDigit:
        case ErrorCode::kCheckDigitMismatch:
            throw ChecksumError(code_, message_);
        case ErrorCode::kSuccess:
            throw SuidException(ErrorCode::kSuccess, message_);
    }
    throw SuidException(code_, message_);
}

}  // namespace suid
