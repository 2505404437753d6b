// =============================================================================
// byteseq - Error Handling Framework Implementation
// =============================================================================

#include "byteseq/common/error.h"

#include <fmt/format.h>

#include <cctype>
#include <sstream>

namespace byteseq {

namespace {

/// @brief Render a character for messages, escaping non-printable values.
std::string printableSymbol(char symbol) {
    const auto value = static_cast<unsigned char>(symbol);
    if (std::isprint(value) != 0) {
        return std::string(1, symbol);
    }
    return fmt::format("\\x{:02x}", value);
}

}  // namespace

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    if (!codecName.empty()) {
        oss << "codec: " << codecName;
        hasContent = true;
    }

    if (index.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "index: " << *index;
        hasContent = true;
    }

    if (bound.has_value()) {
        if (hasContent) {
            oss << ", ";
        }
        oss << "bound: " << *bound;
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
// ByteSeqException Implementation
// =============================================================================

void ByteSeqException::formatWhat() {
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
// Specific Exception Formatting
// =============================================================================

std::string InvalidSymbolError::formatInvalidSymbol(char symbol, std::size_t index) {
    return fmt::format("invalid symbol '{}' at index {}", printableSymbol(symbol), index);
}

std::string InvalidRadixError::formatInvalidRadix(int radix) {
    return fmt::format("unsupported radix {}, expected {}..{}", radix, kMinRadix, kMaxRadix);
}

std::string LengthMismatchError::formatLengthMismatch(std::size_t expected, std::size_t actual) {
    return fmt::format("operands must be of equal length: expected {} bytes, got {}",
                       expected, actual);
}

std::string AccessViolationError::formatAccessViolation(std::string_view operation,
                                                        Ownership ownership) {
    return fmt::format("{} is not permitted on a {} sequence", operation,
                       ownershipToString(ownership));
}

std::string OutOfBoundsError::formatOutOfBounds(std::string_view what, std::size_t index,
                                                std::size_t bound) {
    return fmt::format("{} {} out of bounds [0, {}]", what, index, bound);
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException() const {
    switch (code_) {
        case ErrorCode::kUsageError:
            throw UsageError(message_);
        case ErrorCode::kInvalidArgument:
            throw InvalidArgumentError(message_);
        case ErrorCode::kIOError:
            throw IOError(message_);
        case ErrorCode::kSuccess:
        case ErrorCode::kInvalidSymbol:
        case ErrorCode::kInvalidRadix:
        case ErrorCode::kLengthMismatch:
        case ErrorCode::kAccessViolation:
        case ErrorCode::kOutOfBounds:
            // Structured payload is not carried by Error, rethrow with the code only
            throw ByteSeqException(code_, message_);
    }
    throw ByteSeqException(code_, message_);
}

}  // namespace byteseq
