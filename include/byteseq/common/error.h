// =============================================================================
// byteseq - Error Handling Framework
// =============================================================================
// Error handling for the byteseq library.
//
// This module provides:
// - ErrorCode enum, doubling as the bseq CLI exit codes
// - ByteSeqException hierarchy for structured error handling
// - Result<T, E> type for functional error handling (using std::expected)
// - Error context (codec name, offending index, bound)
//
// Exit Code Convention:
// - 0: Success
// - 1: Usage/argument error
// - 2: Invalid argument
// - 3: Invalid symbol in encoded text
// - 4: Invalid radix
// - 5: Operand length mismatch
// - 6: Access violation
// - 7: Index out of bounds
// - 8: I/O error
// =============================================================================

#ifndef BYTESEQ_COMMON_ERROR_H
#define BYTESEQ_COMMON_ERROR_H

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

#include "byteseq/common/types.h"

namespace byteseq {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes matching CLI exit codes.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Usage or argument error (CLI level).
    kUsageError = 1,

    /// @brief Invalid argument value (e.g. malformed alphabet).
    kInvalidArgument = 2,

    /// @brief Encoded text contains a symbol outside the active alphabet.
    kInvalidSymbol = 3,

    /// @brief Requested radix outside [2, 36].
    kInvalidRadix = 4,

    /// @brief Operands of a bitwise operation differ in length.
    kLengthMismatch = 5,

    /// @brief Buffer access or mutation not permitted by the ownership variant.
    kAccessViolation = 6,

    /// @brief Index, offset or length outside the valid range.
    kOutOfBounds = 7,

    /// @brief I/O error.
    kIOError = 8
};

/// @brief Convert ErrorCode to its integer exit code value.
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
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kInvalidSymbol:
            return "invalid symbol";
        case ErrorCode::kInvalidRadix:
            return "invalid radix";
        case ErrorCode::kLengthMismatch:
            return "length mismatch";
        case ErrorCode::kAccessViolation:
            return "access violation";
        case ErrorCode::kOutOfBounds:
            return "out of bounds";
        case ErrorCode::kIOError:
            return "I/O error";
    }
    return "unknown error";
}

/// @brief Check if an error code represents success.
[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

/// @brief Check if an error code represents an error.
[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Additional context information for errors.
struct ErrorContext {
    /// @brief Name of the codec involved (if applicable).
    std::string codecName;

    /// @brief Offending index or position (if applicable).
    std::optional<std::size_t> index;

    /// @brief Bound the index was checked against (if applicable).
    std::optional<std::size_t> bound;

    /// @brief Source location where the error was created.
    std::source_location location;

    /// @brief Default constructor with current source location.
    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    /// @brief Construct with codec name.
    explicit ErrorContext(std::string codec,
                          std::source_location loc = std::source_location::current())
        : codecName(std::move(codec)), location(loc) {}

    /// @brief Set the codec name.
    /// @return Reference to this for method chaining.
    ErrorContext& withCodec(std::string codec) {
        codecName = std::move(codec);
        return *this;
    }

    /// @brief Set the offending index.
    /// @return Reference to this for method chaining.
    ErrorContext& withIndex(std::size_t idx) {
        index = idx;
        return *this;
    }

    /// @brief Set the bound.
    /// @return Reference to this for method chaining.
    ErrorContext& withBound(std::size_t value) {
        bound = value;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all byteseq errors.
class ByteSeqException : public std::exception {
public:
    /// @brief Construct with error code and message.
    ByteSeqException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    ByteSeqException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~ByteSeqException() override = default;

    ByteSeqException(const ByteSeqException&) = default;
    ByteSeqException(ByteSeqException&&) noexcept = default;
    ByteSeqException& operator=(const ByteSeqException&) = default;
    ByteSeqException& operator=(ByteSeqException&&) noexcept = default;

    /// @brief Get the formatted message including category and context.
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

/// @brief Exception for CLI usage errors (exit code 1).
class UsageError : public ByteSeqException {
public:
    explicit UsageError(std::string message)
        : ByteSeqException(ErrorCode::kUsageError, std::move(message)) {}

    UsageError(std::string message, ErrorContext context)
        : ByteSeqException(ErrorCode::kUsageError, std::move(message), std::move(context)) {}
};

/// @brief Exception for invalid argument values (exit code 2).
/// @note Thrown for malformed alphabets, padding symbols inside the alphabet,
///       integer conversions of the wrong width, etc.
class InvalidArgumentError : public ByteSeqException {
public:
    explicit InvalidArgumentError(std::string message)
        : ByteSeqException(ErrorCode::kInvalidArgument, std::move(message)) {}

    InvalidArgumentError(std::string message, ErrorContext context)
        : ByteSeqException(ErrorCode::kInvalidArgument, std::move(message), std::move(context)) {}
};

/// @brief Exception for symbols outside the active alphabet (exit code 3).
class InvalidSymbolError : public ByteSeqException {
public:
    /// @brief Construct with the offending symbol and its index in the input.
    /// @param symbol The rejected character.
    /// @param index Zero-based position of the character in the decoded text.
    /// @param context Additional error context (codec name).
    InvalidSymbolError(char symbol, std::size_t index, ErrorContext context = {})
        : ByteSeqException(ErrorCode::kInvalidSymbol,
                           formatInvalidSymbol(symbol, index),
                           std::move(context.withIndex(index))),
          symbol_(symbol),
          index_(index) {}

    /// @brief Get the rejected character.
    [[nodiscard]] char symbol() const noexcept { return symbol_; }

    /// @brief Get the position of the rejected character.
    [[nodiscard]] std::size_t index() const noexcept { return index_; }

private:
    static std::string formatInvalidSymbol(char symbol, std::size_t index);

    char symbol_;
    std::size_t index_;
};

/// @brief Exception for radix values outside [2, 36] (exit code 4).
class InvalidRadixError : public ByteSeqException {
public:
    explicit InvalidRadixError(int radix)
        : ByteSeqException(ErrorCode::kInvalidRadix, formatInvalidRadix(radix)), radix_(radix) {}

    /// @brief Get the rejected radix.
    [[nodiscard]] int radix() const noexcept { return radix_; }

private:
    static std::string formatInvalidRadix(int radix);

    int radix_;
};

/// @brief Exception for bitwise operands of differing length (exit code 5).
class LengthMismatchError : public ByteSeqException {
public:
    LengthMismatchError(std::size_t expected, std::size_t actual)
        : ByteSeqException(ErrorCode::kLengthMismatch, formatLengthMismatch(expected, actual)),
          expected_(expected),
          actual_(actual) {}

    [[nodiscard]] std::size_t expected() const noexcept { return expected_; }
    [[nodiscard]] std::size_t actual() const noexcept { return actual_; }

private:
    static std::string formatLengthMismatch(std::size_t expected, std::size_t actual);

    std::size_t expected_;
    std::size_t actual_;
};

/// @brief Exception for access not permitted by the ownership variant (exit code 6).
class AccessViolationError : public ByteSeqException {
public:
    /// @brief Construct with the denied operation and the receiver's ownership.
    AccessViolationError(std::string_view operation, Ownership ownership)
        : ByteSeqException(ErrorCode::kAccessViolation,
                           formatAccessViolation(operation, ownership)),
          ownership_(ownership) {}

    /// @brief Get the ownership variant that denied the access.
    [[nodiscard]] Ownership ownership() const noexcept { return ownership_; }

private:
    static std::string formatAccessViolation(std::string_view operation, Ownership ownership);

    Ownership ownership_;
};

/// @brief Exception for indices outside the valid range (exit code 7).
class OutOfBoundsError : public ByteSeqException {
public:
    /// @brief Construct with the offending index and the bound it violated.
    OutOfBoundsError(std::string_view what, std::size_t index, std::size_t bound)
        : ByteSeqException(ErrorCode::kOutOfBounds,
                           formatOutOfBounds(what, index, bound),
                           ErrorContext{}.withIndex(index).withBound(bound)),
          index_(index),
          bound_(bound) {}

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] std::size_t bound() const noexcept { return bound_; }

private:
    static std::string formatOutOfBounds(std::string_view what, std::size_t index,
                                         std::size_t bound);

    std::size_t index_;
    std::size_t bound_;
};

/// @brief Exception for I/O errors (exit code 8).
class IOError : public ByteSeqException {
public:
    explicit IOError(std::string message)
        : ByteSeqException(ErrorCode::kIOError, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Construct from a ByteSeqException.
    explicit Error(const ByteSeqException& ex) : code_(ex.code()), message_(ex.message()) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code.
    /// @note This function does not return.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

/// @brief Create an error result from an exception.
template <typename T>
[[nodiscard]] Result<T> makeError(const ByteSeqException& ex) {
    return std::unexpected(Error{ex});
}

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

/// @brief Convert a Result to an exception if it contains an error.
/// @throws ByteSeqException (or derived) if the result contains an error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

/// @brief Try to execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func) -> Result<std::conditional_t<
    std::is_void_v<decltype(func())>, std::monostate, decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const ByteSeqException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInvalidArgument, ex.what()});
    }
}

}  // namespace byteseq

#endif  // BYTESEQ_COMMON_ERROR_H
