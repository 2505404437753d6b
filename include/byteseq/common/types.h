// =============================================================================
// byteseq - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codecs and the byte sequence type.
//
// This module defines:
// - Byte, ByteBuffer, SharedBuffer: storage aliases
// - ByteOrder: interpretation order of multi-byte values
// - Ownership: aliasing/copy contract of a byte sequence
// - Capability predicates over Ownership
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef BYTESEQ_COMMON_TYPES_H
#define BYTESEQ_COMMON_TYPES_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace byteseq {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Single unsigned octet.
using Byte = std::uint8_t;

/// @brief Owned contiguous byte storage.
using ByteBuffer = std::vector<Byte>;

/// @brief Reference-counted byte storage.
/// @note Several sequences may alias the same SharedBuffer. Exclusivity while
///       mutating is the caller's responsibility; no synchronization is done.
using SharedBuffer = std::shared_ptr<ByteBuffer>;

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of bits in a byte.
inline constexpr std::size_t kBitsPerByte = 8;

/// @brief Smallest radix accepted by the radix codec.
inline constexpr int kMinRadix = 2;

/// @brief Largest radix accepted by the radix codec.
inline constexpr int kMaxRadix = 36;

/// @brief Number of leading/trailing bytes shown by Bytes::toString() for long buffers.
inline constexpr std::size_t kPreviewBytes = 4;

// =============================================================================
// Byte Order Enumeration
// =============================================================================

/// @brief Order in which the bytes of a sequence are interpreted.
/// @note Never changes the stored bytes, only how they are iterated when
///       encoding or converted to integers.
enum class ByteOrder : std::uint8_t {
    /// @brief Most significant byte first (default).
    kBigEndian = 0,

    /// @brief Least significant byte first.
    kLittleEndian = 1
};

/// @brief Convert ByteOrder to string representation.
[[nodiscard]] constexpr std::string_view byteOrderToString(ByteOrder order) noexcept {
    switch (order) {
        case ByteOrder::kBigEndian:
            return "big-endian";
        case ByteOrder::kLittleEndian:
            return "little-endian";
    }
    return "unknown";
}

// =============================================================================
// Ownership Enumeration
// =============================================================================

/// @brief Aliasing and copy contract of a byte sequence.
/// @note Behavior is selected by explicit matching on this tag; every
///       capability predicate below handles all four values.
enum class Ownership : std::uint8_t {
    /// @brief Live buffer reference; in-place transforms when supported.
    kShared = 0,

    /// @brief Like kShared, additionally permits direct mutation (setByteAt, fill, wipe).
    kMutableInPlace = 1,

    /// @brief Copy handed out on access; transforms always copy.
    kImmutableCopy = 2,

    /// @brief Direct buffer access denied; transforms always copy.
    kReadOnlyRestricted = 3
};

/// @brief Convert Ownership to string representation.
[[nodiscard]] constexpr std::string_view ownershipToString(Ownership ownership) noexcept {
    switch (ownership) {
        case Ownership::kShared:
            return "shared";
        case Ownership::kMutableInPlace:
            return "mutable";
        case Ownership::kImmutableCopy:
            return "immutable";
        case Ownership::kReadOnlyRestricted:
            return "read-only";
    }
    return "unknown";
}

/// @brief Whether transformers may run in place on a sequence of this ownership.
[[nodiscard]] constexpr bool permitsInPlace(Ownership ownership) noexcept {
    switch (ownership) {
        case Ownership::kShared:
        case Ownership::kMutableInPlace:
            return true;
        case Ownership::kImmutableCopy:
        case Ownership::kReadOnlyRestricted:
            return false;
    }
    return false;
}

/// @brief Whether the mutating accessors (setByteAt, overwrite, fill, wipe) are legal.
[[nodiscard]] constexpr bool permitsMutation(Ownership ownership) noexcept {
    switch (ownership) {
        case Ownership::kMutableInPlace:
            return true;
        case Ownership::kShared:
        case Ownership::kImmutableCopy:
        case Ownership::kReadOnlyRestricted:
            return false;
    }
    return false;
}

/// @brief Whether the live buffer may be handed out without copying.
/// @note When false, a transition to another variant must copy the buffer.
[[nodiscard]] constexpr bool sharesBuffer(Ownership ownership) noexcept {
    return permitsInPlace(ownership);
}

// =============================================================================
// Concepts
// =============================================================================

/// @brief Integral types convertible to and from a fixed number of bytes.
template <typename T>
concept ByteConvertible = std::integral<T> && !std::same_as<T, bool>;

}  // namespace byteseq

#endif  // BYTESEQ_COMMON_TYPES_H
