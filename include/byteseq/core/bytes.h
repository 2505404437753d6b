// =============================================================================
// byteseq - Byte Sequence
// =============================================================================
// Bytes is a value type over a reference-counted byte buffer, tagged with a
// byte order and an ownership variant.
//
// Ownership variants:
// - kShared (default): buffer() returns the live buffer; transform() runs in
//   place whenever the transformer supports it.
// - kMutableInPlace: as kShared, and additionally unlocks setByteAt,
//   overwrite, fill, wipe and secureWipe.
// - kImmutableCopy: buffer() returns a private copy; transform() always
//   copies and yields a new instance.
// - kReadOnlyRestricted: buffer() throws AccessViolationError; transform()
//   always copies and yields a new read-only instance.
//
// Variant transitions (toMutable, toImmutable, toReadOnly, duplicate,
// withByteOrder) share the buffer when the source is kShared or
// kMutableInPlace and copy it otherwise.
//
// Thread safety: none. Sequences aliasing one buffer observe each other's
// in-place changes; concurrent mutation and reads through aliases is a data
// race the caller must prevent. kImmutableCopy and kReadOnlyRestricted
// instances that own their buffer may be read from several threads.
// =============================================================================

#ifndef BYTESEQ_CORE_BYTES_H
#define BYTESEQ_CORE_BYTES_H

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "byteseq/codec/text_codec.h"
#include "byteseq/common/error.h"
#include "byteseq/common/types.h"
#include "byteseq/core/transformer.h"

namespace byteseq {

// =============================================================================
// Bytes Class
// =============================================================================

/// @brief Byte sequence with explicit ownership and byte order.
class Bytes {
public:
    // =========================================================================
    // Factories
    // =========================================================================

    /// @brief New zero-filled (or fill-valued) sequence.
    [[nodiscard]] static Bytes allocate(std::size_t length, Byte fill = 0);

    /// @brief Empty sequence.
    [[nodiscard]] static Bytes empty();

    /// @brief Wrap an existing buffer without copying.
    /// @note The result aliases buffer; changes are visible both ways.
    /// @throws InvalidArgumentError if buffer is null.
    [[nodiscard]] static Bytes wrap(SharedBuffer buffer, ByteOrder order = ByteOrder::kBigEndian);

    /// @brief Take ownership of a buffer.
    [[nodiscard]] static Bytes wrap(ByteBuffer&& buffer, ByteOrder order = ByteOrder::kBigEndian);

    /// @brief Copy the given bytes.
    [[nodiscard]] static Bytes from(std::span<const Byte> bytes,
                                    ByteOrder order = ByteOrder::kBigEndian);

    /// @brief Copy a sub-range of the given bytes.
    /// @throws OutOfBoundsError if [offset, offset + length) is not inside bytes.
    [[nodiscard]] static Bytes from(std::span<const Byte> bytes, std::size_t offset,
                                    std::size_t length);

    /// @brief Copy the listed bytes.
    [[nodiscard]] static Bytes from(std::initializer_list<Byte> bytes);

    /// @brief Raw bytes of a (UTF-8) string.
    [[nodiscard]] static Bytes fromUtf8(std::string_view text);

    /// @brief sizeof(T) bytes of value, laid out in the given byte order.
    template <ByteConvertible T>
    [[nodiscard]] static Bytes fromInteger(T value, ByteOrder order = ByteOrder::kBigEndian);

    // =========================================================================
    // Parsing
    // =========================================================================

    /// @brief Decode text with the given decoder.
    /// @throws InvalidSymbolError on characters outside the decoder's alphabet.
    [[nodiscard]] static Bytes parse(std::string_view text, const codec::Decoder& decoder);

    /// @brief Decode text with the given decoder, reporting failure as a Result.
    [[nodiscard]] static Result<Bytes> tryParse(std::string_view text,
                                                const codec::Decoder& decoder);

    [[nodiscard]] static Bytes parseHex(std::string_view text);
    [[nodiscard]] static Bytes parseBase32(std::string_view text);
    [[nodiscard]] static Bytes parseBase64(std::string_view text);
    [[nodiscard]] static Bytes parseBase64Url(std::string_view text);

    /// @throws InvalidRadixError if radix is outside [2, 36].
    [[nodiscard]] static Bytes parseRadix(std::string_view text, int radix);
    [[nodiscard]] static Bytes parseBinary(std::string_view text);
    [[nodiscard]] static Bytes parseOctal(std::string_view text);
    [[nodiscard]] static Bytes parseDec(std::string_view text);
    [[nodiscard]] static Bytes parseBase36(std::string_view text);

    // =========================================================================
    // Encoding
    // =========================================================================

    /// @brief Encode with the given encoder, iterating in this sequence's byte order.
    [[nodiscard]] std::string encode(const codec::Encoder& encoder) const;

    [[nodiscard]] std::string encodeHex(bool upperCase = false) const;
    [[nodiscard]] std::string encodeBase32() const;
    [[nodiscard]] std::string encodeBase64(bool urlSafe = false, bool padding = true) const;
    [[nodiscard]] std::string encodeBase64Url() const;
    [[nodiscard]] std::string encodeRadix(int radix) const;
    [[nodiscard]] std::string encodeBinary() const;
    [[nodiscard]] std::string encodeOctal() const;
    [[nodiscard]] std::string encodeDec() const;
    [[nodiscard]] std::string encodeBase36() const;

    /// @brief The raw bytes as a string.
    [[nodiscard]] std::string encodeUtf8() const;

    // =========================================================================
    // Transformations
    // =========================================================================

    /// @brief Run a transformer and wrap its result in this sequence's variant.
    /// @note Runs in place iff the variant permits it and the transformer
    ///       supports it; the result then aliases this sequence's buffer.
    [[nodiscard]] Bytes transform(const Transformer& transformer) const;

    [[nodiscard]] Bytes append(const Bytes& other) const;
    [[nodiscard]] Bytes append(std::span<const Byte> bytes) const;
    [[nodiscard]] Bytes append(Byte value) const;

    /// @throws LengthMismatchError if other differs in length.
    [[nodiscard]] Bytes xorWith(const Bytes& other) const;
    [[nodiscard]] Bytes xorWith(std::span<const Byte> other) const;
    [[nodiscard]] Bytes andWith(const Bytes& other) const;
    [[nodiscard]] Bytes andWith(std::span<const Byte> other) const;
    [[nodiscard]] Bytes orWith(const Bytes& other) const;
    [[nodiscard]] Bytes orWith(std::span<const Byte> other) const;

    [[nodiscard]] Bytes negate() const;
    [[nodiscard]] Bytes leftShift(std::size_t bitCount) const;
    [[nodiscard]] Bytes rightShift(std::size_t bitCount) const;

    /// @throws OutOfBoundsError if bitPosition >= lengthBit().
    [[nodiscard]] Bytes switchBit(std::size_t bitPosition, bool value) const;
    [[nodiscard]] Bytes flipBit(std::size_t bitPosition) const;

    [[nodiscard]] Bytes copy() const;

    /// @throws OutOfBoundsError if [offset, offset + length) is not inside this sequence.
    [[nodiscard]] Bytes copy(std::size_t offset, std::size_t length) const;

    [[nodiscard]] Bytes reverse() const;
    [[nodiscard]] Bytes resize(std::size_t newLength,
                               ResizeMode mode = ResizeMode::kKeepFromMaxLength) const;
    [[nodiscard]] Bytes sort() const;
    [[nodiscard]] Bytes shuffle(std::uint64_t seed) const;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] std::size_t length() const noexcept { return buffer_->size(); }
    [[nodiscard]] std::size_t lengthBit() const noexcept { return length() * kBitsPerByte; }
    [[nodiscard]] bool isEmpty() const noexcept { return buffer_->empty(); }
    [[nodiscard]] ByteOrder byteOrder() const noexcept { return byteOrder_; }
    [[nodiscard]] Ownership ownership() const noexcept { return ownership_; }
    [[nodiscard]] bool isMutable() const noexcept { return ownership_ == Ownership::kMutableInPlace; }
    [[nodiscard]] bool isReadOnly() const noexcept {
        return ownership_ == Ownership::kReadOnlyRestricted;
    }

    /// @throws OutOfBoundsError if index >= length().
    [[nodiscard]] Byte byteAt(std::size_t index) const;

    /// @brief Bit at index, bit 0 being the least significant bit of the last byte.
    /// @throws OutOfBoundsError if bitIndex >= lengthBit().
    [[nodiscard]] bool bitAt(std::size_t bitIndex) const;

    [[nodiscard]] bool contains(Byte value) const noexcept;
    [[nodiscard]] std::optional<std::size_t> indexOf(Byte value, std::size_t from = 0) const noexcept;
    [[nodiscard]] std::optional<std::size_t> indexOf(std::span<const Byte> pattern,
                                                     std::size_t from = 0) const noexcept;
    [[nodiscard]] std::optional<std::size_t> lastIndexOf(Byte value) const noexcept;
    [[nodiscard]] bool startsWith(std::span<const Byte> prefix) const noexcept;
    [[nodiscard]] bool endsWith(std::span<const Byte> suffix) const noexcept;

    /// @brief Occurrences of value.
    [[nodiscard]] std::size_t count(Byte value) const noexcept;

    /// @brief Occurrences of pattern, overlapping matches included. An empty pattern counts 0.
    [[nodiscard]] std::size_t count(std::span<const Byte> pattern) const noexcept;

    /// @brief Shannon entropy in bits per byte (0 for an empty sequence).
    [[nodiscard]] double entropy() const noexcept;

    /// @brief Interpret the bytes as T in this sequence's byte order.
    /// @throws InvalidArgumentError if length() != sizeof(T).
    template <ByteConvertible T>
    [[nodiscard]] T toInteger() const;

    /// @brief Copy of the content, permitted for every variant.
    [[nodiscard]] ByteBuffer toVector() const { return *buffer_; }

    // =========================================================================
    // Buffer Access
    // =========================================================================

    /// @brief The underlying buffer, per the ownership contract.
    /// @return Live buffer (kShared, kMutableInPlace) or a copy (kImmutableCopy).
    /// @throws AccessViolationError for kReadOnlyRestricted.
    [[nodiscard]] SharedBuffer buffer() const;

    // =========================================================================
    // Variant Transitions
    // =========================================================================

    [[nodiscard]] Bytes toMutable() const;
    [[nodiscard]] Bytes toImmutable() const;
    [[nodiscard]] Bytes toReadOnly() const;

    /// @brief New instance of the same variant.
    [[nodiscard]] Bytes duplicate() const;

    /// @brief Same content and variant, reinterpreted with another byte order.
    [[nodiscard]] Bytes withByteOrder(ByteOrder order) const;

    // =========================================================================
    // Mutation (kMutableInPlace only)
    // =========================================================================

    /// @throws AccessViolationError unless kMutableInPlace; OutOfBoundsError on bad index.
    Bytes& setByteAt(std::size_t index, Byte value);

    /// @brief Copy bytes into this sequence starting at offset.
    /// @throws AccessViolationError unless kMutableInPlace; OutOfBoundsError if it does not fit.
    Bytes& overwrite(std::span<const Byte> bytes, std::size_t offset = 0);

    /// @throws AccessViolationError unless kMutableInPlace.
    Bytes& fill(Byte value);

    /// @brief Fill with zeros.
    /// @throws AccessViolationError unless kMutableInPlace.
    Bytes& wipe();

    /// @brief Overwrite with random bytes.
    /// @throws AccessViolationError unless kMutableInPlace.
    Bytes& secureWipe();

    // =========================================================================
    // Comparison and Printing
    // =========================================================================

    /// @brief Equal content and byte order; the ownership variant is not compared.
    [[nodiscard]] bool operator==(const Bytes& other) const noexcept;

    /// @brief Unsigned lexicographic order of the content.
    [[nodiscard]] std::strong_ordering operator<=>(const Bytes& other) const noexcept;

    [[nodiscard]] bool equalsContent(const Bytes& other) const noexcept;
    [[nodiscard]] bool equalsContent(std::span<const Byte> other) const noexcept;

    /// @brief Comparison whose running time depends only on the lengths.
    [[nodiscard]] bool equalsConstantTime(std::span<const Byte> other) const noexcept;

    /// @brief Hash over content and byte order.
    [[nodiscard]] std::size_t hash() const noexcept;

    /// @brief e.g. "3 bytes (0x0a0b0c)".
    [[nodiscard]] std::string toString() const;

private:
    Bytes(SharedBuffer buffer, ByteOrder order, Ownership ownership) noexcept
        : buffer_(std::move(buffer)), byteOrder_(order), ownership_(ownership) {}

    /// @brief Read-only view for internal use, regardless of the variant.
    [[nodiscard]] std::span<const Byte> view() const noexcept { return *buffer_; }

    /// @brief Buffer for a new instance: shared or copied per this variant.
    [[nodiscard]] SharedBuffer handOff() const;

    /// @throws AccessViolationError unless kMutableInPlace.
    void requireMutable(std::string_view operation) const;

    SharedBuffer buffer_;
    ByteOrder byteOrder_;
    Ownership ownership_;
};

/// @brief Print toString() (also used by GoogleTest).
std::ostream& operator<<(std::ostream& os, const Bytes& bytes);

// =============================================================================
// Template Implementations
// =============================================================================

template <ByteConvertible T>
Bytes Bytes::fromInteger(T value, ByteOrder order) {
    using U = std::make_unsigned_t<T>;
    auto raw = static_cast<U>(value);
    ByteBuffer bytes(sizeof(T));
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t pos = (order == ByteOrder::kBigEndian) ? sizeof(T) - 1 - i : i;
        bytes[pos] = static_cast<Byte>(raw & 0xFF);
        raw = static_cast<U>(raw >> 8);
    }
    return wrap(std::move(bytes), order);
}

template <ByteConvertible T>
T Bytes::toInteger() const {
    if (length() != sizeof(T)) {
        throw InvalidArgumentError("cannot convert " + std::to_string(length()) +
                                   " bytes to an integer of " + std::to_string(sizeof(T)) +
                                   " bytes");
    }
    using U = std::make_unsigned_t<T>;
    U raw = 0;
    const ByteBuffer& bytes = *buffer_;
    for (std::size_t i = 0; i < sizeof(T); ++i) {
        const std::size_t pos = (byteOrder_ == ByteOrder::kBigEndian) ? i : sizeof(T) - 1 - i;
        raw = static_cast<U>((static_cast<std::uintmax_t>(raw) << 8) | bytes[pos]);
    }
    return static_cast<T>(raw);
}

}  // namespace byteseq

template <>
struct std::hash<byteseq::Bytes> {
    std::size_t operator()(const byteseq::Bytes& bytes) const noexcept { return bytes.hash(); }
};

#endif  // BYTESEQ_CORE_BYTES_H
