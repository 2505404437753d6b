// =============================================================================
// byteseq - Byte Transformers
// =============================================================================
// A transformer is a function over a byte buffer plus a flag telling whether
// it can run in place. Bytes::transform() decides the execution mode:
//
//   inPlace == true   the transformer mutates the given buffer and returns
//                     that same buffer object
//   inPlace == false  the transformer returns a freshly allocated buffer and
//                     leaves the input untouched
//
// inPlace is only ever true when supportsInPlace() returned true. Argument
// errors (length mismatch, out of range index) are raised before any byte
// is written.
// =============================================================================

#ifndef BYTESEQ_CORE_TRANSFORMER_H
#define BYTESEQ_CORE_TRANSFORMER_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

#include "byteseq/common/types.h"

namespace byteseq {

// =============================================================================
// Transformer Interface
// =============================================================================

/// @brief Buffer transformation with a declared in-place capability.
class Transformer {
public:
    virtual ~Transformer() = default;

    /// @brief Apply the transformation.
    /// @param buffer Input buffer (never null).
    /// @param inPlace Mutate and return buffer itself instead of allocating.
    /// @return The transformed buffer.
    [[nodiscard]] virtual SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const = 0;

    /// @brief Whether apply() honors inPlace == true.
    [[nodiscard]] virtual bool supportsInPlace() const noexcept = 0;

protected:
    Transformer() = default;
    Transformer(const Transformer&) = default;
    Transformer& operator=(const Transformer&) = default;
};

// =============================================================================
// Bitwise Operators
// =============================================================================

/// @brief Element-wise AND/OR/XOR with an operand of equal length.
class BitwiseTransformer final : public Transformer {
public:
    enum class Mode : std::uint8_t { kAnd, kOr, kXor };

    BitwiseTransformer(ByteBuffer operand, Mode mode)
        : operand_(std::move(operand)), mode_(mode) {}

    /// @throws LengthMismatchError if the operand length differs from the buffer length.
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }

private:
    ByteBuffer operand_;
    Mode mode_;
};

/// @brief Bitwise complement of every byte.
class NegateTransformer final : public Transformer {
public:
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }
};

/// @brief Logical shift of the whole buffer, keeping its length.
/// @note With kBigEndian the first byte is the most significant, with
///       kLittleEndian the last one is.
class ShiftTransformer final : public Transformer {
public:
    enum class Direction : std::uint8_t { kLeft, kRight };

    ShiftTransformer(std::size_t bitCount, Direction direction, ByteOrder order)
        : bitCount_(bitCount), direction_(direction), order_(order) {}

    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }

private:
    std::size_t bitCount_;
    Direction direction_;
    ByteOrder order_;
};

/// @brief Set, clear or flip a single bit.
/// @note Bit 0 is the least significant bit of the last byte.
class BitSwitchTransformer final : public Transformer {
public:
    /// @param position Bit index.
    /// @param value New bit value, or std::nullopt to flip.
    BitSwitchTransformer(std::size_t position, std::optional<bool> value)
        : position_(position), value_(value) {}

    /// @throws OutOfBoundsError if position >= 8 * buffer length.
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }

private:
    std::size_t position_;
    std::optional<bool> value_;
};

// =============================================================================
// Reordering
// =============================================================================

/// @brief Reverse byte order of the buffer content.
class ReverseTransformer final : public Transformer {
public:
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }
};

/// @brief Sort bytes ascending (unsigned).
class SortTransformer final : public Transformer {
public:
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }
};

/// @brief Deterministic Fisher-Yates shuffle seeded by the caller.
class ShuffleTransformer final : public Transformer {
public:
    explicit ShuffleTransformer(std::uint64_t seed) : seed_(seed) {}

    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return true; }

private:
    std::uint64_t seed_;
};

// =============================================================================
// Length Changing (copy only)
// =============================================================================

/// @brief Append bytes at the end.
class ConcatTransformer final : public Transformer {
public:
    explicit ConcatTransformer(ByteBuffer tail) : tail_(std::move(tail)) {}

    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return false; }

private:
    ByteBuffer tail_;
};

/// @brief Copy a sub-range.
class CopyTransformer final : public Transformer {
public:
    CopyTransformer(std::size_t offset, std::size_t length) : offset_(offset), length_(length) {}

    /// @throws OutOfBoundsError if offset + length exceeds the buffer length.
    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return false; }

private:
    std::size_t offset_;
    std::size_t length_;
};

/// @brief Which end of the buffer survives a resize.
enum class ResizeMode : std::uint8_t {
    /// @brief Keep the trailing bytes; grow by zero-padding in front.
    kKeepFromMaxLength = 0,

    /// @brief Keep the leading bytes; grow by zero-padding at the end.
    kKeepFromZeroIndex = 1
};

/// @brief Grow or shrink to a new length.
class ResizeTransformer final : public Transformer {
public:
    ResizeTransformer(std::size_t newLength, ResizeMode mode)
        : newLength_(newLength), mode_(mode) {}

    [[nodiscard]] SharedBuffer apply(const SharedBuffer& buffer, bool inPlace) const override;
    [[nodiscard]] bool supportsInPlace() const noexcept override { return false; }

private:
    std::size_t newLength_;
    ResizeMode mode_;
};

}  // namespace byteseq

#endif  // BYTESEQ_CORE_TRANSFORMER_H
