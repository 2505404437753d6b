// =============================================================================
// byteseq - Radix Number Codec
// =============================================================================
// Renders a byte buffer as a non-negative integer in any base from 2 to 36,
// using the digits 0-9a-z.
//
// This is a numeric encoding, not an opaque-data encoding: leading zero bytes
// carry no numeric weight and are lost on decode. decode(encode(b)) == b holds
// only when b is empty or b[0] != 0.
// =============================================================================

#ifndef BYTESEQ_CODEC_RADIX_CODEC_H
#define BYTESEQ_CODEC_RADIX_CODEC_H

#include <span>
#include <string>
#include <string_view>

#include "byteseq/codec/text_codec.h"
#include "byteseq/common/types.h"

namespace byteseq::codec {

/// @brief Arbitrary-base numeric codec.
class RadixCodec final : public TextCodec {
public:
    /// @brief Construct for the given base.
    /// @throws InvalidRadixError if radix is outside [kMinRadix, kMaxRadix].
    explicit RadixCodec(int radix);

    /// @brief Encode the buffer, read in the given byte order, as a base-N number.
    /// @note Empty input encodes to the empty string; an all-zero buffer to "0".
    [[nodiscard]] std::string encode(std::span<const Byte> bytes, ByteOrder order) const override;

    /// @brief Decode a base-N number to its minimal big-endian representation.
    /// @note Digits are case-insensitive. "0" decodes to an empty buffer.
    [[nodiscard]] ByteBuffer decode(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] int radix() const noexcept { return radix_; }

private:
    int radix_;
    std::string name_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief Codec for the given base.
[[nodiscard]] inline RadixCodec radix(int base) {
    return RadixCodec(base);
}

/// @brief Base 2.
[[nodiscard]] inline RadixCodec binary() {
    return RadixCodec(2);
}

/// @brief Base 8.
[[nodiscard]] inline RadixCodec octal() {
    return RadixCodec(8);
}

/// @brief Base 10.
[[nodiscard]] inline RadixCodec decimal() {
    return RadixCodec(10);
}

/// @brief Base 36.
[[nodiscard]] inline RadixCodec base36() {
    return RadixCodec(36);
}

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_RADIX_CODEC_H
