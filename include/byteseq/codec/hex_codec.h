// =============================================================================
// byteseq - Hex Codec
// =============================================================================
// Base16 codec with its own lookup tables instead of the generic bit-packing
// path. Encoding is case selectable and byte-order aware; decoding accepts
// either case, an optional "0x" prefix, and odd-length input (treated as
// having an implicit leading zero nibble).
// =============================================================================

#ifndef BYTESEQ_CODEC_HEX_CODEC_H
#define BYTESEQ_CODEC_HEX_CODEC_H

#include <span>
#include <string>
#include <string_view>

#include "byteseq/codec/text_codec.h"
#include "byteseq/common/types.h"

namespace byteseq::codec {

/// @brief Hexadecimal (base16) codec.
class HexCodec final : public TextCodec {
public:
    /// @brief Construct a hex codec.
    /// @param upperCase Emit 'A'-'F' instead of 'a'-'f' when encoding.
    explicit HexCodec(bool upperCase = false) noexcept : upperCase_(upperCase) {}

    [[nodiscard]] std::string encode(std::span<const Byte> bytes, ByteOrder order) const override;

    /// @throws InvalidSymbolError with the index of the offending character in text.
    [[nodiscard]] ByteBuffer decode(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override {
        return upperCase_ ? "HEX" : "hex";
    }

    [[nodiscard]] bool upperCase() const noexcept { return upperCase_; }

private:
    bool upperCase_;
};

/// @brief Hex codec factory.
[[nodiscard]] inline HexCodec hex(bool upperCase = false) noexcept {
    return HexCodec(upperCase);
}

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_HEX_CODEC_H
