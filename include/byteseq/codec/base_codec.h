// =============================================================================
// byteseq - Generic Alphabet-Driven Codec
// =============================================================================
// Bit-packing binary-to-text codec for any power-of-two alphabet, with an
// optional padding symbol. Base32 and base64 (standard and url-safe) are
// instances of this codec.
//
// Encoding walks the input in chunks of Alphabet::bytesPerChunk() bytes and
// emits one symbol per Alphabet::bitsPerChar() bits; a partial final chunk
// emits only the symbols its bits need and, when a padding symbol is set, is
// filled up to Alphabet::charsPerChunk() symbols. Decoding strips trailing
// padding and reverses the packing; each symbol group derives its own output
// length, so unpadded input is accepted.
// =============================================================================

#ifndef BYTESEQ_CODEC_BASE_CODEC_H
#define BYTESEQ_CODEC_BASE_CODEC_H

#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "byteseq/codec/alphabet.h"
#include "byteseq/codec/text_codec.h"
#include "byteseq/common/types.h"

namespace byteseq::codec {

// =============================================================================
// BaseCodec Class
// =============================================================================

/// @brief Alphabet-driven bit-packing codec.
class BaseCodec final : public TextCodec {
public:
    /// @brief Construct from alphabet and optional padding symbol.
    /// @param alphabet Symbol set.
    /// @param padding Padding symbol, or std::nullopt for unpadded output.
    /// @param name Codec name reported in logs and errors.
    /// @throws InvalidArgumentError if the padding symbol is part of the alphabet.
    BaseCodec(Alphabet alphabet, std::optional<char> padding, std::string name);

    [[nodiscard]] std::string encode(std::span<const Byte> bytes, ByteOrder order) const override;

    [[nodiscard]] ByteBuffer decode(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    [[nodiscard]] const Alphabet& alphabet() const noexcept { return alphabet_; }

    [[nodiscard]] std::optional<char> padding() const noexcept { return padding_; }

    /// @brief Number of symbols encode() produces for the given input length.
    [[nodiscard]] std::size_t encodedLength(std::size_t byteCount) const noexcept;

    /// @brief Worst-case number of bytes decode() produces for the given symbol count.
    [[nodiscard]] std::size_t maxDecodedLength(std::size_t charCount) const noexcept;

private:
    /// @brief Strip trailing padding symbols.
    [[nodiscard]] std::string_view trimPadding(std::string_view text) const noexcept;

    Alphabet alphabet_;
    std::optional<char> padding_;
    std::string name_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/// @brief RFC 4648 base32 with '=' padding.
[[nodiscard]] BaseCodec base32();

/// @brief RFC 4648 base64 with '=' padding.
[[nodiscard]] BaseCodec base64();

/// @brief RFC 4648 base64 without padding.
[[nodiscard]] BaseCodec base64NoPadding();

/// @brief RFC 4648 url-safe base64 ('-' and '_' in place of '+' and '/').
/// @param padding Whether to emit '=' padding.
[[nodiscard]] BaseCodec base64Url(bool padding = true);

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_BASE_CODEC_H
