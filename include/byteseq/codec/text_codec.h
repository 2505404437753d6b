// =============================================================================
// byteseq - Binary-to-Text Codec Interface
// =============================================================================
// Abstract encoder/decoder interfaces implemented by every text codec.
//
// Implementations are immutable after construction and keep no state across
// calls, so a single instance may be shared freely.
// =============================================================================

#ifndef BYTESEQ_CODEC_TEXT_CODEC_H
#define BYTESEQ_CODEC_TEXT_CODEC_H

#include <span>
#include <string>
#include <string_view>

#include "byteseq/common/types.h"

namespace byteseq::codec {

// =============================================================================
// Encoder / Decoder Interfaces
// =============================================================================

/// @brief Converts bytes to text.
class Encoder {
public:
    virtual ~Encoder() = default;

    /// @brief Encode bytes to text.
    /// @param bytes Input bytes.
    /// @param order Order in which the input bytes are iterated.
    /// @return Encoded text.
    [[nodiscard]] virtual std::string encode(std::span<const Byte> bytes,
                                             ByteOrder order) const = 0;

    /// @brief Short stable name used in logs and error messages.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    Encoder() = default;
    Encoder(const Encoder&) = default;
    Encoder& operator=(const Encoder&) = default;
};

/// @brief Converts text back to bytes.
class Decoder {
public:
    virtual ~Decoder() = default;

    /// @brief Decode text to bytes.
    /// @param text Encoded text.
    /// @return Decoded bytes, most significant first.
    /// @throws InvalidSymbolError if text contains a character outside the alphabet.
    [[nodiscard]] virtual ByteBuffer decode(std::string_view text) const = 0;

    /// @brief Short stable name used in logs and error messages.
    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

protected:
    Decoder() = default;
    Decoder(const Decoder&) = default;
    Decoder& operator=(const Decoder&) = default;
};

/// @brief Bidirectional text codec.
class TextCodec : public Encoder, public Decoder {
public:
    ~TextCodec() override = default;

    [[nodiscard]] std::string_view name() const noexcept override = 0;

protected:
    TextCodec() = default;
    TextCodec(const TextCodec&) = default;
    TextCodec& operator=(const TextCodec&) = default;
};

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_TEXT_CODEC_H
