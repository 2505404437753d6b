// =============================================================================
// byteseq - Codec Registry
// =============================================================================
// Resolves codec names, as used on the bseq command line, to codec instances.
//
// Recognized names:
//   hex, HEX, base16        Hex codec (lower / upper case output)
//   base32                  RFC 4648 base32
//   base64, base64url       RFC 4648 base64 (standard / url-safe, padded)
//   base64-nopad            RFC 4648 base64 without padding
//   binary, octal, dec      Radix 2 / 8 / 10
//   base36                  Radix 36
//   radix:N                 Radix N, 2 <= N <= 36
//   utf8, text              Raw text, bytes passed through unchanged
// =============================================================================

#ifndef BYTESEQ_CODEC_CODEC_REGISTRY_H
#define BYTESEQ_CODEC_CODEC_REGISTRY_H

#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "byteseq/codec/text_codec.h"
#include "byteseq/common/error.h"

namespace byteseq::codec {

/// @brief Passes raw text through as bytes and back.
/// @note No UTF-8 validation is performed.
class RawTextCodec final : public TextCodec {
public:
    [[nodiscard]] std::string encode(std::span<const Byte> bytes, ByteOrder order) const override;

    [[nodiscard]] ByteBuffer decode(std::string_view text) const override;

    [[nodiscard]] std::string_view name() const noexcept override { return "utf8"; }
};

/// @brief Create the codec registered under the given name.
/// @return The codec, or kUsageError for unknown names and kInvalidRadix for
///         radix:N with N outside [2, 36].
[[nodiscard]] Result<std::unique_ptr<TextCodec>> makeCodec(std::string_view name);

/// @brief Names accepted by makeCodec() (radix:N listed once).
[[nodiscard]] std::vector<std::string> codecNames();

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_CODEC_REGISTRY_H
