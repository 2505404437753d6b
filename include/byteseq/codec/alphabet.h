// =============================================================================
// byteseq - Symbol Alphabet
// =============================================================================
// Ordered, power-of-two sized symbol set driving the generic bit-packing codec.
//
// For an alphabet of N = 2^b symbols the codec packs input in chunks of
// bytesPerChunk bytes, emitting charsPerChunk symbols per chunk:
//
//   alphabet   b   charsPerChunk   bytesPerChunk
//   base16     4   2               1
//   base32     5   8               5
//   base64     6   4               3
//
// charsPerChunk * bitsPerChar is the smallest multiple of 8 reachable for the
// alphabet, so chunk boundaries are always byte aligned.
// =============================================================================

#ifndef BYTESEQ_CODEC_ALPHABET_H
#define BYTESEQ_CODEC_ALPHABET_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace byteseq::codec {

// =============================================================================
// Constants
// =============================================================================

/// @brief Size of the reverse lookup table (7-bit ASCII code space).
inline constexpr std::size_t kSymbolCodeSpace = 128;

/// @brief Reverse lookup sentinel for characters outside the alphabet.
inline constexpr std::int8_t kInvalidSymbol = -1;

/// @brief RFC 4648 base32 symbols.
inline constexpr std::string_view kBase32Rfc4648Symbols = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

/// @brief RFC 4648 base64 symbols.
inline constexpr std::string_view kBase64StandardSymbols =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

/// @brief RFC 4648 base64 url and filename safe symbols.
inline constexpr std::string_view kBase64UrlSymbols =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

/// @brief Lower-case base16 symbols.
inline constexpr std::string_view kBase16LowerSymbols = "0123456789abcdef";

/// @brief Upper-case base16 symbols.
inline constexpr std::string_view kBase16UpperSymbols = "0123456789ABCDEF";

/// @brief Default padding symbol of RFC 4648 encodings.
inline constexpr char kRfc4648Padding = '=';

// =============================================================================
// Alphabet Class
// =============================================================================

/// @brief Immutable symbol set with derived bit-packing constants.
class Alphabet {
public:
    /// @brief Construct from an ordered symbol string.
    /// @param symbols Unique 7-bit ASCII symbols; count must be a power of two in [2, 128].
    /// @throws InvalidArgumentError if the symbol set is malformed.
    explicit Alphabet(std::string_view symbols);

    /// @brief Number of symbols.
    [[nodiscard]] std::size_t size() const noexcept { return symbols_.size(); }

    /// @brief Bits carried by one symbol (log2 of size()).
    [[nodiscard]] int bitsPerChar() const noexcept { return bitsPerChar_; }

    /// @brief Symbols per byte-aligned chunk.
    [[nodiscard]] int charsPerChunk() const noexcept { return charsPerChunk_; }

    /// @brief Bytes per byte-aligned chunk.
    [[nodiscard]] int bytesPerChunk() const noexcept { return bytesPerChunk_; }

    /// @brief Mask selecting one symbol's worth of bits.
    [[nodiscard]] std::uint32_t mask() const noexcept { return mask_; }

    /// @brief Symbol for the given value.
    /// @pre value < size()
    [[nodiscard]] char encode(std::uint32_t value) const noexcept { return symbols_[value]; }

    /// @brief Value of the given symbol, or kInvalidSymbol.
    [[nodiscard]] int decode(char symbol) const noexcept {
        const auto code = static_cast<unsigned char>(symbol);
        if (code >= kSymbolCodeSpace) {
            return kInvalidSymbol;
        }
        return decodeTable_[code];
    }

    /// @brief Check whether a character belongs to the alphabet.
    [[nodiscard]] bool contains(char symbol) const noexcept {
        return decode(symbol) != kInvalidSymbol;
    }

    /// @brief The ordered symbols.
    [[nodiscard]] const std::string& symbols() const noexcept { return symbols_; }

    [[nodiscard]] bool operator==(const Alphabet& other) const noexcept {
        return symbols_ == other.symbols_;
    }

private:
    std::string symbols_;
    int bitsPerChar_ = 0;
    int charsPerChunk_ = 0;
    int bytesPerChunk_ = 0;
    std::uint32_t mask_ = 0;
    std::array<std::int8_t, kSymbolCodeSpace> decodeTable_{};
};

}  // namespace byteseq::codec

#endif  // BYTESEQ_CODEC_ALPHABET_H
