// =============================================================================
// byteseq - Symbol Alphabet Implementation
// =============================================================================

#include "byteseq/codec/alphabet.h"

#include <fmt/format.h>

#include <algorithm>
#include <bit>

#include "byteseq/common/error.h"

namespace byteseq::codec {

Alphabet::Alphabet(std::string_view symbols) : symbols_(symbols) {
    const std::size_t count = symbols_.size();
    if (count < 2 || count > kSymbolCodeSpace || !std::has_single_bit(count)) {
        throw InvalidArgumentError(
            fmt::format("alphabet size must be a power of two in [2, {}], got {}",
                        kSymbolCodeSpace, count));
    }

    decodeTable_.fill(kInvalidSymbol);
    for (std::size_t i = 0; i < count; ++i) {
        const auto code = static_cast<unsigned char>(symbols_[i]);
        if (code >= kSymbolCodeSpace) {
            throw InvalidArgumentError(
                fmt::format("alphabet symbol at index {} is not 7-bit ASCII", i));
        }
        if (decodeTable_[code] != kInvalidSymbol) {
            throw InvalidArgumentError(
                fmt::format("duplicate alphabet symbol '{}' at index {}", symbols_[i], i));
        }
        decodeTable_[code] = static_cast<std::int8_t>(i);
    }

    bitsPerChar_ = std::countr_zero(count);

    // e.g. base64: bitsPerChar 6, gcd 2, 4 chars per 3 bytes
    const int gcd = std::min(8, 1 << std::countr_zero(static_cast<unsigned>(bitsPerChar_)));
    charsPerChunk_ = 8 / gcd;
    bytesPerChunk_ = bitsPerChar_ / gcd;
    mask_ = static_cast<std::uint32_t>(count - 1);
}

}  // namespace byteseq::codec
