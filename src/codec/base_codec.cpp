// =============================================================================
// byteseq - Generic Alphabet-Driven Codec Implementation
// =============================================================================

#include "byteseq/codec/base_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <utility>

#include "byteseq/common/error.h"
#include "byteseq/common/logger.h"

namespace byteseq::codec {

BaseCodec::BaseCodec(Alphabet alphabet, std::optional<char> padding, std::string name)
    : alphabet_(std::move(alphabet)), padding_(padding), name_(std::move(name)) {
    if (padding_.has_value() && alphabet_.contains(*padding_)) {
        throw InvalidArgumentError(
            fmt::format("padding symbol '{}' is part of the alphabet", *padding_),
            ErrorContext{name_});
    }
}

std::size_t BaseCodec::encodedLength(std::size_t byteCount) const noexcept {
    const auto bytesPerChunk = static_cast<std::size_t>(alphabet_.bytesPerChunk());
    const auto bitsPerChar = static_cast<std::size_t>(alphabet_.bitsPerChar());
    if (padding_.has_value()) {
        const std::size_t chunks = (byteCount + bytesPerChunk - 1) / bytesPerChunk;
        return chunks * static_cast<std::size_t>(alphabet_.charsPerChunk());
    }
    return (byteCount * kBitsPerByte + bitsPerChar - 1) / bitsPerChar;
}

std::size_t BaseCodec::maxDecodedLength(std::size_t charCount) const noexcept {
    const auto bitsPerChar = static_cast<std::size_t>(alphabet_.bitsPerChar());
    return (bitsPerChar * charCount + kBitsPerByte - 1) / kBitsPerByte;
}

std::string_view BaseCodec::trimPadding(std::string_view text) const noexcept {
    if (!padding_.has_value()) {
        return text;
    }
    const std::size_t last = text.find_last_not_of(*padding_);
    if (last == std::string_view::npos) {
        return text.substr(0, 0);
    }
    return text.substr(0, last + 1);
}

// =============================================================================
// Encoding
// =============================================================================

std::string BaseCodec::encode(std::span<const Byte> bytes, ByteOrder order) const {
    const std::size_t length = bytes.size();
    const auto bytesPerChunk = static_cast<std::size_t>(alphabet_.bytesPerChunk());
    const int bitsPerChar = alphabet_.bitsPerChar();
    const std::uint32_t mask = alphabet_.mask();

    auto byteAt = [&](std::size_t i) -> Byte {
        return order == ByteOrder::kBigEndian ? bytes[i] : bytes[length - 1 - i];
    };

    std::string result;
    result.reserve(encodedLength(length));

    for (std::size_t offset = 0; offset < length; offset += bytesPerChunk) {
        const std::size_t windowLen = std::min(bytesPerChunk, length - offset);

        // Most significant byte first, followed by one zero byte of headroom
        std::uint64_t bitBuffer = 0;
        for (std::size_t i = 0; i < windowLen; ++i) {
            bitBuffer |= byteAt(offset + i);
            bitBuffer <<= 8;
        }

        const int windowBits = static_cast<int>(windowLen * kBitsPerByte);
        const int bitOffset = windowBits + 8 - bitsPerChar;
        int bitsProcessed = 0;
        while (bitsProcessed < windowBits) {
            const auto value =
                static_cast<std::uint32_t>(bitBuffer >> (bitOffset - bitsProcessed)) & mask;
            result.push_back(alphabet_.encode(value));
            bitsProcessed += bitsPerChar;
        }

        if (padding_.has_value()) {
            const int chunkBits = static_cast<int>(bytesPerChunk * kBitsPerByte);
            while (bitsProcessed < chunkBits) {
                result.push_back(*padding_);
                bitsProcessed += bitsPerChar;
            }
        }
    }

    return result;
}

// =============================================================================
// Decoding
// =============================================================================

ByteBuffer BaseCodec::decode(std::string_view text) const {
    const std::string_view symbols = trimPadding(text);
    const auto charsPerChunk = static_cast<std::size_t>(alphabet_.charsPerChunk());
    const int bitsPerChar = alphabet_.bitsPerChar();
    const int bytesPerChunk = alphabet_.bytesPerChunk();

    ByteBuffer out(maxDecodedLength(symbols.size()));
    std::size_t bytesWritten = 0;

    for (std::size_t charIdx = 0; charIdx < symbols.size(); charIdx += charsPerChunk) {
        std::uint64_t chunk = 0;
        int charsProcessed = 0;
        for (std::size_t i = 0; i < charsPerChunk; ++i) {
            chunk <<= bitsPerChar;
            if (charIdx + i < symbols.size()) {
                const char symbol = symbols[charIdx + i];
                const int value = alphabet_.decode(symbol);
                if (value == kInvalidSymbol) {
                    BSEQ_LOG_DEBUG("{} decode rejected symbol at index {}", name_, charIdx + i);
                    throw InvalidSymbolError(symbol, charIdx + i, ErrorContext{name_});
                }
                chunk |= static_cast<std::uint64_t>(value);
                ++charsProcessed;
            }
        }

        const int minOffset = bytesPerChunk * 8 - charsProcessed * bitsPerChar;
        for (int offset = (bytesPerChunk - 1) * 8; offset >= minOffset; offset -= 8) {
            out[bytesWritten++] = static_cast<Byte>((chunk >> offset) & 0xFF);
        }
    }

    out.resize(bytesWritten);
    return out;
}

// =============================================================================
// Factory Functions
// =============================================================================

BaseCodec base32() {
    return BaseCodec(Alphabet(kBase32Rfc4648Symbols), kRfc4648Padding, "base32");
}

BaseCodec base64() {
    return BaseCodec(Alphabet(kBase64StandardSymbols), kRfc4648Padding, "base64");
}

BaseCodec base64NoPadding() {
    return BaseCodec(Alphabet(kBase64StandardSymbols), std::nullopt, "base64");
}

BaseCodec base64Url(bool padding) {
    return BaseCodec(Alphabet(kBase64UrlSymbols),
                     padding ? std::optional<char>(kRfc4648Padding) : std::nullopt,
                     "base64url");
}

}  // namespace byteseq::codec
