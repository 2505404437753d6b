// =============================================================================
// byteseq - Hex Codec Implementation
// =============================================================================

#include "byteseq/codec/hex_codec.h"

#include <array>

#include "byteseq/common/error.h"
#include "byteseq/common/logger.h"

namespace byteseq::codec {

namespace {

constexpr std::array<char, 16> kLowerDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                               '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

constexpr std::array<char, 16> kUpperDigits = {'0', '1', '2', '3', '4', '5', '6', '7',
                                               '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};

/// @brief Nibble value of a hex digit, or -1.
constexpr int nibbleOf(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string HexCodec::encode(std::span<const Byte> bytes, ByteOrder order) const {
    const auto& digits = upperCase_ ? kUpperDigits : kLowerDigits;
    const std::size_t length = bytes.size();

    std::string result;
    result.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        const Byte value = (order == ByteOrder::kBigEndian) ? bytes[i] : bytes[length - 1 - i];
        result.push_back(digits[(value >> 4) & 0x0F]);
        result.push_back(digits[value & 0x0F]);
    }
    return result;
}

ByteBuffer HexCodec::decode(std::string_view text) const {
    std::size_t start = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        start = 2;
    }

    const std::size_t digitCount = text.size() - start;
    ByteBuffer out((digitCount + 1) / 2);

    auto nibbleAt = [&](std::size_t index) -> Byte {
        const int nibble = nibbleOf(text[index]);
        if (nibble < 0) {
            BSEQ_LOG_DEBUG("hex decode rejected symbol at index {}", index);
            throw InvalidSymbolError(text[index], index, ErrorContext{std::string(name())});
        }
        return static_cast<Byte>(nibble);
    };

    // An odd digit count implies a leading zero nibble
    std::size_t pos = start;
    std::size_t outIndex = 0;
    if (digitCount % 2 != 0) {
        out[outIndex++] = nibbleAt(pos++);
    }
    for (; pos < text.size(); pos += 2) {
        const Byte high = nibbleAt(pos);
        const Byte low = nibbleAt(pos + 1);
        out[outIndex++] = static_cast<Byte>((high << 4) | low);
    }
    return out;
}

}  // namespace byteseq::codec
