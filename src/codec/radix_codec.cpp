// =============================================================================
// byteseq - Radix Number Codec Implementation
// =============================================================================
// The buffer is treated as a base-256 big number. Encoding divides it by the
// radix until it reaches zero; decoding multiplies-and-adds digit by digit.
// Both are quadratic in the input length.
// =============================================================================

#include "byteseq/codec/radix_codec.h"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>

#include "byteseq/common/error.h"
#include "byteseq/common/logger.h"

namespace byteseq::codec {

namespace {

constexpr std::string_view kDigits = "0123456789abcdefghijklmnopqrstuvwxyz";

/// @brief Digit value of c in base 36, or -1.
constexpr int digitOf(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'Z') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

RadixCodec::RadixCodec(int radix) : radix_(radix) {
    if (radix < kMinRadix || radix > kMaxRadix) {
        throw InvalidRadixError(radix);
    }
    name_ = fmt::format("radix-{}", radix);
}

std::string RadixCodec::encode(std::span<const Byte> bytes, ByteOrder order) const {
    if (bytes.empty()) {
        return {};
    }

    ByteBuffer number(bytes.begin(), bytes.end());
    if (order == ByteOrder::kLittleEndian) {
        std::reverse(number.begin(), number.end());
    }

    const auto base = static_cast<std::uint32_t>(radix_);
    std::size_t first = 0;
    while (first < number.size() && number[first] == 0) {
        ++first;
    }
    if (first == number.size()) {
        return "0";
    }

    std::string digits;
    while (first < number.size()) {
        // Long division of number by base, remainder is the next digit
        std::uint32_t remainder = 0;
        for (std::size_t i = first; i < number.size(); ++i) {
            const std::uint32_t acc = (remainder << 8) | number[i];
            number[i] = static_cast<Byte>(acc / base);
            remainder = acc % base;
        }
        digits.push_back(kDigits[remainder]);
        while (first < number.size() && number[first] == 0) {
            ++first;
        }
    }

    std::reverse(digits.begin(), digits.end());
    return digits;
}

ByteBuffer RadixCodec::decode(std::string_view text) const {
    const auto base = static_cast<std::uint32_t>(radix_);

    // Little-endian limbs while accumulating
    ByteBuffer limbs;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const int digit = digitOf(text[i]);
        if (digit < 0 || digit >= radix_) {
            BSEQ_LOG_DEBUG("{} decode rejected symbol at index {}", name_, i);
            throw InvalidSymbolError(text[i], i, ErrorContext{name_});
        }

        auto carry = static_cast<std::uint32_t>(digit);
        for (Byte& limb : limbs) {
            const std::uint32_t acc = static_cast<std::uint32_t>(limb) * base + carry;
            limb = static_cast<Byte>(acc & 0xFF);
            carry = acc >> 8;
        }
        while (carry != 0) {
            limbs.push_back(static_cast<Byte>(carry & 0xFF));
            carry >>= 8;
        }
    }

    // Limbs never gain a zero top limb, so the result is already minimal and
    // zero decodes to an empty buffer
    std::reverse(limbs.begin(), limbs.end());
    return limbs;
}

}  // namespace byteseq::codec
