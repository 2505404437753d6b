// =============================================================================
// byteseq - Codec Registry Implementation
// =============================================================================

#include "byteseq/codec/codec_registry.h"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <utility>

#include "byteseq/codec/base_codec.h"
#include "byteseq/codec/hex_codec.h"
#include "byteseq/codec/radix_codec.h"

namespace byteseq::codec {

namespace {

constexpr std::string_view kRadixPrefix = "radix:";

template <typename Codec>
Result<std::unique_ptr<TextCodec>> wrap(Codec codec) {
    return std::unique_ptr<TextCodec>(std::make_unique<Codec>(std::move(codec)));
}

}  // namespace

std::string RawTextCodec::encode(std::span<const Byte> bytes, ByteOrder order) const {
    std::string result(bytes.begin(), bytes.end());
    if (order == ByteOrder::kLittleEndian) {
        std::reverse(result.begin(), result.end());
    }
    return result;
}

ByteBuffer RawTextCodec::decode(std::string_view text) const {
    return ByteBuffer(text.begin(), text.end());
}

Result<std::unique_ptr<TextCodec>> makeCodec(std::string_view name) {
    if (name == "hex" || name == "base16") {
        return wrap(hex(false));
    }
    if (name == "HEX") {
        return wrap(hex(true));
    }
    if (name == "base32") {
        return wrap(base32());
    }
    if (name == "base64") {
        return wrap(base64());
    }
    if (name == "base64-nopad") {
        return wrap(base64NoPadding());
    }
    if (name == "base64url") {
        return wrap(base64Url());
    }
    if (name == "binary") {
        return wrap(binary());
    }
    if (name == "octal") {
        return wrap(octal());
    }
    if (name == "dec") {
        return wrap(decimal());
    }
    if (name == "base36") {
        return wrap(base36());
    }
    if (name == "utf8" || name == "text") {
        return wrap(RawTextCodec{});
    }

    if (name.starts_with(kRadixPrefix)) {
        const std::string_view digits = name.substr(kRadixPrefix.size());
        int base = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), base);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return makeError<std::unique_ptr<TextCodec>>(
                ErrorCode::kUsageError, fmt::format("malformed radix in codec name '{}'", name));
        }
        if (base < kMinRadix || base > kMaxRadix) {
            return makeError<std::unique_ptr<TextCodec>>(InvalidRadixError(base));
        }
        return wrap(radix(base));
    }

    return makeError<std::unique_ptr<TextCodec>>(ErrorCode::kUsageError,
                                                 fmt::format("unknown codec '{}'", name));
}

std::vector<std::string> codecNames() {
    return {"hex",    "HEX",   "base16", "base32", "base64", "base64-nopad", "base64url",
            "binary", "octal", "dec",    "base36", "radix:N", "utf8",        "text"};
}

}  // namespace byteseq::codec
