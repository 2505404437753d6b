// =============================================================================
// byteseq - Byte Sequence Implementation
// =============================================================================

#include "byteseq/core/bytes.h"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <memory>
#include <ostream>
#include <random>

#include "byteseq/codec/base_codec.h"
#include "byteseq/codec/hex_codec.h"
#include "byteseq/codec/radix_codec.h"
#include "byteseq/common/logger.h"

namespace byteseq {

namespace {

/// @brief Combine a value into a running hash (boost::hash_combine constant).
constexpr std::size_t hashCombine(std::size_t seed, std::size_t value) noexcept {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

}  // namespace

// =============================================================================
// Factories
// =============================================================================

Bytes Bytes::allocate(std::size_t length, Byte fill) {
    return Bytes(std::make_shared<ByteBuffer>(length, fill), ByteOrder::kBigEndian,
                 Ownership::kShared);
}

Bytes Bytes::empty() {
    return allocate(0);
}

Bytes Bytes::wrap(SharedBuffer buffer, ByteOrder order) {
    if (!buffer) {
        throw InvalidArgumentError("cannot wrap a null buffer");
    }
    return Bytes(std::move(buffer), order, Ownership::kShared);
}

Bytes Bytes::wrap(ByteBuffer&& buffer, ByteOrder order) {
    return Bytes(std::make_shared<ByteBuffer>(std::move(buffer)), order, Ownership::kShared);
}

Bytes Bytes::from(std::span<const Byte> bytes, ByteOrder order) {
    return Bytes(std::make_shared<ByteBuffer>(bytes.begin(), bytes.end()), order,
                 Ownership::kShared);
}

Bytes Bytes::from(std::span<const Byte> bytes, std::size_t offset, std::size_t length) {
    if (offset > bytes.size()) {
        throw OutOfBoundsError("offset", offset, bytes.size());
    }
    if (length > bytes.size() - offset) {
        throw OutOfBoundsError("end", offset + length, bytes.size());
    }
    return from(bytes.subspan(offset, length));
}

Bytes Bytes::from(std::initializer_list<Byte> bytes) {
    return wrap(ByteBuffer(bytes));
}

Bytes Bytes::fromUtf8(std::string_view text) {
    return wrap(ByteBuffer(text.begin(), text.end()));
}

// =============================================================================
// Parsing
// =============================================================================

Bytes Bytes::parse(std::string_view text, const codec::Decoder& decoder) {
    return wrap(decoder.decode(text));
}

Result<Bytes> Bytes::tryParse(std::string_view text, const codec::Decoder& decoder) {
    return tryExecute([&] { return parse(text, decoder); });
}

Bytes Bytes::parseHex(std::string_view text) {
    return parse(text, codec::hex());
}

Bytes Bytes::parseBase32(std::string_view text) {
    return parse(text, codec::base32());
}

Bytes Bytes::parseBase64(std::string_view text) {
    // Trailing padding is optional on input.
    return parse(text, codec::base64());
}

Bytes Bytes::parseBase64Url(std::string_view text) {
    return parse(text, codec::base64Url());
}

Bytes Bytes::parseRadix(std::string_view text, int radix) {
    return parse(text, codec::radix(radix));
}

Bytes Bytes::parseBinary(std::string_view text) {
    return parse(text, codec::binary());
}

Bytes Bytes::parseOctal(std::string_view text) {
    return parse(text, codec::octal());
}

Bytes Bytes::parseDec(std::string_view text) {
    return parse(text, codec::decimal());
}

Bytes Bytes::parseBase36(std::string_view text) {
    return parse(text, codec::base36());
}

// =============================================================================
// Encoding
// =============================================================================

std::string Bytes::encode(const codec::Encoder& encoder) const {
    return encoder.encode(view(), byteOrder_);
}

std::string Bytes::encodeHex(bool upperCase) const {
    return encode(codec::hex(upperCase));
}

std::string Bytes::encodeBase32() const {
    return encode(codec::base32());
}

std::string Bytes::encodeBase64(bool urlSafe, bool padding) const {
    if (urlSafe) {
        return encode(codec::base64Url(padding));
    }
    return padding ? encode(codec::base64()) : encode(codec::base64NoPadding());
}

std::string Bytes::encodeBase64Url() const {
    return encodeBase64(true, true);
}

std::string Bytes::encodeRadix(int radix) const {
    return encode(codec::radix(radix));
}

std::string Bytes::encodeBinary() const {
    return encode(codec::binary());
}

std::string Bytes::encodeOctal() const {
    return encode(codec::octal());
}

std::string Bytes::encodeDec() const {
    return encode(codec::decimal());
}

std::string Bytes::encodeBase36() const {
    return encode(codec::base36());
}

std::string Bytes::encodeUtf8() const {
    return std::string(buffer_->begin(), buffer_->end());
}

// =============================================================================
// Transformations
// =============================================================================

Bytes Bytes::transform(const Transformer& transformer) const {
    const bool inPlace = permitsInPlace(ownership_) && transformer.supportsInPlace();
    BSEQ_LOG_TRACE("transform {} bytes ({}, {})", length(), ownershipToString(ownership_),
                   inPlace ? "in place" : "copy");
    return Bytes(transformer.apply(buffer_, inPlace), byteOrder_, ownership_);
}

Bytes Bytes::append(const Bytes& other) const {
    return append(other.view());
}

Bytes Bytes::append(std::span<const Byte> bytes) const {
    return transform(ConcatTransformer(ByteBuffer(bytes.begin(), bytes.end())));
}

Bytes Bytes::append(Byte value) const {
    return transform(ConcatTransformer(ByteBuffer{value}));
}

Bytes Bytes::xorWith(const Bytes& other) const {
    return xorWith(other.view());
}

Bytes Bytes::xorWith(std::span<const Byte> other) const {
    return transform(BitwiseTransformer(ByteBuffer(other.begin(), other.end()),
                                        BitwiseTransformer::Mode::kXor));
}

Bytes Bytes::andWith(const Bytes& other) const {
    return andWith(other.view());
}

Bytes Bytes::andWith(std::span<const Byte> other) const {
    return transform(BitwiseTransformer(ByteBuffer(other.begin(), other.end()),
                                        BitwiseTransformer::Mode::kAnd));
}

Bytes Bytes::orWith(const Bytes& other) const {
    return orWith(other.view());
}

Bytes Bytes::orWith(std::span<const Byte> other) const {
    return transform(BitwiseTransformer(ByteBuffer(other.begin(), other.end()),
                                        BitwiseTransformer::Mode::kOr));
}

Bytes Bytes::negate() const {
    return transform(NegateTransformer{});
}

Bytes Bytes::leftShift(std::size_t bitCount) const {
    return transform(ShiftTransformer(bitCount, ShiftTransformer::Direction::kLeft, byteOrder_));
}

Bytes Bytes::rightShift(std::size_t bitCount) const {
    return transform(ShiftTransformer(bitCount, ShiftTransformer::Direction::kRight, byteOrder_));
}

Bytes Bytes::switchBit(std::size_t bitPosition, bool value) const {
    return transform(BitSwitchTransformer(bitPosition, value));
}

Bytes Bytes::flipBit(std::size_t bitPosition) const {
    return transform(BitSwitchTransformer(bitPosition, std::nullopt));
}

Bytes Bytes::copy() const {
    return copy(0, length());
}

Bytes Bytes::copy(std::size_t offset, std::size_t length) const {
    return transform(CopyTransformer(offset, length));
}

Bytes Bytes::reverse() const {
    return transform(ReverseTransformer{});
}

Bytes Bytes::resize(std::size_t newLength, ResizeMode mode) const {
    return transform(ResizeTransformer(newLength, mode));
}

Bytes Bytes::sort() const {
    return transform(SortTransformer{});
}

Bytes Bytes::shuffle(std::uint64_t seed) const {
    return transform(ShuffleTransformer(seed));
}

// =============================================================================
// Queries
// =============================================================================

Byte Bytes::byteAt(std::size_t index) const {
    if (index >= length()) {
        throw OutOfBoundsError("byte index", index, length());
    }
    return (*buffer_)[index];
}

bool Bytes::bitAt(std::size_t bitIndex) const {
    if (bitIndex >= lengthBit()) {
        throw OutOfBoundsError("bit index", bitIndex, lengthBit());
    }
    const Byte b = (*buffer_)[length() - 1 - bitIndex / 8];
    return ((b >> (bitIndex % 8)) & 1U) != 0;
}

bool Bytes::contains(Byte value) const noexcept {
    return indexOf(value).has_value();
}

std::optional<std::size_t> Bytes::indexOf(Byte value, std::size_t from) const noexcept {
    if (from >= length()) {
        return std::nullopt;
    }
    const auto it = std::find(buffer_->begin() + static_cast<std::ptrdiff_t>(from),
                              buffer_->end(), value);
    if (it == buffer_->end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - buffer_->begin());
}

std::optional<std::size_t> Bytes::indexOf(std::span<const Byte> pattern,
                                          std::size_t from) const noexcept {
    if (pattern.empty() || from >= length() || pattern.size() > length() - from) {
        return std::nullopt;
    }
    const auto it = std::search(buffer_->begin() + static_cast<std::ptrdiff_t>(from),
                                buffer_->end(), pattern.begin(), pattern.end());
    if (it == buffer_->end()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(it - buffer_->begin());
}

std::optional<std::size_t> Bytes::lastIndexOf(Byte value) const noexcept {
    const auto it = std::find(buffer_->rbegin(), buffer_->rend(), value);
    if (it == buffer_->rend()) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(buffer_->rend() - it) - 1;
}

bool Bytes::startsWith(std::span<const Byte> prefix) const noexcept {
    return prefix.size() <= length() &&
           std::equal(prefix.begin(), prefix.end(), buffer_->begin());
}

bool Bytes::endsWith(std::span<const Byte> suffix) const noexcept {
    return suffix.size() <= length() &&
           std::equal(suffix.begin(), suffix.end(),
                      buffer_->end() - static_cast<std::ptrdiff_t>(suffix.size()));
}

std::size_t Bytes::count(Byte value) const noexcept {
    return static_cast<std::size_t>(std::count(buffer_->begin(), buffer_->end(), value));
}

std::size_t Bytes::count(std::span<const Byte> pattern) const noexcept {
    std::size_t matches = 0;
    std::optional<std::size_t> pos = indexOf(pattern, 0);
    while (pos.has_value()) {
        ++matches;
        pos = indexOf(pattern, *pos + 1);
    }
    return matches;
}

double Bytes::entropy() const noexcept {
    if (isEmpty()) {
        return 0.0;
    }
    std::array<std::size_t, 256> histogram{};
    for (const Byte b : *buffer_) {
        ++histogram[b];
    }

    const auto total = static_cast<double>(length());
    double result = 0.0;
    for (const std::size_t n : histogram) {
        if (n == 0) {
            continue;
        }
        const double p = static_cast<double>(n) / total;
        result -= p * std::log2(p);
    }
    return result;
}

// =============================================================================
// Buffer Access
// =============================================================================

SharedBuffer Bytes::buffer() const {
    switch (ownership_) {
        case Ownership::kShared:
        case Ownership::kMutableInPlace:
            return buffer_;
        case Ownership::kImmutableCopy:
            return std::make_shared<ByteBuffer>(*buffer_);
        case Ownership::kReadOnlyRestricted:
            break;
    }
    BSEQ_LOG_DEBUG("buffer access denied on {} sequence", ownershipToString(ownership_));
    throw AccessViolationError("buffer access", ownership_);
}

// =============================================================================
// Variant Transitions
// =============================================================================

SharedBuffer Bytes::handOff() const {
    if (sharesBuffer(ownership_)) {
        return buffer_;
    }
    return std::make_shared<ByteBuffer>(*buffer_);
}

Bytes Bytes::toMutable() const {
    return Bytes(handOff(), byteOrder_, Ownership::kMutableInPlace);
}

Bytes Bytes::toImmutable() const {
    return Bytes(handOff(), byteOrder_, Ownership::kImmutableCopy);
}

Bytes Bytes::toReadOnly() const {
    return Bytes(handOff(), byteOrder_, Ownership::kReadOnlyRestricted);
}

Bytes Bytes::duplicate() const {
    return Bytes(handOff(), byteOrder_, ownership_);
}

Bytes Bytes::withByteOrder(ByteOrder order) const {
    return Bytes(handOff(), order, ownership_);
}

// =============================================================================
// Mutation
// =============================================================================

void Bytes::requireMutable(std::string_view operation) const {
    if (!permitsMutation(ownership_)) {
        BSEQ_LOG_DEBUG("{} denied on {} sequence", operation, ownershipToString(ownership_));
        throw AccessViolationError(operation, ownership_);
    }
}

Bytes& Bytes::setByteAt(std::size_t index, Byte value) {
    requireMutable("setByteAt");
    if (index >= length()) {
        throw OutOfBoundsError("byte index", index, length());
    }
    (*buffer_)[index] = value;
    return *this;
}

Bytes& Bytes::overwrite(std::span<const Byte> bytes, std::size_t offset) {
    requireMutable("overwrite");
    if (offset > length()) {
        throw OutOfBoundsError("offset", offset, length());
    }
    if (bytes.size() > length() - offset) {
        throw OutOfBoundsError("end", offset + bytes.size(), length());
    }
    std::copy(bytes.begin(), bytes.end(), buffer_->begin() + static_cast<std::ptrdiff_t>(offset));
    return *this;
}

Bytes& Bytes::fill(Byte value) {
    requireMutable("fill");
    std::fill(buffer_->begin(), buffer_->end(), value);
    return *this;
}

Bytes& Bytes::wipe() {
    requireMutable("wipe");
    std::fill(buffer_->begin(), buffer_->end(), Byte{0});
    return *this;
}

Bytes& Bytes::secureWipe() {
    requireMutable("secureWipe");
    std::random_device device;
    std::uniform_int_distribution<unsigned> dist(0, 0xFF);
    for (Byte& b : *buffer_) {
        b = static_cast<Byte>(dist(device));
    }
    return *this;
}

// =============================================================================
// Comparison and Printing
// =============================================================================

bool Bytes::operator==(const Bytes& other) const noexcept {
    return byteOrder_ == other.byteOrder_ && equalsContent(other);
}

std::strong_ordering Bytes::operator<=>(const Bytes& other) const noexcept {
    // Byte is unsigned, so this orders 0x80 after 0x7f.
    return std::lexicographical_compare_three_way(buffer_->begin(), buffer_->end(),
                                                  other.buffer_->begin(), other.buffer_->end());
}

bool Bytes::equalsContent(const Bytes& other) const noexcept {
    return equalsContent(other.view());
}

bool Bytes::equalsContent(std::span<const Byte> other) const noexcept {
    return std::ranges::equal(view(), other);
}

bool Bytes::equalsConstantTime(std::span<const Byte> other) const noexcept {
    if (other.size() != length()) {
        return false;
    }
    unsigned diff = 0;
    for (std::size_t i = 0; i < other.size(); ++i) {
        diff |= static_cast<unsigned>((*buffer_)[i] ^ other[i]);
    }
    return diff == 0;
}

std::size_t Bytes::hash() const noexcept {
    std::size_t seed = static_cast<std::size_t>(byteOrder_);
    for (const Byte b : *buffer_) {
        seed = hashCombine(seed, b);
    }
    return seed;
}

std::string Bytes::toString() const {
    const std::string_view unit = (length() == 1) ? "byte" : "bytes";
    if (isEmpty()) {
        return fmt::format("0 {}", unit);
    }

    const codec::HexCodec hexCodec{};
    if (length() > 2 * kPreviewBytes) {
        const auto head = view().first(kPreviewBytes);
        const auto tail = view().last(kPreviewBytes);
        return fmt::format("{} {} (0x{}...{})", length(), unit,
                           hexCodec.encode(head, ByteOrder::kBigEndian),
                           hexCodec.encode(tail, ByteOrder::kBigEndian));
    }
    return fmt::format("{} {} (0x{})", length(), unit,
                       hexCodec.encode(view(), ByteOrder::kBigEndian));
}

std::ostream& operator<<(std::ostream& os, const Bytes& bytes) {
    return os << bytes.toString();
}

}  // namespace byteseq
