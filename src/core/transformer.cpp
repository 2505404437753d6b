// =============================================================================
// byteseq - Byte Transformers Implementation
// =============================================================================

#include "byteseq/core/transformer.h"

#include <algorithm>
#include <memory>
#include <random>

#include "byteseq/common/error.h"

namespace byteseq {

namespace {

/// @brief The buffer to write into: the input itself, or a copy of it.
SharedBuffer prepareOutput(const SharedBuffer& buffer, bool inPlace) {
    if (inPlace) {
        return buffer;
    }
    return std::make_shared<ByteBuffer>(*buffer);
}

void shiftLeft(ByteBuffer& bytes, std::size_t bitCount, ByteOrder order) {
    const std::size_t n = bytes.size();
    const std::size_t offsetBytes = bitCount / 8;
    const unsigned shiftMod = static_cast<unsigned>(bitCount % 8);

    if (order == ByteOrder::kBigEndian) {
        for (std::size_t i = 0; i < n; ++i) {
            if (offsetBytes >= n - i) {
                bytes[i] = 0;
                continue;
            }
            const std::size_t src = i + offsetBytes;
            unsigned dst = static_cast<unsigned>(bytes[src]) << shiftMod;
            if (src + 1 < n) {
                dst |= static_cast<unsigned>(bytes[src + 1]) >> (8 - shiftMod);
            }
            bytes[i] = static_cast<Byte>(dst & 0xFF);
        }
    } else {
        for (std::size_t i = n; i-- > 0;) {
            if (i < offsetBytes) {
                bytes[i] = 0;
                continue;
            }
            const std::size_t src = i - offsetBytes;
            unsigned dst = static_cast<unsigned>(bytes[src]) << shiftMod;
            if (src > 0) {
                dst |= static_cast<unsigned>(bytes[src - 1]) >> (8 - shiftMod);
            }
            bytes[i] = static_cast<Byte>(dst & 0xFF);
        }
    }
}

void shiftRight(ByteBuffer& bytes, std::size_t bitCount, ByteOrder order) {
    const std::size_t n = bytes.size();
    const std::size_t offsetBytes = bitCount / 8;
    const unsigned shiftMod = static_cast<unsigned>(bitCount % 8);

    if (order == ByteOrder::kBigEndian) {
        for (std::size_t i = n; i-- > 0;) {
            if (i < offsetBytes) {
                bytes[i] = 0;
                continue;
            }
            const std::size_t src = i - offsetBytes;
            unsigned dst = static_cast<unsigned>(bytes[src]) >> shiftMod;
            if (src > 0) {
                dst |= static_cast<unsigned>(bytes[src - 1]) << (8 - shiftMod);
            }
            bytes[i] = static_cast<Byte>(dst & 0xFF);
        }
    } else {
        for (std::size_t i = 0; i < n; ++i) {
            if (offsetBytes >= n - i) {
                bytes[i] = 0;
                continue;
            }
            const std::size_t src = i + offsetBytes;
            unsigned dst = static_cast<unsigned>(bytes[src]) >> shiftMod;
            if (src + 1 < n) {
                dst |= static_cast<unsigned>(bytes[src + 1]) << (8 - shiftMod);
            }
            bytes[i] = static_cast<Byte>(dst & 0xFF);
        }
    }
}

}  // namespace

// =============================================================================
// Bitwise Operators
// =============================================================================

SharedBuffer BitwiseTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    if (buffer->size() != operand_.size()) {
        throw LengthMismatchError(buffer->size(), operand_.size());
    }

    SharedBuffer out = prepareOutput(buffer, inPlace);
    ByteBuffer& bytes = *out;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        switch (mode_) {
            case Mode::kAnd:
                bytes[i] &= operand_[i];
                break;
            case Mode::kOr:
                bytes[i] |= operand_[i];
                break;
            case Mode::kXor:
                bytes[i] ^= operand_[i];
                break;
        }
    }
    return out;
}

SharedBuffer NegateTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    SharedBuffer out = prepareOutput(buffer, inPlace);
    for (Byte& b : *out) {
        b = static_cast<Byte>(~b);
    }
    return out;
}

SharedBuffer ShiftTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    SharedBuffer out = prepareOutput(buffer, inPlace);
    if (direction_ == Direction::kLeft) {
        shiftLeft(*out, bitCount_, order_);
    } else {
        shiftRight(*out, bitCount_, order_);
    }
    return out;
}

SharedBuffer BitSwitchTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    const std::size_t bitLength = buffer->size() * kBitsPerByte;
    if (position_ >= bitLength) {
        throw OutOfBoundsError("bit index", position_, bitLength);
    }

    SharedBuffer out = prepareOutput(buffer, inPlace);
    Byte& target = (*out)[out->size() - 1 - position_ / 8];
    const auto mask = static_cast<Byte>(1U << (position_ % 8));
    if (!value_.has_value()) {
        target ^= mask;
    } else if (*value_) {
        target |= mask;
    } else {
        target &= static_cast<Byte>(~mask);
    }
    return out;
}

// =============================================================================
// Reordering
// =============================================================================

SharedBuffer ReverseTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    SharedBuffer out = prepareOutput(buffer, inPlace);
    std::reverse(out->begin(), out->end());
    return out;
}

SharedBuffer SortTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    SharedBuffer out = prepareOutput(buffer, inPlace);
    std::sort(out->begin(), out->end());
    return out;
}

SharedBuffer ShuffleTransformer::apply(const SharedBuffer& buffer, bool inPlace) const {
    SharedBuffer out = prepareOutput(buffer, inPlace);
    std::mt19937_64 engine(seed_);
    std::shuffle(out->begin(), out->end(), engine);
    return out;
}

// =============================================================================
// Length Changing
// =============================================================================

SharedBuffer ConcatTransformer::apply(const SharedBuffer& buffer,
                                      [[maybe_unused]] bool inPlace) const {
    auto out = std::make_shared<ByteBuffer>();
    out->reserve(buffer->size() + tail_.size());
    out->insert(out->end(), buffer->begin(), buffer->end());
    out->insert(out->end(), tail_.begin(), tail_.end());
    return out;
}

SharedBuffer CopyTransformer::apply(const SharedBuffer& buffer,
                                    [[maybe_unused]] bool inPlace) const {
    const std::size_t size = buffer->size();
    if (offset_ > size) {
        throw OutOfBoundsError("copy offset", offset_, size);
    }
    if (length_ > size - offset_) {
        throw OutOfBoundsError("copy end", offset_ + length_, size);
    }

    const auto first = buffer->begin() + static_cast<std::ptrdiff_t>(offset_);
    return std::make_shared<ByteBuffer>(first, first + static_cast<std::ptrdiff_t>(length_));
}

SharedBuffer ResizeTransformer::apply(const SharedBuffer& buffer,
                                      [[maybe_unused]] bool inPlace) const {
    const std::size_t size = buffer->size();
    auto out = std::make_shared<ByteBuffer>(newLength_, Byte{0});
    const std::size_t kept = std::min(size, newLength_);

    if (mode_ == ResizeMode::kKeepFromZeroIndex) {
        std::copy_n(buffer->begin(), kept, out->begin());
    } else {
        std::copy_n(buffer->end() - static_cast<std::ptrdiff_t>(kept), kept,
                    out->end() - static_cast<std::ptrdiff_t>(kept));
    }
    return out;
}

}  // namespace byteseq
