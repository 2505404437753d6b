// =============================================================================
// byteseq - Radix Number Codec Tests
// =============================================================================

#include "byteseq/codec/radix_codec.h"

#include <gtest/gtest.h>

#include "byteseq/common/error.h"

namespace byteseq::codec {
namespace {

const ByteBuffer kSample = {0x4a, 0x94, 0xfd, 0xff, 0x1e, 0xaf, 0xed};

// =============================================================================
// Construction
// =============================================================================

TEST(RadixCodecTest, AcceptsRadixRange) {
    EXPECT_EQ(radix(2).radix(), 2);
    EXPECT_EQ(radix(36).radix(), 36);
    EXPECT_EQ(radix(16).name(), "radix-16");
}

TEST(RadixCodecTest, RejectsRadixOutsideRange) {
    EXPECT_THROW(RadixCodec(1), InvalidRadixError);
    EXPECT_THROW(RadixCodec(37), InvalidRadixError);
    EXPECT_THROW(RadixCodec(0), InvalidRadixError);

    try {
        (void)radix(-5);
        FAIL() << "expected InvalidRadixError";
    } catch (const InvalidRadixError& e) {
        EXPECT_EQ(e.radix(), -5);
    }
}

// =============================================================================
// Encoding
// =============================================================================

TEST(RadixCodecTest, EncodeKnownValues) {
    EXPECT_EQ(decimal().encode(kSample, ByteOrder::kBigEndian), "20992966904426477");
    EXPECT_EQ(base36().encode(kSample, ByteOrder::kBigEndian), "5qpdvuwjvu5");
    EXPECT_EQ(octal().encode(kSample, ByteOrder::kBigEndian), "1124517677707527755");
    EXPECT_EQ(radix(16).encode(kSample, ByteOrder::kBigEndian), "4a94fdff1eafed");
    EXPECT_EQ(binary().encode(kSample, ByteOrder::kBigEndian),
              "1001010100101001111110111111111000111101010111111101101");
}

TEST(RadixCodecTest, EncodeSmallNumbers) {
    EXPECT_EQ(decimal().encode(ByteBuffer{0x01, 0x00}, ByteOrder::kBigEndian), "256");
    EXPECT_EQ(base36().encode(ByteBuffer{0xff}, ByteOrder::kBigEndian), "73");
    EXPECT_EQ(binary().encode(ByteBuffer{0x05}, ByteOrder::kBigEndian), "101");
}

TEST(RadixCodecTest, EncodeLittleEndian) {
    EXPECT_EQ(decimal().encode(kSample, ByteOrder::kLittleEndian), "66902117159113802");
    EXPECT_EQ(decimal().encode(ByteBuffer{0x00, 0x01}, ByteOrder::kLittleEndian), "256");
}

TEST(RadixCodecTest, EncodeLeadingZeroBytesAreDropped) {
    EXPECT_EQ(decimal().encode(ByteBuffer{0x00, 0x00, 0x01, 0x00}, ByteOrder::kBigEndian), "256");
}

TEST(RadixCodecTest, EncodeEmptyAndZero) {
    EXPECT_EQ(decimal().encode({}, ByteOrder::kBigEndian), "");
    EXPECT_EQ(decimal().encode(ByteBuffer{0x00}, ByteOrder::kBigEndian), "0");
    EXPECT_EQ(base36().encode(ByteBuffer{0x00, 0x00, 0x00}, ByteOrder::kBigEndian), "0");
}

// =============================================================================
// Decoding
// =============================================================================

TEST(RadixCodecTest, DecodeKnownValues) {
    EXPECT_EQ(decimal().decode("20992966904426477"), kSample);
    EXPECT_EQ(base36().decode("5qpdvuwjvu5"), kSample);
    EXPECT_EQ(decimal().decode("256"), (ByteBuffer{0x01, 0x00}));
}

TEST(RadixCodecTest, DecodeIsMinimal) {
    EXPECT_EQ(decimal().decode("0000256"), (ByteBuffer{0x01, 0x00}));
    EXPECT_EQ(decimal().decode("255"), (ByteBuffer{0xff}));
}

TEST(RadixCodecTest, DecodeZeroAndEmpty) {
    EXPECT_TRUE(decimal().decode("0").empty());
    EXPECT_TRUE(decimal().decode("").empty());
    EXPECT_TRUE(binary().decode("0000").empty());
}

TEST(RadixCodecTest, DecodeAcceptsUpperCaseDigits) {
    EXPECT_EQ(base36().decode("5QPDVUWJVU5"), kSample);
    EXPECT_EQ(radix(16).decode("FF"), (ByteBuffer{0xff}));
}

TEST(RadixCodecTest, DecodeRejectsDigitOutsideRadix) {
    try {
        (void)binary().decode("1012");
        FAIL() << "expected InvalidSymbolError";
    } catch (const InvalidSymbolError& e) {
        EXPECT_EQ(e.symbol(), '2');
        EXPECT_EQ(e.index(), 3U);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->codecName, "radix-2");
    }
}

TEST(RadixCodecTest, DecodeRejectsSign) {
    EXPECT_THROW((void)decimal().decode("-1"), InvalidSymbolError);
    EXPECT_THROW((void)decimal().decode("+1"), InvalidSymbolError);
}

}  // namespace
}  // namespace byteseq::codec
