// =============================================================================
// byteseq - Hex Codec Tests
// =============================================================================

#include "byteseq/codec/hex_codec.h"

#include <gtest/gtest.h>

#include "byteseq/common/error.h"

namespace byteseq::codec {
namespace {

const ByteBuffer kSample = {0x4a, 0x94, 0xfd, 0xff, 0x1e, 0xaf, 0xed};

TEST(HexCodecTest, EncodeLowerCaseByDefault) {
    EXPECT_EQ(hex().encode(kSample, ByteOrder::kBigEndian), "4a94fdff1eafed");
    EXPECT_EQ(hex().name(), "hex");
}

TEST(HexCodecTest, EncodeUpperCase) {
    EXPECT_EQ(hex(true).encode(kSample, ByteOrder::kBigEndian), "4A94FDFF1EAFED");
    EXPECT_EQ(hex(true).name(), "HEX");
}

TEST(HexCodecTest, EncodeLittleEndianReversesBytes) {
    EXPECT_EQ(hex().encode(kSample, ByteOrder::kLittleEndian), "edaf1efffd944a");
}

TEST(HexCodecTest, EmptyInput) {
    EXPECT_EQ(hex().encode({}, ByteOrder::kBigEndian), "");
    EXPECT_TRUE(hex().decode("").empty());
    EXPECT_TRUE(hex().decode("0x").empty());
}

TEST(HexCodecTest, DecodeAcceptsBothCases) {
    EXPECT_EQ(hex().decode("4a94fdff1eafed"), kSample);
    EXPECT_EQ(hex().decode("4A94FDFF1EAFED"), kSample);
    EXPECT_EQ(hex().decode("4a94FDff1EafED"), kSample);
}

TEST(HexCodecTest, DecodeAcceptsPrefix) {
    EXPECT_EQ(hex().decode("0x4a94fdff1eafed"), kSample);
    EXPECT_EQ(hex().decode("0X4A"), (ByteBuffer{0x4a}));
}

TEST(HexCodecTest, DecodeOddLengthImpliesLeadingZero) {
    EXPECT_EQ(hex().decode("abc"), (ByteBuffer{0x0a, 0xbc}));
    EXPECT_EQ(hex().decode("0x1"), (ByteBuffer{0x01}));
}

TEST(HexCodecTest, InvalidSymbolIndexCountsPrefix) {
    try {
        (void)hex().decode("0xZZ");
        FAIL() << "expected InvalidSymbolError";
    } catch (const InvalidSymbolError& e) {
        EXPECT_EQ(e.symbol(), 'Z');
        EXPECT_EQ(e.index(), 2U);
        EXPECT_EQ(e.code(), ErrorCode::kInvalidSymbol);
    }
}

TEST(HexCodecTest, InvalidSymbolInLowNibble) {
    try {
        (void)hex().decode("0a0g");
        FAIL() << "expected InvalidSymbolError";
    } catch (const InvalidSymbolError& e) {
        EXPECT_EQ(e.symbol(), 'g');
        EXPECT_EQ(e.index(), 3U);
    }
}

TEST(HexCodecTest, RejectsWhitespace) {
    EXPECT_THROW((void)hex().decode("4a 94"), InvalidSymbolError);
}

}  // namespace
}  // namespace byteseq::codec
