// =============================================================================
// byteseq - Generic Alphabet-Driven Codec Tests
// =============================================================================
// Known-answer tests from RFC 4648 section 10, padding handling, byte order
// and symbol rejection.
// =============================================================================

#include "byteseq/codec/base_codec.h"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "byteseq/common/error.h"

namespace byteseq::codec {
namespace {

// =============================================================================
// Test Utilities
// =============================================================================

[[nodiscard]] ByteBuffer bytesOf(std::string_view text) {
    return ByteBuffer(text.begin(), text.end());
}

[[nodiscard]] std::string encodeText(const BaseCodec& codec, std::string_view text) {
    const ByteBuffer bytes = bytesOf(text);
    return codec.encode(bytes, ByteOrder::kBigEndian);
}

const ByteBuffer kSample = {0x4a, 0x94, 0xfd, 0xff, 0x1e, 0xaf, 0xed};

// =============================================================================
// Base64
// =============================================================================

TEST(BaseCodecTest, Base64Rfc4648Vectors) {
    const BaseCodec codec = base64();
    EXPECT_EQ(encodeText(codec, ""), "");
    EXPECT_EQ(encodeText(codec, "f"), "Zg==");
    EXPECT_EQ(encodeText(codec, "fo"), "Zm8=");
    EXPECT_EQ(encodeText(codec, "foo"), "Zm9v");
    EXPECT_EQ(encodeText(codec, "foob"), "Zm9vYg==");
    EXPECT_EQ(encodeText(codec, "fooba"), "Zm9vYmE=");
    EXPECT_EQ(encodeText(codec, "foobar"), "Zm9vYmFy");
}

TEST(BaseCodecTest, Base64DecodeVectors) {
    const BaseCodec codec = base64();
    EXPECT_EQ(codec.decode(""), ByteBuffer{});
    EXPECT_EQ(codec.decode("Zg=="), bytesOf("f"));
    EXPECT_EQ(codec.decode("Zm8="), bytesOf("fo"));
    EXPECT_EQ(codec.decode("Zm9vYmFy"), bytesOf("foobar"));
    EXPECT_EQ(codec.decode("SpT9/x6v7Q=="), kSample);
}

TEST(BaseCodecTest, Base64DecodeAcceptsMissingPadding) {
    const BaseCodec codec = base64();
    EXPECT_EQ(codec.decode("Zg"), bytesOf("f"));
    EXPECT_EQ(codec.decode("Zm9vYg"), bytesOf("foob"));
    EXPECT_EQ(codec.decode("===="), ByteBuffer{});
}

TEST(BaseCodecTest, Base64NoPaddingOmitsPadding) {
    const BaseCodec codec = base64NoPadding();
    EXPECT_EQ(codec.encode(kSample, ByteOrder::kBigEndian), "SpT9/x6v7Q");
    EXPECT_EQ(codec.decode("SpT9/x6v7Q"), kSample);
    EXPECT_FALSE(codec.padding().has_value());
}

TEST(BaseCodecTest, Base64UrlUsesUrlSafeSymbols) {
    const ByteBuffer bytes = {0xfb, 0xff};
    EXPECT_EQ(base64().encode(bytes, ByteOrder::kBigEndian), "+/8=");
    EXPECT_EQ(base64Url().encode(bytes, ByteOrder::kBigEndian), "-_8=");
    EXPECT_EQ(base64Url(false).encode(bytes, ByteOrder::kBigEndian), "-_8");
    EXPECT_EQ(base64Url().decode("-_8="), bytes);
    EXPECT_THROW((void)base64Url().decode("+/8="), InvalidSymbolError);
}

// =============================================================================
// Base32
// =============================================================================

TEST(BaseCodecTest, Base32Rfc4648Vectors) {
    const BaseCodec codec = base32();
    EXPECT_EQ(encodeText(codec, ""), "");
    EXPECT_EQ(encodeText(codec, "f"), "MY======");
    EXPECT_EQ(encodeText(codec, "fo"), "MZXQ====");
    EXPECT_EQ(encodeText(codec, "foo"), "MZXW6===");
    EXPECT_EQ(encodeText(codec, "foob"), "MZXW6YQ=");
    EXPECT_EQ(encodeText(codec, "fooba"), "MZXW6YTB");
    EXPECT_EQ(encodeText(codec, "foobar"), "MZXW6YTBOI======");
}

TEST(BaseCodecTest, Base32DecodeVectors) {
    const BaseCodec codec = base32();
    EXPECT_EQ(codec.decode("MZXW6YQ="), bytesOf("foob"));
    EXPECT_EQ(codec.decode("MZXW6YTBOI======"), bytesOf("foobar"));
    EXPECT_EQ(codec.decode("JKKP37Y6V7WQ===="), kSample);
}

// =============================================================================
// Byte Order
// =============================================================================

TEST(BaseCodecTest, LittleEndianEncodesReversedBytes) {
    EXPECT_EQ(base64().encode(kSample, ByteOrder::kLittleEndian), "7a8e//2USg==");
    EXPECT_EQ(base32().encode(kSample, ByteOrder::kLittleEndian), "5WXR5775SRFA====");
}

// =============================================================================
// Length Estimates
// =============================================================================

TEST(BaseCodecTest, EncodedLength) {
    EXPECT_EQ(base64().encodedLength(0), 0U);
    EXPECT_EQ(base64().encodedLength(1), 4U);
    EXPECT_EQ(base64().encodedLength(7), 12U);
    EXPECT_EQ(base64NoPadding().encodedLength(7), 10U);
    EXPECT_EQ(base32().encodedLength(4), 8U);
}

TEST(BaseCodecTest, MaxDecodedLength) {
    EXPECT_EQ(base64().maxDecodedLength(4), 3U);
    EXPECT_EQ(base64().maxDecodedLength(2), 2U);
    EXPECT_EQ(base32().maxDecodedLength(8), 5U);
}

// =============================================================================
// Custom Alphabets
// =============================================================================

TEST(BaseCodecTest, CustomOctalAlphabet) {
    const BaseCodec codec(Alphabet("01234567"), std::nullopt, "base8");
    const ByteBuffer bytes = {0xff, 0x00, 0x01};
    const std::string encoded = codec.encode(bytes, ByteOrder::kBigEndian);

    EXPECT_EQ(encoded, "77600001");
    EXPECT_EQ(codec.decode(encoded), bytes);
    EXPECT_EQ(codec.name(), "base8");
}

TEST(BaseCodecTest, PaddingInsideAlphabetRejected) {
    EXPECT_THROW(BaseCodec(Alphabet(kBase64StandardSymbols), '+', "broken"),
                 InvalidArgumentError);
}

// =============================================================================
// Invalid Input
// =============================================================================

TEST(BaseCodecTest, InvalidSymbolReportsCharacterAndIndex) {
    try {
        (void)base64().decode("Zm9v!mFy");
        FAIL() << "expected InvalidSymbolError";
    } catch (const InvalidSymbolError& e) {
        EXPECT_EQ(e.symbol(), '!');
        EXPECT_EQ(e.index(), 4U);
        ASSERT_TRUE(e.context().has_value());
        EXPECT_EQ(e.context()->codecName, "base64");
    }
}

TEST(BaseCodecTest, PaddingInTheMiddleIsRejected) {
    try {
        (void)base64().decode("Zg==Zg==");
        FAIL() << "expected InvalidSymbolError";
    } catch (const InvalidSymbolError& e) {
        EXPECT_EQ(e.symbol(), '=');
        EXPECT_EQ(e.index(), 2U);
    }
}

TEST(BaseCodecTest, Base32RejectsLowerCase) {
    EXPECT_THROW((void)base32().decode("mzxw6yq="), InvalidSymbolError);
}

}  // namespace
}  // namespace byteseq::codec
