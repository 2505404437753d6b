// =============================================================================
// byteseq - Symbol Alphabet Tests
// =============================================================================

#include "byteseq/codec/alphabet.h"

#include <gtest/gtest.h>

#include "byteseq/common/error.h"

namespace byteseq::codec {
namespace {

// =============================================================================
// Derived Geometry
// =============================================================================

TEST(AlphabetTest, Base64Geometry) {
    const Alphabet alphabet(kBase64StandardSymbols);
    EXPECT_EQ(alphabet.size(), 64U);
    EXPECT_EQ(alphabet.bitsPerChar(), 6);
    EXPECT_EQ(alphabet.charsPerChunk(), 4);
    EXPECT_EQ(alphabet.bytesPerChunk(), 3);
    EXPECT_EQ(alphabet.mask(), 0x3FU);
}

TEST(AlphabetTest, Base32Geometry) {
    const Alphabet alphabet(kBase32Rfc4648Symbols);
    EXPECT_EQ(alphabet.bitsPerChar(), 5);
    EXPECT_EQ(alphabet.charsPerChunk(), 8);
    EXPECT_EQ(alphabet.bytesPerChunk(), 5);
}

TEST(AlphabetTest, Base16Geometry) {
    const Alphabet alphabet(kBase16LowerSymbols);
    EXPECT_EQ(alphabet.bitsPerChar(), 4);
    EXPECT_EQ(alphabet.charsPerChunk(), 2);
    EXPECT_EQ(alphabet.bytesPerChunk(), 1);
}

TEST(AlphabetTest, BinaryAndLargestGeometry) {
    const Alphabet binary("01");
    EXPECT_EQ(binary.bitsPerChar(), 1);
    EXPECT_EQ(binary.charsPerChunk(), 8);
    EXPECT_EQ(binary.bytesPerChunk(), 1);

    std::string symbols;
    for (int c = 0; c < 128; ++c) {
        symbols.push_back(static_cast<char>(c));
    }
    const Alphabet full(symbols);
    EXPECT_EQ(full.bitsPerChar(), 7);
    EXPECT_EQ(full.charsPerChunk(), 8);
    EXPECT_EQ(full.bytesPerChunk(), 7);
}

// =============================================================================
// Lookup
// =============================================================================

TEST(AlphabetTest, EncodeDecodeSymbols) {
    const Alphabet alphabet(kBase64UrlSymbols);
    EXPECT_EQ(alphabet.encode(0), 'A');
    EXPECT_EQ(alphabet.encode(62), '-');
    EXPECT_EQ(alphabet.encode(63), '_');
    EXPECT_EQ(alphabet.decode('-'), 62);
    EXPECT_EQ(alphabet.decode('+'), kInvalidSymbol);
    EXPECT_TRUE(alphabet.contains('_'));
    EXPECT_FALSE(alphabet.contains('='));
}

TEST(AlphabetTest, NonAsciiDecodesToSentinel) {
    const Alphabet alphabet(kBase32Rfc4648Symbols);
    EXPECT_EQ(alphabet.decode(static_cast<char>(0xC3)), kInvalidSymbol);
    EXPECT_FALSE(alphabet.contains(static_cast<char>(0x80)));
}

TEST(AlphabetTest, Equality) {
    EXPECT_EQ(Alphabet(kBase16LowerSymbols), Alphabet("0123456789abcdef"));
    EXPECT_FALSE(Alphabet(kBase16LowerSymbols) == Alphabet(kBase16UpperSymbols));
}

// =============================================================================
// Validation
// =============================================================================

TEST(AlphabetTest, RejectsSizeNotPowerOfTwo) {
    EXPECT_THROW(Alphabet("012"), InvalidArgumentError);
    EXPECT_THROW(Alphabet("0123456789"), InvalidArgumentError);
}

TEST(AlphabetTest, RejectsTooSmall) {
    EXPECT_THROW(Alphabet(""), InvalidArgumentError);
    EXPECT_THROW(Alphabet("0"), InvalidArgumentError);
}

TEST(AlphabetTest, RejectsDuplicateSymbols) {
    EXPECT_THROW(Alphabet("0120"), InvalidArgumentError);
}

TEST(AlphabetTest, RejectsNonAsciiSymbols) {
    std::string symbols = "0123";
    symbols[3] = static_cast<char>(0xE9);
    EXPECT_THROW(Alphabet{symbols}, InvalidArgumentError);
}

}  // namespace
}  // namespace byteseq::codec
