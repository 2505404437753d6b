// =============================================================================
// byteseq - Command Tests
// =============================================================================
// Unit tests for the convert and inspect command handlers, exercised through
// run() so no output is printed.
// =============================================================================

#include <gtest/gtest.h>

#include <string>

#include "commands/convert_command.h"
#include "commands/inspect_command.h"

namespace byteseq::commands {
namespace {

// =============================================================================
// ConvertCommand Tests
// =============================================================================

TEST(ConvertCommandTest, HexToBase64) {
    auto cmd = createConvertCommand("hex", "base64", false, "4a94fdff1eafed");
    const auto result = cmd->run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "SpT9/x6v7Q==");
}

TEST(ConvertCommandTest, TextToBase32) {
    auto cmd = createConvertCommand("utf8", "base32", false, "foob");
    const auto result = cmd->run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "MZXW6YQ=");
}

TEST(ConvertCommandTest, LittleEndianOutput) {
    auto cmd = createConvertCommand("hex", "hex", true, "0102ff");
    EXPECT_EQ(cmd->options().outputOrder, ByteOrder::kLittleEndian);
    const auto result = cmd->run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "ff0201");
}

TEST(ConvertCommandTest, RadixToDecimal) {
    auto cmd = createConvertCommand("radix:16", "dec", false, "ff");
    const auto result = cmd->run();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "255");
}

TEST(ConvertCommandTest, InvalidInputReportsSymbolError) {
    auto cmd = createConvertCommand("hex", "base64", false, "0xZZ");
    const auto result = cmd->run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kInvalidSymbol);
    EXPECT_EQ(result.error().message(), "invalid symbol 'Z' at index 2");
    EXPECT_EQ(cmd->execute(), 3);
}

TEST(ConvertCommandTest, UnknownCodecIsUsageError) {
    auto cmd = createConvertCommand("hex", "rot13", false, "00");
    const auto result = cmd->run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kUsageError);
    EXPECT_EQ(cmd->execute(), 1);
}

// =============================================================================
// InspectCommand Tests
// =============================================================================

TEST(InspectCommandTest, ReportListsEveryEncoding) {
    auto cmd = createInspectCommand("hex", "cafe");
    const auto report = cmd->run();
    ASSERT_TRUE(report.has_value());

    EXPECT_NE(report->find("2 bytes (0xcafe)"), std::string::npos);
    EXPECT_NE(report->find("2 bytes / 16 bits"), std::string::npos);
    EXPECT_NE(report->find("1.0000"), std::string::npos);
    EXPECT_NE(report->find("yv4="), std::string::npos);
    EXPECT_NE(report->find("51966"), std::string::npos);
    EXPECT_NE(report->find("1100101011111110"), std::string::npos);
}

TEST(InspectCommandTest, InvalidRadixName) {
    auto cmd = createInspectCommand("radix:99", "1");
    const auto report = cmd->run();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code(), ErrorCode::kInvalidRadix);
}

}  // namespace
}  // namespace byteseq::commands
