// =============================================================================
// byteseq - Inspect Command Implementation
// =============================================================================

#include "inspect_command.h"

#include <fmt/format.h>

#include <iostream>

#include "byteseq/codec/codec_registry.h"
#include "byteseq/common/logger.h"
#include "byteseq/core/bytes.h"

namespace byteseq::commands {

// =============================================================================
// InspectCommand Implementation
// =============================================================================

InspectCommand::InspectCommand(InspectOptions options) : options_(std::move(options)) {}

int InspectCommand::execute() {
    auto report = run();
    if (!report) {
        BSEQ_LOG_ERROR("Inspect command failed: {}", report.error().message());
        std::cerr << "bseq: " << report.error().message() << std::endl;
        return report.error().exitCode();
    }
    std::cout << *report;
    return 0;
}

Result<std::string> InspectCommand::run() const {
    auto decoder = codec::makeCodec(options_.fromCodec);
    if (!decoder) {
        return std::unexpected(decoder.error());
    }

    auto parsed = Bytes::tryParse(options_.input, **decoder);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    const Bytes& bytes = *parsed;

    std::string report;
    auto line = [&report](std::string_view label, std::string_view value) {
        report += fmt::format("{:<10}{}\n", fmt::format("{}:", label), value);
    };

    line("Summary", bytes.toString());
    line("Length", fmt::format("{} bytes / {} bits", bytes.length(), bytes.lengthBit()));
    line("Entropy", fmt::format("{:.4f}", bytes.entropy()));
    line("Hex", bytes.encodeHex());
    line("Base32", bytes.encodeBase32());
    line("Base64", bytes.encodeBase64());
    line("Base64Url", bytes.encodeBase64Url());
    line("Binary", bytes.encodeBinary());
    line("Octal", bytes.encodeOctal());
    line("Decimal", bytes.encodeDec());
    line("Base36", bytes.encodeBase36());
    return report;
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<InspectCommand> createInspectCommand(const std::string& fromCodec,
                                                     const std::string& input) {
    InspectOptions opts;
    opts.fromCodec = fromCodec;
    opts.input = input;

    return std::make_unique<InspectCommand>(std::move(opts));
}

}  // namespace byteseq::commands
