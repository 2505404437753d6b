// =============================================================================
// byteseq - Convert Command Implementation
// =============================================================================

#include "convert_command.h"

#include <iostream>

#include "byteseq/codec/codec_registry.h"
#include "byteseq/common/logger.h"
#include "byteseq/core/bytes.h"

namespace byteseq::commands {

// =============================================================================
// ConvertCommand Implementation
// =============================================================================

ConvertCommand::ConvertCommand(ConvertOptions options) : options_(std::move(options)) {}

int ConvertCommand::execute() {
    auto result = run();
    if (!result) {
        BSEQ_LOG_ERROR("Convert command failed: {}", result.error().message());
        std::cerr << "bseq: " << result.error().message() << std::endl;
        return result.error().exitCode();
    }
    std::cout << *result << std::endl;
    return 0;
}

Result<std::string> ConvertCommand::run() const {
    auto decoder = codec::makeCodec(options_.fromCodec);
    if (!decoder) {
        return std::unexpected(decoder.error());
    }
    auto encoder = codec::makeCodec(options_.toCodec);
    if (!encoder) {
        return std::unexpected(encoder.error());
    }

    auto bytes = Bytes::tryParse(options_.input, **decoder);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    BSEQ_LOG_DEBUG("Decoded {} as {} ({})", options_.fromCodec, bytes->toString(),
                   byteOrderToString(options_.outputOrder));

    return bytes->withByteOrder(options_.outputOrder).encode(**encoder);
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<ConvertCommand> createConvertCommand(const std::string& fromCodec,
                                                     const std::string& toCodec,
                                                     bool littleEndian,
                                                     const std::string& input) {
    ConvertOptions opts;
    opts.fromCodec = fromCodec;
    opts.toCodec = toCodec;
    opts.outputOrder = littleEndian ? ByteOrder::kLittleEndian : ByteOrder::kBigEndian;
    opts.input = input;

    return std::make_unique<ConvertCommand>(std::move(opts));
}

}  // namespace byteseq::commands
