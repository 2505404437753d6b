// =============================================================================
// byteseq - Convert Command
// =============================================================================
// Command handler for re-encoding text from one codec to another.
//
// This module provides:
// - ConvertCommand: Decode with one codec, encode with another
// - ConvertOptions: Configuration options for conversion
// =============================================================================

#ifndef BYTESEQ_COMMANDS_CONVERT_COMMAND_H
#define BYTESEQ_COMMANDS_CONVERT_COMMAND_H

#include <memory>
#include <string>

#include "byteseq/common/error.h"
#include "byteseq/common/types.h"

namespace byteseq::commands {

// =============================================================================
// Convert Options
// =============================================================================

/// @brief Configuration options for conversion.
struct ConvertOptions {
    /// @brief Codec name of the input text (see codec::makeCodec()).
    std::string fromCodec = "hex";

    /// @brief Codec name of the output text.
    std::string toCodec = "hex";

    /// @brief Byte order used when encoding the output.
    ByteOrder outputOrder = ByteOrder::kBigEndian;

    /// @brief Input text.
    std::string input;
};

// =============================================================================
// ConvertCommand Class
// =============================================================================

/// @brief Command handler for codec conversion.
class ConvertCommand {
public:
    /// @brief Construct with options.
    explicit ConvertCommand(ConvertOptions options);

    /// @brief Execute the conversion and print the result to stdout.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Perform the conversion without printing.
    /// @return Encoded output, or the decode / lookup error.
    [[nodiscard]] Result<std::string> run() const;

    /// @brief Get the options.
    [[nodiscard]] const ConvertOptions& options() const noexcept { return options_; }

private:
    ConvertOptions options_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create a convert command from CLI options.
[[nodiscard]] std::unique_ptr<ConvertCommand> createConvertCommand(const std::string& fromCodec,
                                                                   const std::string& toCodec,
                                                                   bool littleEndian,
                                                                   const std::string& input);

}  // namespace byteseq::commands

#endif  // BYTESEQ_COMMANDS_CONVERT_COMMAND_H
