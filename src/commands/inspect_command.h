// =============================================================================
// byteseq - Inspect Command
// =============================================================================
// Command handler for displaying a decoded byte sequence: its length, its
// entropy and its rendering in every built-in encoding.
// =============================================================================

#ifndef BYTESEQ_COMMANDS_INSPECT_COMMAND_H
#define BYTESEQ_COMMANDS_INSPECT_COMMAND_H

#include <memory>
#include <string>

#include "byteseq/common/error.h"

namespace byteseq::commands {

// =============================================================================
// Inspect Options
// =============================================================================

/// @brief Configuration options for inspect command.
struct InspectOptions {
    /// @brief Codec name of the input text.
    std::string fromCodec = "hex";

    /// @brief Input text.
    std::string input;
};

// =============================================================================
// InspectCommand Class
// =============================================================================

/// @brief Command handler for displaying sequence information.
class InspectCommand {
public:
    /// @brief Construct with options.
    explicit InspectCommand(InspectOptions options);

    /// @brief Execute the inspect command and print the report to stdout.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    /// @brief Build the report without printing.
    [[nodiscard]] Result<std::string> run() const;

    /// @brief Get the options.
    [[nodiscard]] const InspectOptions& options() const noexcept { return options_; }

private:
    InspectOptions options_;
};

// =============================================================================
// Factory Function
// =============================================================================

/// @brief Create an inspect command from CLI options.
[[nodiscard]] std::unique_ptr<InspectCommand> createInspectCommand(const std::string& fromCodec,
                                                                   const std::string& input);

}  // namespace byteseq::commands

#endif  // BYTESEQ_COMMANDS_INSPECT_COMMAND_H
