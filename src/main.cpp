// =============================================================================
// byteseq - Byte Sequence Toolkit
// =============================================================================
// Main entry point for the bseq command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: convert, inspect, codecs
// - Global options: verbose, quiet, log-file
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdlib>
#include <iostream>
#include <string>

#include "byteseq/codec/codec_registry.h"
#include "byteseq/common/error.h"
#include "byteseq/common/logger.h"

// Command implementations
#include "commands/convert_command.h"
#include "commands/inspect_command.h"

// Forward declarations for command handlers
namespace byteseq::commands {
int runConvert(CLI::App* app);
int runInspect(CLI::App* app);
int runCodecs(CLI::App* app);
}  // namespace byteseq::commands

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "bseq: convert and inspect byte sequences\n"
    "Decodes text in one encoding (hex, base32, base64, radix-N, ...) and\n"
    "re-encodes it in another.";

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = normal, 1 = verbose, 2 = trace
    bool quiet = false;
    std::string logFile;
};

GlobalOptions gOptions;

// =============================================================================
// Convert Command Options
// =============================================================================

struct CliConvertOptions {
    std::string from = "hex";
    std::string to = "hex";
    bool littleEndian = false;
    std::string input;
};

CliConvertOptions gConvertOpts;

// =============================================================================
// Inspect Command Options
// =============================================================================

struct CliInspectOptions {
    std::string from = "hex";
    std::string input;
};

CliInspectOptions gInspectOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupConvertCommand(CLI::App& app) {
    auto* convert = app.add_subcommand("convert", "Re-encode text from one codec to another");
    convert->alias("c");

    convert->add_option("-f,--from", gConvertOpts.from, "Codec of the input text")
        ->default_val("hex");

    convert->add_option("-t,--to", gConvertOpts.to, "Codec of the output text")
        ->default_val("hex");

    convert->add_flag("--little-endian", gConvertOpts.littleEndian,
                      "Encode the output in little-endian byte order");

    convert->add_option("input", gConvertOpts.input, "Input text")->required();
}

void setupInspectCommand(CLI::App& app) {
    auto* inspect = app.add_subcommand("inspect", "Display length, entropy and encodings");
    inspect->alias("i");

    inspect->add_option("-f,--from", gInspectOpts.from, "Codec of the input text")
        ->default_val("hex");

    inspect->add_option("input", gInspectOpts.input, "Input text")->required();
}

void setupCodecsCommand(CLI::App& app) {
    app.add_subcommand("codecs", "List the codec names accepted by --from and --to");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    // Global options
    app.add_flag("-v,--verbose", gOptions.verbosity, "Increase verbosity (-v, -vv for trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Suppress non-error log output");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    // Setup subcommands
    setupConvertCommand(app);
    setupInspectCommand(app);
    setupCodecsCommand(app);

    // Require a subcommand
    app.require_subcommand(1);

    // Parse arguments
    CLI11_PARSE(app, argc, argv);

    // Initialize logger
    try {
        auto logLevel = byteseq::log::Level::kWarning;
        if (gOptions.quiet) {
            logLevel = byteseq::log::Level::kError;
        } else if (gOptions.verbosity >= 2) {
            logLevel = byteseq::log::Level::kTrace;
        } else if (gOptions.verbosity >= 1) {
            logLevel = byteseq::log::Level::kDebug;
        }
        byteseq::log::init(gOptions.logFile, logLevel);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    // Dispatch to subcommand handlers
    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("convert")) {
            exitCode = byteseq::commands::runConvert(app.get_subcommand("convert"));
        } else if (app.got_subcommand("inspect")) {
            exitCode = byteseq::commands::runInspect(app.get_subcommand("inspect"));
        } else if (app.got_subcommand("codecs")) {
            exitCode = byteseq::commands::runCodecs(app.get_subcommand("codecs"));
        }
    } catch (const byteseq::ByteSeqException& ex) {
        BSEQ_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        BSEQ_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = EXIT_FAILURE;
    }

    byteseq::log::shutdown();
    return exitCode;
}

// =============================================================================
// Command Implementations
// =============================================================================

namespace byteseq::commands {

int runConvert([[maybe_unused]] CLI::App* app) {
    auto cmd = createConvertCommand(gConvertOpts.from, gConvertOpts.to, gConvertOpts.littleEndian,
                                    gConvertOpts.input);
    return cmd->execute();
}

int runInspect([[maybe_unused]] CLI::App* app) {
    auto cmd = createInspectCommand(gInspectOpts.from, gInspectOpts.input);
    return cmd->execute();
}

int runCodecs([[maybe_unused]] CLI::App* app) {
    for (const auto& name : codec::codecNames()) {
        std::cout << name << '\n';
    }
    return EXIT_SUCCESS;
}

}  // namespace byteseq::commands
