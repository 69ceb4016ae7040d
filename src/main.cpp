// =============================================================================
// packed-dna - 2-bit Nucleotide Sequence Packer
// =============================================================================
// Main entry point for the pdna command-line tool.
//
// This file implements the CLI framework using CLI11, providing:
// - Subcommands: pack, unpack, info, get
// - Global options: verbose, quiet, log-file
//
// Exit codes are ErrorCode values (see pdna/common/error.h).
// =============================================================================

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

#include "pdna/common/error.h"
#include "pdna/common/logger.h"

#include "commands/get_command.h"
#include "commands/info_command.h"
#include "commands/pack_command.h"
#include "commands/unpack_command.h"

namespace {

// =============================================================================
// Version Information
// =============================================================================

constexpr const char* kVersion = "0.1.0";
constexpr const char* kDescription =
    "pdna: pack nucleotide text (A/C/G/T, case-insensitive) at 2 bits per base\n"
    "and decode it back with random access.";

// =============================================================================
// Options
// =============================================================================

struct GlobalOptions {
    int verbosity = 0;  // 0 = warnings, 1 = info, 2 = debug, 3 = trace
    bool quiet = false;
    std::string logFile;
};

struct CliPackOptions {
    std::string input;
    std::string output;
    bool force = false;
};

struct CliUnpackOptions {
    std::string input;
    std::string output = "-";
    bool force = false;
};

struct CliInfoOptions {
    std::string input;
    bool json = false;
};

struct CliGetOptions {
    std::string input;
    std::uint64_t index = 0;
    bool name = false;
};

GlobalOptions gOptions;
CliPackOptions gPackOpts;
CliUnpackOptions gUnpackOpts;
CliInfoOptions gInfoOpts;
CliGetOptions gGetOpts;

// =============================================================================
// Command Setup Functions
// =============================================================================

void setupPackCommand(CLI::App& app) {
    auto* pack = app.add_subcommand("pack", "Pack nucleotide text into a .pdna file");
    pack->alias("p");

    pack->add_option("-i,--input", gPackOpts.input, "Input text file (or '-' for stdin)")
        ->required()
        ->check(CLI::ExistingFile | CLI::IsMember({"-"}));

    pack->add_option("-o,--output", gPackOpts.output, "Output .pdna file")->required();

    pack->add_flag("-f,--force", gPackOpts.force, "Overwrite existing output file");
}

void setupUnpackCommand(CLI::App& app) {
    auto* unpack = app.add_subcommand("unpack", "Decode a .pdna file to text");
    unpack->alias("u");

    unpack->add_option("-i,--input", gUnpackOpts.input, "Input .pdna file")
        ->required()
        ->check(CLI::ExistingFile);

    unpack->add_option("-o,--output", gUnpackOpts.output, "Output text file (or '-' for stdout)")
        ->default_val("-");

    unpack->add_flag("-f,--force", gUnpackOpts.force, "Overwrite existing output file");
}

void setupInfoCommand(CLI::App& app) {
    auto* info = app.add_subcommand("info", "Display .pdna file information");
    info->alias("i");

    info->add_option("-i,--input", gInfoOpts.input, "Input .pdna file")
        ->required()
        ->check(CLI::ExistingFile);

    info->add_flag("--json", gInfoOpts.json, "Output as JSON");
}

void setupGetCommand(CLI::App& app) {
    auto* get = app.add_subcommand("get", "Print the symbol at a zero-based index");

    get->add_option("-i,--input", gGetOpts.input, "Input .pdna file")
        ->required()
        ->check(CLI::ExistingFile);

    get->add_option("-n,--index", gGetOpts.index, "Zero-based symbol index")
        ->required()
        ->check(CLI::NonNegativeNumber);

    get->add_flag("--name", gGetOpts.name, "Print the base name instead of the letter");
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
    CLI::App app{kDescription};
    app.set_version_flag("-V,--version", kVersion);

    app.add_flag("-v,--verbose", gOptions.verbosity,
                 "Increase verbosity (-v info, -vv debug, -vvv trace)");

    app.add_flag("-q,--quiet", gOptions.quiet, "Only log errors");

    app.add_option("--log-file", gOptions.logFile, "Also write log messages to this file");

    setupPackCommand(app);
    setupUnpackCommand(app);
    setupInfoCommand(app);
    setupGetCommand(app);

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    pdna::log::Config logConfig;
    logConfig.level = pdna::log::levelFromVerbosity(gOptions.verbosity, gOptions.quiet);
    logConfig.logFile = gOptions.logFile;

    try {
        pdna::log::init(logConfig);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
        return pdna::toExitCode(pdna::ErrorCode::kInternalError);
    }

    int exitCode = EXIT_SUCCESS;
    try {
        if (app.got_subcommand("pack")) {
            exitCode = pdna::commands::createPackCommand(gPackOpts.input, gPackOpts.output,
                                                         gPackOpts.force)
                           ->execute();
        } else if (app.got_subcommand("unpack")) {
            exitCode = pdna::commands::createUnpackCommand(gUnpackOpts.input, gUnpackOpts.output,
                                                           gUnpackOpts.force)
                           ->execute();
        } else if (app.got_subcommand("info")) {
            exitCode = pdna::commands::createInfoCommand(gInfoOpts.input, gInfoOpts.json)
                           ->execute();
        } else if (app.got_subcommand("get")) {
            exitCode = pdna::commands::createGetCommand(gGetOpts.input, gGetOpts.index,
                                                        gGetOpts.name)
                           ->execute();
        }
    } catch (const pdna::PdnaException& ex) {
        PDNA_LOG_ERROR("Error: {}", ex.what());
        exitCode = ex.exitCode();
    } catch (const std::exception& ex) {
        PDNA_LOG_ERROR("Unexpected error: {}", ex.what());
        exitCode = pdna::toExitCode(pdna::ErrorCode::kInternalError);
    }

    pdna::log::shutdown();
    return exitCode;
}
