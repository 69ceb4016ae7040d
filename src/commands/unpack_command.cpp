// =============================================================================
// packed-dna - Unpack Command Implementation
// =============================================================================

#include "unpack_command.h"

#include <fstream>
#include <iostream>

#include <fmt/format.h>

#include "pdna/common/logger.h"
#include "pdna/core/packed_sequence.h"
#include "pdna/format/packed_codec.h"

namespace pdna::commands {

UnpackCommand::UnpackCommand(UnpackOptions options) : options_(std::move(options)) {}

UnpackCommand::~UnpackCommand() = default;

UnpackCommand::UnpackCommand(UnpackCommand&&) noexcept = default;
UnpackCommand& UnpackCommand::operator=(UnpackCommand&&) noexcept = default;

int UnpackCommand::execute() {
    try {
        if (options_.outputPath != "-" && std::filesystem::exists(options_.outputPath) &&
            !options_.forceOverwrite) {
            throw UsageError(fmt::format("Output file exists: {} (use --force to overwrite)",
                                         options_.outputPath.string()));
        }

        const PackedSequence sequence = unwrapOrThrow(format::readFile(options_.inputPath));
        PDNA_LOG_DEBUG("Decoded {} symbols from {}", sequence.size(),
                       options_.inputPath.string());

        writeText(sequence.toText());
        return 0;

    } catch (const PdnaException& e) {
        PDNA_LOG_ERROR("Unpack failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDNA_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void UnpackCommand::writeText(const std::string& text) const {
    if (options_.outputPath == "-") {
        std::cout << text << '\n';
        std::cout.flush();
        if (!std::cout) {
            throw IOError("Failed to write to stdout");
        }
        return;
    }

    std::ofstream file(options_.outputPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw IOError("Failed to open output file: " + options_.outputPath.string(),
                      ErrorContext{options_.outputPath.string()});
    }
    file << text << '\n';
    file.close();
    if (!file) {
        throw IOError("Failed to write output file: " + options_.outputPath.string());
    }
}

std::unique_ptr<UnpackCommand> createUnpackCommand(const std::string& inputPath,
                                                   const std::string& outputPath,
                                                   bool forceOverwrite) {
    UnpackOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.forceOverwrite = forceOverwrite;
    return std::make_unique<UnpackCommand>(std::move(opts));
}

}  // namespace pdna::commands
