// =============================================================================
// packed-dna - Pack Command Implementation
// =============================================================================

#include "pack_command.h"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

#include <fmt/format.h>

#include "pdna/common/logger.h"
#include "pdna/core/packed_sequence.h"
#include "pdna/format/packed_codec.h"

namespace pdna::commands {

PackCommand::PackCommand(PackOptions options) : options_(std::move(options)) {}

PackCommand::~PackCommand() = default;

PackCommand::PackCommand(PackCommand&&) noexcept = default;
PackCommand& PackCommand::operator=(PackCommand&&) noexcept = default;

int PackCommand::execute() {
    const auto startTime = std::chrono::steady_clock::now();

    try {
        if (std::filesystem::exists(options_.outputPath) && !options_.forceOverwrite) {
            throw UsageError(fmt::format("Output file exists: {} (use --force to overwrite)",
                                         options_.outputPath.string()));
        }

        const std::string raw = readInputText();
        const std::string_view text = stripLineTerminators(raw);
        PDNA_LOG_DEBUG("Read {} characters from {}", text.size(), options_.inputPath.string());

        auto sequence = PackedSequence::fromText(text);
        if (!sequence) {
            PDNA_LOG_ERROR("Cannot pack {}: {}", options_.inputPath.string(),
                           sequence.error().message());
            return toExitCode(ErrorCode::kInvalidSymbol);
        }

        unwrapOrThrow(format::writeFile(options_.outputPath, *sequence));

        stats_.symbols = sequence->size();
        stats_.packedBytes = sequence->byteCount();
        stats_.elapsedSeconds =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();

        PDNA_LOG_INFO("Packed {} symbols into {} bytes ({:.3f}s)", stats_.symbols,
                      stats_.packedBytes, stats_.elapsedSeconds);
        return 0;

    } catch (const PdnaException& e) {
        PDNA_LOG_ERROR("Pack failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDNA_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

std::string PackCommand::readInputText() const {
    if (options_.inputPath == "-") {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        if (std::cin.bad()) {
            throw IOError("Failed to read from stdin");
        }
        return buffer.str();
    }

    std::ifstream file(options_.inputPath, std::ios::binary);
    if (!file) {
        throw IOError("Failed to open input file: " + options_.inputPath.string(),
                      ErrorContext{options_.inputPath.string()});
    }
    std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
    if (file.bad()) {
        throw IOError("Failed to read input file: " + options_.inputPath.string());
    }
    return text;
}

std::string_view stripLineTerminators(std::string_view text) noexcept {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

std::unique_ptr<PackCommand> createPackCommand(const std::string& inputPath,
                                               const std::string& outputPath,
                                               bool forceOverwrite) {
    PackOptions opts;
    opts.inputPath = inputPath;
    opts.outputPath = outputPath;
    opts.forceOverwrite = forceOverwrite;
    return std::make_unique<PackCommand>(std::move(opts));
}

}  // namespace pdna::commands
