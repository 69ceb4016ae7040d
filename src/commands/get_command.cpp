// =============================================================================
// packed-dna - Get Command Implementation
// =============================================================================

#include "get_command.h"

#include <fmt/format.h>

#include "pdna/common/logger.h"
#include "pdna/core/packed_sequence.h"
#include "pdna/format/packed_codec.h"

namespace pdna::commands {

GetCommand::GetCommand(GetOptions options) : options_(std::move(options)) {}

GetCommand::~GetCommand() = default;

GetCommand::GetCommand(GetCommand&&) noexcept = default;
GetCommand& GetCommand::operator=(GetCommand&&) noexcept = default;

int GetCommand::execute() {
    try {
        const PackedSequence sequence = unwrapOrThrow(format::readFile(options_.inputPath));
        const Symbol symbol = sequence.get(static_cast<std::size_t>(options_.index));

        if (options_.longName) {
            fmt::print("{}\n", symbolName(symbol));
        } else {
            fmt::print("{}\n", toChar(symbol));
        }
        return 0;

    } catch (const PdnaException& e) {
        PDNA_LOG_ERROR("Get failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDNA_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

std::unique_ptr<GetCommand> createGetCommand(const std::string& inputPath, std::uint64_t index,
                                             bool longName) {
    GetOptions opts;
    opts.inputPath = inputPath;
    opts.index = index;
    opts.longName = longName;
    return std::make_unique<GetCommand>(std::move(opts));
}

}  // namespace pdna::commands
