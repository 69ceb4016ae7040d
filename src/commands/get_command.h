// =============================================================================
// packed-dna - Get Command
// =============================================================================
// Command handler that prints the symbol at one index of a .pdna file.
// =============================================================================

#ifndef PDNA_COMMANDS_GET_COMMAND_H
#define PDNA_COMMANDS_GET_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "pdna/common/error.h"

namespace pdna::commands {

struct GetOptions {
    /// @brief Input .pdna file path.
    std::filesystem::path inputPath;

    /// @brief Zero-based symbol index.
    std::uint64_t index = 0;

    /// @brief Print the base name ("Guanine") instead of the letter.
    bool longName = false;
};

class GetCommand {
public:
    explicit GetCommand(GetOptions options);
    ~GetCommand();

    GetCommand(const GetCommand&) = delete;
    GetCommand& operator=(const GetCommand&) = delete;
    GetCommand(GetCommand&&) noexcept;
    GetCommand& operator=(GetCommand&&) noexcept;

    /// @return 0 on success, ErrorCode::kOutOfRange for an index past the end.
    [[nodiscard]] int execute();

    [[nodiscard]] const GetOptions& options() const noexcept { return options_; }

private:
    GetOptions options_;
};

[[nodiscard]] std::unique_ptr<GetCommand> createGetCommand(const std::string& inputPath,
                                                           std::uint64_t index, bool longName);

}  // namespace pdna::commands

#endif  // PDNA_COMMANDS_GET_COMMAND_H
