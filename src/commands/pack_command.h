// =============================================================================
// packed-dna - Pack Command
// =============================================================================
// Command handler that packs nucleotide text into a .pdna file.
//
// Input handling:
// - The whole input (file or stdin) is one sequence.
// - Trailing '\r' / '\n' line terminators are stripped; any other
//   character outside AaCcGgTt is rejected with its position.
// =============================================================================

#ifndef PDNA_COMMANDS_PACK_COMMAND_H
#define PDNA_COMMANDS_PACK_COMMAND_H

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "pdna/common/error.h"

namespace pdna::commands {

/// @brief Configuration options for the pack command.
struct PackOptions {
    /// @brief Input text path ("-" for stdin).
    std::filesystem::path inputPath;

    /// @brief Output .pdna path.
    std::filesystem::path outputPath;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

/// @brief Statistics gathered by a successful pack run.
struct PackStats {
    std::size_t symbols = 0;
    std::size_t packedBytes = 0;
    double elapsedSeconds = 0.0;
};

/// @brief Command handler for packing text.
class PackCommand {
public:
    explicit PackCommand(PackOptions options);
    ~PackCommand();

    PackCommand(const PackCommand&) = delete;
    PackCommand& operator=(const PackCommand&) = delete;
    PackCommand(PackCommand&&) noexcept;
    PackCommand& operator=(PackCommand&&) noexcept;

    /// @brief Execute the pack command.
    /// @return Exit code (0 = success, otherwise an ErrorCode value).
    [[nodiscard]] int execute();

    [[nodiscard]] const PackOptions& options() const noexcept { return options_; }

    [[nodiscard]] const PackStats& stats() const noexcept { return stats_; }

private:
    /// @brief Read the input text, throwing IOError on failure.
    [[nodiscard]] std::string readInputText() const;

    PackOptions options_;
    PackStats stats_;
};

/// @brief Remove trailing '\r' and '\n' characters.
[[nodiscard]] std::string_view stripLineTerminators(std::string_view text) noexcept;

/// @brief Create a pack command from CLI options.
[[nodiscard]] std::unique_ptr<PackCommand> createPackCommand(const std::string& inputPath,
                                                             const std::string& outputPath,
                                                             bool forceOverwrite);

}  // namespace pdna::commands

#endif  // PDNA_COMMANDS_PACK_COMMAND_H
