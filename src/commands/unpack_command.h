// =============================================================================
// packed-dna - Unpack Command
// =============================================================================
// Command handler that decodes a .pdna file back to uppercase text.
// =============================================================================

#ifndef PDNA_COMMANDS_UNPACK_COMMAND_H
#define PDNA_COMMANDS_UNPACK_COMMAND_H

#include <filesystem>
#include <memory>
#include <string>

#include "pdna/common/error.h"

namespace pdna::commands {

/// @brief Configuration options for the unpack command.
struct UnpackOptions {
    /// @brief Input .pdna path.
    std::filesystem::path inputPath;

    /// @brief Output text path ("-" for stdout).
    std::filesystem::path outputPath;

    /// @brief Overwrite an existing output file.
    bool forceOverwrite = false;
};

/// @brief Command handler for unpacking to text.
class UnpackCommand {
public:
    explicit UnpackCommand(UnpackOptions options);
    ~UnpackCommand();

    UnpackCommand(const UnpackCommand&) = delete;
    UnpackCommand& operator=(const UnpackCommand&) = delete;
    UnpackCommand(UnpackCommand&&) noexcept;
    UnpackCommand& operator=(UnpackCommand&&) noexcept;

    /// @brief Execute the unpack command.
    /// @return Exit code (0 = success, otherwise an ErrorCode value).
    [[nodiscard]] int execute();

    [[nodiscard]] const UnpackOptions& options() const noexcept { return options_; }

private:
    /// @brief Write one line of text to the configured output.
    void writeText(const std::string& text) const;

    UnpackOptions options_;
};

[[nodiscard]] std::unique_ptr<UnpackCommand> createUnpackCommand(const std::string& inputPath,
                                                                 const std::string& outputPath,
                                                                 bool forceOverwrite);

}  // namespace pdna::commands

#endif  // PDNA_COMMANDS_UNPACK_COMMAND_H
