// =============================================================================
// packed-dna - Info Command
// =============================================================================
// Command handler for displaying .pdna file information.
//
// This module provides:
// - InfoCommand: Display header fields and packing statistics
// - Support for JSON output format
// =============================================================================

#ifndef PDNA_COMMANDS_INFO_COMMAND_H
#define PDNA_COMMANDS_INFO_COMMAND_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "pdna/common/error.h"
#include "pdna/format/packed_format.h"

namespace pdna::commands {

/// @brief Configuration options for info command.
struct InfoOptions {
    /// @brief Input .pdna file path.
    std::filesystem::path inputPath;

    /// @brief Output as JSON.
    bool jsonOutput = false;
};

/// @brief Summary of a verified .pdna file.
struct FileInfo {
    std::string path;
    std::uint64_t fileSize = 0;
    format::PackedHeader header;

    /// @brief Average storage cost of one symbol, counting only the payload.
    [[nodiscard]] double bitsPerSymbol() const noexcept;
};

/// @brief Command handler for displaying file information.
class InfoCommand {
public:
    explicit InfoCommand(InfoOptions options);
    ~InfoCommand();

    InfoCommand(const InfoCommand&) = delete;
    InfoCommand& operator=(const InfoCommand&) = delete;
    InfoCommand(InfoCommand&&) noexcept;
    InfoCommand& operator=(InfoCommand&&) noexcept;

    /// @brief Execute the info command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

    [[nodiscard]] const InfoOptions& options() const noexcept { return options_; }

private:
    /// @brief Read the file, verify it fully and collect its header.
    [[nodiscard]] FileInfo collectInfo() const;

    void printTextInfo(const FileInfo& info) const;

    void printJsonInfo(const FileInfo& info) const;

    InfoOptions options_;
};

/// @brief Escape text for use inside a JSON string literal.
/// @note Quotes, backslashes and control characters are escaped; other bytes
///       (including UTF-8 sequences) pass through unchanged.
[[nodiscard]] std::string escapeJsonString(std::string_view text);

/// @brief Create an info command from CLI options.
[[nodiscard]] std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath,
                                                             bool jsonOutput);

}  // namespace pdna::commands

#endif  // PDNA_COMMANDS_INFO_COMMAND_H
