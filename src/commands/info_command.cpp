// =============================================================================
// packed-dna - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <fmt/format.h>

#include "pdna/common/logger.h"
#include "pdna/format/packed_codec.h"

namespace pdna::commands {

double FileInfo::bitsPerSymbol() const noexcept {
    if (header.length == 0) {
        return 0.0;
    }
    return static_cast<double>(header.payloadSize * 8) / static_cast<double>(header.length);
}

InfoCommand::InfoCommand(InfoOptions options) : options_(std::move(options)) {}

InfoCommand::~InfoCommand() = default;

InfoCommand::InfoCommand(InfoCommand&&) noexcept = default;
InfoCommand& InfoCommand::operator=(InfoCommand&&) noexcept = default;

int InfoCommand::execute() {
    try {
        const FileInfo info = collectInfo();

        if (options_.jsonOutput) {
            printJsonInfo(info);
        } else {
            printTextInfo(info);
        }
        return 0;

    } catch (const PdnaException& e) {
        PDNA_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        PDNA_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

FileInfo InfoCommand::collectInfo() const {
    // Decoding the whole file verifies checksum and padding, not just the header.
    const PackedSequence sequence = unwrapOrThrow(format::readFile(options_.inputPath));

    FileInfo info;
    info.path = options_.inputPath.string();
    info.header = format::makeHeader(sequence);
    info.fileSize = info.header.totalSize();
    return info;
}

void InfoCommand::printTextInfo(const FileInfo& info) const {
    fmt::print("=== PDNA File Information ===\n\n");
    fmt::print("File:           {}\n", info.path);
    fmt::print("Size:           {} bytes\n", info.fileSize);
    fmt::print("Version:        {}.{}\n", format::decodeMajorVersion(info.header.version),
               format::decodeMinorVersion(info.header.version));
    fmt::print("Symbols:        {}\n", info.header.length);
    fmt::print("Payload:        {} bytes\n", info.header.payloadSize);
    fmt::print("Checksum:       0x{:016x}\n", info.header.checksum);
    fmt::print("Bits/symbol:    {:.3f}\n", info.bitsPerSymbol());
}

void InfoCommand::printJsonInfo(const FileInfo& info) const {
    fmt::print("{{\n");
    fmt::print("  \"file\": \"{}\",\n", escapeJsonString(info.path));
    fmt::print("  \"size\": {},\n", info.fileSize);
    fmt::print("  \"version\": {{\n");
    fmt::print("    \"major\": {},\n", format::decodeMajorVersion(info.header.version));
    fmt::print("    \"minor\": {}\n", format::decodeMinorVersion(info.header.version));
    fmt::print("  }},\n");
    fmt::print("  \"symbols\": {},\n", info.header.length);
    fmt::print("  \"payload_bytes\": {},\n", info.header.payloadSize);
    fmt::print("  \"checksum\": \"0x{:016x}\",\n", info.header.checksum);
    fmt::print("  \"bits_per_symbol\": {:.3f}\n", info.bitsPerSymbol());
    fmt::print("}}\n");
}

std::string escapeJsonString(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    out += c;
                }
        }
    }
    return out;
}

std::unique_ptr<InfoCommand> createInfoCommand(const std::string& inputPath, bool jsonOutput) {
    InfoOptions opts;
    opts.inputPath = inputPath;
    opts.jsonOutput = jsonOutput;
    return std::make_unique<InfoCommand>(std::move(opts));
}

}  // namespace pdna::commands
