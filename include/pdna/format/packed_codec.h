// =============================================================================
// packed-dna - Packed Sequence Codec
// =============================================================================
// Serialization of PackedSequence values to the .pdna binary format.
//
// This module provides:
// - serialize / deserialize: in-memory byte buffers
// - writeToStream / readFromStream: std::iostream based I/O
// - writeFile / readFile: filesystem convenience wrappers
// - parseHeader: header-only inspection (used by `pdna info`)
//
// Decoding validates magic, version, reserved bytes, payload size, XXH64
// checksum and padding bits before a PackedSequence is handed out.
// =============================================================================

#ifndef PDNA_FORMAT_PACKED_CODEC_H
#define PDNA_FORMAT_PACKED_CODEC_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <span>
#include <vector>

#include "pdna/common/error.h"
#include "pdna/core/packed_sequence.h"
#include "pdna/format/packed_format.h"

namespace pdna::format {

/// @brief Compute the record checksum: XXH64 of the payload seeded with the length.
/// @note Seeding with the length makes a corrupted length field fail the check
///       even when it still maps to the same payload size.
[[nodiscard]] std::uint64_t computeChecksum(std::span<const std::uint8_t> payload,
                                            std::uint64_t length) noexcept;

/// @brief Build the header describing a sequence.
[[nodiscard]] PackedHeader makeHeader(const PackedSequence& sequence) noexcept;

/// @brief Serialize a sequence (header followed by payload).
[[nodiscard]] std::vector<std::uint8_t> serialize(const PackedSequence& sequence);

/// @brief Decode and validate a header from the start of a buffer.
/// @return kFormatError for short buffers, bad magic, non-zero reserved
///         bytes, unsupported versions and inconsistent sizes.
[[nodiscard]] Result<PackedHeader> parseHeader(std::span<const std::uint8_t> data);

/// @brief Deserialize a sequence from a buffer holding exactly one record.
/// @return kFormatError for malformed data (including trailing bytes),
///         kChecksumError when the payload checksum does not match.
[[nodiscard]] Result<PackedSequence> deserialize(std::span<const std::uint8_t> data);

/// @brief Write one serialized sequence to a stream.
[[nodiscard]] VoidResult writeToStream(std::ostream& stream, const PackedSequence& sequence);

/// @brief Read one serialized sequence from a stream.
/// @note Reads exactly header + payload bytes; the stream may hold more data.
[[nodiscard]] Result<PackedSequence> readFromStream(std::istream& stream);

/// @brief Write a sequence to a file, replacing any existing content.
[[nodiscard]] VoidResult writeFile(const std::filesystem::path& path,
                                   const PackedSequence& sequence);

/// @brief Read a sequence from a file holding exactly one record.
[[nodiscard]] Result<PackedSequence> readFile(const std::filesystem::path& path);

}  // namespace pdna::format

#endif  // PDNA_FORMAT_PACKED_CODEC_H
