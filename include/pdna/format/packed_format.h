// =============================================================================
// packed-dna - Packed Sequence File Format Definitions
// =============================================================================
// Binary layout of a serialized PackedSequence (.pdna).
//
// File Layout (all integers little-endian):
// +--------+------+------------------------------------------+
// | Offset | Size | Field                                    |
// +--------+------+------------------------------------------+
// |      0 |    8 | Magic bytes                              |
// |      8 |    1 | Version (major:4, minor:4)               |
// |      9 |    3 | Reserved (zero)                          |
// |     12 |    8 | Logical length (symbols)                 |
// |     20 |    8 | Payload size (bytes) = ceil(length / 4)  |
// |     28 |    8 | XXH64 of payload (seed = length)         |
// |     36 |    n | Packed payload                           |
// +--------+------+------------------------------------------+
//
// The logical length is authoritative: the final payload byte may be
// partially used and its padding bits must be zero.
// =============================================================================

#ifndef PDNA_FORMAT_PACKED_FORMAT_H
#define PDNA_FORMAT_PACKED_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

#include "pdna/common/error.h"
#include "pdna/common/types.h"

namespace pdna::format {

// =============================================================================
// Magic and Version
// =============================================================================

/// @brief Magic number bytes.
/// @note Format: 0x89 'P' 'D' 'N' 0x0D 0x0A 0x1A 0x0A
///       - 0x89: High bit set to detect 7-bit transmission corruption
///       - 0x0D 0x0A: CR-LF to detect line ending conversion
///       - 0x1A: Ctrl-Z to stop DOS TYPE command
///       - 0x0A: LF to detect CR-LF to LF conversion
inline constexpr std::array<std::uint8_t, 8> kMagicBytes = {
    0x89, 'P', 'D', 'N', 0x0D, 0x0A, 0x1A, 0x0A
};

/// @brief Current format major version (incompatible changes).
inline constexpr std::uint8_t kFormatVersionMajor = 1;

/// @brief Current format minor version (backward compatible changes).
inline constexpr std::uint8_t kFormatVersionMinor = 0;

/// @brief Encode version as single byte (major:4bit, minor:4bit).
[[nodiscard]] constexpr std::uint8_t encodeVersion(std::uint8_t major, std::uint8_t minor) noexcept {
    return static_cast<std::uint8_t>((major << 4) | (minor & 0x0F));
}

[[nodiscard]] constexpr std::uint8_t decodeMajorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version >> 4);
}

[[nodiscard]] constexpr std::uint8_t decodeMinorVersion(std::uint8_t version) noexcept {
    return static_cast<std::uint8_t>(version & 0x0F);
}

/// @brief Current format version (encoded).
inline constexpr std::uint8_t kCurrentVersion =
    encodeVersion(kFormatVersionMajor, kFormatVersionMinor);

// =============================================================================
// Header Structure
// =============================================================================

/// @brief Decoded file header.
struct PackedHeader {
    /// @brief Serialized header size in bytes.
    static constexpr std::size_t kHeaderSize = 36;

    /// @brief Offsets of the header fields.
    static constexpr std::size_t kVersionOffset = 8;
    static constexpr std::size_t kReservedOffset = 9;
    static constexpr std::size_t kReservedSize = 3;
    static constexpr std::size_t kLengthOffset = 12;
    static constexpr std::size_t kPayloadSizeOffset = 20;
    static constexpr std::size_t kChecksumOffset = 28;

    /// @brief Encoded format version.
    std::uint8_t version = kCurrentVersion;

    /// @brief Logical number of symbols.
    std::uint64_t length = 0;

    /// @brief Packed payload size in bytes.
    std::uint64_t payloadSize = 0;

    /// @brief XXH64 of the payload, seeded with the length.
    std::uint64_t checksum = 0;

    /// @brief Total serialized size (header + payload).
    [[nodiscard]] std::uint64_t totalSize() const noexcept { return kHeaderSize + payloadSize; }

    friend bool operator==(const PackedHeader&, const PackedHeader&) = default;
};

/// @brief Validate header fields that do not depend on the payload.
/// @return kFormatError for an unsupported major version, a length this
///         platform cannot index, or a payload size other than ceil(length / 4).
[[nodiscard]] inline VoidResult validateHeader(const PackedHeader& header) {
    if (decodeMajorVersion(header.version) != kFormatVersionMajor) {
        return makeVoidError(ErrorCode::kFormatError,
                             "Unsupported format version " +
                                 std::to_string(decodeMajorVersion(header.version)) + "." +
                                 std::to_string(decodeMinorVersion(header.version)));
    }
    if constexpr (sizeof(std::size_t) < sizeof(std::uint64_t)) {
        if (header.length > std::numeric_limits<std::size_t>::max()) {
            return makeVoidError(ErrorCode::kFormatError,
                                 "Length " + std::to_string(header.length) +
                                     " exceeds the addressable size");
        }
    }
    if (header.payloadSize != packedByteCount(static_cast<std::size_t>(header.length))) {
        return makeVoidError(ErrorCode::kFormatError,
                             "Payload size " + std::to_string(header.payloadSize) +
                                 " does not match length " + std::to_string(header.length));
    }
    return makeVoidSuccess();
}

}  // namespace pdna::format

#endif  // PDNA_FORMAT_PACKED_FORMAT_H
