// =============================================================================
// packed-dna - Packed Sequence Codec Implementation
// =============================================================================

#include "pdna/format/packed_codec.h"

#include <algorithm>
#include <fstream>
#include <istream>
#include <ostream>

#include <fmt/format.h>
#include <xxhash.h>

namespace pdna::format {

namespace {

/// @brief Payload bytes read from a stream per step.
constexpr std::size_t kStreamChunkSize = 1 << 20;

void writeU64(std::vector<std::uint8_t>& out, std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

std::uint64_t readU64(const std::uint8_t* ptr) noexcept {
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(ptr[i]) << (i * 8);
    }
    return value;
}

std::vector<std::uint8_t> encodeHeader(const PackedHeader& header) {
    std::vector<std::uint8_t> out;
    out.reserve(PackedHeader::kHeaderSize);
    out.insert(out.end(), kMagicBytes.begin(), kMagicBytes.end());
    out.push_back(header.version);
    out.insert(out.end(), PackedHeader::kReservedSize, 0);
    writeU64(out, header.length);
    writeU64(out, header.payloadSize);
    writeU64(out, header.checksum);
    return out;
}

/// @brief Verify the checksum and padding of a payload and wrap it.
Result<PackedSequence> decodePayload(const PackedHeader& header,
                                     std::vector<std::uint8_t> payload) {
    const std::uint64_t actual = computeChecksum(payload, header.length);
    if (actual != header.checksum) {
        return makeError<PackedSequence>(
            ErrorCode::kChecksumError,
            ChecksumError::formatChecksumMismatch(header.checksum, actual));
    }
    return PackedSequence::fromPacked(std::move(payload),
                                      static_cast<std::size_t>(header.length));
}

}  // namespace

// =============================================================================
// Header Encoding
// =============================================================================

std::uint64_t computeChecksum(std::span<const std::uint8_t> payload,
                              std::uint64_t length) noexcept {
    return XXH64(payload.data(), payload.size(), length);
}

PackedHeader makeHeader(const PackedSequence& sequence) noexcept {
    PackedHeader header;
    header.version = kCurrentVersion;
    header.length = sequence.size();
    header.payloadSize = sequence.byteCount();
    header.checksum = computeChecksum(sequence.packedBytes(), sequence.size());
    return header;
}

std::vector<std::uint8_t> serialize(const PackedSequence& sequence) {
    std::vector<std::uint8_t> out = encodeHeader(makeHeader(sequence));
    const auto payload = sequence.packedBytes();
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Result<PackedHeader> parseHeader(std::span<const std::uint8_t> data) {
    if (data.size() < PackedHeader::kHeaderSize) {
        return makeError<PackedHeader>(
            ErrorCode::kFormatError,
            fmt::format("Data too small for header: {} bytes, need {}", data.size(),
                        PackedHeader::kHeaderSize));
    }

    if (!std::equal(kMagicBytes.begin(), kMagicBytes.end(), data.begin())) {
        return makeError<PackedHeader>(ErrorCode::kFormatError, "Invalid magic header");
    }

    const auto reserved = data.subspan(PackedHeader::kReservedOffset, PackedHeader::kReservedSize);
    if (std::any_of(reserved.begin(), reserved.end(), [](std::uint8_t b) { return b != 0; })) {
        return makeError<PackedHeader>(ErrorCode::kFormatError, "Reserved header bytes are not zero");
    }

    PackedHeader header;
    header.version = data[PackedHeader::kVersionOffset];
    header.length = readU64(data.data() + PackedHeader::kLengthOffset);
    header.payloadSize = readU64(data.data() + PackedHeader::kPayloadSizeOffset);
    header.checksum = readU64(data.data() + PackedHeader::kChecksumOffset);

    if (auto validation = validateHeader(header); !validation) {
        return makeError<PackedHeader>(validation.error());
    }
    return header;
}

// =============================================================================
// Buffer Codec
// =============================================================================

Result<PackedSequence> deserialize(std::span<const std::uint8_t> data) {
    auto header = parseHeader(data);
    if (!header) {
        return makeError<PackedSequence>(header.error());
    }

    const std::uint64_t available = data.size() - PackedHeader::kHeaderSize;
    if (available != header->payloadSize) {
        return makeError<PackedSequence>(
            ErrorCode::kFormatError,
            fmt::format("Payload size mismatch: header says {} bytes, found {}",
                        header->payloadSize, available));
    }

    const auto payload = data.subspan(PackedHeader::kHeaderSize);
    return decodePayload(*header, std::vector<std::uint8_t>(payload.begin(), payload.end()));
}

// =============================================================================
// Stream Codec
// =============================================================================

VoidResult writeToStream(std::ostream& stream, const PackedSequence& sequence) {
    const std::vector<std::uint8_t> bytes = serialize(sequence);
    stream.write(reinterpret_cast<const char*>(bytes.data()),
                 static_cast<std::streamsize>(bytes.size()));
    if (!stream) {
        return makeVoidError(ErrorCode::kIOError, "Failed to write packed sequence");
    }
    return makeVoidSuccess();
}

Result<PackedSequence> readFromStream(std::istream& stream) {
    std::vector<std::uint8_t> headerBytes(PackedHeader::kHeaderSize);
    stream.read(reinterpret_cast<char*>(headerBytes.data()),
                static_cast<std::streamsize>(headerBytes.size()));
    if (static_cast<std::size_t>(stream.gcount()) != headerBytes.size()) {
        return makeError<PackedSequence>(
            ErrorCode::kFormatError,
            fmt::format("Truncated header: read {} of {} bytes", stream.gcount(),
                        PackedHeader::kHeaderSize));
    }

    auto header = parseHeader(headerBytes);
    if (!header) {
        return makeError<PackedSequence>(header.error());
    }

    // Grow the payload chunk by chunk so a corrupt size field cannot force
    // one huge allocation before the stream runs dry.
    std::vector<std::uint8_t> payload;
    while (payload.size() < header->payloadSize) {
        const std::size_t step = static_cast<std::size_t>(
            std::min<std::uint64_t>(kStreamChunkSize, header->payloadSize - payload.size()));
        const std::size_t offset = payload.size();
        payload.resize(offset + step);
        stream.read(reinterpret_cast<char*>(payload.data() + offset),
                    static_cast<std::streamsize>(step));
        if (static_cast<std::size_t>(stream.gcount()) != step) {
            return makeError<PackedSequence>(
                ErrorCode::kFormatError,
                fmt::format("Truncated payload: read {} of {} bytes",
                            offset + static_cast<std::size_t>(stream.gcount()),
                            header->payloadSize));
        }
    }

    return decodePayload(*header, std::move(payload));
}

// =============================================================================
// File Codec
// =============================================================================

VoidResult writeFile(const std::filesystem::path& path, const PackedSequence& sequence) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to open output file: {}", path.string()));
    }

    if (auto written = writeToStream(file, sequence); !written) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to write {}: {}", path.string(),
                                         written.error().message()));
    }

    file.close();
    if (!file) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("Failed to close output file: {}", path.string()));
    }
    return makeVoidSuccess();
}

Result<PackedSequence> readFile(const std::filesystem::path& path) {
    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return makeError<PackedSequence>(
            ErrorCode::kIOError,
            fmt::format("Failed to stat {}: {}", path.string(), ec.message()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return makeError<PackedSequence>(
            ErrorCode::kIOError, fmt::format("Failed to open input file: {}", path.string()));
    }

    std::vector<std::uint8_t> data(static_cast<std::size_t>(fileSize));
    file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (static_cast<std::uintmax_t>(file.gcount()) != fileSize) {
        return makeError<PackedSequence>(
            ErrorCode::kIOError, fmt::format("Failed to read input file: {}", path.string()));
    }

    auto sequence = deserialize(data);
    if (!sequence) {
        return makeError<PackedSequence>(
            sequence.error().code(),
            fmt::format("{}: {}", path.string(), sequence.error().message()));
    }
    return sequence;
}

}  // namespace pdna::format
