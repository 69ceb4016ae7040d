// =============================================================================
// packed-dna - Packed Codec Tests
// =============================================================================
// Unit tests for the .pdna binary format: header layout, buffer, stream and
// file I/O, and rejection of malformed or corrupted data.
// =============================================================================

#include "pdna/format/packed_codec.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace pdna::format {
namespace {

[[nodiscard]] PackedSequence sample(std::string_view text) {
    return PackedSequence::fromText(text).value();
}

[[nodiscard]] std::uint64_t readLE64(const std::vector<std::uint8_t>& data, std::size_t offset) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>(data[offset + i]) << (i * 8);
    }
    return value;
}

[[nodiscard]] std::string asString(const std::vector<std::uint8_t>& data) {
    return std::string(data.begin(), data.end());
}

// =============================================================================
// Version Encoding Tests
// =============================================================================

TEST(PackedFormatTest, VersionNibbles) {
    EXPECT_EQ(kCurrentVersion, 0x10);
    EXPECT_EQ(decodeMajorVersion(encodeVersion(3, 7)), 3);
    EXPECT_EQ(decodeMinorVersion(encodeVersion(3, 7)), 7);
}

TEST(PackedFormatTest, ValidateHeaderChecksSizes) {
    PackedHeader header;
    header.length = 9;
    header.payloadSize = 3;
    EXPECT_TRUE(validateHeader(header).has_value());

    header.payloadSize = 2;
    EXPECT_FALSE(validateHeader(header).has_value());

    header.payloadSize = 3;
    header.version = encodeVersion(2, 0);
    auto result = validateHeader(header);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// Serialize Tests
// =============================================================================

TEST(PackedCodecTest, SerializedLayout) {
    const PackedSequence seq = sample("ACGTT");
    const auto data = serialize(seq);

    ASSERT_EQ(data.size(), PackedHeader::kHeaderSize + 2);
    EXPECT_TRUE(std::equal(kMagicBytes.begin(), kMagicBytes.end(), data.begin()));
    EXPECT_EQ(data[PackedHeader::kVersionOffset], kCurrentVersion);
    EXPECT_EQ(data[9], 0);
    EXPECT_EQ(data[10], 0);
    EXPECT_EQ(data[11], 0);
    EXPECT_EQ(readLE64(data, PackedHeader::kLengthOffset), 5);
    EXPECT_EQ(readLE64(data, PackedHeader::kPayloadSizeOffset), 2);
    EXPECT_EQ(readLE64(data, PackedHeader::kChecksumOffset),
              computeChecksum(seq.packedBytes(), seq.size()));
    EXPECT_EQ(data[36], 0b1110'0100);
    EXPECT_EQ(data[37], 0b0000'0011);
}

TEST(PackedCodecTest, MakeHeaderDescribesSequence) {
    const PackedSequence seq = sample("GATTACA");
    const PackedHeader header = makeHeader(seq);
    EXPECT_EQ(header.version, kCurrentVersion);
    EXPECT_EQ(header.length, 7);
    EXPECT_EQ(header.payloadSize, 2);
    EXPECT_EQ(header.checksum, computeChecksum(seq.packedBytes(), seq.size()));
    EXPECT_EQ(header.totalSize(), 38);
}

TEST(PackedCodecTest, BufferRoundTrip) {
    for (const char* text : {"", "A", "ACG", "ACGT", "GATTACAGATTACA"}) {
        const PackedSequence seq = sample(text);
        auto restored = deserialize(serialize(seq));
        ASSERT_TRUE(restored.has_value()) << text;
        EXPECT_EQ(*restored, seq) << text;
    }
}

TEST(PackedCodecTest, ParseHeaderOnly) {
    const PackedSequence seq = sample("TTTTGGGGCC");
    const auto data = serialize(seq);

    auto header = parseHeader(data);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(*header, makeHeader(seq));
}

// =============================================================================
// Malformed Data Tests
// =============================================================================

TEST(PackedCodecTest, RejectsTruncatedHeader) {
    auto data = serialize(sample("ACGT"));
    data.resize(PackedHeader::kHeaderSize - 1);

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsTruncatedPayload) {
    auto data = serialize(sample("ACGTACGTA"));
    data.pop_back();

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsTrailingBytes) {
    auto data = serialize(sample("ACGT"));
    data.push_back(0);

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsBadMagic) {
    auto data = serialize(sample("ACGT"));
    data[1] = 'X';

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsUnsupportedVersion) {
    auto data = serialize(sample("ACGT"));
    data[PackedHeader::kVersionOffset] = encodeVersion(kFormatVersionMajor + 1, 0);

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, AcceptsNewerMinorVersion) {
    auto data = serialize(sample("ACGT"));
    data[PackedHeader::kVersionOffset] = encodeVersion(kFormatVersionMajor, 5);
    EXPECT_TRUE(deserialize(data).has_value());
}

TEST(PackedCodecTest, RejectsNonZeroReservedBytes) {
    auto data = serialize(sample("ACGT"));
    data[PackedHeader::kReservedOffset + 1] = 1;

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsInconsistentPayloadSize) {
    auto data = serialize(sample("ACGTA"));
    // Claim a length of 9, which needs three payload bytes instead of two.
    data[PackedHeader::kLengthOffset] = 9;

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

TEST(PackedFormatTest, ValidateHeaderAtMaximumLength) {
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    PackedHeader header;
    header.length = kMax;
    header.payloadSize = 0;
    EXPECT_FALSE(validateHeader(header).has_value());

    header.payloadSize = kMax / 4;
    EXPECT_FALSE(validateHeader(header).has_value());

    header.payloadSize = kMax / 4 + 1;
    EXPECT_TRUE(validateHeader(header).has_value());
}

TEST(PackedCodecTest, RejectsMaximumLengthWithEmptyPayload) {
    // A well-formed empty record whose length field claims UINT64_MAX symbols,
    // with a checksum that matches the claimed length.
    auto data = serialize(sample(""));
    const std::uint64_t length = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t checksum = computeChecksum({}, length);
    for (std::size_t i = 0; i < 8; ++i) {
        data[PackedHeader::kLengthOffset + i] = static_cast<std::uint8_t>(length >> (i * 8));
        data[PackedHeader::kChecksumOffset + i] = static_cast<std::uint8_t>(checksum >> (i * 8));
    }

    EXPECT_FALSE(parseHeader(data).has_value());

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);

    std::istringstream stream(asString(data), std::ios::binary);
    auto streamed = readFromStream(stream);
    ASSERT_FALSE(streamed.has_value());
    EXPECT_EQ(streamed.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, RejectsMaximumLengthWithTruncatedPayload) {
    // Sizes agree with each other but the payload bytes are missing.
    auto data = serialize(sample(""));
    const std::uint64_t length = std::numeric_limits<std::uint64_t>::max();
    const std::uint64_t payloadSize = length / 4 + 1;
    for (std::size_t i = 0; i < 8; ++i) {
        data[PackedHeader::kLengthOffset + i] = static_cast<std::uint8_t>(length >> (i * 8));
        data[PackedHeader::kPayloadSizeOffset + i] =
            static_cast<std::uint8_t>(payloadSize >> (i * 8));
    }

    ASSERT_TRUE(parseHeader(data).has_value());

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);

    std::istringstream stream(asString(data), std::ios::binary);
    auto streamed = readFromStream(stream);
    ASSERT_FALSE(streamed.has_value());
    EXPECT_EQ(streamed.error().code(), ErrorCode::kFormatError);
}

TEST(PackedCodecTest, DetectsLengthCorruptionWithinSamePayloadSize) {
    // Lengths 5 and 6 both need two payload bytes.
    auto data = serialize(sample("ACGTA"));
    data[PackedHeader::kLengthOffset] = 6;

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChecksumError);
}

TEST(PackedCodecTest, DetectsPayloadCorruption) {
    auto data = serialize(sample("ACGTACGT"));
    data[PackedHeader::kHeaderSize] ^= 0x01;

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kChecksumError);
}

TEST(PackedCodecTest, RejectsPaddingBitsEvenWithMatchingChecksum) {
    // Length 5: the second payload byte only uses its two low bits.
    const PackedSequence seq = sample("ACGTA");
    std::vector<std::uint8_t> payload(seq.packedBytes().begin(), seq.packedBytes().end());
    payload[1] |= 0b1000'0000;

    auto data = serialize(seq);
    std::copy(payload.begin(), payload.end(), data.begin() + PackedHeader::kHeaderSize);
    const std::uint64_t checksum = computeChecksum(payload, seq.size());
    for (std::size_t i = 0; i < 8; ++i) {
        data[PackedHeader::kChecksumOffset + i] = static_cast<std::uint8_t>(checksum >> (i * 8));
    }

    auto result = deserialize(data);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// Stream Tests
// =============================================================================

TEST(PackedCodecTest, StreamRoundTrip) {
    const PackedSequence first = sample("ACGTACGTAC");
    const PackedSequence second = sample("TTG");

    std::stringstream stream(std::ios::in | std::ios::out | std::ios::binary);
    ASSERT_TRUE(writeToStream(stream, first).has_value());
    ASSERT_TRUE(writeToStream(stream, second).has_value());

    auto readFirst = readFromStream(stream);
    ASSERT_TRUE(readFirst.has_value());
    EXPECT_EQ(*readFirst, first);

    auto readSecond = readFromStream(stream);
    ASSERT_TRUE(readSecond.has_value());
    EXPECT_EQ(*readSecond, second);
}

TEST(PackedCodecTest, StreamWriteMatchesSerialize) {
    const PackedSequence seq = sample("CCGGAATT");
    std::ostringstream stream(std::ios::binary);
    ASSERT_TRUE(writeToStream(stream, seq).has_value());
    EXPECT_EQ(stream.str(), asString(serialize(seq)));
}

TEST(PackedCodecTest, StreamReadReportsTruncation) {
    auto data = serialize(sample("ACGTACGTACGT"));
    data.resize(data.size() - 1);

    std::istringstream stream(asString(data), std::ios::binary);
    auto result = readFromStream(stream);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

// =============================================================================
// File Tests
// =============================================================================

class PackedCodecFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("pdna_codec_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
};

TEST_F(PackedCodecFileTest, FileRoundTrip) {
    const PackedSequence seq = sample("gattacaGATTACA");
    const auto path = dir_ / "seq.pdna";

    ASSERT_TRUE(writeFile(path, seq).has_value());
    EXPECT_EQ(std::filesystem::file_size(path), serialize(seq).size());

    auto restored = readFile(path);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, seq);
}

TEST_F(PackedCodecFileTest, WriteReplacesExistingContent) {
    const auto path = dir_ / "seq.pdna";
    ASSERT_TRUE(writeFile(path, sample("ACGTACGTACGTACGT")).has_value());
    ASSERT_TRUE(writeFile(path, sample("A")).has_value());

    auto restored = readFile(path);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->toText(), "A");
}

TEST_F(PackedCodecFileTest, MissingFileIsIOError) {
    auto result = readFile(dir_ / "missing.pdna");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

TEST_F(PackedCodecFileTest, UnwritablePathIsIOError) {
    auto result = writeFile(dir_ / "no_such_dir" / "seq.pdna", sample("ACGT"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kIOError);
}

TEST_F(PackedCodecFileTest, TextFileIsFormatError) {
    const auto path = dir_ / "plain.txt";
    {
        std::ofstream out(path);
        out << "ACGTACGTACGTACGTACGTACGTACGTACGTACGTACGTACGT\n";
    }

    auto result = readFile(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::kFormatError);
}

}  // namespace
}  // namespace pdna::format
