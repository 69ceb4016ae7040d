// =============================================================================
// packed-dna - Packed Nucleotide Sequence Implementation
// =============================================================================

#include "pdna/core/packed_sequence.h"

#include <ostream>

#include <xxhash.h>

namespace pdna {

namespace {

/// @brief Length of the UTF-8 sequence introduced by a lead byte.
/// @return 1 for ASCII, stray continuation bytes and invalid lead bytes.
std::size_t utf8SequenceLength(unsigned char lead) noexcept {
    if ((lead & 0xE0) == 0xC0) {
        return 2;
    }
    if ((lead & 0xF0) == 0xE0) {
        return 3;
    }
    if ((lead & 0xF8) == 0xF0) {
        return 4;
    }
    return 1;
}

/// @brief Extract the character starting at @p pos for error reporting.
/// @note Stops early at the end of input or at a byte that is not a
///       continuation byte, so malformed UTF-8 is reported byte by byte.
std::string offendingUnit(std::string_view text, std::size_t pos) {
    const std::size_t expected = utf8SequenceLength(static_cast<unsigned char>(text[pos]));
    std::size_t end = pos + 1;
    while (end < text.size() && end - pos < expected &&
           (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
        ++end;
    }
    return std::string(text.substr(pos, end - pos));
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

Result<PackedSequence, ParseSymbolError> PackedSequence::fromText(std::string_view text) {
    std::vector<std::uint8_t> bytes;
    bytes.reserve(packedByteCount(text.size()));

    for (std::size_t i = 0; i < text.size(); ++i) {
        const std::uint8_t code = charToCode(text[i]);
        if (code == kInvalidSymbolCode) {
            return std::unexpected(ParseSymbolError{offendingUnit(text, i), i});
        }
        appendCode(bytes, i, code);
    }
    return PackedSequence(std::move(bytes), text.size());
}

Result<PackedSequence> PackedSequence::fromPacked(std::vector<std::uint8_t> bytes,
                                                  std::size_t length) {
    if (bytes.size() != packedByteCount(length)) {
        return makeError<PackedSequence>(
            ErrorCode::kFormatError,
            "Packed size mismatch: " + std::to_string(length) + " symbols need " +
                std::to_string(packedByteCount(length)) + " bytes, got " +
                std::to_string(bytes.size()));
    }

    if (!bytes.empty() && (bytes.back() & ~usedBitsMask(length)) != 0) {
        return makeError<PackedSequence>(ErrorCode::kFormatError,
                                         "Padding bits of the final packed byte are not zero");
    }

    return PackedSequence(std::move(bytes), length);
}

// =============================================================================
// Access
// =============================================================================

Symbol PackedSequence::get(std::size_t index) const {
    if (index >= length_) {
        throw OutOfRangeError(index, length_);
    }
    return decodeAt(index);
}

Result<Symbol> PackedSequence::tryGet(std::size_t index) const {
    if (index >= length_) {
        return makeError<Symbol>(ErrorCode::kOutOfRange,
                                 OutOfRangeError::formatOutOfRange(index, length_));
    }
    return decodeAt(index);
}

std::string PackedSequence::toText() const {
    std::string text;
    text.reserve(length_);
    for (std::size_t i = 0; i < length_; ++i) {
        text.push_back(toChar(decodeAt(i)));
    }
    return text;
}

std::uint64_t PackedSequence::hash() const noexcept {
    return XXH64(bytes_.data(), bytes_.size(), static_cast<XXH64_hash_t>(length_));
}

std::ostream& operator<<(std::ostream& os, const PackedSequence& sequence) {
    return os << sequence.toText();
}

}  // namespace pdna
