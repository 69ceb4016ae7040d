// =============================================================================
// packed-dna - Common Type Definitions
// =============================================================================
// Constants shared by the packed sequence container and its file format.
//
// Packing layout:
// - Each symbol occupies kBitsPerSymbol (2) bits.
// - Each byte holds kSymbolsPerByte (4) symbols.
// - Symbol i lives in byte i / 4 at bit offset (i % 4) * 2, so the first
//   symbol of a byte sits in its two least-significant bits.
// =============================================================================

#ifndef PDNA_COMMON_TYPES_H
#define PDNA_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>

namespace pdna {

// =============================================================================
// Packing Constants
// =============================================================================

/// @brief Bits used to store one symbol.
inline constexpr std::size_t kBitsPerSymbol = 2;

/// @brief Symbols stored in one byte.
inline constexpr std::size_t kSymbolsPerByte = 8 / kBitsPerSymbol;

/// @brief Mask selecting one symbol code from a shifted byte.
inline constexpr std::uint8_t kSymbolMask = 0b11;

/// @brief Number of bytes needed to pack a given number of symbols.
/// @note Exact for every length, including those within 3 of SIZE_MAX.
[[nodiscard]] constexpr std::size_t packedByteCount(std::size_t length) noexcept {
    return length / kSymbolsPerByte + (length % kSymbolsPerByte != 0 ? 1 : 0);
}

/// @brief Byte holding the symbol at a given index.
[[nodiscard]] constexpr std::size_t byteIndexOf(std::size_t index) noexcept {
    return index / kSymbolsPerByte;
}

/// @brief Bit offset of the symbol at a given index within its byte.
[[nodiscard]] constexpr unsigned bitOffsetOf(std::size_t index) noexcept {
    return static_cast<unsigned>((index % kSymbolsPerByte) * kBitsPerSymbol);
}

/// @brief Mask of the bits in the final byte that carry symbols.
/// @param length Logical sequence length.
/// @return 0xFF when the final byte is full (or there is none).
[[nodiscard]] constexpr std::uint8_t usedBitsMask(std::size_t length) noexcept {
    const std::size_t used = length % kSymbolsPerByte;
    if (used == 0) {
        return 0xFF;
    }
    return static_cast<std::uint8_t>((1u << (used * kBitsPerSymbol)) - 1u);
}

static_assert(packedByteCount(0) == 0);
static_assert(packedByteCount(1) == 1);
static_assert(packedByteCount(4) == 1);
static_assert(packedByteCount(5) == 2);
static_assert(packedByteCount(SIZE_MAX) == SIZE_MAX / 4 + 1);
static_assert(usedBitsMask(1) == 0b0000'0011);
static_assert(usedBitsMask(3) == 0b0011'1111);
static_assert(usedBitsMask(4) == 0xFF);

}  // namespace pdna

#endif  // PDNA_COMMON_TYPES_H
