// =============================================================================
// packed-dna - Packed Nucleotide Sequence
// =============================================================================
// Immutable container storing an ordered run of Symbols at 2 bits each.
//
// This module provides:
// - PackedSequence::fromText: fail-fast, case-insensitive text construction
// - PackedSequence::fromSymbols: infallible construction from typed symbols
// - O(1) checked random access (get / operator[] / tryGet)
// - Text reconstruction, forward iteration, equality and hashing
//
// State:
// - bytes_:  ceil(length_ / 4) bytes, four 2-bit codes per byte
// - length_: logical number of symbols (authoritative; the final byte may
//            be partially used)
//
// Invariants:
// - bytes_.size() == packedByteCount(length_)
// - Padding bits of the final byte are zero, so two sequences are equal
//   exactly when their lengths and bytes are equal
// - No member function modifies an existing instance
//
// Thread Safety:
// - Instances may be read concurrently without synchronization.
// =============================================================================

#ifndef PDNA_CORE_PACKED_SEQUENCE_H
#define PDNA_CORE_PACKED_SEQUENCE_H

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pdna/common/error.h"
#include "pdna/common/types.h"
#include "pdna/core/symbol.h"

namespace pdna {

/// @brief An immutable nucleotide sequence packed at 2 bits per symbol.
///
/// Usage:
/// @code
/// auto parsed = PackedSequence::fromText("acgtA");
/// if (!parsed) {
///     std::cerr << parsed.error() << '\n';  // invalid nucleotide symbol ...
/// }
/// Symbol s = parsed->get(2);                // Symbol::kG
/// std::string text = parsed->toText();      // "ACGTA"
///
/// auto typed = PackedSequence::fromSymbols({Symbol::kA, Symbol::kT});
/// @endcode
class PackedSequence {
public:
    // =========================================================================
    // Iteration
    // =========================================================================

    /// @brief Read-only iterator yielding decoded symbols by value.
    class const_iterator {
    public:
        using iterator_concept = std::forward_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = Symbol;
        using difference_type = std::ptrdiff_t;
        using reference = Symbol;

        const_iterator() = default;

        [[nodiscard]] Symbol operator*() const noexcept { return owner_->decodeAt(index_); }

        const_iterator& operator++() noexcept {
            ++index_;
            return *this;
        }

        const_iterator operator++(int) noexcept {
            const_iterator previous = *this;
            ++index_;
            return previous;
        }

        friend bool operator==(const const_iterator& lhs, const const_iterator& rhs) noexcept {
            return lhs.owner_ == rhs.owner_ && lhs.index_ == rhs.index_;
        }

    private:
        friend class PackedSequence;

        const_iterator(const PackedSequence* owner, std::size_t index) noexcept
            : owner_(owner), index_(index) {}

        const PackedSequence* owner_ = nullptr;
        std::size_t index_ = 0;
    };

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Construct an empty sequence.
    PackedSequence() = default;

    /// @brief Parse text into a packed sequence.
    ///
    /// Characters are parsed left to right (case-insensitive). Parsing stops
    /// at the first character outside AaCcGgTt; the returned error names
    /// that character and its position. If the character is a multi-byte
    /// UTF-8 sequence, the whole encoded character is reported.
    ///
    /// @param text Input text. Empty text yields an empty sequence.
    /// @return The packed sequence, or the first parse error.
    [[nodiscard]] static Result<PackedSequence, ParseSymbolError> fromText(std::string_view text);

    /// @brief Pack every symbol produced by an iterator range.
    /// @note Consumes the whole range before returning; never fails.
    template <std::input_iterator It, std::sentinel_for<It> S>
        requires SymbolValue<std::iter_reference_t<It>>
    [[nodiscard]] static PackedSequence fromSymbols(It first, S last) {
        std::vector<std::uint8_t> bytes;
        if constexpr (std::sized_sentinel_for<S, It>) {
            bytes.reserve(packedByteCount(static_cast<std::size_t>(last - first)));
        }

        std::size_t length = 0;
        for (; first != last; ++first) {
            const Symbol symbol = *first;
            appendCode(bytes, length++, toCode(symbol));
        }
        return PackedSequence(std::move(bytes), length);
    }

    /// @brief Pack every symbol of an input range (possibly a lazy view).
    template <std::ranges::input_range R>
        requires SymbolValue<std::ranges::range_reference_t<R>>
    [[nodiscard]] static PackedSequence fromSymbols(R&& symbols) {
        return fromSymbols(std::ranges::begin(symbols), std::ranges::end(symbols));
    }

    /// @brief Pack a braced list of symbols.
    [[nodiscard]] static PackedSequence fromSymbols(std::initializer_list<Symbol> symbols) {
        return fromSymbols(symbols.begin(), symbols.end());
    }

    /// @brief Rebuild a sequence from its serialized fields.
    /// @param bytes Packed bytes as returned by packedBytes().
    /// @param length Logical length stored alongside the bytes.
    /// @return kFormatError if the byte count does not match the length or
    ///         a padding bit is set.
    [[nodiscard]] static Result<PackedSequence> fromPacked(std::vector<std::uint8_t> bytes,
                                                           std::size_t length);

    // =========================================================================
    // Access
    // =========================================================================

    /// @brief Number of symbols in the sequence.
    [[nodiscard]] std::size_t size() const noexcept { return length_; }

    /// @brief Check whether the sequence holds no symbols.
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    /// @brief Size of the packed buffer in bytes (always packedByteCount(size())).
    [[nodiscard]] std::size_t byteCount() const noexcept { return bytes_.size(); }

    /// @brief Decode the symbol at @p index.
    /// @throws OutOfRangeError if index >= size().
    [[nodiscard]] Symbol get(std::size_t index) const;

    /// @brief Same as get().
    [[nodiscard]] Symbol operator[](std::size_t index) const { return get(index); }

    /// @brief Decode the symbol at @p index, reporting bad indices as an error value.
    /// @return The symbol, or an Error with code kOutOfRange.
    [[nodiscard]] Result<Symbol> tryGet(std::size_t index) const;

    /// @brief Reconstruct the sequence as uppercase text.
    [[nodiscard]] std::string toText() const;

    [[nodiscard]] const_iterator begin() const noexcept { return const_iterator(this, 0); }
    [[nodiscard]] const_iterator end() const noexcept { return const_iterator(this, length_); }

    /// @brief Read-only view of the packed bytes, for serialization only.
    /// @note The byte layout is an implementation detail; store it together
    ///       with size() and rebuild with fromPacked().
    [[nodiscard]] std::span<const std::uint8_t> packedBytes() const noexcept { return bytes_; }

    /// @brief XXH64 of the packed bytes seeded with the length.
    [[nodiscard]] std::uint64_t hash() const noexcept;

    friend bool operator==(const PackedSequence&, const PackedSequence&) = default;

private:
    PackedSequence(std::vector<std::uint8_t> bytes, std::size_t length) noexcept
        : bytes_(std::move(bytes)), length_(length) {}

    /// @brief Write @p code into slot @p index, opening a new zeroed byte when needed.
    static void appendCode(std::vector<std::uint8_t>& bytes, std::size_t index,
                           std::uint8_t code) {
        if (bitOffsetOf(index) == 0) {
            bytes.push_back(0);
        }
        bytes.back() |= static_cast<std::uint8_t>(code << bitOffsetOf(index));
    }

    /// @brief Unchecked decode; callers guarantee index < length_.
    [[nodiscard]] Symbol decodeAt(std::size_t index) const noexcept {
        return symbolFromCode(
            static_cast<std::uint8_t>(bytes_[byteIndexOf(index)] >> bitOffsetOf(index)));
    }

    std::vector<std::uint8_t> bytes_;
    std::size_t length_ = 0;
};

/// @brief Write the sequence as uppercase text.
std::ostream& operator<<(std::ostream& os, const PackedSequence& sequence);

}  // namespace pdna

template <>
struct std::hash<pdna::PackedSequence> {
    std::size_t operator()(const pdna::PackedSequence& sequence) const noexcept {
        return static_cast<std::size_t>(sequence.hash());
    }
};

#endif  // PDNA_CORE_PACKED_SEQUENCE_H
