// =============================================================================
// packed-dna - Nucleotide Symbol
// =============================================================================
// The four-valued nucleotide alphabet and its text parsing rules.
//
// This module provides:
// - Symbol: closed enumeration of A, C, G, T with fixed 2-bit codes
// - ParseSymbolError: the single malformed-input error of the library
// - parseChar / parseStr: case-insensitive, fail-fast classification
// - Code and character conversions shared with PackedSequence
//
// Code table:
//   A (Adenine)  = 0
//   C (Cytosine) = 1
//   G (Guanine)  = 2
//   T (Thymine)  = 3
// =============================================================================

#ifndef PDNA_CORE_SYMBOL_H
#define PDNA_CORE_SYMBOL_H

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

#include "pdna/common/error.h"
#include "pdna/common/types.h"

namespace pdna {

// =============================================================================
// Symbol Enumeration
// =============================================================================

/// @brief A nucleotide base.
/// @note The underlying value is the symbol's 2-bit packing code.
enum class Symbol : std::uint8_t {
    /// @brief Adenine.
    kA = 0,
    /// @brief Cytosine.
    kC = 1,
    /// @brief Guanine.
    kG = 2,
    /// @brief Thymine.
    kT = 3
};

/// @brief Number of symbols in the alphabet.
inline constexpr std::size_t kAlphabetSize = 4;

/// @brief All symbols in code order.
inline constexpr std::array<Symbol, kAlphabetSize> kAllSymbols = {
    Symbol::kA, Symbol::kC, Symbol::kG, Symbol::kT
};

/// @brief Marker returned by charToCode() for characters outside the alphabet.
inline constexpr std::uint8_t kInvalidSymbolCode = 0xFF;

/// @brief Concept for values accepted wherever a Symbol is expected.
template <typename T>
concept SymbolValue = std::convertible_to<T, Symbol>;

// =============================================================================
// Code and Character Conversions
// =============================================================================

/// @brief Get the 2-bit code of a symbol.
[[nodiscard]] constexpr std::uint8_t toCode(Symbol symbol) noexcept {
    return static_cast<std::uint8_t>(symbol);
}

/// @brief Get the symbol for a 2-bit code.
/// @note Only the two low bits of @p code are read, so every input maps to a symbol.
[[nodiscard]] constexpr Symbol symbolFromCode(std::uint8_t code) noexcept {
    return static_cast<Symbol>(code & kSymbolMask);
}

/// @brief Get the canonical (uppercase) character of a symbol.
[[nodiscard]] constexpr char toChar(Symbol symbol) noexcept {
    constexpr char kCodeToChar[kAlphabetSize] = {'A', 'C', 'G', 'T'};
    return kCodeToChar[toCode(symbol)];
}

/// @brief Get the full base name of a symbol.
[[nodiscard]] constexpr std::string_view symbolName(Symbol symbol) noexcept {
    switch (symbol) {
        case Symbol::kA:
            return "Adenine";
        case Symbol::kC:
            return "Cytosine";
        case Symbol::kG:
            return "Guanine";
        case Symbol::kT:
            return "Thymine";
    }
    return "unknown";
}

namespace detail {

/// @brief Character to code lookup table (A/a=0, C/c=1, G/g=2, T/t=3, else invalid).
inline constexpr std::array<std::uint8_t, 256> kCharToCode = [] {
    std::array<std::uint8_t, 256> table{};
    table.fill(kInvalidSymbolCode);
    table['A'] = 0;
    table['a'] = 0;
    table['C'] = 1;
    table['c'] = 1;
    table['G'] = 2;
    table['g'] = 2;
    table['T'] = 3;
    table['t'] = 3;
    return table;
}();

}  // namespace detail

/// @brief Look up the code of a character.
/// @return The symbol code, or kInvalidSymbolCode if @p c is not in AaCcGgTt.
[[nodiscard]] constexpr std::uint8_t charToCode(char c) noexcept {
    return detail::kCharToCode[static_cast<unsigned char>(c)];
}

static_assert(charToCode('g') == toCode(Symbol::kG));
static_assert(charToCode('N') == kInvalidSymbolCode);
static_assert(symbolFromCode(toCode(Symbol::kT)) == Symbol::kT);

// =============================================================================
// ParseSymbolError
// =============================================================================

/// @brief Error raised when text cannot be parsed as a nucleotide symbol.
///
/// Carries the offending input unit (a character or a string token) and,
/// when the failure comes from parsing a whole sequence, the zero-based
/// position of that unit in the source text.
class ParseSymbolError {
public:
    /// @brief Construct from an offending character.
    explicit ParseSymbolError(char unit, std::optional<std::size_t> position = std::nullopt)
        : unit_(1, unit), position_(position) {}

    /// @brief Construct from an offending string token.
    explicit ParseSymbolError(std::string unit,
                              std::optional<std::size_t> position = std::nullopt)
        : unit_(std::move(unit)), position_(position) {}

    /// @brief The offending input unit, exactly as it is reported.
    [[nodiscard]] std::string_view unit() const noexcept { return unit_; }

    /// @brief Position of the unit in the parsed text, if known.
    [[nodiscard]] std::optional<std::size_t> position() const noexcept { return position_; }

    /// @brief Human-readable message naming the offending unit.
    [[nodiscard]] std::string message() const;

    /// @brief Convert to the generic Error (code kInvalidSymbol).
    [[nodiscard]] Error toError() const { return Error{ErrorCode::kInvalidSymbol, message()}; }

    friend bool operator==(const ParseSymbolError&, const ParseSymbolError&) = default;

private:
    std::string unit_;
    std::optional<std::size_t> position_;
};

std::ostream& operator<<(std::ostream& os, const ParseSymbolError& error);

// =============================================================================
// Parsing
// =============================================================================

/// @brief Parse one character as a symbol (case-insensitive).
/// @return The symbol, or a ParseSymbolError carrying @p c unchanged.
[[nodiscard]] Result<Symbol, ParseSymbolError> parseChar(char c);

/// @brief Parse a one-letter string token as a symbol (case-insensitive).
/// @return The symbol, or a ParseSymbolError carrying @p token in uppercase.
[[nodiscard]] Result<Symbol, ParseSymbolError> parseStr(std::string_view token);

/// @brief Write the canonical character of a symbol.
std::ostream& operator<<(std::ostream& os, Symbol symbol);

}  // namespace pdna

#endif  // PDNA_CORE_SYMBOL_H
