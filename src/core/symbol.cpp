// =============================================================================
// packed-dna - Nucleotide Symbol Implementation
// =============================================================================

#include "pdna/core/symbol.h"

#include <algorithm>
#include <cctype>
#include <ostream>

namespace pdna {

std::string ParseSymbolError::message() const {
    std::string result = "invalid nucleotide symbol '" + unit_ + "'";
    if (position_.has_value()) {
        result += " at position " + std::to_string(*position_);
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const ParseSymbolError& error) {
    return os << error.message();
}

Result<Symbol, ParseSymbolError> parseChar(char c) {
    const std::uint8_t code = charToCode(c);
    if (code == kInvalidSymbolCode) {
        return std::unexpected(ParseSymbolError{c});
    }
    return symbolFromCode(code);
}

Result<Symbol, ParseSymbolError> parseStr(std::string_view token) {
    std::string upper(token);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper.size() != 1 || charToCode(upper.front()) == kInvalidSymbolCode) {
        return std::unexpected(ParseSymbolError{std::move(upper)});
    }
    return symbolFromCode(charToCode(upper.front()));
}

std::ostream& operator<<(std::ostream& os, Symbol symbol) {
    return os << toChar(symbol);
}

}  // namespace pdna
