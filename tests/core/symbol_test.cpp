// =============================================================================
// packed-dna - Symbol Tests
// =============================================================================
// Unit tests for the nucleotide alphabet: code table, character parsing
// and string-token parsing.
// =============================================================================

#include "pdna/core/symbol.h"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace pdna {
namespace {

// =============================================================================
// Code Table Tests
// =============================================================================

TEST(SymbolTest, CodesFollowAlphabetOrder) {
    EXPECT_EQ(toCode(Symbol::kA), 0);
    EXPECT_EQ(toCode(Symbol::kC), 1);
    EXPECT_EQ(toCode(Symbol::kG), 2);
    EXPECT_EQ(toCode(Symbol::kT), 3);
}

TEST(SymbolTest, CodeMappingIsBijective) {
    for (std::uint8_t code = 0; code < kAlphabetSize; ++code) {
        EXPECT_EQ(toCode(symbolFromCode(code)), code);
    }
    for (Symbol symbol : kAllSymbols) {
        EXPECT_EQ(symbolFromCode(toCode(symbol)), symbol);
    }
}

TEST(SymbolTest, SymbolFromCodeReadsLowBitsOnly) {
    EXPECT_EQ(symbolFromCode(0b0000'0110), Symbol::kG);
    EXPECT_EQ(symbolFromCode(0xFF), Symbol::kT);
}

TEST(SymbolTest, CanonicalCharacters) {
    EXPECT_EQ(toChar(Symbol::kA), 'A');
    EXPECT_EQ(toChar(Symbol::kC), 'C');
    EXPECT_EQ(toChar(Symbol::kG), 'G');
    EXPECT_EQ(toChar(Symbol::kT), 'T');
}

TEST(SymbolTest, Names) {
    EXPECT_EQ(symbolName(Symbol::kA), "Adenine");
    EXPECT_EQ(symbolName(Symbol::kC), "Cytosine");
    EXPECT_EQ(symbolName(Symbol::kG), "Guanine");
    EXPECT_EQ(symbolName(Symbol::kT), "Thymine");
}

TEST(SymbolTest, StreamsCanonicalCharacter) {
    std::ostringstream oss;
    oss << Symbol::kG << Symbol::kA;
    EXPECT_EQ(oss.str(), "GA");
}

// =============================================================================
// parseChar Tests
// =============================================================================

TEST(ParseCharTest, AcceptsBothCases) {
    const std::string upper = "ACGT";
    const std::string lower = "acgt";
    for (std::size_t i = 0; i < upper.size(); ++i) {
        auto fromUpper = parseChar(upper[i]);
        auto fromLower = parseChar(lower[i]);
        ASSERT_TRUE(fromUpper.has_value());
        ASSERT_TRUE(fromLower.has_value());
        EXPECT_EQ(*fromUpper, kAllSymbols[i]);
        EXPECT_EQ(*fromLower, kAllSymbols[i]);
    }
}

TEST(ParseCharTest, RejectsEveryOtherCharacter) {
    const std::string accepted = "AaCcGgTt";
    for (int value = 0; value < 256; ++value) {
        const char c = static_cast<char>(value);
        auto result = parseChar(c);
        if (accepted.find(c) != std::string::npos) {
            EXPECT_TRUE(result.has_value()) << "value " << value;
            continue;
        }
        ASSERT_FALSE(result.has_value()) << "value " << value;
        EXPECT_EQ(result.error().unit(), std::string(1, c));
        EXPECT_FALSE(result.error().position().has_value());
    }
}

TEST(ParseCharTest, ErrorKeepsOriginalCase) {
    auto result = parseChar('n');
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().unit(), "n");
    EXPECT_EQ(result.error().message(), "invalid nucleotide symbol 'n'");
}

TEST(ParseCharTest, NIsNotPartOfTheAlphabet) {
    EXPECT_FALSE(parseChar('N').has_value());
    EXPECT_FALSE(parseChar('U').has_value());
}

// =============================================================================
// parseStr Tests
// =============================================================================

TEST(ParseStrTest, AcceptsSingleLetterTokens) {
    EXPECT_EQ(parseStr("a").value(), Symbol::kA);
    EXPECT_EQ(parseStr("C").value(), Symbol::kC);
    EXPECT_EQ(parseStr("g").value(), Symbol::kG);
    EXPECT_EQ(parseStr("T").value(), Symbol::kT);
}

TEST(ParseStrTest, ErrorCarriesUppercaseToken) {
    auto result = parseStr("acx");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().unit(), "ACX");
}

TEST(ParseStrTest, RejectsEmptyAndMultiLetterTokens) {
    EXPECT_FALSE(parseStr("").has_value());
    EXPECT_FALSE(parseStr("AA").has_value());
    EXPECT_FALSE(parseStr(" a").has_value());
}

TEST(ParseStrTest, RejectsUnknownLetter) {
    auto result = parseStr("u");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().unit(), "U");
}

// =============================================================================
// ParseSymbolError Tests
// =============================================================================

TEST(ParseSymbolErrorTest, MessageIncludesPosition) {
    ParseSymbolError error{'X', 3};
    EXPECT_EQ(error.message(), "invalid nucleotide symbol 'X' at position 3");

    std::ostringstream oss;
    oss << error;
    EXPECT_EQ(oss.str(), error.message());
}

TEST(ParseSymbolErrorTest, ConvertsToInvalidSymbolError) {
    ParseSymbolError error{std::string("Q")};
    Error generic = error.toError();
    EXPECT_EQ(generic.code(), ErrorCode::kInvalidSymbol);
    EXPECT_EQ(generic.message(), "invalid nucleotide symbol 'Q'");
    EXPECT_THROW(generic.throwException(), InvalidSymbolError);
}

}  // namespace
}  // namespace pdna
