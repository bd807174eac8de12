#include <gtest/gtest.h>
#include "domain/Symbol.hpp"

using namespace pricefetcher::domain;

// ================================================================
// normalizeSymbol
// ================================================================

TEST(SymbolTest, Normalize_UppercasesLowercase) {
    EXPECT_EQ(normalizeSymbol("aapl"), "AAPL");
}

TEST(SymbolTest, Normalize_TrimsWhitespace) {
    EXPECT_EQ(normalizeSymbol(" tsla "), "TSLA");
    EXPECT_EQ(normalizeSymbol("\tmsft\n"), "MSFT");
}

TEST(SymbolTest, Normalize_KeepsInnerCharacters) {
    EXPECT_EQ(normalizeSymbol("brk.b"), "BRK.B");
    EXPECT_EQ(normalizeSymbol("^gspc"), "^GSPC");
}

TEST(SymbolTest, Normalize_BlankBecomesEmpty) {
    EXPECT_EQ(normalizeSymbol(""), "");
    EXPECT_EQ(normalizeSymbol("   "), "");
}

// ================================================================
// splitSymbols
// ================================================================

TEST(SymbolTest, Split_NormalizesEachEntry) {
    auto symbols = splitSymbols("aapl, tsla ,MSFT");

    std::vector<std::string> expected = {"AAPL", "TSLA", "MSFT"};
    EXPECT_EQ(symbols, expected);
}

TEST(SymbolTest, Split_SkipsEmptyEntries) {
    auto symbols = splitSymbols("AAPL,,  ,MSFT,");

    std::vector<std::string> expected = {"AAPL", "MSFT"};
    EXPECT_EQ(symbols, expected);
}

TEST(SymbolTest, Split_PreservesOrderAndDuplicates) {
    auto symbols = splitSymbols("nvda,aapl,nvda");

    std::vector<std::string> expected = {"NVDA", "AAPL", "NVDA"};
    EXPECT_EQ(symbols, expected);
}

TEST(SymbolTest, Split_EmptyString_ReturnsEmpty) {
    EXPECT_TRUE(splitSymbols("").empty());
    EXPECT_TRUE(splitSymbols(" , ,").empty());
}
