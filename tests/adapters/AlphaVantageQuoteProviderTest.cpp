#include <gtest/gtest.h>

#include "adapters/secondary/AlphaVantageQuoteProvider.hpp"
#include "mocks/FixedClock.hpp"

using namespace pricefetcher::adapters::secondary;
using namespace pricefetcher::tests;

TEST(AlphaVantageQuoteProviderTest, DelegatesToSyntheticProvider) {
    auto clock = std::make_shared<FixedClock>(1700000042);
    auto mock = std::make_shared<MockQuoteProvider>(clock);
    AlphaVantageQuoteProvider provider(mock);

    auto quote = provider.fetchQuote("AAPL");
    auto expected = mock->fetchQuote("AAPL");

    EXPECT_EQ(quote.symbol, "AAPL");
    EXPECT_DOUBLE_EQ(quote.price, expected.price);
    EXPECT_EQ(quote.source, "mock");
    EXPECT_EQ(quote.timestamp, 1700000042);
}

TEST(AlphaVantageQuoteProviderTest, NeverFails) {
    auto mock = std::make_shared<MockQuoteProvider>(std::make_shared<FixedClock>());
    AlphaVantageQuoteProvider provider(mock);

    EXPECT_NO_THROW(provider.fetchQuote("UNKNOWNSYM"));
}
