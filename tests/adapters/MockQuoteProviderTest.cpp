#include <gtest/gtest.h>

#include "adapters/secondary/MockQuoteProvider.hpp"
#include "mocks/FixedClock.hpp"

#include <cmath>

using namespace pricefetcher::adapters::secondary;
using namespace pricefetcher::tests;

class MockQuoteProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock = std::make_shared<FixedClock>(1700000042);
        provider = std::make_unique<MockQuoteProvider>(clock);
    }

    std::shared_ptr<FixedClock> clock;
    std::unique_ptr<MockQuoteProvider> provider;
};

// ================================================================
// Базовые цены
// ================================================================

TEST_F(MockQuoteProviderTest, BasePrice_KnownSymbols) {
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("AAPL"), 150.0);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("TSLA"), 200.0);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("GOOGL"), 2500.0);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("NFLX"), 400.0);
}

TEST_F(MockQuoteProviderTest, BasePrice_UnknownSymbol_DependsOnLength) {
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("XYZ"), 130.0);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("A"), 110.0);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::basePrice("ABCDEF"), 160.0);
}

TEST_F(MockQuoteProviderTest, Variation_StaysInHalfOpenRange) {
    EXPECT_DOUBLE_EQ(MockQuoteProvider::variation(1700000000), -0.5);
    EXPECT_NEAR(MockQuoteProvider::variation(1700000050), 0.0, 1e-12);
    EXPECT_NEAR(MockQuoteProvider::variation(1700000099), 0.49, 1e-12);
}

TEST_F(MockQuoteProviderTest, RoundToCents_HalfAwayFromZero) {
    EXPECT_DOUBLE_EQ(MockQuoteProvider::roundToCents(0.125), 0.13);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::roundToCents(-0.125), -0.13);
    EXPECT_DOUBLE_EQ(MockQuoteProvider::roundToCents(148.8), 148.8);
}

// ================================================================
// fetchQuote
// ================================================================

TEST_F(MockQuoteProviderTest, FetchQuote_DeterministicForFixedClock) {
    auto quote = provider->fetchQuote("AAPL");

    EXPECT_EQ(quote.symbol, "AAPL");
    EXPECT_DOUBLE_EQ(quote.price, 148.8);
    EXPECT_EQ(quote.currency, "USD");
    EXPECT_EQ(quote.timestamp, 1700000042);
    EXPECT_EQ(quote.source, "mock");
    ASSERT_TRUE(quote.change24h.has_value());
    ASSERT_TRUE(quote.changePercent24h.has_value());
    EXPECT_NEAR(*quote.change24h, -0.4, 1e-9);
    EXPECT_NEAR(*quote.changePercent24h, -0.16, 1e-9);
}

TEST_F(MockQuoteProviderTest, FetchQuote_LowestVariation) {
    clock->set(1700000000);

    EXPECT_DOUBLE_EQ(provider->fetchQuote("AAPL").price, 142.5);
    EXPECT_DOUBLE_EQ(provider->fetchQuote("GOOGL").price, 2375.0);
}

TEST_F(MockQuoteProviderTest, FetchQuote_HighestVariation) {
    clock->set(1700000099);

    auto quote = provider->fetchQuote("AAPL");

    EXPECT_DOUBLE_EQ(quote.price, 157.35);
    EXPECT_NEAR(*quote.change24h, 2.45, 1e-9);
    EXPECT_NEAR(*quote.changePercent24h, 0.98, 1e-9);
}

TEST_F(MockQuoteProviderTest, FetchQuote_UnknownSymbolAtMidpoint) {
    clock->set(1700000050);

    auto quote = provider->fetchQuote("XYZ");

    EXPECT_DOUBLE_EQ(quote.price, 130.0);
    EXPECT_NEAR(*quote.change24h, 0.0, 1e-12);
}

TEST_F(MockQuoteProviderTest, FetchQuote_PriceWithinFivePercentOfBase) {
    for (std::int64_t t = 1700000000; t < 1700000100; ++t) {
        clock->set(t);
        auto quote = provider->fetchQuote("TSLA");

        EXPECT_GE(quote.price, 190.0) << "t=" << t;
        EXPECT_LT(quote.price, 210.0) << "t=" << t;
        EXPECT_DOUBLE_EQ(quote.price, std::round(quote.price * 100.0) / 100.0) << "t=" << t;
    }
}

TEST_F(MockQuoteProviderTest, FetchQuote_SameSecond_SameResult) {
    auto first = provider->fetchQuote("NVDA");
    auto second = provider->fetchQuote("NVDA");

    EXPECT_DOUBLE_EQ(first.price, second.price);
    EXPECT_EQ(first.timestamp, second.timestamp);
}
