// ============================================================================
// FNO SIGNAL ENGINE - Open Interest Analyzer Unit Tests
// ============================================================================

#include "fno/strategy/open_interest_analyzer.hpp"

#include "market_fixtures.hpp"

#include <gtest/gtest.h>

using namespace fno;
using namespace fno::strategy;

class OpenInterestAnalyzerTest : public ::testing::Test {
protected:
    static market::OptionChain three_strike_chain(double spot) {
        market::OptionChain chain;
        chain.underlying = Symbol("NIFTY");
        chain.spot = Price::from_double(spot);
        for (double strike : {19800.0, 19850.0, 19900.0}) {
            chain.contracts.push_back(test::contract("NIFTY", strike, OptionType::Call, 100.0, 1000, 10));
            chain.contracts.push_back(test::contract("NIFTY", strike, OptionType::Put, 100.0, 1000, 10));
        }
        return chain;
    }

    OpenInterestAnalyzer analyzer;
};

TEST_F(OpenInterestAnalyzerTest, BullishStrongAtHighPcr) {
    const auto result = analyzer.analyze(test::nifty_chain(150000));
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(result->total_call_oi, 100000);
    EXPECT_EQ(result->total_put_oi, 150000);
    EXPECT_DOUBLE_EQ(result->put_call_ratio, 1.5);
    EXPECT_EQ(result->sentiment, Sentiment::Bullish);
    EXPECT_EQ(result->strength, OIStrength::Strong);
}

TEST_F(OpenInterestAnalyzerTest, BearishAtLowPcr) {
    const auto result = analyzer.analyze(test::nifty_chain(60000));
    ASSERT_TRUE(result.has_value());
    EXPECT_DOUBLE_EQ(result->put_call_ratio, 0.6);
    EXPECT_EQ(result->sentiment, Sentiment::Bearish);
    EXPECT_EQ(result->strength, OIStrength::Strong);
}

TEST_F(OpenInterestAnalyzerTest, NeutralNearParity) {
    const auto result = analyzer.analyze(test::nifty_chain(120000));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->sentiment, Sentiment::Neutral);
    EXPECT_EQ(result->strength, OIStrength::Moderate);
}

TEST_F(OpenInterestAnalyzerTest, SentimentThresholdsAreExclusive) {
    EXPECT_EQ(OpenInterestAnalyzer::sentiment_for(1.3), Sentiment::Neutral);
    EXPECT_EQ(OpenInterestAnalyzer::sentiment_for(1.31), Sentiment::Bullish);
    EXPECT_EQ(OpenInterestAnalyzer::sentiment_for(0.7), Sentiment::Neutral);
    EXPECT_EQ(OpenInterestAnalyzer::sentiment_for(0.69), Sentiment::Bearish);
    EXPECT_EQ(OpenInterestAnalyzer::strength_for(1.1), OIStrength::Moderate);
    EXPECT_EQ(OpenInterestAnalyzer::strength_for(1.4), OIStrength::Strong);
}

TEST_F(OpenInterestAnalyzerTest, AtmExactMatch) {
    const auto result = analyzer.analyze(three_strike_chain(19850.0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->atm_strike, Price::from_double(19850.0));
}

TEST_F(OpenInterestAnalyzerTest, AtmTieGoesToLowerStrike) {
    EXPECT_EQ(OpenInterestAnalyzer::nearest_strike(three_strike_chain(19875.0)),
              Price::from_double(19850.0));
    EXPECT_EQ(OpenInterestAnalyzer::nearest_strike(three_strike_chain(19880.0)),
              Price::from_double(19900.0));
}

TEST_F(OpenInterestAnalyzerTest, SupportAndResistanceFromMaxOi) {
    auto chain = three_strike_chain(19850.0);
    chain.contracts[4].open_interest = 9000;  // 19900 CE
    chain.contracts[1].open_interest = 7000;  // 19800 PE

    const auto result = analyzer.analyze(chain);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resistance, Price::from_double(19900.0));
    EXPECT_EQ(result->max_call_oi_strike, Price::from_double(19900.0));
    EXPECT_EQ(result->support, Price::from_double(19800.0));
    EXPECT_EQ(result->max_put_oi_strike, Price::from_double(19800.0));
}

TEST_F(OpenInterestAnalyzerTest, MaxOiTieBrokenByVolume) {
    auto chain = three_strike_chain(19850.0);
    chain.contracts[2].volume = 500;  // 19850 CE, same OI as the others
    const auto result = analyzer.analyze(chain);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resistance, Price::from_double(19850.0));
}

TEST_F(OpenInterestAnalyzerTest, MaxOiFullTieGoesToLowerStrike) {
    const auto result = analyzer.analyze(three_strike_chain(19850.0));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->resistance, Price::from_double(19800.0));
    EXPECT_EQ(result->support, Price::from_double(19800.0));
}

TEST_F(OpenInterestAnalyzerTest, MissingSideIsInsufficient) {
    auto chain = three_strike_chain(19850.0);
    std::erase_if(chain.contracts, [](const auto& c) { return c.type == OptionType::Put; });
    EXPECT_FALSE(analyzer.analyze(chain).has_value());
}

TEST_F(OpenInterestAnalyzerTest, ZeroCallOiIsInsufficient) {
    auto chain = three_strike_chain(19850.0);
    for (auto& c : chain.contracts) {
        if (c.type == OptionType::Call) c.open_interest = 0;
    }
    EXPECT_FALSE(analyzer.analyze(chain).has_value());
}

TEST_F(OpenInterestAnalyzerTest, MissingSpotIsInsufficient) {
    auto chain = three_strike_chain(19850.0);
    chain.spot = Price{};
    EXPECT_FALSE(analyzer.analyze(chain).has_value());
}
