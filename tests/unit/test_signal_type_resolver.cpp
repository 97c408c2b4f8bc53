// ============================================================================
// FNO SIGNAL ENGINE - Signal Type Resolver Unit Tests
// ============================================================================

#include "fno/strategy/signal_type_resolver.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace fno;
using namespace fno::strategy;

class SignalTypeResolverTest : public ::testing::Test {
protected:
    static OIAnalysis oi(Sentiment sentiment) {
        OIAnalysis result;
        result.sentiment = sentiment;
        return result;
    }

    static TechnicalSnapshot technical(Trend trend, double rsi, double macd, double macd_signal,
                                       int strength) {
        TechnicalSnapshot snapshot;
        snapshot.trend = trend;
        snapshot.strength = strength;
        snapshot.indicators.rsi = rsi;
        snapshot.indicators.macd = macd;
        snapshot.indicators.macd_signal = macd_signal;
        return snapshot;
    }

    SignalTypeResolver resolver;
};

// ============================================================================
// Directional Confluence
// ============================================================================

TEST_F(SignalTypeResolverTest, BullishConfluenceBuysCall) {
    const auto call = resolver.resolve(oi(Sentiment::Bullish),
                                       technical(Trend::Bullish, 60.0, 1.0, 0.5, 50));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->direction, Direction::BuyCall);
    EXPECT_EQ(call->confidence, 95);
    EXPECT_FALSE(call->mean_reversion);
}

TEST_F(SignalTypeResolverTest, BearishConfluenceBuysPut) {
    const auto call = resolver.resolve(oi(Sentiment::Bearish),
                                       technical(Trend::Bearish, 40.0, -1.0, -0.5, 25));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->direction, Direction::BuyPut);
    EXPECT_EQ(call->confidence, 90);
}

TEST_F(SignalTypeResolverTest, ConfluenceConfidenceFormula) {
    // min(85 + strength / 5, 95) with integer division
    for (int strength : {0, 4, 5, 24, 49, 50, 100}) {
        const auto call = resolver.resolve(oi(Sentiment::Bullish),
                                           technical(Trend::Bullish, 60.0, 1.0, 0.5, strength));
        ASSERT_TRUE(call.has_value());
        EXPECT_EQ(call->confidence, std::min(85 + strength / 5, 95)) << "strength " << strength;
    }
}

TEST_F(SignalTypeResolverTest, BullishNeedsEveryCondition) {
    // Overbought RSI
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Bullish),
                                  technical(Trend::Bullish, 72.0, 1.0, 0.5, 50)).has_value());
    // MACD below signal
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Bullish),
                                  technical(Trend::Bullish, 60.0, 0.4, 0.5, 50)).has_value());
    // Trend disagrees
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Bullish),
                                  technical(Trend::Sideways, 60.0, 1.0, 0.5, 50)).has_value());
}

TEST_F(SignalTypeResolverTest, NeutralOiNeverConfluence) {
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Neutral),
                                  technical(Trend::Bullish, 60.0, 1.0, 0.5, 80)).has_value());
}

// ============================================================================
// Mean Reversion
// ============================================================================

TEST_F(SignalTypeResolverTest, ExtremeOverboughtBuysPut) {
    const auto call = resolver.resolve(oi(Sentiment::Neutral),
                                       technical(Trend::Sideways, 85.0, 1.0, 0.5, 40));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->direction, Direction::BuyPut);
    EXPECT_EQ(call->confidence, 80);
    EXPECT_TRUE(call->mean_reversion);
}

TEST_F(SignalTypeResolverTest, ExtremeOversoldBuysCall) {
    const auto call = resolver.resolve(oi(Sentiment::Bearish),
                                       technical(Trend::Bullish, 15.0, -1.0, -0.5, 100));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->direction, Direction::BuyCall);
    EXPECT_EQ(call->confidence, 85);  // capped
    EXPECT_TRUE(call->mean_reversion);
}

TEST_F(SignalTypeResolverTest, ReversionNeedsNonConfirmingTrend) {
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Neutral),
                                  technical(Trend::Bullish, 85.0, 1.0, 0.5, 40)).has_value());
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Neutral),
                                  technical(Trend::Bearish, 15.0, -1.0, -0.5, 40)).has_value());
}

TEST_F(SignalTypeResolverTest, RsiThresholdsAreExclusive) {
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Neutral),
                                  technical(Trend::Sideways, 80.0, 0.0, 0.0, 40)).has_value());
    EXPECT_FALSE(resolver.resolve(oi(Sentiment::Neutral),
                                  technical(Trend::Sideways, 20.0, 0.0, 0.0, 40)).has_value());
}

TEST_F(SignalTypeResolverTest, ConfluenceTakesPrecedence) {
    // Bearish confluence with RSI above 30 wins before any reversion rule
    const auto call = resolver.resolve(oi(Sentiment::Bearish),
                                       technical(Trend::Bearish, 35.0, -1.0, -0.5, 10));
    ASSERT_TRUE(call.has_value());
    EXPECT_EQ(call->direction, Direction::BuyPut);
    EXPECT_FALSE(call->mean_reversion);
    EXPECT_EQ(call->confidence, 87);
}
