// ============================================================================
// FNO SIGNAL ENGINE - Strength Scorer Unit Tests
// ============================================================================

#include "fno/strategy/strength_scorer.hpp"

#include <gtest/gtest.h>

using namespace fno;
using namespace fno::strategy;

class StrengthScorerTest : public ::testing::Test {
protected:
    static IndicatorSet quiet() {
        IndicatorSet ind;
        ind.rsi = 65.0;
        ind.macd = 0.0;
        ind.macd_signal = 0.0;
        ind.ema_fast = 100.0;
        ind.sma_slow = 100.0;
        ind.adx = 15.0;
        ind.close = 100.0;
        ind.volume = 0.0;
        return ind;
    }

    StrengthScorer scorer;
};

TEST_F(StrengthScorerTest, NothingScores) {
    EXPECT_EQ(scorer.score(quiet()), 0);
}

TEST_F(StrengthScorerTest, EveryContribution) {
    IndicatorSet ind = quiet();
    ind.rsi = 75.0;            // extreme
    ind.macd = 1.2;
    ind.macd_signal = 0.8;     // cross
    ind.ema_fast = 101.0;      // relation
    ind.vwap = 100.2;          // within 0.5%
    ind.adx = 30.0;            // strong trend
    ind.volume = 5000.0;
    EXPECT_EQ(scorer.score(ind), 20 + 15 + 15 + 10 + 15 + 10);
}

TEST_F(StrengthScorerTest, RsiBands) {
    IndicatorSet ind = quiet();
    ind.rsi = 25.0;
    EXPECT_EQ(scorer.score(ind), StrengthScorer::RSI_EXTREME_POINTS);
    ind.rsi = 50.0;
    EXPECT_EQ(scorer.score(ind), StrengthScorer::RSI_NEUTRAL_POINTS);
    ind.rsi = 40.0;
    EXPECT_EQ(scorer.score(ind), StrengthScorer::RSI_NEUTRAL_POINTS);
    ind.rsi = 35.0;
    EXPECT_EQ(scorer.score(ind), 0);
}

TEST_F(StrengthScorerTest, VwapProximity) {
    IndicatorSet ind = quiet();
    ind.vwap = 99.0;  // close 1% away
    EXPECT_EQ(scorer.score(ind), 0);
    ind.vwap = 99.8;
    EXPECT_EQ(scorer.score(ind), StrengthScorer::VWAP_PROXIMITY_POINTS);
    ind.vwap.reset();
    EXPECT_EQ(scorer.score(ind), 0);
}

TEST_F(StrengthScorerTest, AdxThresholdIsExclusive) {
    IndicatorSet ind = quiet();
    ind.adx = 25.0;
    EXPECT_EQ(scorer.score(ind), 0);
    ind.adx = 25.1;
    EXPECT_EQ(scorer.score(ind), StrengthScorer::ADX_TREND_POINTS);
}

TEST_F(StrengthScorerTest, ScoreStaysInRange) {
    IndicatorSet ind = quiet();
    ind.rsi = 95.0;
    ind.macd = 5.0;
    ind.ema_fast = 150.0;
    ind.vwap = 100.0;
    ind.adx = 80.0;
    ind.volume = 1e9;
    const int score = scorer.score(ind);
    EXPECT_GE(score, 0);
    EXPECT_LE(score, StrengthScorer::MAX_SCORE);
}

// ============================================================================
// Trend Votes
// ============================================================================

TEST_F(StrengthScorerTest, TrendMajority) {
    IndicatorSet ind = quiet();
    ind.rsi = 60.0;
    ind.macd = 1.0;
    ind.macd_signal = 0.5;
    ind.ema_fast = 99.0;   // one bearish vote
    EXPECT_EQ(scorer.trend(ind), Trend::Bullish);

    ind.rsi = 40.0;
    EXPECT_EQ(scorer.trend(ind), Trend::Bearish);
}

TEST_F(StrengthScorerTest, EqualVotesAreSideways) {
    EXPECT_EQ(StrengthScorer::majority(1, 1), Trend::Sideways);
    EXPECT_EQ(StrengthScorer::majority(0, 0), Trend::Sideways);
    EXPECT_EQ(StrengthScorer::majority(2, 1), Trend::Bullish);
    EXPECT_EQ(StrengthScorer::majority(0, 3), Trend::Bearish);
}
