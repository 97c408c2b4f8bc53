// ============================================================================
// FNO SIGNAL ENGINE - Core Types Unit Tests
// ============================================================================

#include "fno/core/error.hpp"
#include "fno/core/types.hpp"

#include <gtest/gtest.h>

using namespace fno;

// ============================================================================
// Price Tests
// ============================================================================

TEST(PriceTest, DefaultConstruction) {
    Price p;
    EXPECT_EQ(p.raw(), 0);
}

TEST(PriceTest, FromDouble) {
    Price p = Price::from_double(19850.05);
    EXPECT_DOUBLE_EQ(p.to_double(), 19850.05);
}

TEST(PriceTest, NonFiniteIsInvalid) {
    EXPECT_FALSE(Price::from_double(std::numeric_limits<double>::quiet_NaN()).is_valid());
    EXPECT_FALSE(Price::from_double(std::numeric_limits<double>::infinity()).is_valid());
}

TEST(PriceTest, Arithmetic) {
    Price p1 = Price::from_double(100.0);
    Price p2 = Price::from_double(50.0);

    Price sum = p1 + p2;
    EXPECT_DOUBLE_EQ(sum.to_double(), 150.0);

    Price diff = p1 - p2;
    EXPECT_DOUBLE_EQ(diff.to_double(), 50.0);
}

TEST(PriceTest, Comparison) {
    Price p1 = Price::from_double(100.0);
    Price p2 = Price::from_double(50.0);
    Price p3 = Price::from_double(100.0);

    EXPECT_GT(p1, p2);
    EXPECT_LT(p2, p1);
    EXPECT_EQ(p1, p3);
}

TEST(PriceTest, IsValid) {
    Price valid = Price::from_double(100.0);
    Price invalid = Price{0};
    Price negative = Price{-1};

    EXPECT_TRUE(valid.is_valid());
    EXPECT_FALSE(invalid.is_valid());
    EXPECT_FALSE(negative.is_valid());
}

TEST(PriceTest, RoundToTick) {
    EXPECT_DOUBLE_EQ(round_to_tick(187.499), 187.50);
    EXPECT_DOUBLE_EQ(round_to_tick(135.0), 135.0);
    EXPECT_DOUBLE_EQ(round_to_tick(0.004), 0.0);
}

// ============================================================================
// Symbol Tests
// ============================================================================

TEST(SymbolTest, Construction) {
    Symbol s("NIFTY");
    EXPECT_EQ(s.view(), "NIFTY");
    EXPECT_EQ(s.size(), 5);
}

TEST(SymbolTest, Truncation) {
    // Symbols longer than MAX_LENGTH should be truncated
    Symbol s("BANKNIFTY24OCT52000CE_WEEKLY_SERIES_XYZ");
    EXPECT_LE(s.size(), Symbol::MAX_LENGTH);
}

TEST(SymbolTest, Equality) {
    Symbol s1("NIFTY");
    Symbol s2("NIFTY");
    Symbol s3("BANKNIFTY");

    EXPECT_EQ(s1, s2);
    EXPECT_NE(s1, s3);
}

TEST(SymbolTest, Hashing) {
    std::hash<Symbol> hasher;
    EXPECT_EQ(hasher(Symbol("INFY")), hasher(Symbol("INFY")));
}

// ============================================================================
// Direction and Tier Tests
// ============================================================================

TEST(DirectionTest, OptionTypeFollowsDirection) {
    EXPECT_EQ(option_type_of(Direction::BuyCall), OptionType::Call);
    EXPECT_EQ(option_type_of(Direction::SellCall), OptionType::Call);
    EXPECT_EQ(option_type_of(Direction::BuyPut), OptionType::Put);
    EXPECT_EQ(option_type_of(Direction::SellPut), OptionType::Put);
}

TEST(DirectionTest, BuySide) {
    EXPECT_TRUE(is_buy(Direction::BuyCall));
    EXPECT_TRUE(is_buy(Direction::BuyPut));
    EXPECT_FALSE(is_buy(Direction::SellCall));
    EXPECT_FALSE(is_buy(Direction::SellPut));
}

TEST(ConfidenceTierTest, Boundaries) {
    EXPECT_EQ(confidence_tier(95), ConfidenceTier::VeryHigh);
    EXPECT_EQ(confidence_tier(90), ConfidenceTier::VeryHigh);
    EXPECT_EQ(confidence_tier(89), ConfidenceTier::High);
    EXPECT_EQ(confidence_tier(80), ConfidenceTier::High);
    EXPECT_EQ(confidence_tier(79), ConfidenceTier::Medium);
    EXPECT_EQ(confidence_tier(70), ConfidenceTier::Medium);
    EXPECT_EQ(confidence_tier(69), ConfidenceTier::Low);
}

TEST(ToStringTest, ContractAndDirectionCodes) {
    EXPECT_EQ(to_string(OptionType::Call), "CE");
    EXPECT_EQ(to_string(OptionType::Put), "PE");
    EXPECT_EQ(to_string(Direction::BuyPut), "BUY_PE");
    EXPECT_EQ(to_string(ChartPattern::UpwardBreakout), "Upward Breakout");
    EXPECT_EQ(to_string(EvaluationOutcome::QuotaExhausted), "QuotaExhausted");
}

// ============================================================================
// Timestamp Tests
// ============================================================================

TEST(TimestampTest, Now) {
    Timestamp t1 = now();
    Timestamp t2 = now();
    EXPECT_LE(t1, t2);
}

TEST(TimestampTest, EpochConversion) {
    int64_t epoch_ms = 1700000000000;
    Timestamp ts = from_epoch_ms(epoch_ms);
    int64_t back = to_epoch_ms(ts);
    EXPECT_EQ(epoch_ms, back);
}

TEST(TimestampTest, SessionDateIsUtcDay) {
    using namespace std::chrono;
    // 2023-11-14T22:13:20Z
    const Date day = session_date(from_epoch_ms(1700000000000));
    EXPECT_EQ(day, (Date{year{2023}, November, std::chrono::day{14}}));
}

TEST(ErrorTest, InsufficientDataCarriesCounts) {
    InsufficientDataError e(12, 50);
    EXPECT_EQ(e.available(), 12u);
    EXPECT_EQ(e.required(), 50u);
    EXPECT_NE(std::string(e.what()).find("12"), std::string::npos);
}
