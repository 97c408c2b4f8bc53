#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Core Types
// ============================================================================
// Fundamental type definitions for the signal pipeline
// Using strong typing and fixed-point arithmetic for precision
// ============================================================================

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <string_view>

namespace fno {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Calendar date (option expiry, trading session)
using Date = std::chrono::year_month_day;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

/// UTC calendar day a timestamp falls on (session key for VWAP)
[[nodiscard]] inline Date session_date(Timestamp ts) noexcept {
    return Date{std::chrono::floor<std::chrono::days>(ts)};
}

// ============================================================================
// Price Type (Fixed-Point Arithmetic)
// ============================================================================

/// Price with 8 decimal places precision
/// Stored as int64 to avoid floating-point errors in comparisons
/// 1 Price unit = 0.00000001 actual price
class Price {
public:
    static constexpr int64_t PRECISION = 100000000LL;  // 10^8
    static constexpr int DECIMAL_PLACES = 8;

    constexpr Price() noexcept : value_(0) {}
    constexpr explicit Price(int64_t raw_value) noexcept : value_(raw_value) {}

    /// Create from double (e.g., 19850.05 -> internal representation)
    [[nodiscard]] static Price from_double(double price) noexcept {
        if (!std::isfinite(price)) return Price{0};
        return Price{std::llround(price * PRECISION)};
    }

    /// Convert to double for arithmetic/logging
    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / PRECISION;
    }

    /// Raw internal value
    [[nodiscard]] constexpr int64_t raw() const noexcept { return value_; }

    /// Arithmetic operators
    constexpr Price operator+(Price other) const noexcept { return Price{value_ + other.value_}; }
    constexpr Price operator-(Price other) const noexcept { return Price{value_ - other.value_}; }
    constexpr Price& operator+=(Price other) noexcept { value_ += other.value_; return *this; }
    constexpr Price& operator-=(Price other) noexcept { value_ -= other.value_; return *this; }

    /// Comparison operators
    constexpr auto operator<=>(const Price&) const noexcept = default;

    /// Check if price is valid (non-zero, non-negative)
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ > 0; }

private:
    int64_t value_;
};

/// Round to exchange tick (0.01)
[[nodiscard]] inline double round_to_tick(double price) noexcept {
    return std::round(price * 100.0) / 100.0;
}

// ============================================================================
// Symbol Type
// ============================================================================

/// Instrument or contract symbol (e.g., "NIFTY", "NIFTY24OCT19850CE")
/// Fixed inline storage, no heap allocation
class Symbol {
public:
    static constexpr size_t MAX_LENGTH = 31;

    Symbol() noexcept : length_(0) { data_[0] = '\0'; }

    explicit Symbol(std::string_view symbol) noexcept {
        length_ = static_cast<uint8_t>(std::min(symbol.size(), MAX_LENGTH));
        std::copy_n(symbol.data(), length_, data_);
        data_[length_] = '\0';
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, length_};
    }

    [[nodiscard]] const char* c_str() const noexcept { return data_; }
    [[nodiscard]] size_t size() const noexcept { return length_; }
    [[nodiscard]] bool empty() const noexcept { return length_ == 0; }

    bool operator==(const Symbol& other) const noexcept {
        return view() == other.view();
    }

    bool operator!=(const Symbol& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Symbol& other) const noexcept {
        return view() < other.view();
    }

private:
    char data_[MAX_LENGTH + 1];
    uint8_t length_;
};

// ============================================================================
// Option and Signal Enumerations
// ============================================================================

/// Option contract type (CE/PE)
enum class OptionType : uint8_t {
    Call = 0,
    Put = 1
};

/// Trade direction of a signal
enum class Direction : uint8_t {
    BuyCall = 0,
    BuyPut = 1,
    SellCall = 2,
    SellPut = 3
};

/// Open-interest sentiment derived from PCR
enum class Sentiment : uint8_t {
    Bullish = 0,
    Bearish = 1,
    Neutral = 2
};

/// Divergence of PCR from parity
enum class OIStrength : uint8_t {
    Strong = 0,
    Moderate = 1
};

/// Technical trend vote result
enum class Trend : uint8_t {
    Bullish = 0,
    Bearish = 1,
    Sideways = 2
};

enum class VolatilityLevel : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2
};

enum class ConfidenceTier : uint8_t {
    Low = 0,
    Medium = 1,
    High = 2,
    VeryHigh = 3
};

enum class ChartPattern : uint8_t {
    InsufficientData = 0,
    AscendingTriangle = 1,
    DescendingTriangle = 2,
    UpwardBreakout = 3,
    DownwardBreakout = 4,
    Consolidation = 5
};

[[nodiscard]] constexpr OptionType option_type_of(Direction d) noexcept {
    switch (d) {
        case Direction::BuyCall:
        case Direction::SellCall:
            return OptionType::Call;
        case Direction::BuyPut:
        case Direction::SellPut:
            return OptionType::Put;
    }
    return OptionType::Call;
}

[[nodiscard]] constexpr bool is_buy(Direction d) noexcept {
    switch (d) {
        case Direction::BuyCall:
        case Direction::BuyPut:
            return true;
        case Direction::SellCall:
        case Direction::SellPut:
            return false;
    }
    return true;
}

/// Map confidence percentage to tier
[[nodiscard]] constexpr ConfidenceTier confidence_tier(int confidence) noexcept {
    if (confidence >= 90) return ConfidenceTier::VeryHigh;
    if (confidence >= 80) return ConfidenceTier::High;
    if (confidence >= 70) return ConfidenceTier::Medium;
    return ConfidenceTier::Low;
}

// ============================================================================
// String Conversions (logging and rendering only)
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(OptionType t) noexcept {
    switch (t) {
        case OptionType::Call: return "CE";
        case OptionType::Put: return "PE";
    }
    return "CE";
}

[[nodiscard]] constexpr std::string_view to_string(Direction d) noexcept {
    switch (d) {
        case Direction::BuyCall: return "BUY_CE";
        case Direction::BuyPut: return "BUY_PE";
        case Direction::SellCall: return "SELL_CE";
        case Direction::SellPut: return "SELL_PE";
    }
    return "BUY_CE";
}

[[nodiscard]] constexpr std::string_view to_string(Sentiment s) noexcept {
    switch (s) {
        case Sentiment::Bullish: return "Bullish";
        case Sentiment::Bearish: return "Bearish";
        case Sentiment::Neutral: return "Neutral";
    }
    return "Neutral";
}

[[nodiscard]] constexpr std::string_view to_string(OIStrength s) noexcept {
    switch (s) {
        case OIStrength::Strong: return "Strong";
        case OIStrength::Moderate: return "Moderate";
    }
    return "Moderate";
}

[[nodiscard]] constexpr std::string_view to_string(Trend t) noexcept {
    switch (t) {
        case Trend::Bullish: return "Bullish";
        case Trend::Bearish: return "Bearish";
        case Trend::Sideways: return "Sideways";
    }
    return "Sideways";
}

[[nodiscard]] constexpr std::string_view to_string(VolatilityLevel v) noexcept {
    switch (v) {
        case VolatilityLevel::Low: return "Low";
        case VolatilityLevel::Medium: return "Medium";
        case VolatilityLevel::High: return "High";
    }
    return "Low";
}

[[nodiscard]] constexpr std::string_view to_string(ConfidenceTier c) noexcept {
    switch (c) {
        case ConfidenceTier::Low: return "LOW";
        case ConfidenceTier::Medium: return "MEDIUM";
        case ConfidenceTier::High: return "HIGH";
        case ConfidenceTier::VeryHigh: return "VERY_HIGH";
    }
    return "LOW";
}

[[nodiscard]] constexpr std::string_view to_string(ChartPattern p) noexcept {
    switch (p) {
        case ChartPattern::InsufficientData: return "Insufficient Data";
        case ChartPattern::AscendingTriangle: return "Ascending Triangle";
        case ChartPattern::DescendingTriangle: return "Descending Triangle";
        case ChartPattern::UpwardBreakout: return "Upward Breakout";
        case ChartPattern::DownwardBreakout: return "Downward Breakout";
        case ChartPattern::Consolidation: return "Consolidation";
    }
    return "Consolidation";
}

}  // namespace fno

// ============================================================================
// Hash specializations for use with containers
// ============================================================================
template <>
struct std::hash<fno::Symbol> {
    size_t operator()(const fno::Symbol& s) const noexcept {
        return std::hash<std::string_view>{}(s.view());
    }
};
