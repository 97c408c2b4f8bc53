// ============================================================================
// FNO SIGNAL ENGINE - Pattern Classifier Implementation
// ============================================================================

#include "fno/strategy/pattern_classifier.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace fno::strategy {

namespace {

using Window = std::array<double, PatternClassifier::WINDOW>;

double sample_std_dev(const Window& values) {
    double mean = 0.0;
    for (double v : values) mean += v;
    mean /= static_cast<double>(values.size());

    double variance = 0.0;
    for (double v : values) {
        const double diff = v - mean;
        variance += diff * diff;
    }
    return std::sqrt(variance / static_cast<double>(values.size() - 1));
}

}  // namespace

ChartPattern PatternClassifier::classify(market::PriceSeries bars) const noexcept {
    if (bars.size() < MIN_BARS) {
        return ChartPattern::InsufficientData;
    }

    const auto recent = bars.last(WINDOW);
    Window highs{};
    Window lows{};
    for (size_t i = 0; i < WINDOW; ++i) {
        highs[i] = recent[i].high;
        lows[i] = recent[i].low;
    }

    const double highest = *std::max_element(highs.begin(), highs.end());
    const double lowest = *std::min_element(lows.begin(), lows.end());
    const double high_dev = sample_std_dev(highs);
    const double low_dev = sample_std_dev(lows);
    const double close = recent.back().close;

    // Higher lows against a flat ceiling
    if (lowest >= lows.front() && high_dev < low_dev) {
        return ChartPattern::AscendingTriangle;
    }

    // Lower highs against a flat floor
    if (highest <= highs.front() && low_dev < high_dev) {
        return ChartPattern::DescendingTriangle;
    }

    if (close >= highest * BREAKOUT_HIGH_FACTOR) {
        return ChartPattern::UpwardBreakout;
    }

    if (close <= lowest * BREAKOUT_LOW_FACTOR) {
        return ChartPattern::DownwardBreakout;
    }

    return ChartPattern::Consolidation;
}

}  // namespace fno::strategy
