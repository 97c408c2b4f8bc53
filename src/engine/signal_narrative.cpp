// ============================================================================
// FNO SIGNAL ENGINE - Signal Narrative Implementation
// ============================================================================

#include "fno/engine/signal_narrative.hpp"

#include "fno/strategy/indicators/rsi.hpp"

#include <fmt/format.h>

#include <cctype>
#include <chrono>
#include <cmath>

namespace fno::engine {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

}  // namespace

std::string build_reasoning(const strategy::OIAnalysis& oi,
                            const strategy::TechnicalSnapshot& technical) {
    std::string text = fmt::format("OI shows {} sentiment (PCR: {:.2f})",
                                   lower(to_string(oi.sentiment)), oi.put_call_ratio);

    const double rsi = technical.indicators.rsi;
    if (rsi > strategy::RSI14::OVERBOUGHT) {
        text += " | RSI indicates overbought conditions";
    } else if (rsi < strategy::RSI14::OVERSOLD) {
        text += " | RSI indicates oversold conditions";
    } else {
        text += fmt::format(" | RSI at {:.1f} shows balanced momentum", rsi);
    }

    if (technical.pattern != ChartPattern::InsufficientData) {
        text += fmt::format(" | Chart shows {} formation", lower(to_string(technical.pattern)));
    }

    text += fmt::format(" | Overall trend is {}", lower(to_string(technical.trend)));
    return text;
}

std::string describe_setup(const strategy::TechnicalSnapshot& technical) {
    return fmt::format("{} | {} Trend | Strength: {}%",
                       to_string(technical.pattern), to_string(technical.trend), technical.strength);
}

std::string describe_vwap(const strategy::IndicatorSet& indicators) {
    if (!indicators.vwap || *indicators.vwap <= 0.0) {
        return "VWAP data unavailable";
    }

    const double diff_pct = (indicators.close - *indicators.vwap) / *indicators.vwap * 100.0;
    if (diff_pct > 1.0) {
        return fmt::format("Above VWAP by {:.1f}% (Bullish)", diff_pct);
    }
    if (diff_pct < -1.0) {
        return fmt::format("Below VWAP by {:.1f}% (Bearish)", std::abs(diff_pct));
    }
    return fmt::format("Near VWAP ({:+.1f}%)", diff_pct);
}

std::string describe_volume(const strategy::IndicatorSet& indicators) {
    return indicators.volume > 0.0 ? "Above Average" : "Below Average";
}

std::string describe_time_decay(Date expiry, Date today) {
    const auto days = (std::chrono::sys_days{expiry} - std::chrono::sys_days{today}).count();
    if (days <= 7) return "High (Weekly expiry - Fast decay)";
    if (days <= 30) return "Medium (Monthly expiry)";
    return "Low (Far expiry)";
}

SignalNarrative build_narrative(const strategy::OIAnalysis& oi,
                                const strategy::TechnicalSnapshot& technical,
                                Date expiry,
                                Date today) {
    SignalNarrative narrative;
    narrative.reasoning = build_reasoning(oi, technical);
    narrative.technical_setup = describe_setup(technical);
    narrative.vwap_analysis = describe_vwap(technical.indicators);
    narrative.volume_profile = describe_volume(technical.indicators);
    narrative.time_decay_impact = describe_time_decay(expiry, today);
    return narrative;
}

}  // namespace fno::engine
