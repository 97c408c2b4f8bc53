#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - ADX (Average Directional Index)
// ============================================================================
// Trend-strength indicator (direction-agnostic)
// Range: 0-100, > 25 trending, > 30 treated as high volatility
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>

namespace fno::strategy {

/// ADX with Wilder's smoothing of TR, +DM, -DM and DX
template <size_t Period = 14>
class ADX : public BarIndicatorBase<ADX<Period>> {
public:
    static constexpr double TRENDING = 25.0;

    ADX() { reset_impl(); }

    void update_impl(double high, double low, double close) {
        if (count_ == 0) {
            prev_high_ = high;
            prev_low_ = low;
            prev_close_ = close;
            ++count_;
            return;
        }

        const double up_move = high - prev_high_;
        const double down_move = prev_low_ - low;
        const double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        const double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
        const double tr = std::max({high - low,
                                    std::abs(high - prev_close_),
                                    std::abs(low - prev_close_)});

        prev_high_ = high;
        prev_low_ = low;
        prev_close_ = close;
        ++count_;

        if (count_ <= Period + 1) {
            // Seed with plain sums of the first Period moves
            tr_smooth_ += tr;
            plus_smooth_ += plus_dm;
            minus_smooth_ += minus_dm;
            if (count_ < Period + 1) return;
        } else {
            tr_smooth_ = tr_smooth_ - tr_smooth_ / Period + tr;
            plus_smooth_ = plus_smooth_ - plus_smooth_ / Period + plus_dm;
            minus_smooth_ = minus_smooth_ - minus_smooth_ / Period + minus_dm;
        }

        const double dx = directional_index();
        ++dx_count_;

        if (dx_count_ <= Period) {
            dx_sum_ += dx;
            if (dx_count_ == Period) {
                adx_ = dx_sum_ / Period;
            }
        } else {
            adx_ = (adx_ * (Period - 1) + dx) / Period;
        }
    }

    [[nodiscard]] double value_impl() const { return adx_; }

    /// +DI of the latest bar
    [[nodiscard]] double plus_di() const {
        return tr_smooth_ > 0.0 ? 100.0 * plus_smooth_ / tr_smooth_ : 0.0;
    }

    /// -DI of the latest bar
    [[nodiscard]] double minus_di() const {
        return tr_smooth_ > 0.0 ? 100.0 * minus_smooth_ / tr_smooth_ : 0.0;
    }

    [[nodiscard]] bool is_ready_impl() const { return dx_count_ >= Period; }

    void reset_impl() {
        count_ = 0;
        dx_count_ = 0;
        prev_high_ = 0.0;
        prev_low_ = 0.0;
        prev_close_ = 0.0;
        tr_smooth_ = 0.0;
        plus_smooth_ = 0.0;
        minus_smooth_ = 0.0;
        dx_sum_ = 0.0;
        adx_ = 0.0;
    }

    /// Bars needed: one reference bar, Period moves to seed DI, Period DX values
    [[nodiscard]] constexpr size_t period_impl() const { return 2 * Period; }

    [[nodiscard]] bool is_trending() const { return is_ready_impl() && adx_ > TRENDING; }

private:
    [[nodiscard]] double directional_index() const {
        const double plus = plus_di();
        const double minus = minus_di();
        const double sum = plus + minus;
        return sum > 0.0 ? 100.0 * std::abs(plus - minus) / sum : 0.0;
    }

    size_t count_;
    size_t dx_count_;
    double prev_high_;
    double prev_low_;
    double prev_close_;
    double tr_smooth_;
    double plus_smooth_;
    double minus_smooth_;
    double dx_sum_;
    double adx_;
};

using ADX14 = ADX<14>;

}  // namespace fno::strategy
