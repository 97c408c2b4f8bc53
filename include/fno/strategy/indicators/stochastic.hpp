#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Stochastic Oscillator
// ============================================================================
// Close relative to the recent high/low range, slow form
// Default 14/3/3: 14-bar range, %K smoothed over 3, %D = SMA(3) of %K
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

namespace fno::strategy {

template <size_t KPeriod = 14, size_t KSmooth = 3, size_t DPeriod = 3>
class Stochastic : public BarIndicatorBase<Stochastic<KPeriod, KSmooth, DPeriod>> {
public:
    static constexpr double OVERBOUGHT = 80.0;
    static constexpr double OVERSOLD = 20.0;

    Stochastic() { reset_impl(); }

    void update_impl(double high, double low, double close) {
        highs_.push(high);
        lows_.push(low);
        if (!highs_.is_full()) return;

        const double highest = highs_.max();
        const double lowest = lows_.min();
        const double range = highest - lowest;
        // Flat range puts the close at mid-range
        const double raw_k = range > 0.0 ? 100.0 * (close - lowest) / range : 50.0;

        k_smooth_.update(raw_k);
        if (!k_smooth_.is_ready()) return;

        k_ = k_smooth_.value();
        d_smooth_.update(k_);
        d_ = d_smooth_.value();
    }

    /// Slow %K
    [[nodiscard]] double value_impl() const { return k_; }

    /// %D
    [[nodiscard]] double d_line() const { return d_; }

    [[nodiscard]] bool is_ready_impl() const { return d_smooth_.is_ready(); }

    void reset_impl() {
        highs_.reset();
        lows_.reset();
        k_smooth_.reset();
        d_smooth_.reset();
        k_ = 0.0;
        d_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return KPeriod + KSmooth + DPeriod - 2; }

private:
    RollingWindow<KPeriod> highs_;
    RollingWindow<KPeriod> lows_;
    SMA<KSmooth> k_smooth_;
    SMA<DPeriod> d_smooth_;
    double k_;
    double d_;
};

using Stoch_14_3_3 = Stochastic<14, 3, 3>;

}  // namespace fno::strategy
