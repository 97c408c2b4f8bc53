#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Moving Averages
// ============================================================================
// EMA feeds MACD and the fast side of the trend relation (EMA20 vs SMA50)
// ============================================================================

#include "indicator_base.hpp"

namespace fno::strategy {

/// Exponential moving average, seeded with the simple mean of the first Period closes
template <size_t Period>
class EMA : public IndicatorBase<EMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    static constexpr double ALPHA = 2.0 / (Period + 1);

    EMA() { reset_impl(); }

    void update_impl(double close) {
        ++samples_;
        if (samples_ <= Period) {
            seed_sum_ += close;
            average_ = seed_sum_ / static_cast<double>(samples_);
            return;
        }
        average_ += ALPHA * (close - average_);
    }

    [[nodiscard]] double value_impl() const { return average_; }
    [[nodiscard]] bool is_ready_impl() const { return samples_ >= Period; }
    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

    void reset_impl() {
        samples_ = 0;
        seed_sum_ = 0.0;
        average_ = 0.0;
    }

private:
    size_t samples_ = 0;
    double seed_sum_ = 0.0;
    double average_ = 0.0;
};

/// Simple moving average over the last Period closes
template <size_t Period>
class SMA : public IndicatorBase<SMA<Period>> {
public:
    static_assert(Period > 0, "Period must be positive");

    void update_impl(double close) { closes_.push(close); }

    [[nodiscard]] double value_impl() const { return closes_.mean(); }
    [[nodiscard]] bool is_ready_impl() const { return closes_.is_full(); }
    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

    void reset_impl() { closes_.reset(); }

private:
    RollingWindow<Period> closes_;
};

using EMA20 = EMA<20>;
using SMA50 = SMA<50>;

}  // namespace fno::strategy
