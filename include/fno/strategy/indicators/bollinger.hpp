#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Bollinger Bands
// ============================================================================
// Rolling mean with population standard deviation envelopes
// The snapshot uses the short 5-bar, 2 sigma configuration
// ============================================================================

#include "indicator_base.hpp"

namespace fno::strategy {

struct Bands {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
};

template <size_t Period = 20, size_t Width = 2>
class BollingerBands : public IndicatorBase<BollingerBands<Period, Width>> {
public:
    BollingerBands() { reset_impl(); }

    void update_impl(double close) {
        closes_.push(close);
        last_close_ = close;

        if (!closes_.is_full()) return;

        const double sigma = closes_.std_dev();
        bands_.middle = closes_.mean();
        bands_.upper = bands_.middle + static_cast<double>(Width) * sigma;
        bands_.lower = bands_.middle - static_cast<double>(Width) * sigma;
    }

    [[nodiscard]] double value_impl() const { return bands_.middle; }

    [[nodiscard]] const Bands& bands() const { return bands_; }
    [[nodiscard]] double upper_band() const { return bands_.upper; }
    [[nodiscard]] double lower_band() const { return bands_.lower; }

    /// Where the last close sits inside the envelope, 0.5 when it is flat
    [[nodiscard]] double percent_b() const {
        const double span = bands_.upper - bands_.lower;
        if (span == 0.0) return 0.5;
        return (last_close_ - bands_.lower) / span;
    }

    [[nodiscard]] bool is_ready_impl() const { return closes_.is_full(); }

    void reset_impl() {
        closes_.reset();
        bands_ = Bands{};
        last_close_ = 0.0;
    }

    [[nodiscard]] constexpr size_t period_impl() const { return Period; }

private:
    RollingWindow<Period> closes_;
    Bands bands_;
    double last_close_ = 0.0;
};

using BB5_2 = BollingerBands<5, 2>;

}  // namespace fno::strategy
