#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Session VWAP
// ============================================================================
// Volume-weighted average of the typical price (H+L+C)/3
// Accumulators reset whenever a bar opens a new UTC calendar day
// ============================================================================

#include "fno/core/types.hpp"

#include <optional>

namespace fno::strategy {

class SessionVWAP {
public:
    SessionVWAP() { reset(); }

    void update(Timestamp ts, double high, double low, double close, double volume) {
        const Date day = session_date(ts);
        if (!session_ || *session_ != day) {
            session_ = day;
            pv_sum_ = 0.0;
            volume_sum_ = 0.0;
        }

        const double typical = (high + low + close) / 3.0;
        pv_sum_ += typical * volume;
        volume_sum_ += volume;
    }

    /// Absent while the session has traded no volume (e.g. spot indices)
    [[nodiscard]] std::optional<double> value() const {
        if (volume_sum_ <= 0.0) return std::nullopt;
        return pv_sum_ / volume_sum_;
    }

    [[nodiscard]] bool is_ready() const { return volume_sum_ > 0.0; }

    void reset() {
        session_.reset();
        pv_sum_ = 0.0;
        volume_sum_ = 0.0;
    }

private:
    std::optional<Date> session_;
    double pv_sum_;
    double volume_sum_;
};

}  // namespace fno::strategy
