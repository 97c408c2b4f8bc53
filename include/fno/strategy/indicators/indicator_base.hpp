#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Indicator Base Class
// ============================================================================
// CRTP pattern for zero-overhead polymorphism
// Close-price indicators and high/low/close indicators share one interface
// shape without virtual call overhead
// ============================================================================

#include "fno/core/types.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <concepts>
#include <cstddef>

namespace fno::strategy {

// ============================================================================
// Indicator Concepts
// ============================================================================

template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

/// Indicators fed with a full candle range instead of a single price
template <typename T>
concept BarIndicator = requires(T indicator, double high, double low, double close) {
    { indicator.update(high, low, close) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

// ============================================================================
// CRTP Base Classes
// ============================================================================

template <typename Derived>
class IndicatorBase {
public:
    /// Update indicator with new price data
    void update(double value) {
        static_cast<Derived*>(this)->update_impl(value);
    }

    /// Get current indicator value
    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    /// Check if indicator has enough data
    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    /// Reset indicator state
    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    /// Number of samples needed before is_ready()
    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

template <typename Derived>
class BarIndicatorBase {
public:
    void update(double high, double low, double close) {
        static_cast<Derived*>(this)->update_impl(high, low, close);
    }

    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    BarIndicatorBase() = default;
    ~BarIndicatorBase() = default;
};

// ============================================================================
// Rolling Window for Historical Data
// ============================================================================

template <size_t MaxSize>
class RollingWindow {
public:
    RollingWindow() : size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % MaxSize;
        if (size_ < MaxSize) {
            ++size_;
        }
    }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] bool is_full() const { return size_ == MaxSize; }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            s += buffer_[i];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            const double diff = buffer_[i] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

    [[nodiscard]] double max() const {
        if (size_ == 0) return 0.0;
        return *std::max_element(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size_));
    }

    [[nodiscard]] double min() const {
        if (size_ == 0) return 0.0;
        return *std::min_element(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size_));
    }

private:
    std::array<double, MaxSize> buffer_{};
    size_t size_;
    size_t index_;
};

}  // namespace fno::strategy
