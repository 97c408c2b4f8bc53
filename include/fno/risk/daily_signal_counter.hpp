#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Daily Signal Counter
// ============================================================================
// Shared emission quota for one trading day. Owned by the caller and
// injected into the engine; reset only by an explicit call at day rollover.
// ============================================================================

#include <atomic>
#include <cstdint>

namespace fno::risk {

class DailySignalCounter {
public:
    explicit DailySignalCounter(uint32_t daily_limit) noexcept
        : limit_(daily_limit), count_(0) {}

    // Non-copyable (atomic member)
    DailySignalCounter(const DailySignalCounter&) = delete;
    DailySignalCounter& operator=(const DailySignalCounter&) = delete;

    /// Take one slot if the limit has not been reached
    /// Compare-and-increment: concurrent callers never overshoot the limit
    [[nodiscard]] bool try_acquire() noexcept {
        uint32_t current = count_.load(std::memory_order_relaxed);
        while (current < limit_) {
            if (count_.compare_exchange_weak(current, current + 1,
                                             std::memory_order_acq_rel,
                                             std::memory_order_relaxed)) {
                return true;
            }
        }
        return false;
    }

    [[nodiscard]] bool exhausted() const noexcept {
        return count_.load(std::memory_order_acquire) >= limit_;
    }

    void reset() noexcept { count_.store(0, std::memory_order_release); }

    [[nodiscard]] uint32_t count() const noexcept { return count_.load(std::memory_order_acquire); }
    [[nodiscard]] uint32_t limit() const noexcept { return limit_; }
    [[nodiscard]] uint32_t remaining() const noexcept {
        const uint32_t used = count();
        return used >= limit_ ? 0 : limit_ - used;
    }

private:
    const uint32_t limit_;
    std::atomic<uint32_t> count_;
};

}  // namespace fno::risk
