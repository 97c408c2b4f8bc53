#pragma once
// ============================================================================
// FNO SIGNAL ENGINE - Error Types
// ============================================================================
// Recoverable failures raised inside the pipeline and the outcome codes
// the engine reports for every evaluated instrument
// ============================================================================

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fno {

/// Price history shorter than the longest indicator lookback
class InsufficientDataError : public std::runtime_error {
public:
    InsufficientDataError(size_t available, size_t required)
        : std::runtime_error("insufficient data: " + std::to_string(available) +
                             " bars, need " + std::to_string(required)),
          available_(available),
          required_(required) {}

    [[nodiscard]] size_t available() const noexcept { return available_; }
    [[nodiscard]] size_t required() const noexcept { return required_; }

private:
    size_t available_;
    size_t required_;
};

/// Invalid or unreadable configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Result of one instrument evaluation
enum class EvaluationOutcome : uint8_t {
    Emitted = 0,
    InsufficientData = 1,     // chain without both sides, history too short
    UpstreamUnavailable = 2,  // provider returned nothing
    NoOpportunity = 3,        // no directional confluence
    BelowMinConfidence = 4,
    NoContract = 5,           // no contract of the required type
    RiskRejected = 6,         // reward-to-risk under the minimum
    QuotaExhausted = 7
};

[[nodiscard]] constexpr std::string_view to_string(EvaluationOutcome o) noexcept {
    switch (o) {
        case EvaluationOutcome::Emitted: return "Emitted";
        case EvaluationOutcome::InsufficientData: return "InsufficientData";
        case EvaluationOutcome::UpstreamUnavailable: return "UpstreamUnavailable";
        case EvaluationOutcome::NoOpportunity: return "NoOpportunity";
        case EvaluationOutcome::BelowMinConfidence: return "BelowMinConfidence";
        case EvaluationOutcome::NoContract: return "NoContract";
        case EvaluationOutcome::RiskRejected: return "RiskRejected";
        case EvaluationOutcome::QuotaExhausted: return "QuotaExhausted";
    }
    return "NoOpportunity";
}

}  // namespace fno
