#pragma once

#include "stt/ambient_calibrator.hpp"
#include "stt/recognition_service.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace medscribe {
namespace audio {
class AudioNormalizer;
}

namespace stt {

/**
 * Retry configuration for recognition calls
 */
struct RecoveryConfig {
    int maxAttempts;
    std::chrono::milliseconds requestTimeout;
    std::chrono::milliseconds deadlineStep;
    std::chrono::milliseconds retryBackoff;

    RecoveryConfig()
        : maxAttempts(3)
        , requestTimeout(45000)
        , deadlineStep(15000)
        , retryBackoff(2000) {}

    static RecoveryConfig fromConfig(const utils::RecognitionConfig& config);
};

/**
 * Bounded retry policy. Only timeouts are transient; "not understood" and
 * request errors are final on the first attempt.
 */
class RetryPolicy {
public:
    explicit RetryPolicy(const RecoveryConfig& config = RecoveryConfig());

    /**
     * Deadline for a 0-based attempt: requestTimeout + attempt * deadlineStep
     */
    std::chrono::milliseconds deadlineForAttempt(int attempt) const;

    /**
     * @param attemptsMade number of attempts already completed (>= 1)
     */
    bool shouldRetry(RecognitionStatus status, int attemptsMade) const;

    std::chrono::milliseconds getBackoff() const { return config_.retryBackoff; }
    int getMaxAttempts() const { return config_.maxAttempts; }

private:
    RecoveryConfig config_;
};

using CaptureFunction = std::function<CapturedAudio(const std::vector<uint8_t>&)>;

/**
 * One named way of turning segment bytes into recognizable audio
 */
struct CaptureStrategy {
    std::string name;
    CaptureFunction capture;
};

struct CaptureOutcome {
    bool success = false;
    CapturedAudio audio;
    std::string strategyName;
    std::vector<std::string> diagnostics;

    std::string getLastDiagnostic() const {
        return diagnostics.empty() ? std::string() : diagnostics.back();
    }
};

/**
 * Ordered list of capture strategies, tried first to last. A strategy fails by
 * throwing; the first one that returns non-empty audio wins.
 */
class CaptureFallbackChain {
public:
    CaptureFallbackChain() = default;

    void addStrategy(const std::string& name, CaptureFunction capture);

    CaptureOutcome capture(const std::vector<uint8_t>& bytes) const;

    std::vector<std::string> getStrategyNames() const;
    size_t size() const { return strategies_.size(); }

    /**
     * convert -> raw-read -> raw-read-without-calibration
     */
    static CaptureFallbackChain createDefault(std::shared_ptr<const audio::AudioNormalizer> normalizer,
                                              const AmbientCalibrator& calibrator);

private:
    std::vector<CaptureStrategy> strategies_;
};

/**
 * Utility functions for recognition error handling
 */
namespace error_utils {

    bool isTransient(RecognitionStatus status);

} // namespace error_utils

} // namespace stt
} // namespace medscribe
