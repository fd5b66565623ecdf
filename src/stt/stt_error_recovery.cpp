#include "stt/stt_error_recovery.hpp"
#include "audio/audio_decoder.hpp"
#include "audio/audio_normalizer.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace medscribe {
namespace stt {

RecoveryConfig RecoveryConfig::fromConfig(const utils::RecognitionConfig& config) {
    RecoveryConfig recovery;
    recovery.maxAttempts = config.maxAttempts;
    recovery.requestTimeout = std::chrono::milliseconds(config.requestTimeoutMs);
    recovery.deadlineStep = std::chrono::milliseconds(config.deadlineStepMs);
    recovery.retryBackoff = std::chrono::milliseconds(config.retryBackoffMs);
    return recovery;
}

RetryPolicy::RetryPolicy(const RecoveryConfig& config)
    : config_(config) {
}

std::chrono::milliseconds RetryPolicy::deadlineForAttempt(int attempt) const {
    return config_.requestTimeout + config_.deadlineStep * attempt;
}

bool RetryPolicy::shouldRetry(RecognitionStatus status, int attemptsMade) const {
    return error_utils::isTransient(status) && attemptsMade < config_.maxAttempts;
}

void CaptureFallbackChain::addStrategy(const std::string& name, CaptureFunction capture) {
    strategies_.push_back(CaptureStrategy{name, std::move(capture)});
}

CaptureOutcome CaptureFallbackChain::capture(const std::vector<uint8_t>& bytes) const {
    CaptureOutcome outcome;

    for (const auto& strategy : strategies_) {
        try {
            CapturedAudio captured = strategy.capture(bytes);
            if (captured.samples.empty()) {
                outcome.diagnostics.push_back(strategy.name + ": no audio captured");
                continue;
            }
            outcome.success = true;
            outcome.audio = std::move(captured);
            outcome.strategyName = strategy.name;
            return outcome;
        } catch (const utils::MedScribeException& e) {
            outcome.diagnostics.push_back(strategy.name + ": " + e.what());
            utils::Logger::warn("Capture strategy '" + strategy.name + "' failed: " + e.what());
        }
    }

    if (outcome.diagnostics.empty()) {
        outcome.diagnostics.push_back("no capture strategy configured");
    }
    return outcome;
}

std::vector<std::string> CaptureFallbackChain::getStrategyNames() const {
    std::vector<std::string> names;
    names.reserve(strategies_.size());
    for (const auto& strategy : strategies_) {
        names.push_back(strategy.name);
    }
    return names;
}

CaptureFallbackChain CaptureFallbackChain::createDefault(
        std::shared_ptr<const audio::AudioNormalizer> normalizer,
        const AmbientCalibrator& calibrator) {
    CaptureFallbackChain chain;

    chain.addStrategy("convert", [normalizer, calibrator](const std::vector<uint8_t>& bytes) {
        return calibrator.calibrate(normalizer->normalizeSamples(bytes), audio::kCanonicalSampleRate);
    });

    chain.addStrategy("raw-read", [calibrator](const std::vector<uint8_t>& bytes) {
        audio::DecodedAudio decoded = audio::WavDecoder().decode(bytes);
        return calibrator.calibrate(audio::AudioNormalizer::toCanonical(decoded, -1.0f),
                                    audio::kCanonicalSampleRate);
    });

    chain.addStrategy("raw-read-without-calibration", [](const std::vector<uint8_t>& bytes) {
        CapturedAudio captured;
        captured.samples = audio::AudioNormalizer::toCanonical(audio::WavDecoder().decode(bytes), -1.0f);
        captured.sampleRate = audio::kCanonicalSampleRate;
        return captured;
    });

    return chain;
}

namespace error_utils {

bool isTransient(RecognitionStatus status) {
    return status == RecognitionStatus::TIMEOUT;
}

} // namespace error_utils

} // namespace stt
} // namespace medscribe
