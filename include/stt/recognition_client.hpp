#pragma once

#include "audio/audio_normalizer.hpp"
#include "audio/segmenter.hpp"
#include "stt/ambient_calibrator.hpp"
#include "stt/recognition_service.hpp"
#include "stt/stt_error_recovery.hpp"
#include "stt/transcript_fragment.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace medscribe {
namespace stt {

/**
 * Turns one segment into one TranscriptFragment.
 *
 * Capture goes through the fallback chain; the recognition call is retried on
 * timeout only, each attempt with its own widened deadline. Every failure is
 * returned as a fragment, never thrown.
 */
class RecognitionClient {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    RecognitionClient(std::shared_ptr<RecognitionService> service,
                      const utils::RecognitionConfig& recognitionConfig,
                      const utils::AudioConfig& audioConfig);

    RecognitionClient(const RecognitionClient&) = delete;
    RecognitionClient& operator=(const RecognitionClient&) = delete;

    TranscriptFragment recognize(const audio::Segment& segment) const;

    /**
     * Recognize arbitrary bytes (canonical WAV, or original input kept after
     * a decode failure).
     */
    TranscriptFragment recognizeBytes(int index, const std::vector<uint8_t>& bytes) const;

    /**
     * Retry loop around the service for audio that is already captured
     */
    TranscriptFragment recognizeCaptured(int index, const CapturedAudio& captured) const;

    void setSleepFunction(SleepFunction sleep) { sleep_ = std::move(sleep); }
    void setFallbackChain(CaptureFallbackChain chain) { chain_ = std::move(chain); }

    const CaptureFallbackChain& getFallbackChain() const { return chain_; }
    const RetryPolicy& getRetryPolicy() const { return retryPolicy_; }
    const std::string& getLocale() const { return locale_; }

private:
    std::shared_ptr<RecognitionService> service_;
    std::string locale_;
    RetryPolicy retryPolicy_;
    CaptureFallbackChain chain_;
    SleepFunction sleep_;
};

} // namespace stt
} // namespace medscribe
