#include "stt/recognition_client.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cctype>
#include <thread>

namespace medscribe {
namespace stt {

namespace {

bool isBlank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string fragmentLabel(int index) {
    return index == TranscriptFragment::kWholeIndex
        ? std::string("whole recording")
        : "segment " + std::to_string(index + 1);
}

} // namespace

RecognitionClient::RecognitionClient(std::shared_ptr<RecognitionService> service,
                                     const utils::RecognitionConfig& recognitionConfig,
                                     const utils::AudioConfig& audioConfig)
    : service_(std::move(service))
    , locale_(recognitionConfig.locale)
    , retryPolicy_(RecoveryConfig::fromConfig(recognitionConfig))
    , sleep_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
    if (!service_) {
        throw utils::RecognitionException("Recognition client requires a service", "RecognitionClient");
    }

    // Capture always produces canonical audio; the external decoder stays available
    auto normalizer = std::make_shared<const audio::AudioNormalizer>(audioConfig);
    AmbientCalibrator calibrator(std::chrono::milliseconds(recognitionConfig.calibrationMs));
    chain_ = CaptureFallbackChain::createDefault(normalizer, calibrator);
}

TranscriptFragment RecognitionClient::recognize(const audio::Segment& segment) const {
    int index = segment.whole ? TranscriptFragment::kWholeIndex : segment.index;
    utils::Logger::info("Recognizing " + fragmentLabel(index) + " [" +
                        std::to_string(segment.startMs) + " ms, " +
                        std::to_string(segment.endMs) + " ms)");
    return recognizeBytes(index, segment.toWav());
}

TranscriptFragment RecognitionClient::recognizeBytes(int index, const std::vector<uint8_t>& bytes) const {
    CaptureOutcome outcome = chain_.capture(bytes);

    if (!outcome.success) {
        std::string diagnostic = outcome.getLastDiagnostic();
        MEDSCRIBE_REPORT_ERROR(utils::ErrorCategory::RECOGNITION, utils::ErrorSeverity::ERROR,
                               "Audio capture failed for " + fragmentLabel(index), diagnostic);
        return TranscriptFragment::serviceError(index, std::string(markers::kUnsupportedFormat) + diagnostic);
    }

    if (outcome.strategyName != chain_.getStrategyNames().front()) {
        utils::Logger::warn("Captured " + fragmentLabel(index) + " using fallback strategy '" +
                            outcome.strategyName + "'");
    }

    TranscriptFragment fragment = recognizeCaptured(index, outcome.audio);
    fragment.captureStrategy = outcome.strategyName;
    return fragment;
}

TranscriptFragment RecognitionClient::recognizeCaptured(int index, const CapturedAudio& captured) const {
    const std::string label = fragmentLabel(index);
    int attempt = 0;

    while (true) {
        std::chrono::milliseconds deadline = retryPolicy_.deadlineForAttempt(attempt);
        utils::Logger::debug("Sending " + label + " to " + service_->getName() + " (attempt " +
                             std::to_string(attempt + 1) + "/" +
                             std::to_string(retryPolicy_.getMaxAttempts()) + ", deadline " +
                             std::to_string(deadline.count()) + " ms)");

        RecognitionResponse response = service_->recognize(captured.samples, captured.sampleRate,
                                                           locale_, deadline);
        ++attempt;

        TranscriptFragment fragment;
        switch (response.status) {
            case RecognitionStatus::OK:
                if (isBlank(response.text)) {
                    utils::Logger::info(label + ": recognition returned no text");
                    fragment = TranscriptFragment::empty(index);
                } else {
                    utils::Logger::info(label + " transcribed: " +
                                        std::to_string(response.text.size()) + " characters");
                    fragment = TranscriptFragment::ok(index, response.text);
                }
                break;

            case RecognitionStatus::NOT_UNDERSTOOD:
                MEDSCRIBE_REPORT_ERROR(utils::ErrorCategory::RECOGNITION, utils::ErrorSeverity::WARNING,
                                       "Audio could not be understood", label);
                fragment = TranscriptFragment::unrecognized(index);
                break;

            case RecognitionStatus::REQUEST_ERROR:
                MEDSCRIBE_REPORT_ERROR(utils::ErrorCategory::RECOGNITION, utils::ErrorSeverity::ERROR,
                                       "Recognition service error", label + ": " + response.detail);
                fragment = TranscriptFragment::serviceError(index, response.detail);
                break;

            case RecognitionStatus::TIMEOUT:
                if (retryPolicy_.shouldRetry(response.status, attempt)) {
                    utils::Logger::warn(label + ": timeout on attempt " + std::to_string(attempt) +
                                        ", retrying in " +
                                        std::to_string(retryPolicy_.getBackoff().count()) + " ms");
                    sleep_(retryPolicy_.getBackoff());
                    continue;
                }
                MEDSCRIBE_REPORT_ERROR(utils::ErrorCategory::RECOGNITION, utils::ErrorSeverity::ERROR,
                                       "Recognition timed out",
                                       label + " after " + std::to_string(attempt) + " attempts");
                fragment = TranscriptFragment::timeout(index);
                break;
        }

        fragment.attempts = attempt;
        return fragment;
    }
}

} // namespace stt
} // namespace medscribe
