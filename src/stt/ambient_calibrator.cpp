#include "stt/ambient_calibrator.hpp"
#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace medscribe {
namespace stt {

AmbientCalibrator::AmbientCalibrator(std::chrono::milliseconds window, float thresholdRatio)
    : window_(window)
    , thresholdRatio_(thresholdRatio) {
}

float AmbientCalibrator::measureAmbient(const std::vector<int16_t>& samples,
                                        uint32_t sampleRate) const {
    size_t windowSamples = static_cast<size_t>(window_.count()) * sampleRate / 1000;
    if (windowSamples == 0 || samples.size() < windowSamples) {
        throw utils::AudioProcessingException(
            "Audio too short for ambient calibration (" + std::to_string(samples.size()) +
            " samples, need " + std::to_string(windowSamples) + ")",
            "AmbientCalibrator");
    }

    std::vector<float> leading = audio::AudioFormatConverter::pcm16ToFloat(
        std::vector<int16_t>(samples.begin(), samples.begin() + static_cast<std::ptrdiff_t>(windowSamples)));
    return audio::AudioLevel::rms(leading);
}

CapturedAudio AmbientCalibrator::calibrate(std::vector<int16_t> samples, uint32_t sampleRate) const {
    if (window_.count() <= 0) {
        CapturedAudio passthrough;
        passthrough.samples = std::move(samples);
        passthrough.sampleRate = sampleRate;
        return passthrough;
    }

    float ambient = measureAmbient(samples, sampleRate);

    CapturedAudio captured;
    captured.sampleRate = sampleRate;
    captured.calibrated = true;
    captured.energyThreshold = ambient * thresholdRatio_;

    captured.samples = std::move(samples);

    utils::Logger::debug("Ambient calibration: rms=" + std::to_string(ambient) +
                         " threshold=" + std::to_string(captured.energyThreshold) +
                         " over " + std::to_string(captured.samples.size()) + " samples");
    return captured;
}

} // namespace stt
} // namespace medscribe
