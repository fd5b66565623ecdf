#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

namespace medscribe {
namespace stt {

/**
 * Audio ready for the recognition service
 */
struct CapturedAudio {
    std::vector<int16_t> samples;
    uint32_t sampleRate = 16000;
    bool calibrated = false;
    float energyThreshold = 0.0f;
};

/**
 * Measures ambient energy over a fixed leading window and derives an energy
 * threshold from it. Calibration only reports the level; the captured samples
 * are always passed on whole.
 */
class AmbientCalibrator {
public:
    explicit AmbientCalibrator(std::chrono::milliseconds window, float thresholdRatio = 1.5f);

    /**
     * RMS of the calibration window.
     * @throws utils::AudioProcessingException when the audio is shorter than the window
     */
    float measureAmbient(const std::vector<int16_t>& samples, uint32_t sampleRate) const;

    CapturedAudio calibrate(std::vector<int16_t> samples, uint32_t sampleRate) const;

    std::chrono::milliseconds getWindow() const { return window_; }

private:
    std::chrono::milliseconds window_;
    float thresholdRatio_;
};

} // namespace stt
} // namespace medscribe
