#pragma once

#include "audio/audio_normalizer.hpp"
#include "utils/config.hpp"
#include <cstdint>
#include <vector>

namespace medscribe {
namespace audio {

/**
 * A bounded slice of a recording. The implicit whole-recording segment does
 * not copy samples; it views the recording it references.
 */
struct Segment {
    RecordingPtr recording;
    int index = 0;
    int64_t startMs = 0;
    int64_t endMs = 0;
    bool whole = false;
    std::vector<int16_t> samples;

    const std::vector<int16_t>& audio() const;
    int64_t getDurationMs() const { return endMs - startMs; }

    // Canonical WAV bytes for this segment
    std::vector<uint8_t> toWav() const;
};

/**
 * Splits long recordings into fixed windows. Recordings up to the long-audio
 * threshold yield one implicit segment covering [0, D).
 */
class Segmenter {
public:
    explicit Segmenter(const utils::AudioConfig& config);

    std::vector<Segment> segment(const RecordingPtr& recording) const;

    bool requiresSplit(int64_t durationMs) const;

    // ceil(D / segmentLength) for long recordings, 1 otherwise
    size_t expectedSegmentCount(int64_t durationMs) const;

private:
    utils::AudioConfig config_;
};

} // namespace audio
} // namespace medscribe
