#include "audio/segmenter.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace medscribe {
namespace audio {

const std::vector<int16_t>& Segment::audio() const {
    if (whole && recording) {
        return recording->samples;
    }
    return samples;
}

std::vector<uint8_t> Segment::toWav() const {
    uint32_t rate = recording ? recording->sampleRate : kCanonicalSampleRate;
    return WavContainer::encodePCM16(audio(), rate, kCanonicalChannels);
}

Segmenter::Segmenter(const utils::AudioConfig& config)
    : config_(config) {
}

bool Segmenter::requiresSplit(int64_t durationMs) const {
    return durationMs > config_.longAudioThresholdMs;
}

size_t Segmenter::expectedSegmentCount(int64_t durationMs) const {
    if (!requiresSplit(durationMs)) {
        return 1;
    }
    return static_cast<size_t>((durationMs + config_.segmentLengthMs - 1) / config_.segmentLengthMs);
}

std::vector<Segment> Segmenter::segment(const RecordingPtr& recording) const {
    if (!recording) {
        throw utils::AudioProcessingException("Cannot segment a null recording", "Segmenter");
    }

    std::vector<Segment> segments;
    const int64_t duration = recording->durationMs;

    if (!requiresSplit(duration)) {
        Segment whole;
        whole.recording = recording;
        whole.index = 0;
        whole.startMs = 0;
        whole.endMs = duration;
        whole.whole = true;
        segments.push_back(std::move(whole));
        utils::Logger::debug("Recording " + recording->id + " (" + std::to_string(duration) +
                             " ms) processed as a single segment");
        return segments;
    }

    const int64_t samplesPerMs = static_cast<int64_t>(recording->sampleRate) / 1000;
    const auto& source = recording->samples;
    segments.reserve(expectedSegmentCount(duration));

    int index = 0;
    for (int64_t start = 0; start < duration; start += config_.segmentLengthMs) {
        int64_t end = std::min(start + config_.segmentLengthMs, duration);

        size_t firstSample = static_cast<size_t>(start * samplesPerMs);
        // The last window also takes the sub-millisecond tail
        size_t lastSample = (end == duration)
            ? source.size()
            : static_cast<size_t>(end * samplesPerMs);

        std::vector<float> window = AudioFormatConverter::pcm16ToFloat(std::vector<int16_t>(
            source.begin() + static_cast<std::ptrdiff_t>(firstSample),
            source.begin() + static_cast<std::ptrdiff_t>(lastSample)));

        Segment piece;
        piece.recording = recording;
        piece.index = index++;
        piece.startMs = start;
        piece.endMs = end;
        piece.whole = false;
        piece.samples = AudioFormatConverter::convertToPCM16(
            AudioLevel::peakNormalize(window, config_.normalizeHeadroomDb));
        segments.push_back(std::move(piece));
    }

    utils::Logger::info("Recording " + recording->id + " (" + std::to_string(duration) +
                        " ms) split into " + std::to_string(segments.size()) + " segments of up to " +
                        std::to_string(config_.segmentLengthMs) + " ms");
    return segments;
}

} // namespace audio
} // namespace medscribe
