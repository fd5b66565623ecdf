#pragma once

#include "audio/audio_decoder.hpp"
#include "audio/audio_utils.hpp"
#include "utils/config.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace medscribe {
namespace audio {

/**
 * Canonical recording: 16 kHz, mono, 16-bit PCM. Immutable once built; later
 * stages share it through RecordingPtr.
 */
struct Recording {
    std::string id;
    std::string ownerId;
    std::string subject;
    std::vector<int16_t> samples;
    uint32_t sampleRate = kCanonicalSampleRate;
    int64_t durationMs = 0;
    std::chrono::system_clock::time_point createdAt;

    std::vector<uint8_t> toWav() const;
};

using RecordingPtr = std::shared_ptr<const Recording>;

/**
 * Identity attached to a recording at normalization time
 */
struct RecordingMetadata {
    std::string id;
    std::string ownerId;
    std::string subject;
    std::chrono::system_clock::time_point createdAt = std::chrono::system_clock::now();
};

/**
 * Converts arbitrary input audio to canonical PCM. Decoders are tried in
 * order; the first that succeeds wins.
 */
class AudioNormalizer {
public:
    explicit AudioNormalizer(const utils::AudioConfig& config);
    AudioNormalizer(const utils::AudioConfig& config,
                    std::vector<std::unique_ptr<AudioDecoder>> decoders);

    /**
     * Decode, downmix, resample and peak-normalize.
     * @throws utils::DecodeException with reason TOO_SMALL below the minimum
     *         input size, UNDECODABLE when no decoder accepts the bytes
     */
    std::vector<int16_t> normalizeSamples(const std::vector<uint8_t>& raw) const;

    RecordingPtr normalize(const std::vector<uint8_t>& raw, const RecordingMetadata& metadata) const;

    /**
     * Mono 16 kHz conversion of already decoded audio, with optional peak
     * normalization (headroomDb < 0 disables it).
     */
    static std::vector<int16_t> toCanonical(const DecodedAudio& decoded, float headroomDb);

    static int64_t durationMs(size_t sampleCount, uint32_t sampleRate);

    const std::vector<std::unique_ptr<AudioDecoder>>& getDecoders() const { return decoders_; }

private:
    utils::AudioConfig config_;
    std::vector<std::unique_ptr<AudioDecoder>> decoders_;
};

} // namespace audio
} // namespace medscribe
