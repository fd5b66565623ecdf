#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace audio {

/**
 * Decoded audio in its source layout: interleaved float samples in [-1, 1].
 */
struct DecodedAudio {
    std::vector<float> samples;
    uint32_t sampleRate = 0;
    uint16_t channels = 0;

    size_t getFrameCount() const { return channels == 0 ? 0 : samples.size() / channels; }
};

/**
 * One way of turning container bytes into samples. Implementations throw
 * utils::AudioProcessingException when they cannot handle the input.
 */
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    virtual std::string getName() const = 0;
    virtual DecodedAudio decode(const std::vector<uint8_t>& bytes) const = 0;
};

/**
 * Built-in RIFF/WAVE decoder (PCM 8/16/24/32-bit and IEEE float).
 */
class WavDecoder : public AudioDecoder {
public:
    std::string getName() const override { return "wav"; }
    DecodedAudio decode(const std::vector<uint8_t>& bytes) const override;
};

/**
 * Decodes any format ffmpeg understands. The input is written to a scoped
 * temporary file and ffmpeg streams canonical WAV back over a pipe.
 */
class FfmpegDecoder : public AudioDecoder {
public:
    explicit FfmpegDecoder(std::string binary = "ffmpeg", uint32_t targetSampleRate = 16000);

    std::string getName() const override { return "ffmpeg"; }
    DecodedAudio decode(const std::vector<uint8_t>& bytes) const override;

private:
    std::string buildCommand(const std::string& inputPath) const;

    std::string binary_;
    uint32_t targetSampleRate_;
};

} // namespace audio
} // namespace medscribe
