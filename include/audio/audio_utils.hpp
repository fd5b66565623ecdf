#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace audio {

// Sample encodings understood by the built-in decoder
enum class AudioCodec { PCM_8, PCM_16, PCM_24, PCM_32, FLOAT_32, UNKNOWN };

// Canonical format every stage after normalization works with
constexpr uint32_t kCanonicalSampleRate = 16000;
constexpr uint16_t kCanonicalChannels = 1;
constexpr uint16_t kCanonicalBitsPerSample = 16;
constexpr size_t kSamplesPerMs = kCanonicalSampleRate / 1000;

// Layout of a RIFF/WAVE container
struct WavInfo {
  uint32_t sampleRate;
  uint16_t channels;
  uint16_t bitsPerSample;
  AudioCodec codec;
  size_t dataOffset;
  size_t dataSize;

  WavInfo()
      : sampleRate(0), channels(0), bitsPerSample(0),
        codec(AudioCodec::UNKNOWN), dataOffset(0), dataSize(0) {}

  size_t getBytesPerSample() const;
  size_t getFrameCount() const;
  std::string toString() const;
};

// RIFF/WAVE reading and writing
class WavContainer {
public:
  static bool looksLikeWav(const std::vector<uint8_t> &data);

  /**
   * Walk the RIFF chunks and locate "fmt " and "data".
   * @throws utils::AudioProcessingException when the container is malformed
   */
  static WavInfo parse(const std::vector<uint8_t> &data);

  // 16-bit PCM mono/multichannel WAV with a canonical 44-byte header
  static std::vector<uint8_t> encodePCM16(const std::vector<int16_t> &samples,
                                          uint32_t sampleRate,
                                          uint16_t channels = 1);
};

// Audio format converter
class AudioFormatConverter {
public:
  // Linear interpolation resampler
  static std::vector<float> resample(const std::vector<float> &input,
                                     uint32_t inputRate, uint32_t outputRate);

  // Interleaved N-channel to mono by averaging each frame
  static std::vector<float> downmix(const std::vector<float> &interleaved,
                                    uint16_t channels);

  static std::vector<float> convertToFloat(const uint8_t *data, size_t size,
                                           AudioCodec codec);
  static std::vector<float> pcm16ToFloat(const std::vector<int16_t> &samples);
  static std::vector<int16_t> convertToPCM16(const std::vector<float> &samples);

private:
  static float interpolate(const std::vector<float> &data, double index);
};

// Level measurement and loudness adjustment
class AudioLevel {
public:
  static float peak(const std::vector<float> &samples);
  static float rms(const float *samples, size_t count);
  static float rms(const std::vector<float> &samples);

  static float dbToLinear(float db);

  /**
   * Scale so the absolute peak sits headroomDb below full scale. Silent input
   * is returned unchanged.
   */
  static std::vector<float> peakNormalize(const std::vector<float> &samples,
                                          float headroomDb);
};

} // namespace audio
} // namespace medscribe
