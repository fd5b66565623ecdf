#include "audio/audio_utils.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <sstream>

namespace medscribe {
namespace audio {

namespace {

uint16_t readLE16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readLE32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void writeLE16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void writeLE32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

void writeTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

constexpr uint16_t kFormatPCM = 1;
constexpr uint16_t kFormatIEEEFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

AudioCodec codecFor(uint16_t formatTag, uint16_t bitsPerSample) {
    if (formatTag == kFormatPCM) {
        switch (bitsPerSample) {
            case 8: return AudioCodec::PCM_8;
            case 16: return AudioCodec::PCM_16;
            case 24: return AudioCodec::PCM_24;
            case 32: return AudioCodec::PCM_32;
            default: return AudioCodec::UNKNOWN;
        }
    }
    if (formatTag == kFormatIEEEFloat && bitsPerSample == 32) {
        return AudioCodec::FLOAT_32;
    }
    return AudioCodec::UNKNOWN;
}

} // namespace

// WavInfo implementation
size_t WavInfo::getBytesPerSample() const {
    switch (codec) {
        case AudioCodec::PCM_8: return 1;
        case AudioCodec::PCM_16: return 2;
        case AudioCodec::PCM_24: return 3;
        case AudioCodec::PCM_32: return 4;
        case AudioCodec::FLOAT_32: return 4;
        default: return 0;
    }
}

size_t WavInfo::getFrameCount() const {
    size_t frameBytes = getBytesPerSample() * channels;
    return frameBytes == 0 ? 0 : dataSize / frameBytes;
}

std::string WavInfo::toString() const {
    std::ostringstream oss;
    oss << "WavInfo{sampleRate=" << sampleRate
        << ", channels=" << channels
        << ", bits=" << bitsPerSample
        << ", dataSize=" << dataSize << "}";
    return oss.str();
}

// WavContainer implementation
bool WavContainer::looksLikeWav(const std::vector<uint8_t>& data) {
    return data.size() >= 12 &&
           std::memcmp(data.data(), "RIFF", 4) == 0 &&
           std::memcmp(data.data() + 8, "WAVE", 4) == 0;
}

WavInfo WavContainer::parse(const std::vector<uint8_t>& data) {
    if (!looksLikeWav(data)) {
        throw utils::AudioProcessingException("Not a RIFF/WAVE container", "WavContainer");
    }

    WavInfo info;
    bool haveFormat = false;
    bool haveData = false;
    size_t pos = 12;

    while (pos + 8 <= data.size() && !haveData) {
        const uint8_t* chunk = data.data() + pos;
        uint32_t chunkSize = readLE32(chunk + 4);
        size_t body = pos + 8;

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunkSize < 16 || body + 16 > data.size()) {
                throw utils::AudioProcessingException("Truncated fmt chunk", "WavContainer");
            }
            uint16_t formatTag = readLE16(data.data() + body);
            info.channels = readLE16(data.data() + body + 2);
            info.sampleRate = readLE32(data.data() + body + 4);
            info.bitsPerSample = readLE16(data.data() + body + 14);

            // WAVE_FORMAT_EXTENSIBLE stores the real tag in the sub-format GUID
            if (formatTag == kFormatExtensible && chunkSize >= 40 && body + 26 <= data.size()) {
                formatTag = readLE16(data.data() + body + 24);
            }
            info.codec = codecFor(formatTag, info.bitsPerSample);
            haveFormat = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            info.dataOffset = body;
            // Streamed writers leave the size at 0 or 0xFFFFFFFF; take what is there
            size_t available = data.size() - body;
            info.dataSize = (chunkSize == 0 || chunkSize > available) ? available : chunkSize;
            haveData = true;
        }

        // Chunks are word aligned
        pos = body + chunkSize + (chunkSize & 1);
    }

    if (!haveFormat) {
        throw utils::AudioProcessingException("WAV container has no fmt chunk", "WavContainer");
    }
    if (!haveData) {
        throw utils::AudioProcessingException("WAV container has no data chunk", "WavContainer");
    }
    if (info.codec == AudioCodec::UNKNOWN) {
        throw utils::AudioProcessingException(
            "Unsupported WAV sample format (" + std::to_string(info.bitsPerSample) + " bits)",
            "WavContainer");
    }
    if (info.channels == 0 || info.sampleRate == 0) {
        throw utils::AudioProcessingException("Invalid WAV format: " + info.toString(), "WavContainer");
    }

    return info;
}

std::vector<uint8_t> WavContainer::encodePCM16(const std::vector<int16_t>& samples,
                                               uint32_t sampleRate, uint16_t channels) {
    const uint32_t dataSize = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    const uint16_t blockAlign = static_cast<uint16_t>(channels * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);

    writeTag(out, "RIFF");
    writeLE32(out, 36 + dataSize);
    writeTag(out, "WAVE");

    writeTag(out, "fmt ");
    writeLE32(out, 16);
    writeLE16(out, kFormatPCM);
    writeLE16(out, channels);
    writeLE32(out, sampleRate);
    writeLE32(out, sampleRate * blockAlign);
    writeLE16(out, blockAlign);
    writeLE16(out, 16);

    writeTag(out, "data");
    writeLE32(out, dataSize);
    for (int16_t sample : samples) {
        writeLE16(out, static_cast<uint16_t>(sample));
    }

    return out;
}

// AudioFormatConverter implementation
std::vector<float> AudioFormatConverter::resample(const std::vector<float>& input,
                                                  uint32_t inputRate, uint32_t outputRate) {
    if (inputRate == outputRate || input.empty()) {
        return input;
    }

    double ratio = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    size_t outputSize = static_cast<size_t>(std::llround(static_cast<double>(input.size()) * ratio));
    std::vector<float> output;
    output.reserve(outputSize);

    for (size_t i = 0; i < outputSize; ++i) {
        double srcIndex = static_cast<double>(i) / ratio;
        output.push_back(interpolate(input, srcIndex));
    }

    return output;
}

std::vector<float> AudioFormatConverter::downmix(const std::vector<float>& interleaved,
                                                 uint16_t channels) {
    if (channels <= 1) {
        return interleaved;
    }
    if (interleaved.size() % channels != 0) {
        utils::Logger::warn("Interleaved data size is not a multiple of the channel count; "
                            "dropping the incomplete trailing frame");
    }

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono;
    mono.reserve(frames);

    for (size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += interleaved[frame * channels + ch];
        }
        mono.push_back(sum / static_cast<float>(channels));
    }

    return mono;
}

std::vector<float> AudioFormatConverter::convertToFloat(const uint8_t* data, size_t size,
                                                        AudioCodec codec) {
    std::vector<float> samples;

    switch (codec) {
        case AudioCodec::PCM_8: {
            samples.reserve(size);
            for (size_t i = 0; i < size; ++i) {
                // 8-bit WAV is unsigned with a 128 bias
                samples.push_back((static_cast<float>(data[i]) - 128.0f) / 128.0f);
            }
            break;
        }
        case AudioCodec::PCM_16: {
            size_t sampleCount = size / 2;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int16_t sample = static_cast<int16_t>(readLE16(data + i * 2));
                samples.push_back(static_cast<float>(sample) / 32768.0f);
            }
            break;
        }
        case AudioCodec::PCM_24: {
            size_t sampleCount = size / 3;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int32_t sample = (data[i*3] << 8) | (data[i*3+1] << 16) | (data[i*3+2] << 24);
                sample >>= 8; // Sign extend
                samples.push_back(static_cast<float>(sample) / 8388608.0f);
            }
            break;
        }
        case AudioCodec::PCM_32: {
            size_t sampleCount = size / 4;
            samples.reserve(sampleCount);
            for (size_t i = 0; i < sampleCount; ++i) {
                int32_t sample = static_cast<int32_t>(readLE32(data + i * 4));
                samples.push_back(static_cast<float>(sample) / 2147483648.0f);
            }
            break;
        }
        case AudioCodec::FLOAT_32: {
            size_t sampleCount = size / 4;
            samples.resize(sampleCount);
            std::memcpy(samples.data(), data, sampleCount * sizeof(float));
            break;
        }
        default:
            utils::Logger::error("Unsupported audio codec for conversion");
            break;
    }

    return samples;
}

std::vector<float> AudioFormatConverter::pcm16ToFloat(const std::vector<int16_t>& samples) {
    std::vector<float> out;
    out.reserve(samples.size());
    for (int16_t sample : samples) {
        out.push_back(static_cast<float>(sample) / 32768.0f);
    }
    return out;
}

std::vector<int16_t> AudioFormatConverter::convertToPCM16(const std::vector<float>& samples) {
    std::vector<int16_t> pcm;
    pcm.reserve(samples.size());

    for (float sample : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, sample));
        pcm.push_back(static_cast<int16_t>(std::lround(clamped * 32767.0f)));
    }

    return pcm;
}

float AudioFormatConverter::interpolate(const std::vector<float>& data, double index) {
    size_t lower = static_cast<size_t>(index);
    if (lower >= data.size() - 1) {
        return data.back();
    }
    float fraction = static_cast<float>(index - static_cast<double>(lower));
    return data[lower] * (1.0f - fraction) + data[lower + 1] * fraction;
}

// AudioLevel implementation
float AudioLevel::peak(const std::vector<float>& samples) {
    float peakValue = 0.0f;
    for (float sample : samples) {
        peakValue = std::max(peakValue, std::abs(sample));
    }
    return peakValue;
}

float AudioLevel::rms(const float* samples, size_t count) {
    if (count == 0) {
        return 0.0f;
    }
    double sum = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sum += static_cast<double>(samples[i]) * samples[i];
    }
    return static_cast<float>(std::sqrt(sum / static_cast<double>(count)));
}

float AudioLevel::rms(const std::vector<float>& samples) {
    return rms(samples.data(), samples.size());
}

float AudioLevel::dbToLinear(float db) {
    return std::pow(10.0f, db / 20.0f);
}

std::vector<float> AudioLevel::peakNormalize(const std::vector<float>& samples, float headroomDb) {
    if (samples.empty()) return samples;

    float peakValue = peak(samples);
    if (peakValue < 1e-10f) return samples;

    float gain = dbToLinear(-headroomDb) / peakValue;
    std::vector<float> normalized;
    normalized.reserve(samples.size());

    for (float sample : samples) {
        normalized.push_back(sample * gain);
    }

    return normalized;
}

} // namespace audio
} // namespace medscribe
