#include "audio/audio_normalizer.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace medscribe {
namespace audio {

std::vector<uint8_t> Recording::toWav() const {
    return WavContainer::encodePCM16(samples, sampleRate, kCanonicalChannels);
}

AudioNormalizer::AudioNormalizer(const utils::AudioConfig& config)
    : config_(config) {
    decoders_.push_back(std::make_unique<WavDecoder>());
    if (config_.enableExternalDecoder) {
        decoders_.push_back(std::make_unique<FfmpegDecoder>(
            config_.ffmpegBinary, static_cast<uint32_t>(config_.sampleRate)));
    }
}

AudioNormalizer::AudioNormalizer(const utils::AudioConfig& config,
                                 std::vector<std::unique_ptr<AudioDecoder>> decoders)
    : config_(config), decoders_(std::move(decoders)) {
}

std::vector<int16_t> AudioNormalizer::normalizeSamples(const std::vector<uint8_t>& raw) const {
    if (raw.size() < config_.minInputBytes) {
        throw utils::DecodeException(utils::DecodeException::Reason::TOO_SMALL,
            "Audio input too small (" + std::to_string(raw.size()) + " bytes, minimum " +
            std::to_string(config_.minInputBytes) + ")");
    }

    std::string lastError = "no decoder configured";
    for (const auto& decoder : decoders_) {
        try {
            DecodedAudio decoded = decoder->decode(raw);
            std::vector<int16_t> canonical = toCanonical(decoded, config_.normalizeHeadroomDb);
            if (canonical.empty()) {
                lastError = decoder->getName() + ": decoded audio is empty";
                continue;
            }
            utils::Logger::debug("Input decoded by " + decoder->getName() + " decoder: " +
                                 std::to_string(decoded.sampleRate) + " Hz, " +
                                 std::to_string(decoded.channels) + " channel(s)");
            return canonical;
        } catch (const utils::AudioProcessingException& e) {
            lastError = decoder->getName() + ": " + e.what();
            utils::Logger::debug("Decoder " + decoder->getName() + " rejected input: " + e.what());
        } catch (const utils::MedScribeException& e) {
            // Temp file or process failures inside a decoder
            lastError = decoder->getName() + ": " + e.what();
            utils::Logger::warn("Decoder " + decoder->getName() + " failed: " + e.what());
        }
    }

    throw utils::DecodeException(utils::DecodeException::Reason::UNDECODABLE,
                                 "Unable to decode audio input (" + lastError + ")");
}

RecordingPtr AudioNormalizer::normalize(const std::vector<uint8_t>& raw,
                                        const RecordingMetadata& metadata) const {
    auto recording = std::make_shared<Recording>();
    recording->id = metadata.id;
    recording->ownerId = metadata.ownerId;
    recording->subject = metadata.subject;
    recording->createdAt = metadata.createdAt;
    recording->samples = normalizeSamples(raw);
    recording->sampleRate = kCanonicalSampleRate;
    recording->durationMs = durationMs(recording->samples.size(), recording->sampleRate);

    utils::Logger::info("Normalized recording " + recording->id + ": " +
                        std::to_string(raw.size()) + " input bytes -> " +
                        std::to_string(recording->durationMs) + " ms canonical PCM");
    return recording;
}

std::vector<int16_t> AudioNormalizer::toCanonical(const DecodedAudio& decoded, float headroomDb) {
    std::vector<float> mono = AudioFormatConverter::downmix(decoded.samples, decoded.channels);
    std::vector<float> resampled =
        AudioFormatConverter::resample(mono, decoded.sampleRate, kCanonicalSampleRate);
    if (headroomDb >= 0.0f) {
        resampled = AudioLevel::peakNormalize(resampled, headroomDb);
    }
    return AudioFormatConverter::convertToPCM16(resampled);
}

int64_t AudioNormalizer::durationMs(size_t sampleCount, uint32_t sampleRate) {
    if (sampleRate == 0) {
        return 0;
    }
    return static_cast<int64_t>(sampleCount) * 1000 / static_cast<int64_t>(sampleRate);
}

} // namespace audio
} // namespace medscribe
