#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "audio/audio_normalizer.hpp"
#include "mocks/mock_services.hpp"
#include "test_data_generator.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>
#include <cstdlib>

using namespace medscribe;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;
using ::testing::_;

namespace {

int maxAbs(const std::vector<int16_t>& samples) {
    int peak = 0;
    for (int16_t s : samples) {
        peak = std::max(peak, std::abs(static_cast<int>(s)));
    }
    return peak;
}

} // namespace

class AudioNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.enableExternalDecoder = false;
        normalizer_ = std::make_unique<audio::AudioNormalizer>(config_);
    }

    utils::DecodeException::Reason decodeFailure(const std::vector<uint8_t>& bytes) {
        try {
            normalizer_->normalizeSamples(bytes);
        } catch (const utils::DecodeException& e) {
            return e.getReason();
        }
        ADD_FAILURE() << "expected DecodeException";
        return utils::DecodeException::Reason::UNDECODABLE;
    }

    utils::AudioConfig config_;
    std::unique_ptr<audio::AudioNormalizer> normalizer_;
    fixtures::TestDataGenerator generator_;
};

TEST_F(AudioNormalizerTest, DecodersFollowConfiguration) {
    ASSERT_EQ(normalizer_->getDecoders().size(), 1u);
    EXPECT_EQ(normalizer_->getDecoders()[0]->getName(), "wav");

    utils::AudioConfig withExternal;
    audio::AudioNormalizer full(withExternal);
    ASSERT_EQ(full.getDecoders().size(), 2u);
    EXPECT_EQ(full.getDecoders()[1]->getName(), "ffmpeg");
}

TEST_F(AudioNormalizerTest, TooSmallInputIsTerminal) {
    std::vector<uint8_t> tiny(config_.minInputBytes - 1, 0);
    EXPECT_EQ(decodeFailure(tiny), utils::DecodeException::Reason::TOO_SMALL);
}

TEST_F(AudioNormalizerTest, GarbageIsUndecodable) {
    EXPECT_EQ(decodeFailure(generator_.generateGarbage(4000)), utils::DecodeException::Reason::UNDECODABLE);
}

TEST_F(AudioNormalizerTest, StereoInputBecomesCanonicalMono) {
    auto left = generator_.generateTone(440.0f, 1.0f, 0.3f, 44100);
    std::vector<float> stereo;
    for (float sample : left) {
        stereo.push_back(sample);
        stereo.push_back(sample);
    }

    audio::RecordingMetadata metadata;
    metadata.id = "dr_silva_conversa_20261018_101500";
    metadata.ownerId = "dr_silva";
    auto recording = normalizer_->normalize(generator_.encodeWav(stereo, 44100, 2), metadata);

    EXPECT_EQ(recording->id, metadata.id);
    EXPECT_EQ(recording->ownerId, "dr_silva");
    EXPECT_EQ(recording->sampleRate, 16000u);
    EXPECT_EQ(recording->samples.size(), 16000u);
    EXPECT_EQ(recording->durationMs, 1000);

    // Loudness normalized to 0.1 dB below full scale
    EXPECT_NEAR(maxAbs(recording->samples), 32392, 2);
}

TEST_F(AudioNormalizerTest, DecodesEightBitAndFloat) {
    auto tone = generator_.generateTone(300.0f, 0.5f, 0.4f, 8000);

    auto fromPcm8 = normalizer_->normalizeSamples(generator_.encodeWav(tone, 8000, 1, 8));
    EXPECT_EQ(fromPcm8.size(), 8000u);

    auto fromFloat = normalizer_->normalizeSamples(generator_.encodeWav(tone, 8000, 1, 32, true));
    EXPECT_EQ(fromFloat.size(), 8000u);
}

TEST_F(AudioNormalizerTest, SilenceStaysSilent) {
    auto silent = normalizer_->normalizeSamples(generator_.encodeWav(generator_.generateSilence(0.5f), 16000));
    EXPECT_EQ(silent.size(), 8000u);
    EXPECT_EQ(maxAbs(silent), 0);
}

TEST_F(AudioNormalizerTest, TriesDecodersInOrder) {
    auto failing = std::make_unique<NiceMock<mocks::MockAudioDecoder>>();
    auto empty = std::make_unique<NiceMock<mocks::MockAudioDecoder>>();
    auto working = std::make_unique<NiceMock<mocks::MockAudioDecoder>>();

    ON_CALL(*failing, getName()).WillByDefault(Return("failing"));
    ON_CALL(*empty, getName()).WillByDefault(Return("empty"));
    ON_CALL(*working, getName()).WillByDefault(Return("working"));

    EXPECT_CALL(*failing, decode(_)).WillOnce(Throw(utils::AudioProcessingException("unsupported")));
    EXPECT_CALL(*empty, decode(_)).WillOnce(Return(audio::DecodedAudio{{}, 16000, 1}));
    EXPECT_CALL(*working, decode(_)).WillOnce(Return(audio::DecodedAudio{std::vector<float>(1600, 0.25f), 16000, 1}));

    std::vector<std::unique_ptr<audio::AudioDecoder>> decoders;
    decoders.push_back(std::move(failing));
    decoders.push_back(std::move(empty));
    decoders.push_back(std::move(working));
    audio::AudioNormalizer normalizer(config_, std::move(decoders));

    auto samples = normalizer.normalizeSamples(std::vector<uint8_t>(2000, 1));
    ASSERT_EQ(samples.size(), 1600u);
    EXPECT_NEAR(samples[0], 32392, 2);
}

TEST_F(AudioNormalizerTest, ExhaustedDecodersReportLastError) {
    auto failing = std::make_unique<NiceMock<mocks::MockAudioDecoder>>();
    ON_CALL(*failing, getName()).WillByDefault(Return("probe"));
    EXPECT_CALL(*failing, decode(_)).WillOnce(Throw(utils::AudioProcessingException("bad header")));

    std::vector<std::unique_ptr<audio::AudioDecoder>> decoders;
    decoders.push_back(std::move(failing));
    audio::AudioNormalizer normalizer(config_, std::move(decoders));

    try {
        normalizer.normalizeSamples(std::vector<uint8_t>(2000, 1));
        FAIL() << "expected DecodeException";
    } catch (const utils::DecodeException& e) {
        EXPECT_EQ(e.getReason(), utils::DecodeException::Reason::UNDECODABLE);
        EXPECT_NE(std::string(e.what()).find("probe: bad header"), std::string::npos);
    }
}

TEST_F(AudioNormalizerTest, CanonicalRecordingEncodesAsWav) {
    audio::RecordingMetadata metadata;
    metadata.id = "rec";
    auto recording = normalizer_->normalize(generator_.generateSpeechWav(1.0f), metadata);

    auto wav = recording->toWav();
    audio::WavInfo info = audio::WavContainer::parse(wav);
    EXPECT_EQ(info.sampleRate, 16000u);
    EXPECT_EQ(info.channels, 1);
    EXPECT_EQ(info.getFrameCount(), recording->samples.size());
}

TEST_F(AudioNormalizerTest, DurationFromSampleCount) {
    EXPECT_EQ(audio::AudioNormalizer::durationMs(16000, 16000), 1000);
    EXPECT_EQ(audio::AudioNormalizer::durationMs(16015, 16000), 1000);
    EXPECT_EQ(audio::AudioNormalizer::durationMs(100, 0), 0);
}
