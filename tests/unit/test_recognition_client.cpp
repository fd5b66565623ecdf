#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "stt/recognition_client.hpp"
#include "audio/audio_utils.hpp"
#include "mocks/mock_services.hpp"
#include "test_data_generator.hpp"
#include "utils/error_handler.hpp"
#include <algorithm>

using namespace medscribe;
using namespace medscribe::stt;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using std::chrono::milliseconds;

class RecognitionClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        audioConfig_.enableExternalDecoder = false;
        service_ = std::make_shared<NiceMock<mocks::MockRecognitionService>>();
        ON_CALL(*service_, getName()).WillByDefault(Return("mock-speech"));

        client_ = std::make_unique<RecognitionClient>(service_, recognitionConfig_, audioConfig_);
        client_->setSleepFunction([this](milliseconds delay) { sleeps_.push_back(delay); });
    }

    audio::Segment speechSegment(float seconds, int index = 0, bool whole = true) {
        auto recording = std::make_shared<audio::Recording>();
        recording->id = "rec";
        utils::AudioConfig config;
        config.enableExternalDecoder = false;
        recording->samples = audio::AudioNormalizer(config).normalizeSamples(
            generator_.generateSpeechWav(seconds));
        recording->durationMs = audio::AudioNormalizer::durationMs(recording->samples.size(), 16000);

        audio::Segment segment;
        segment.recording = recording;
        segment.index = index;
        segment.endMs = recording->durationMs;
        segment.whole = whole;
        if (!whole) {
            segment.samples = recording->samples;
        }
        return segment;
    }

    utils::AudioConfig audioConfig_;
    utils::RecognitionConfig recognitionConfig_;
    std::shared_ptr<NiceMock<mocks::MockRecognitionService>> service_;
    std::unique_ptr<RecognitionClient> client_;
    std::vector<milliseconds> sleeps_;
    fixtures::TestDataGenerator generator_;
};

TEST_F(RecognitionClientTest, RequiresService) {
    EXPECT_THROW(RecognitionClient(nullptr, recognitionConfig_, audioConfig_),
                 utils::RecognitionException);
}

TEST_F(RecognitionClientTest, SuccessfulWholeRecording) {
    EXPECT_CALL(*service_, recognize(_, 16000u, "pt-BR", milliseconds(45000)))
        .WillOnce(Return(RecognitionResponse::success("bom dia, doutor", 0.92f)));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::OK);
    EXPECT_TRUE(fragment.isWhole());
    EXPECT_EQ(fragment.text, "bom dia, doutor");
    EXPECT_EQ(fragment.attempts, 1);
    EXPECT_EQ(fragment.captureStrategy, "convert");
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RecognitionClientTest, SegmentKeepsItsIndex) {
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::success("segunda parte")));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f, 1, false));
    EXPECT_EQ(fragment.index, 1);
    EXPECT_FALSE(fragment.isWhole());
}

TEST_F(RecognitionClientTest, SegmentStartingMidSpeechIsSentWhole) {
    // 10 s of steady speech level from t=0 with one louder 100 ms word at t=5 s
    auto recording = std::make_shared<audio::Recording>();
    recording->id = "rec";
    recording->samples = audio::AudioFormatConverter::convertToPCM16(
        generator_.generateTone(220.0f, 10.0f, 0.3f));
    auto word = audio::AudioFormatConverter::convertToPCM16(generator_.generateTone(220.0f, 0.1f, 0.9f));
    std::copy(word.begin(), word.end(), recording->samples.begin() + 5 * 16000);
    recording->durationMs = 10000;

    audio::Segment segment;
    segment.recording = recording;
    segment.index = 1;
    segment.startMs = 45000;
    segment.endMs = 55000;
    segment.samples = recording->samples;

    size_t sent = 0;
    EXPECT_CALL(*service_, recognize(_, 16000u, _, _))
        .WillOnce(Invoke([&sent](const std::vector<int16_t>& samples, uint32_t, const std::string&,
                                 milliseconds) {
            sent = samples.size();
            return RecognitionResponse::success("continua a consulta");
        }));

    TranscriptFragment fragment = client_->recognize(segment);
    EXPECT_EQ(fragment.kind, FragmentKind::OK);
    EXPECT_EQ(fragment.captureStrategy, "convert");
    EXPECT_EQ(sent, 160000u);
}

TEST_F(RecognitionClientTest, TimeoutRetriesWithWiderDeadlines) {
    std::vector<milliseconds> deadlines;
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .Times(3)
        .WillRepeatedly(Invoke([&deadlines](const std::vector<int16_t>&, uint32_t, const std::string&,
                                     milliseconds deadline) {
            deadlines.push_back(deadline);
            return RecognitionResponse::timedOut("deadline exceeded");
        }));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::TIMEOUT);
    EXPECT_EQ(fragment.attempts, 3);
    EXPECT_EQ(fragment.render(), markers::kTimeout);

    std::vector<milliseconds> expectedDeadlines = {milliseconds(45000), milliseconds(60000), milliseconds(75000)};
    EXPECT_EQ(deadlines, expectedDeadlines);
    std::vector<milliseconds> expectedSleeps = {milliseconds(2000), milliseconds(2000)};
    EXPECT_EQ(sleeps_, expectedSleeps);
}

TEST_F(RecognitionClientTest, TimeoutThenSuccess) {
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::timedOut()))
        .WillOnce(Return(RecognitionResponse::success("recuperado")));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::OK);
    EXPECT_EQ(fragment.attempts, 2);
    EXPECT_EQ(sleeps_.size(), 1u);
}

TEST_F(RecognitionClientTest, NotUnderstoodIsFinal) {
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::notUnderstood()));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::UNRECOGNIZED);
    EXPECT_EQ(fragment.attempts, 1);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(RecognitionClientTest, RequestErrorCarriesDetail) {
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::requestError("HTTP 403: API key not valid")));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::SERVICE_ERROR);
    EXPECT_EQ(fragment.render(), "[Erro no serviço de reconhecimento: HTTP 403: API key not valid]");
}

TEST_F(RecognitionClientTest, BlankResultIsEmpty) {
    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::success("  \n")));

    TranscriptFragment fragment = client_->recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::EMPTY);
    EXPECT_EQ(fragment.render(), markers::kEmptyAudio);
}

TEST_F(RecognitionClientTest, UncapturableBytesNeverReachService) {
    EXPECT_CALL(*service_, recognize(_, _, _, _)).Times(0);

    TranscriptFragment fragment = client_->recognizeBytes(TranscriptFragment::kWholeIndex,
                                                          generator_.generateGarbage(4001));
    EXPECT_EQ(fragment.kind, FragmentKind::SERVICE_ERROR);
    EXPECT_EQ(fragment.attempts, 0);
    EXPECT_FALSE(fragment.detail.empty());
}

TEST_F(RecognitionClientTest, EvenLengthGarbageIsNotSentAsAudio) {
    EXPECT_CALL(*service_, recognize(_, _, _, _)).Times(0);

    TranscriptFragment fragment = client_->recognizeBytes(TranscriptFragment::kWholeIndex,
                                                          generator_.generateGarbage(4000));
    EXPECT_EQ(fragment.kind, FragmentKind::SERVICE_ERROR);
    EXPECT_EQ(fragment.attempts, 0);
    EXPECT_NE(fragment.render().find("O formato pode não ser suportado"), std::string::npos);
    EXPECT_NE(fragment.detail.find("raw-read-without-calibration"), std::string::npos);
}

TEST_F(RecognitionClientTest, CustomRetryBudget) {
    recognitionConfig_.maxAttempts = 1;
    RecognitionClient client(service_, recognitionConfig_, audioConfig_);
    client.setSleepFunction([this](milliseconds delay) { sleeps_.push_back(delay); });

    EXPECT_CALL(*service_, recognize(_, _, _, _))
        .WillOnce(Return(RecognitionResponse::timedOut()));

    TranscriptFragment fragment = client.recognize(speechSegment(2.0f));
    EXPECT_EQ(fragment.kind, FragmentKind::TIMEOUT);
    EXPECT_EQ(fragment.attempts, 1);
    EXPECT_TRUE(sleeps_.empty());
}
