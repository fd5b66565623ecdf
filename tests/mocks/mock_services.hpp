#pragma once

#include "audio/audio_decoder.hpp"
#include "refine/generative_service.hpp"
#include "stt/recognition_service.hpp"
#include <gmock/gmock.h>

namespace medscribe {
namespace mocks {

class MockRecognitionService : public stt::RecognitionService {
public:
    MOCK_METHOD(stt::RecognitionResponse, recognize,
                (const std::vector<int16_t>& samples, uint32_t sampleRate,
                 const std::string& locale, std::chrono::milliseconds deadline),
                (override));
    MOCK_METHOD(std::string, getName, (), (const, override));
};

class MockGenerativeService : public refine::GenerativeService {
public:
    MOCK_METHOD(std::string, generate, (const std::string& prompt), (override));
    MOCK_METHOD(bool, isAvailable, (), (const, override));
    MOCK_METHOD(std::string, getName, (), (const, override));
};

class MockAudioDecoder : public audio::AudioDecoder {
public:
    MOCK_METHOD(std::string, getName, (), (const, override));
    MOCK_METHOD(audio::DecodedAudio, decode, (const std::vector<uint8_t>& bytes), (const, override));
};

} // namespace mocks
} // namespace medscribe
