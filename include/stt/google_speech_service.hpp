#pragma once

#include "stt/recognition_service.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace medscribe {
namespace stt {

/**
 * Google Cloud Speech-to-Text v1 REST adapter (speech:recognize). Audio is
 * sent inline as base64 LINEAR16.
 */
class GoogleSpeechService : public RecognitionService {
public:
    explicit GoogleSpeechService(const utils::RecognitionConfig& config);

    RecognitionResponse recognize(const std::vector<int16_t>& samples,
                                  uint32_t sampleRate,
                                  const std::string& locale,
                                  std::chrono::milliseconds deadline) override;

    std::string getName() const override { return "google-speech"; }

    static std::string buildRequestBody(const std::vector<int16_t>& samples,
                                        uint32_t sampleRate,
                                        const std::string& locale);

    /**
     * Map an HTTP exchange onto a recognition outcome: transport timeout ->
     * TIMEOUT, no results or blank alternatives -> NOT_UNDERSTOOD, anything
     * else unexpected -> REQUEST_ERROR.
     */
    static RecognitionResponse interpretResponse(const utils::HttpResult& result);

private:
    std::string endpoint_;
    std::string apiKey_;
    utils::HttpClient http_;
};

} // namespace stt
} // namespace medscribe
