#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace medscribe {
namespace stt {

enum class RecognitionStatus {
    OK,
    NOT_UNDERSTOOD,
    REQUEST_ERROR,
    TIMEOUT
};

struct RecognitionResponse {
    RecognitionStatus status;
    std::string text;
    std::string detail;
    float confidence;

    RecognitionResponse()
        : status(RecognitionStatus::REQUEST_ERROR)
        , confidence(0.0f) {}

    static RecognitionResponse success(const std::string& text, float confidence = 0.0f) {
        RecognitionResponse response;
        response.status = RecognitionStatus::OK;
        response.text = text;
        response.confidence = confidence;
        return response;
    }

    static RecognitionResponse notUnderstood() {
        RecognitionResponse response;
        response.status = RecognitionStatus::NOT_UNDERSTOOD;
        return response;
    }

    static RecognitionResponse requestError(const std::string& detail) {
        RecognitionResponse response;
        response.status = RecognitionStatus::REQUEST_ERROR;
        response.detail = detail;
        return response;
    }

    static RecognitionResponse timedOut(const std::string& detail = "") {
        RecognitionResponse response;
        response.status = RecognitionStatus::TIMEOUT;
        response.detail = detail;
        return response;
    }
};

/**
 * External speech-to-text service. The deadline bounds this one call only;
 * implementations keep no timeout state between calls.
 */
class RecognitionService {
public:
    virtual ~RecognitionService() = default;

    /**
     * Recognize canonical mono 16-bit PCM.
     * Implementations report failures through the response status and do not
     * throw for service-side conditions.
     */
    virtual RecognitionResponse recognize(const std::vector<int16_t>& samples,
                                          uint32_t sampleRate,
                                          const std::string& locale,
                                          std::chrono::milliseconds deadline) = 0;

    virtual std::string getName() const = 0;
};

std::string recognitionStatusToString(RecognitionStatus status);

} // namespace stt
} // namespace medscribe
