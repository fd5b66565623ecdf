#include "stt/google_speech_service.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>

using json = nlohmann::json;

namespace medscribe {
namespace stt {

GoogleSpeechService::GoogleSpeechService(const utils::RecognitionConfig& config)
    : endpoint_(config.endpoint)
    , apiKey_(config.apiKey) {
}

std::string GoogleSpeechService::buildRequestBody(const std::vector<int16_t>& samples,
                                                  uint32_t sampleRate,
                                                  const std::string& locale) {
    std::vector<uint8_t> bytes;
    bytes.reserve(samples.size() * 2);
    for (int16_t sample : samples) {
        uint16_t value = static_cast<uint16_t>(sample);
        bytes.push_back(static_cast<uint8_t>(value & 0xFF));
        bytes.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    }

    json body;
    body["config"]["encoding"] = "LINEAR16";
    body["config"]["sampleRateHertz"] = sampleRate;
    body["config"]["languageCode"] = locale;
    body["config"]["enableAutomaticPunctuation"] = true;
    body["audio"]["content"] = utils::base64Encode(bytes);
    return body.dump();
}

RecognitionResponse GoogleSpeechService::interpretResponse(const utils::HttpResult& result) {
    if (!result.transportOk) {
        if (result.timedOut) {
            return RecognitionResponse::timedOut(result.error);
        }
        return RecognitionResponse::requestError("recognition connection failed; " + result.error);
    }

    json response;
    try {
        response = json::parse(result.body);
    } catch (const json::exception& e) {
        return RecognitionResponse::requestError(
            "malformed response (HTTP " + std::to_string(result.statusCode) + "): " + e.what());
    }

    try {
        if (!result.isSuccess()) {
            std::string message = "HTTP " + std::to_string(result.statusCode);
            if (response.contains("error") && response["error"].contains("message")) {
                message += ": " + response["error"]["message"].get<std::string>();
            }
            return RecognitionResponse::requestError(message);
        }

        if (!response.contains("results") || !response["results"].is_array() ||
            response["results"].empty()) {
            return RecognitionResponse::notUnderstood();
        }

        std::string text;
        float confidence = 0.0f;
        for (const auto& item : response["results"]) {
            if (!item.contains("alternatives") || item["alternatives"].empty()) {
                continue;
            }
            const auto& best = item["alternatives"][0];
            std::string piece = best.value("transcript", "");
            if (piece.empty()) {
                continue;
            }
            if (!text.empty() && text.back() != ' ' && piece.front() != ' ') {
                text += ' ';
            }
            text += piece;
            confidence = std::max(confidence, best.value("confidence", 0.0f));
        }

        if (text.empty()) {
            return RecognitionResponse::notUnderstood();
        }

        return RecognitionResponse::success(text, confidence);
    } catch (const json::exception& e) {
        // Fields of an unexpected type
        return RecognitionResponse::requestError(
            "unexpected response structure (HTTP " + std::to_string(result.statusCode) + "): " + e.what());
    }
}

RecognitionResponse GoogleSpeechService::recognize(const std::vector<int16_t>& samples,
                                                   uint32_t sampleRate,
                                                   const std::string& locale,
                                                   std::chrono::milliseconds deadline) {
    if (apiKey_.empty()) {
        return RecognitionResponse::requestError("no API key configured for the recognition service");
    }

    std::string url = endpoint_ + "?key=" + utils::HttpClient::urlEncode(apiKey_);
    std::string payload = buildRequestBody(samples, sampleRate, locale);

    utils::Logger::debug("Sending " + std::to_string(samples.size()) + " samples to " + getName() +
                         " (" + locale + ")");

    utils::HttpResult result = http_.postJson(url, payload, {}, deadline);
    return interpretResponse(result);
}

std::string recognitionStatusToString(RecognitionStatus status) {
    switch (status) {
        case RecognitionStatus::OK: return "OK";
        case RecognitionStatus::NOT_UNDERSTOOD: return "NOT_UNDERSTOOD";
        case RecognitionStatus::REQUEST_ERROR: return "REQUEST_ERROR";
        case RecognitionStatus::TIMEOUT: return "TIMEOUT";
    }
    return "UNKNOWN";
}

} // namespace stt
} // namespace medscribe
