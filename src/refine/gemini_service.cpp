#include "refine/gemini_service.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace medscribe {
namespace refine {

GeminiService::GeminiService(const utils::GenerationConfig& config)
    : config_(config) {
}

std::string GeminiService::buildRequestBody(const std::string& prompt) {
    json body;
    body["contents"] = json::array({
        {{"parts", json::array({{{"text", prompt}}})}}
    });
    return body.dump();
}

std::string GeminiService::extractText(const utils::HttpResult& result) {
    if (!result.transportOk) {
        throw utils::GenerationException(
            result.timedOut ? "Generative service timed out" : "Generative service unreachable",
            result.error);
    }

    json response;
    try {
        response = json::parse(result.body);
    } catch (const json::exception& e) {
        throw utils::GenerationException("Malformed generative service response",
                                         "HTTP " + std::to_string(result.statusCode) + ": " + e.what());
    }

    try {
        if (!result.isSuccess()) {
            std::string detail = "HTTP " + std::to_string(result.statusCode);
            if (response.contains("error") && response["error"].contains("message")) {
                detail += ": " + response["error"]["message"].get<std::string>();
            }
            throw utils::GenerationException("Generative service rejected the request", detail);
        }

        if (response.contains("promptFeedback") && response["promptFeedback"].contains("blockReason")) {
            throw utils::GenerationException("Prompt blocked by the generative service",
                                             response["promptFeedback"]["blockReason"].dump());
        }

        if (!response.contains("candidates") || !response["candidates"].is_array() ||
            response["candidates"].empty()) {
            throw utils::GenerationException("Generative service returned no candidates");
        }

        const auto& candidate = response["candidates"][0];
        if (!candidate.contains("content") || !candidate["content"].contains("parts")) {
            throw utils::GenerationException("Generative service candidate has no content",
                                             candidate.value("finishReason", std::string("unknown")));
        }

        std::string text;
        for (const auto& part : candidate["content"]["parts"]) {
            text += part.value("text", "");
        }

        if (text.empty()) {
            throw utils::GenerationException("Generative service returned empty text");
        }
        return text;
    } catch (const json::exception& e) {
        throw utils::GenerationException("Unexpected generative service response",
                                         "HTTP " + std::to_string(result.statusCode) + ": " + e.what());
    }
}

std::string GeminiService::generate(const std::string& prompt) {
    if (!isAvailable()) {
        throw utils::GenerationException("Generative service is not configured",
                                         "set GEMINI_API_KEY or generation.apiKey");
    }

    std::string url = config_.endpoint + "/" + config_.model + ":generateContent";
    std::vector<std::string> headers = {"x-goog-api-key: " + config_.apiKey};

    utils::Logger::debug("Sending prompt to " + getName() + " (" +
                         std::to_string(prompt.size()) + " characters)");

    utils::HttpResult result = http_.postJson(url, buildRequestBody(prompt), headers,
                                              std::chrono::milliseconds(config_.timeoutMs));
    std::string text = extractText(result);

    utils::Logger::debug(getName() + " replied with " + std::to_string(text.size()) + " characters");
    return text;
}

} // namespace refine
} // namespace medscribe
