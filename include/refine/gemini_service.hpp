#pragma once

#include "refine/generative_service.hpp"
#include "utils/config.hpp"
#include "utils/http_client.hpp"

namespace medscribe {
namespace refine {

/**
 * Gemini generateContent REST adapter
 */
class GeminiService : public GenerativeService {
public:
    explicit GeminiService(const utils::GenerationConfig& config);

    std::string generate(const std::string& prompt) override;
    bool isAvailable() const override { return !config_.apiKey.empty(); }
    std::string getName() const override { return "gemini:" + config_.model; }

    static std::string buildRequestBody(const std::string& prompt);

    /**
     * Text of the first candidate.
     * @throws utils::GenerationException for transport errors, non-2xx status,
     *         blocked prompts or replies without text
     */
    static std::string extractText(const utils::HttpResult& result);

private:
    utils::GenerationConfig config_;
    utils::HttpClient http_;
};

} // namespace refine
} // namespace medscribe
